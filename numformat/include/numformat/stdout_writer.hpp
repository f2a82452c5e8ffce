/* This file is part of numformat
 * Copyright 2026 The numformat authors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#ifndef NUMFORMAT_STDOUT_WRITER_HPP
#define NUMFORMAT_STDOUT_WRITER_HPP

#include "writer.hpp"

namespace numformat {

// Writes to an already open file descriptor (a HANDLE on Windows), which it
// does not take ownership of.
class fd_writer : public writer {
public:
#if defined(_WIN32)
    explicit fd_writer(void* handle) : handle_(handle) {}
#else
    explicit fd_writer(int fd) : fd_(fd) {}
#endif

    std::size_t write(void const* pbuffer, std::size_t count,
            std::error_code& ec) noexcept override;

private:
#if defined(_WIN32)
    void* handle_;
#else
    int fd_;
#endif
};

#if defined(_WIN32)
namespace detail {
    unsigned long const NUMFORMAT_STD_OUTPUT_HANDLE = static_cast<unsigned long>(-11);
    unsigned long const NUMFORMAT_STD_ERROR_HANDLE = static_cast<unsigned long>(-12);
    extern "C" {
        void* __stdcall GetStdHandle(unsigned long nStdHandle);
    }
}   // namespace detail
#endif

class stdout_writer : public fd_writer {
public:
#if defined(_WIN32)
    stdout_writer() : fd_writer(detail::GetStdHandle(detail::NUMFORMAT_STD_OUTPUT_HANDLE)) { }
#else
    stdout_writer() : fd_writer(1) { }
#endif
};

class stderr_writer : public fd_writer {
public:
#if defined(_WIN32)
    stderr_writer() : fd_writer(detail::GetStdHandle(detail::NUMFORMAT_STD_ERROR_HANDLE)) { }
#else
    stderr_writer() : fd_writer(2) { }
#endif
};

}   // namespace numformat

#endif  // NUMFORMAT_STDOUT_WRITER_HPP
