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
#ifndef NUMFORMAT_WRITER_HPP
#define NUMFORMAT_WRITER_HPP

#include <cstddef>  // size_t
#include <system_error>     // error_code, error_condition

namespace numformat {

// Destination for formatted output, for callers that want numbers to go
// somewhere other than a buffer or a string.
class writer {
public:
    enum errc
    {
        // Retrying later may succeed, e.g. the disk is full.
        temporary_failure = 1,
        permanent_failure = 2
    };
    static std::error_category const& error_category();

    virtual ~writer() = 0;

    // Must write all count bytes, or set ec. Returns the number of bytes
    // written, which is less than count only if ec is set.
    virtual std::size_t write(void const* pbuffer, std::size_t count,
            std::error_code& ec) noexcept = 0;
};

inline std::error_condition make_error_condition(writer::errc ec)
{
    return std::error_condition(ec, writer::error_category());
}

inline std::error_code make_error_code(writer::errc ec)
{
    return std::error_code(ec, writer::error_category());
}

}   // namespace numformat

namespace std
{
    template <>
    struct is_error_condition_enum<numformat::writer::errc> : public true_type {};
}

#endif  // NUMFORMAT_WRITER_HPP
