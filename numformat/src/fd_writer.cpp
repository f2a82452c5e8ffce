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
#include <numformat/stdout_writer.hpp>

#include <string>

#if defined(_WIN32)
#define NOMINMAX
#include <Windows.h>
#include <limits>   // numeric_limits
#else
#include <errno.h>      // errno, EINTR
#include <unistd.h>     // write
#endif

namespace {

// Keeps the OS error number but lets callers compare it against
// numformat::writer::temporary_failure and permanent_failure.
class fd_error_category : public std::error_category {
public:
    char const* name() const noexcept override
    {
        return "numformat::fd_writer";
    }

    std::error_condition default_error_condition(int code) const noexcept override
    {
        return std::system_category().default_error_condition(code);
    }

    bool equivalent(int code, std::error_condition const& condition) const noexcept override
    {
        if(condition.category() == numformat::writer::error_category())
            return to_writer_errc(code) == condition.value();
        else
            return std::system_category().equivalent(code, condition);
    }

    bool equivalent(std::error_code const& code, int condition) const noexcept override
    {
        if(code.category() == numformat::writer::error_category())
            return to_writer_errc(condition) == code.value();
        else
            return std::system_category().equivalent(code, condition);
    }

    std::string message(int condition) const override
    {
        return std::system_category().message(condition);
    }

private:
    static int to_writer_errc(int code)
    {
#if defined(_WIN32)
        switch(code) {
        case ERROR_BUSY:
        case ERROR_DISK_FULL:
        case ERROR_HANDLE_DISK_FULL:
        case ERROR_NOT_ENOUGH_MEMORY:
        case ERROR_NOT_READY:
        case ERROR_OPERATION_ABORTED:
        case ERROR_OUTOFMEMORY:
        case ERROR_RETRY:
        case ERROR_WRITE_FAULT:
            return numformat::writer::temporary_failure;
        default:
            return numformat::writer::permanent_failure;
        }
#else
        switch(code) {
        case EAGAIN:
        case ENOSPC:
        case ENOBUFS:
        case EDQUOT:
        case EIO:
            return numformat::writer::temporary_failure;
        default:
            return numformat::writer::permanent_failure;
        }
#endif
    }
};

fd_error_category const& get_fd_error_category()
{
    static fd_error_category cat;
    return cat;
}

}   // anonymous namespace

namespace numformat {

#if defined(_WIN32)
std::size_t fd_writer::write(void const* pbuffer, std::size_t count, std::error_code& ec) noexcept
{
    if(count > std::numeric_limits<DWORD>::max()) {
        ec = make_error_code(writer::permanent_failure);
        return 0;
    }
    DWORD written = 0;
    if(WriteFile(handle_, pbuffer, static_cast<DWORD>(count), &written, NULL)) {
        ec.clear();
        return written;
    } else {
        ec.assign(static_cast<int>(GetLastError()), get_fd_error_category());
        return written;
    }
}

#else
std::size_t fd_writer::write(void const* pbuffer, std::size_t count, std::error_code& ec) noexcept
{
    char const* p = static_cast<char const*>(pbuffer);
    char const* pend = p + count;
    ec.clear();
    while(p != pend) {
        ssize_t written = ::write(fd_, p, pend - p);
        if(written == -1) {
            if(errno != EINTR) {
                ec.assign(errno, get_fd_error_category());
                break;
            }
        } else {
            p += written;
        }
    }
    return p - static_cast<char const*>(pbuffer);
}

#endif

}   // namespace numformat
