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
#ifndef NUMFORMAT_WRITE_FORMATTED_HPP
#define NUMFORMAT_WRITE_FORMATTED_HPP

#include "buffer.hpp"
#include "format.hpp"
#include "writer.hpp"

#include <cstddef>  // size_t
#include <string>
#include <system_error>     // error_code

namespace numformat {

template <class Integer, class Format>
std::string to_formatted_string(Integer value, Format const& format,
        sign_display sign = sign_display::negative_only)
{
    buffer buf;
    buf.write_formatted(value, format, sign);
    return buf.str();
}

// Appends to the end of out.
template <class Integer, class Format>
void write_formatted(std::string& out, Integer value, Format const& format,
        sign_display sign = sign_display::negative_only)
{
    buffer buf;
    buf.write_formatted(value, format, sign);
    out.append(buf.data(), buf.size());
}

// Returns the number of bytes the writer accepted. On a short write ec holds
// the writer's error.
template <class Integer, class Format>
std::size_t write_formatted(writer* pwriter, Integer value,
        Format const& format, sign_display sign, std::error_code& ec)
{
    buffer buf;
    buf.write_formatted(value, format, sign);
    return pwriter->write(buf.data(), buf.size(), ec);
}

template <class Integer, class Format>
std::size_t write_formatted(writer* pwriter, Integer value,
        Format const& format, std::error_code& ec)
{
    return write_formatted(pwriter, value, format,
        sign_display::negative_only, ec);
}

namespace detail {

std::string format_decimal_digits(std::string const& digits,
        grouping_policy grouping, separator_string const& separator,
        minus_sign_string const& minus_sign, plus_sign_string const& plus_sign,
        sign_display sign);

}   // namespace detail

// Groups a decimal number of any length, e.g. one that does not fit in
// unsigned long long. digits is an optional '-' or '+' followed by one or
// more ASCII digits; leading zeros are dropped. A leading '+' does not by
// itself produce a plus sign, only sign_display::always does. Throws
// std::invalid_argument for anything else.
template <class Format>
std::string format_decimal_digits(std::string const& digits,
        Format const& format, sign_display sign = sign_display::negative_only)
{
    static_assert(is_format<Format>::value,
        "Format does not provide the symbols of a format description");
    return detail::format_decimal_digits(digits, format.grouping(),
        format.separator(), format.minus_sign(), format.plus_sign(), sign);
}

}   // namespace numformat

#endif  // NUMFORMAT_WRITE_FORMATTED_HPP
