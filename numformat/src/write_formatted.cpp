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
#include <numformat/write_formatted.hpp>

#include <stdexcept>    // invalid_argument

namespace numformat {
namespace detail {

std::string format_decimal_digits(std::string const& digits,
        grouping_policy grouping, separator_string const& separator,
        minus_sign_string const& minus_sign, plus_sign_string const& plus_sign,
        sign_display sign)
{
    std::size_t first = 0;
    bool negative = false;
    if(!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
        negative = digits[0] == '-';
        ++first;
    }

    if(first == digits.size())
        throw std::invalid_argument("not a decimal number: \"" + digits + "\"");
    for(std::size_t i=first; i!=digits.size(); ++i) {
        if(digits[i] < '0' || digits[i] > '9')
            throw std::invalid_argument("not a decimal number: \"" + digits + "\"");
    }

    while(first + 1 != digits.size() && digits[first] == '0')
        ++first;
    if(digits[first] == '0')
        return "0";

    unsigned const digit_count = static_cast<unsigned>(digits.size() - first);
    std::string result;
    result.reserve(minus_sign.size() + digit_count
        + separator_count(grouping, digit_count)*separator.size());

    if(negative)
        result.append(minus_sign.data(), minus_sign.size());
    else if(sign == sign_display::always)
        result.append(plus_sign.data(), plus_sign.size());

    for(unsigned i=0; i!=digit_count; ++i) {
        result += digits[first + i];
        unsigned remaining = digit_count - 1 - i;
        if(remaining != 0 && is_group_boundary(grouping, remaining))
            result.append(separator.data(), separator.size());
    }
    return result;
}

}   // namespace detail
}   // namespace numformat
