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
#include <numformat/buffer.hpp>

#include <type_traits>  // is_signed, is_unsigned, enable_if
#include <cstring>      // memcpy

namespace numformat {

constexpr std::size_t buffer::capacity;

static_assert(std::numeric_limits<unsigned long long>::digits10 + 1
        >= std::numeric_limits<long long>::digits10 + 1,
    "buffer capacity assumes unsigned long long has the most digits");

namespace {

// Writes the digits of a non-zero value to the left of str[pos], least
// significant digit first, inserting the separator at every group boundary.
// Returns the position of the most significant digit.
//
// The remainders of a negative value are zero or negative, so the digits are
// taken from the magnitude of each remainder rather than from the negated
// value. Negating the minimum value of a signed type would overflow.
template <typename Integer>
std::size_t write_grouped_digits(char* str, std::size_t pos, Integer value,
        grouping_policy grouping, separator_string const& separator)
{
    unsigned digits = 0;
    while(value != 0) {
        if(digits != 0 && detail::is_group_boundary(grouping, digits)) {
            pos -= separator.size();
            std::memcpy(str + pos, separator.data(), separator.size());
        }
        int digit = static_cast<int>(value % 10);
        value /= 10;
        if(digit < 0)
            digit = -digit;
        str[--pos] = static_cast<char>('0' + digit);
        ++digits;
    }
    return pos;
}

template <typename Integer>
std::size_t format_integer_generic(char* str, std::size_t pos, bool negative,
        Integer value, grouping_policy grouping,
        separator_string const& separator, minus_sign_string const& minus_sign,
        plus_sign_string const& plus_sign, sign_display sign)
{
    if(value == 0) {
        str[--pos] = '0';
        return pos;
    }

    pos = write_grouped_digits(str, pos, value, grouping, separator);
    if(negative) {
        pos -= minus_sign.size();
        std::memcpy(str + pos, minus_sign.data(), minus_sign.size());
    } else if(sign == sign_display::always) {
        pos -= plus_sign.size();
        std::memcpy(str + pos, plus_sign.data(), plus_sign.size());
    }
    return pos;
}

template <typename Integer>
typename std::enable_if<std::is_signed<Integer>::value, std::size_t>::type
format_integer(char* str, std::size_t pos, Integer value,
        grouping_policy grouping, separator_string const& separator,
        minus_sign_string const& minus_sign, plus_sign_string const& plus_sign,
        sign_display sign)
{
    return format_integer_generic(str, pos, value < 0, value, grouping,
            separator, minus_sign, plus_sign, sign);
}

template <typename Integer>
typename std::enable_if<std::is_unsigned<Integer>::value, std::size_t>::type
format_integer(char* str, std::size_t pos, Integer value,
        grouping_policy grouping, separator_string const& separator,
        minus_sign_string const& minus_sign, plus_sign_string const& plus_sign,
        sign_display sign)
{
    return format_integer_generic(str, pos, false, value, grouping,
            separator, minus_sign, plus_sign, sign);
}

}   // anonymous namespace

buffer::buffer() noexcept
{
    reset();
}

void buffer::reset() noexcept
{
    pos_ = capacity;
    data_[capacity] = '\0';
}

void buffer::write_integer(int value, grouping_policy grouping,
    separator_string const& separator, minus_sign_string const& minus_sign,
    plus_sign_string const& plus_sign, sign_display sign) noexcept
{
    pos_ = format_integer(data_, pos_, value, grouping, separator, minus_sign,
            plus_sign, sign);
}

void buffer::write_integer(unsigned int value, grouping_policy grouping,
    separator_string const& separator, minus_sign_string const& minus_sign,
    plus_sign_string const& plus_sign, sign_display sign) noexcept
{
    pos_ = format_integer(data_, pos_, value, grouping, separator, minus_sign,
            plus_sign, sign);
}

void buffer::write_integer(long value, grouping_policy grouping,
    separator_string const& separator, minus_sign_string const& minus_sign,
    plus_sign_string const& plus_sign, sign_display sign) noexcept
{
    pos_ = format_integer(data_, pos_, value, grouping, separator, minus_sign,
            plus_sign, sign);
}

void buffer::write_integer(unsigned long value, grouping_policy grouping,
    separator_string const& separator, minus_sign_string const& minus_sign,
    plus_sign_string const& plus_sign, sign_display sign) noexcept
{
    pos_ = format_integer(data_, pos_, value, grouping, separator, minus_sign,
            plus_sign, sign);
}

void buffer::write_integer(long long value, grouping_policy grouping,
    separator_string const& separator, minus_sign_string const& minus_sign,
    plus_sign_string const& plus_sign, sign_display sign) noexcept
{
    pos_ = format_integer(data_, pos_, value, grouping, separator, minus_sign,
            plus_sign, sign);
}

void buffer::write_integer(unsigned long long value, grouping_policy grouping,
    separator_string const& separator, minus_sign_string const& minus_sign,
    plus_sign_string const& plus_sign, sign_display sign) noexcept
{
    pos_ = format_integer(data_, pos_, value, grouping, separator, minus_sign,
            plus_sign, sign);
}

}   // namespace numformat
