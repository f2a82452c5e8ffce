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
#ifndef NUMFORMAT_BUFFER_HPP
#define NUMFORMAT_BUFFER_HPP

#include "bounded_string.hpp"
#include "format.hpp"
#include "grouping.hpp"

#include <cstddef>  // size_t
#include <cstring>  // memcpy
#include <limits>   // numeric_limits
#include <string>
#include <type_traits>  // is_integral, is_same

namespace numformat {

// Whether non-negative values get a plus sign. Zero is never signed.
enum class sign_display
{
    negative_only,
    always
};

namespace detail {

constexpr std::size_t max_of(std::size_t a, std::size_t b)
{
    return a > b? a : b;
}

// unsigned long long is the widest type accepted by buffer.
constexpr std::size_t max_integer_digits =
    std::numeric_limits<unsigned long long>::digits10 + 1;

constexpr std::size_t max_integer_separators = max_of(
    separator_count(grouping_policy::standard, max_integer_digits),
    separator_count(grouping_policy::indian, max_integer_digits));

constexpr std::size_t max_sign_size =
    max_of(minus_sign_string::max_size, plus_sign_string::max_size);

constexpr std::size_t max_integer_size = max_integer_digits
    + max_integer_separators*separator_string::max_size
    + max_sign_size;

constexpr std::size_t max_special_size = max_of(
    minus_sign_string::max_size + infinity_string::max_size,
    nan_string::max_size);

}   // namespace detail

// Fixed-size storage for one formatted number. Output is produced from the
// end of the storage towards the start, so no reversal or shifting is needed
// and the result is always NUL terminated. The capacity covers every integer
// type with every possible format description, which is why writing can
// never fail.
//
// The pointer returned by the write functions, and by c_str(), stays valid
// until the next write or reset() on the same buffer.
class buffer {
public:
    static constexpr std::size_t capacity =
        detail::max_of(detail::max_integer_size, detail::max_special_size);

    buffer() noexcept;

    void reset() noexcept;

    template <class Integer, class Format>
    char const* write_formatted(Integer value, Format const& format,
            sign_display sign = sign_display::negative_only)
    {
        static_assert(std::is_integral<Integer>::value
                && !std::is_same<Integer, bool>::value,
            "buffer::write_formatted requires an integer type");
        static_assert(is_format<Format>::value,
            "Format does not provide the symbols of a format description");
        reset();
        write_integer(value, format.grouping(), format.separator(),
            format.minus_sign(), format.plus_sign(), sign);
        return c_str();
    }

    template <class Format>
    char const* write_infinity(bool negative, Format const& format)
    {
        static_assert(is_format<Format>::value,
            "Format does not provide the symbols of a format description");
        reset();
        prepend(format.infinity());
        if(negative)
            prepend(format.minus_sign());
        return c_str();
    }

    template <class Format>
    char const* write_nan(Format const& format)
    {
        static_assert(is_format<Format>::value,
            "Format does not provide the symbols of a format description");
        reset();
        prepend(format.nan());
        return c_str();
    }

    char const* c_str() const noexcept
    {
        return data_ + pos_;
    }

    char const* data() const noexcept
    {
        return data_ + pos_;
    }

    std::size_t size() const noexcept
    {
        return capacity - pos_;
    }

    bool empty() const noexcept
    {
        return pos_ == capacity;
    }

    char const* begin() const noexcept
    {
        return data_ + pos_;
    }

    char const* end() const noexcept
    {
        return data_ + capacity;
    }

    std::string str() const
    {
        return std::string(data(), size());
    }

private:
    template <class Kind>
    void prepend(bounded_string<Kind> const& s) noexcept
    {
        pos_ -= s.size();
        std::memcpy(data_ + pos_, s.data(), s.size());
    }

    void write_integer(int value, grouping_policy grouping,
        separator_string const& separator, minus_sign_string const& minus_sign,
        plus_sign_string const& plus_sign, sign_display sign) noexcept;
    void write_integer(unsigned int value, grouping_policy grouping,
        separator_string const& separator, minus_sign_string const& minus_sign,
        plus_sign_string const& plus_sign, sign_display sign) noexcept;
    void write_integer(long value, grouping_policy grouping,
        separator_string const& separator, minus_sign_string const& minus_sign,
        plus_sign_string const& plus_sign, sign_display sign) noexcept;
    void write_integer(unsigned long value, grouping_policy grouping,
        separator_string const& separator, minus_sign_string const& minus_sign,
        plus_sign_string const& plus_sign, sign_display sign) noexcept;
    void write_integer(long long value, grouping_policy grouping,
        separator_string const& separator, minus_sign_string const& minus_sign,
        plus_sign_string const& plus_sign, sign_display sign) noexcept;
    void write_integer(unsigned long long value, grouping_policy grouping,
        separator_string const& separator, minus_sign_string const& minus_sign,
        plus_sign_string const& plus_sign, sign_display sign) noexcept;

    char data_[capacity + 1];
    std::size_t pos_;
};

}   // namespace numformat

#endif  // NUMFORMAT_BUFFER_HPP
