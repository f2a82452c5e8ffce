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
#ifndef NUMFORMAT_LOCALE_HPP
#define NUMFORMAT_LOCALE_HPP

#include "bounded_string.hpp"
#include "grouping.hpp"

#include <cstddef>  // size_t
#include <set>
#include <string>
#include <system_error>     // error_code

namespace numformat {

namespace detail {

// One row of the built-in locale table. Symbols are UTF-8.
struct locale_data {
    char const* name;
    char const* decimal;
    grouping_policy grouping;
    char const* infinity;
    char const* minus_sign;
    char const* nan;
    char const* plus_sign;
    char const* separator;
};

// The table is sorted by name.
locale_data const* locale_table();
std::size_t locale_table_size();

}   // namespace detail

// Format description taken from the built-in table of locales, which is
// derived from the Unicode Common Locale Data Repository. Names use the CLDR
// form, e.g. "en", "en-IN" or "de-CH"; "en_IN" is accepted as well. A
// default-constructed locale is "en".
class locale {
public:
    locale();

    // Throws numformat::error with errc::unknown_locale_name if there is no
    // such locale in the table.
    static locale from_name(std::string const& name);
    // On failure ec is set and the "en" locale is returned.
    static locale from_name(std::string const& name, std::error_code& ec);

    static std::set<std::string> available_names();

    char const* name() const noexcept
    {
        return name_;
    }

    decimal_string const& decimal() const noexcept
    {
        return decimal_;
    }

    grouping_policy grouping() const noexcept
    {
        return grouping_;
    }

    infinity_string const& infinity() const noexcept
    {
        return infinity_;
    }

    minus_sign_string const& minus_sign() const noexcept
    {
        return minus_sign_;
    }

    nan_string const& nan() const noexcept
    {
        return nan_;
    }

    plus_sign_string const& plus_sign() const noexcept
    {
        return plus_sign_;
    }

    separator_string const& separator() const noexcept
    {
        return separator_;
    }

private:
    explicit locale(detail::locale_data const& data);

    char const* name_;
    decimal_string decimal_;
    grouping_policy grouping_;
    infinity_string infinity_;
    minus_sign_string minus_sign_;
    nan_string nan_;
    plus_sign_string plus_sign_;
    separator_string separator_;
};

inline bool operator==(locale const& lhs, locale const& rhs)
{
    return std::string(lhs.name()) == rhs.name();
}

inline bool operator!=(locale const& lhs, locale const& rhs)
{
    return !(lhs == rhs);
}

}   // namespace numformat

#endif  // NUMFORMAT_LOCALE_HPP
