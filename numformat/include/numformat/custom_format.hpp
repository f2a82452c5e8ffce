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
#ifndef NUMFORMAT_CUSTOM_FORMAT_HPP
#define NUMFORMAT_CUSTOM_FORMAT_HPP

#include "bounded_string.hpp"
#include "format.hpp"
#include "grouping.hpp"

#include <string>
#include <system_error>     // error_code

namespace numformat {

class custom_format_builder;

// Format description assembled by the caller through custom_format_builder.
// A default-constructed custom_format uses "." for the decimal point, "," as
// separator, "-" as minus sign, no plus sign, "inf", "NaN" and standard
// grouping.
class custom_format {
public:
    custom_format();

    static custom_format_builder builder();
    custom_format_builder to_builder() const;

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
    friend class custom_format_builder;

    decimal_string decimal_;
    grouping_policy grouping_;
    infinity_string infinity_;
    minus_sign_string minus_sign_;
    nan_string nan_;
    plus_sign_string plus_sign_;
    separator_string separator_;
};

bool operator==(custom_format const& lhs, custom_format const& rhs);
bool operator!=(custom_format const& lhs, custom_format const& rhs);

// Collects candidate symbols without checking them. Everything is validated
// by build(), which either returns a complete custom_format or fails with
// the first problem it finds.
class custom_format_builder {
public:
    custom_format_builder();

    // Start from the symbols of an existing format description.
    template <class Format>
    explicit custom_format_builder(Format const& format) :
        decimal_(format.decimal().str()),
        grouping_(format.grouping()),
        infinity_(format.infinity().str()),
        minus_sign_(format.minus_sign().str()),
        nan_(format.nan().str()),
        plus_sign_(format.plus_sign().str()),
        separator_(format.separator().str())
    {
        static_assert(is_format<Format>::value,
            "Format does not provide the symbols of a format description");
    }

    custom_format_builder& decimal(std::string s);
    custom_format_builder& grouping(grouping_policy policy);
    custom_format_builder& infinity(std::string s);
    custom_format_builder& minus_sign(std::string s);
    custom_format_builder& nan(std::string s);
    custom_format_builder& plus_sign(std::string s);
    custom_format_builder& separator(std::string s);

    // Throws numformat::error.
    custom_format build() const;
    // On failure ec is set and a default custom_format is returned.
    custom_format build(std::error_code& ec) const;

private:
    custom_format build(std::error_code& ec, char const** pproblem) const;

    std::string decimal_;
    grouping_policy grouping_;
    std::string infinity_;
    std::string minus_sign_;
    std::string nan_;
    std::string plus_sign_;
    std::string separator_;
};

}   // namespace numformat

#endif  // NUMFORMAT_CUSTOM_FORMAT_HPP
