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
#include <numformat/custom_format.hpp>

#include <cstring>  // memcmp
#include <utility>  // move

namespace numformat {

namespace {

template <class Kind1, class Kind2>
bool same_text(bounded_string<Kind1> const& lhs, bounded_string<Kind2> const& rhs)
{
    return lhs.size() == rhs.size()
        && std::memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}   // anonymous namespace

custom_format::custom_format() :
    grouping_(grouping_policy::standard)
{
}

custom_format_builder custom_format::builder()
{
    return custom_format_builder();
}

custom_format_builder custom_format::to_builder() const
{
    return custom_format_builder(*this);
}

bool operator==(custom_format const& lhs, custom_format const& rhs)
{
    return lhs.decimal() == rhs.decimal()
        && lhs.grouping() == rhs.grouping()
        && lhs.infinity() == rhs.infinity()
        && lhs.minus_sign() == rhs.minus_sign()
        && lhs.nan() == rhs.nan()
        && lhs.plus_sign() == rhs.plus_sign()
        && lhs.separator() == rhs.separator();
}

bool operator!=(custom_format const& lhs, custom_format const& rhs)
{
    return !(lhs == rhs);
}

custom_format_builder::custom_format_builder() :
    custom_format_builder(custom_format())
{
}

custom_format_builder& custom_format_builder::decimal(std::string s)
{
    decimal_ = std::move(s);
    return *this;
}

custom_format_builder& custom_format_builder::grouping(grouping_policy policy)
{
    grouping_ = policy;
    return *this;
}

custom_format_builder& custom_format_builder::infinity(std::string s)
{
    infinity_ = std::move(s);
    return *this;
}

custom_format_builder& custom_format_builder::minus_sign(std::string s)
{
    minus_sign_ = std::move(s);
    return *this;
}

custom_format_builder& custom_format_builder::nan(std::string s)
{
    nan_ = std::move(s);
    return *this;
}

custom_format_builder& custom_format_builder::plus_sign(std::string s)
{
    plus_sign_ = std::move(s);
    return *this;
}

custom_format_builder& custom_format_builder::separator(std::string s)
{
    separator_ = std::move(s);
    return *this;
}

custom_format custom_format_builder::build() const
{
    std::error_code ec;
    char const* problem = nullptr;
    custom_format format = build(ec, &problem);
    if(ec)
        throw error(ec, problem);
    return format;
}

custom_format custom_format_builder::build(std::error_code& ec) const
{
    char const* problem = nullptr;
    return build(ec, &problem);
}

custom_format custom_format_builder::build(std::error_code& ec,
        char const** pproblem) const
{
    custom_format format;

    format.decimal_ = decimal_string::create(decimal_, ec);
    if(ec) {
        *pproblem = "invalid decimal symbol";
        return custom_format();
    }
    format.infinity_ = infinity_string::create(infinity_, ec);
    if(ec) {
        *pproblem = "invalid infinity symbol";
        return custom_format();
    }
    format.minus_sign_ = minus_sign_string::create(minus_sign_, ec);
    if(ec) {
        *pproblem = "invalid minus sign symbol";
        return custom_format();
    }
    format.nan_ = nan_string::create(nan_, ec);
    if(ec) {
        *pproblem = "invalid nan symbol";
        return custom_format();
    }
    format.plus_sign_ = plus_sign_string::create(plus_sign_, ec);
    if(ec) {
        *pproblem = "invalid plus sign symbol";
        return custom_format();
    }
    format.separator_ = separator_string::create(separator_, ec);
    if(ec) {
        *pproblem = "invalid separator symbol";
        return custom_format();
    }
    format.grouping_ = grouping_;

    // Output like "1.000.000" must read back unambiguously, so the separator
    // may not double as the decimal point, and positive and negative
    // numbers must look different.
    if(!format.separator_.empty() && same_text(format.separator_, format.decimal_)) {
        ec = make_error_code(errc::invalid_combination);
        *pproblem = "separator is the same as the decimal symbol";
        return custom_format();
    }
    if(same_text(format.plus_sign_, format.minus_sign_)) {
        ec = make_error_code(errc::invalid_combination);
        *pproblem = "plus sign is the same as the minus sign";
        return custom_format();
    }

    ec.clear();
    return format;
}

}   // namespace numformat
