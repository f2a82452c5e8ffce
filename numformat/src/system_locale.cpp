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
#include <numformat/system_locale.hpp>

#include "native_locale.hpp"

namespace numformat {

system_locale::system_locale() :
    grouping_(grouping_policy::standard)
{
}

system_locale system_locale::load(char const* name, std::error_code& ec)
{
    detail::native_symbols symbols;
    if(!detail::query_native_symbols(name, &symbols, ec))
        return system_locale();

    // The OS has no notion of which symbols are acceptable to us, so
    // everything it reports goes through the same validation as symbols from
    // any other source.
    system_locale loc;
    loc.name_ = symbols.name;
    loc.grouping_ = symbols.grouping;
    loc.decimal_ = decimal_string::create(symbols.decimal, ec);
    if(ec)
        return system_locale();
    loc.infinity_ = infinity_string::create(symbols.infinity, ec);
    if(ec)
        return system_locale();
    loc.minus_sign_ = minus_sign_string::create(symbols.minus_sign, ec);
    if(ec)
        return system_locale();
    loc.nan_ = nan_string::create(symbols.nan, ec);
    if(ec)
        return system_locale();
    loc.plus_sign_ = plus_sign_string::create(symbols.plus_sign, ec);
    if(ec)
        return system_locale();
    loc.separator_ = separator_string::create(symbols.separator, ec);
    if(ec)
        return system_locale();
    return loc;
}

system_locale system_locale::default_locale()
{
    std::error_code ec;
    system_locale loc = load(nullptr, ec);
    if(ec)
        throw error(ec, "unable to load the system locale");
    return loc;
}

system_locale system_locale::default_locale(std::error_code& ec)
{
    return load(nullptr, ec);
}

system_locale system_locale::from_name(std::string const& name)
{
    std::error_code ec;
    system_locale loc = load(name.c_str(), ec);
    if(ec)
        throw error(ec, "unable to load system locale \"" + name + "\"");
    return loc;
}

system_locale system_locale::from_name(std::string const& name,
        std::error_code& ec)
{
    return load(name.c_str(), ec);
}

void system_locale::set_infinity(std::string const& s)
{
    infinity_ = infinity_string(s);
}

void system_locale::set_infinity(std::string const& s, std::error_code& ec)
{
    infinity_string infinity = infinity_string::create(s, ec);
    if(!ec)
        infinity_ = infinity;
}

void system_locale::set_nan(std::string const& s)
{
    nan_ = nan_string(s);
}

void system_locale::set_nan(std::string const& s, std::error_code& ec)
{
    nan_string nan = nan_string::create(s, ec);
    if(!ec)
        nan_ = nan;
}

std::set<std::string> system_locale::available_names()
{
    std::error_code ec;
    std::set<std::string> names = detail::query_native_locale_names(ec);
    if(ec)
        throw error(ec, "unable to list system locales");
    return names;
}

std::set<std::string> system_locale::available_names(std::error_code& ec)
{
    return detail::query_native_locale_names(ec);
}

}   // namespace numformat
