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
#ifndef NUMFORMAT_NATIVE_LOCALE_HPP
#define NUMFORMAT_NATIVE_LOCALE_HPP

#include <numformat/grouping.hpp>

#include <set>
#include <string>
#include <system_error>     // error_code

namespace numformat {
namespace detail {

// Locale symbols as reported by the operating system, before validation.
struct native_symbols {
    native_symbols() :
        grouping(grouping_policy::standard)
    {
    }

    std::string name;
    std::string decimal;
    grouping_policy grouping;
    std::string infinity;
    std::string minus_sign;
    std::string nan;
    std::string plus_sign;
    std::string separator;
};

// These are implemented once per platform, in system_locale_posix.cpp and
// system_locale_win32.cpp. A null name selects the locale configured by the
// environment.
bool query_native_symbols(char const* name, native_symbols* psymbols,
        std::error_code& ec);
std::set<std::string> query_native_locale_names(std::error_code& ec);

}   // namespace detail
}   // namespace numformat

#endif  // NUMFORMAT_NATIVE_LOCALE_HPP
