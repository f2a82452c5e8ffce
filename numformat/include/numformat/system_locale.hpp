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
#ifndef NUMFORMAT_SYSTEM_LOCALE_HPP
#define NUMFORMAT_SYSTEM_LOCALE_HPP

#include "bounded_string.hpp"
#include "grouping.hpp"

#include <set>
#include <string>
#include <system_error>     // error_code

namespace numformat {

// Format description read from the operating system's locale database. On
// POSIX systems this uses newlocale() and localeconv(); on Windows it uses
// GetLocaleInfoEx(). Which one is compiled is decided by the build.
//
// Querying the OS may block, e.g. while locale files are loaded from disk.
// Callers that format on a latency-sensitive path should query once and keep
// the result. Apart from set_infinity() and set_nan(), which are meant to be
// called before the locale is put to use, a system_locale never changes and
// can be shared between threads.
class system_locale {
public:
    // The locale selected by the environment (LC_ALL, LC_NUMERIC and LANG on
    // POSIX, the user default locale on Windows). Throws numformat::error
    // with errc::provider_unavailable if it can not be loaded.
    static system_locale default_locale();
    static system_locale default_locale(std::error_code& ec);

    // Throws numformat::error with errc::unknown_locale_name if the system
    // has no locale by that name.
    static system_locale from_name(std::string const& name);
    static system_locale from_name(std::string const& name, std::error_code& ec);

    static std::set<std::string> available_names();
    static std::set<std::string> available_names(std::error_code& ec);

    std::string const& name() const noexcept
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

    // POSIX locales carry no infinity or NaN symbol, so "inf" and "NaN" are
    // used until replaced here. On failure the current symbol is kept. The
    // first form throws numformat::error.
    void set_infinity(std::string const& s);
    void set_infinity(std::string const& s, std::error_code& ec);
    void set_nan(std::string const& s);
    void set_nan(std::string const& s, std::error_code& ec);

private:
    system_locale();

    // A null name selects the locale configured by the environment.
    static system_locale load(char const* name, std::error_code& ec);

    std::string name_;
    decimal_string decimal_;
    grouping_policy grouping_;
    infinity_string infinity_;
    minus_sign_string minus_sign_;
    nan_string nan_;
    plus_sign_string plus_sign_;
    separator_string separator_;
};

}   // namespace numformat

#endif  // NUMFORMAT_SYSTEM_LOCALE_HPP
