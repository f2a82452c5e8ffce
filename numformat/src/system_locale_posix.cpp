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
#include "native_locale.hpp"

#include <numformat/bounded_string.hpp>
#include <numformat/error.hpp>

#include <cstdio>   // FILE, fgets
#include <cstdlib>  // getenv

#include <locale.h>     // newlocale, uselocale, freelocale, localeconv
#include <stdio.h>      // popen, pclose

namespace numformat {
namespace detail {

namespace {

// Makes a locale current for the calling thread only, and releases it again
// when going out of scope.
class scoped_thread_locale {
public:
    explicit scoped_thread_locale(locale_t loc) :
        locale_(loc),
        previous_(uselocale(loc))
    {
    }

    ~scoped_thread_locale()
    {
        uselocale(previous_);
        freelocale(locale_);
    }

private:
    scoped_thread_locale(scoped_thread_locale const&) = delete;
    scoped_thread_locale& operator=(scoped_thread_locale const&) = delete;

    locale_t locale_;
    locale_t previous_;
};

// Same precedence as setlocale(LC_NUMERIC, "").
std::string environment_locale_name()
{
    char const* const variables[] = {"LC_ALL", "LC_NUMERIC", "LANG"};
    for(char const* variable : variables) {
        char const* value = std::getenv(variable);
        if(value && *value)
            return value;
    }
    return "C";
}

}   // anonymous namespace

bool query_native_symbols(char const* name, native_symbols* psymbols,
        std::error_code& ec)
{
    // The minus and plus signs are only available as monetary symbols in
    // struct lconv, hence LC_MONETARY.
    locale_t loc = newlocale(LC_NUMERIC_MASK | LC_MONETARY_MASK,
            name? name : "", static_cast<locale_t>(0));
    if(loc == static_cast<locale_t>(0)) {
        if(name)
            ec = make_error_code(errc::unknown_locale_name);
        else
            ec = make_error_code(errc::provider_unavailable);
        return false;
    }

    std::string grouping;
    {
        scoped_thread_locale current(loc);
        struct lconv const* lc = localeconv();
        psymbols->decimal = lc->decimal_point;
        psymbols->separator = lc->thousands_sep;
        psymbols->minus_sign = lc->negative_sign;
        psymbols->plus_sign = lc->positive_sign;
        grouping = lc->grouping;
    }

    psymbols->name = name? name : environment_locale_name();
    if(psymbols->minus_sign.empty())
        psymbols->minus_sign = minus_sign_kind::fallback();
    psymbols->infinity = infinity_kind::fallback();
    psymbols->nan = nan_kind::fallback();

    if(psymbols->separator.empty()) {
        psymbols->grouping = grouping_policy::posix;
    } else if(!grouping_from_lconv(grouping.c_str(), &psymbols->grouping)) {
        ec = make_error_code(errc::provider_unavailable);
        return false;
    }

    ec.clear();
    return true;
}

std::set<std::string> query_native_locale_names(std::error_code& ec)
{
    std::set<std::string> names;
    FILE* pipe = popen("locale -a", "r");
    if(!pipe) {
        ec = make_error_code(errc::provider_unavailable);
        return names;
    }

    char line[256];
    while(std::fgets(line, sizeof(line), pipe)) {
        std::string name(line);
        while(!name.empty() && (name.back() == '\n' || name.back() == '\r'))
            name.pop_back();
        if(!name.empty())
            names.insert(name);
    }

    if(pclose(pipe) != 0) {
        ec = make_error_code(errc::provider_unavailable);
        return std::set<std::string>();
    }
    ec.clear();
    return names;
}

}   // namespace detail
}   // namespace numformat
