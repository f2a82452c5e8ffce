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

#include <numformat/error.hpp>

#define NOMINMAX
#include <Windows.h>

namespace numformat {
namespace detail {

namespace {

std::string to_utf8(wchar_t const* s)
{
    int size = WideCharToMultiByte(CP_UTF8, 0, s, -1, NULL, 0, NULL, NULL);
    if(size <= 1)
        return std::string();
    std::string result(static_cast<std::size_t>(size), '\0');
    WideCharToMultiByte(CP_UTF8, 0, s, -1, &result[0], size, NULL, NULL);
    result.resize(static_cast<std::size_t>(size - 1));
    return result;
}

std::wstring to_wide(char const* s)
{
    int size = MultiByteToWideChar(CP_UTF8, 0, s, -1, NULL, 0);
    if(size <= 1)
        return std::wstring();
    std::wstring result(static_cast<std::size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s, -1, &result[0], size);
    result.resize(static_cast<std::size_t>(size - 1));
    return result;
}

bool get_locale_info(wchar_t const* locale_name, LCTYPE type, std::string* pvalue)
{
    // LOCALE_SNAN and LOCALE_SPOSINFINITY are the longest of the values we
    // ask for, and are documented to be well below this.
    wchar_t value[128];
    if(GetLocaleInfoEx(locale_name, type, value, 128) == 0)
        return false;
    *pvalue = to_utf8(value);
    return true;
}

BOOL CALLBACK add_locale_name(LPWSTR name, DWORD, LPARAM param)
{
    auto pnames = reinterpret_cast<std::set<std::string>*>(param);
    std::string utf8_name = to_utf8(name);
    // The invariant locale is reported with an empty name.
    if(!utf8_name.empty())
        pnames->insert(utf8_name);
    return TRUE;
}

}   // anonymous namespace

bool query_native_symbols(char const* name, native_symbols* psymbols,
        std::error_code& ec)
{
    std::wstring wide_name;
    wchar_t const* locale_name;
    if(name) {
        wide_name = to_wide(name);
        if(!IsValidLocaleName(wide_name.c_str())) {
            ec = make_error_code(errc::unknown_locale_name);
            return false;
        }
        locale_name = wide_name.c_str();
        psymbols->name = name;
    } else {
        wchar_t user_default[LOCALE_NAME_MAX_LENGTH];
        if(GetUserDefaultLocaleName(user_default, LOCALE_NAME_MAX_LENGTH) == 0) {
            ec = make_error_code(errc::provider_unavailable);
            return false;
        }
        locale_name = LOCALE_NAME_USER_DEFAULT;
        psymbols->name = to_utf8(user_default);
    }

    std::string grouping;
    if(!get_locale_info(locale_name, LOCALE_SDECIMAL, &psymbols->decimal)
        || !get_locale_info(locale_name, LOCALE_STHOUSAND, &psymbols->separator)
        || !get_locale_info(locale_name, LOCALE_SGROUPING, &grouping)
        || !get_locale_info(locale_name, LOCALE_SNEGATIVESIGN, &psymbols->minus_sign)
        || !get_locale_info(locale_name, LOCALE_SPOSITIVESIGN, &psymbols->plus_sign)
        || !get_locale_info(locale_name, LOCALE_SPOSINFINITY, &psymbols->infinity)
        || !get_locale_info(locale_name, LOCALE_SNAN, &psymbols->nan))
    {
        ec = make_error_code(errc::provider_unavailable);
        return false;
    }

    if(psymbols->separator.empty()) {
        psymbols->grouping = grouping_policy::posix;
    } else if(!grouping_from_win32(grouping.c_str(), &psymbols->grouping)) {
        ec = make_error_code(errc::provider_unavailable);
        return false;
    }

    ec.clear();
    return true;
}

std::set<std::string> query_native_locale_names(std::error_code& ec)
{
    std::set<std::string> names;
    if(!EnumSystemLocalesEx(&add_locale_name, LOCALE_ALL,
            reinterpret_cast<LPARAM>(&names), NULL))
    {
        ec = make_error_code(errc::provider_unavailable);
        return std::set<std::string>();
    }
    ec.clear();
    return names;
}

}   // namespace detail
}   // namespace numformat
