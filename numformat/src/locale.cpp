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
#include <numformat/locale.hpp>

#include <algorithm>    // lower_bound, replace
#include <cstring>      // strcmp

namespace numformat {

namespace {

using detail::locale_data;

grouping_policy const STANDARD = grouping_policy::standard;
grouping_policy const INDIAN = grouping_policy::indian;

char const NBSP[] = "\xc2\xa0";     // U+00A0 NO-BREAK SPACE
char const NNBSP[] = "\xe2\x80\xaf";    // U+202F NARROW NO-BREAK SPACE
char const RSQUO[] = "\xe2\x80\x99";    // U+2019 RIGHT SINGLE QUOTATION MARK
char const MINUS[] = "\xe2\x88\x92";    // U+2212 MINUS SIGN
char const INF[] = "\xe2\x88\x9e";  // U+221E INFINITY
char const LRM_MINUS[] = "\xe2\x80\x8e-";   // U+200E LEFT-TO-RIGHT MARK, '-'
char const LRM_PLUS[] = "\xe2\x80\x8e+";

locale_data const LOCALES[] = {
//   name     dec  grouping  inf  minus      nan          plus      separator
    {"af",    ",", STANDARD, INF, "-",       "NaN",       "+",      NBSP},
    {"bg",    ",", STANDARD, INF, "-",       "NaN",       "+",      NBSP},
    {"ca",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"cs",    ",", STANDARD, INF, "-",       "NaN",       "+",      NBSP},
    {"da",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"de",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"de-AT", ",", STANDARD, INF, "-",       "NaN",       "+",      NBSP},
    {"de-CH", ".", STANDARD, INF, "-",       "NaN",       "+",      RSQUO},
    {"el",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"en",    ".", STANDARD, INF, "-",       "NaN",       "+",      ","},
    {"en-CH", ".", STANDARD, INF, "-",       "NaN",       "+",      RSQUO},
    {"en-IN", ".", INDIAN,   INF, "-",       "NaN",       "+",      ","},
    {"es",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"es-MX", ".", STANDARD, INF, "-",       "NaN",       "+",      ","},
    {"et",    ",", STANDARD, INF, MINUS,     "NaN",       "+",      NBSP},
    {"fi",    ",", STANDARD, INF, MINUS,     "ep\xc3\xa4" "luku", "+", NBSP},
    {"fr",    ",", STANDARD, INF, "-",       "NaN",       "+",      NNBSP},
    {"gsw",   ".", STANDARD, INF, MINUS,     "NaN",       "+",      RSQUO},
    {"gu",    ".", INDIAN,   INF, "-",       "NaN",       "+",      ","},
    {"he",    ".", STANDARD, INF, LRM_MINUS, "NaN",       LRM_PLUS, ","},
    {"hi",    ".", INDIAN,   INF, "-",       "NaN",       "+",      ","},
    {"hr",    ",", STANDARD, INF, MINUS,     "NaN",       "+",      "."},
    {"hu",    ",", STANDARD, INF, "-",       "NaN",       "+",      NBSP},
    {"id",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"it",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"ja",    ".", STANDARD, INF, "-",       "NaN",       "+",      ","},
    {"ko",    ".", STANDARD, INF, "-",       "NaN",       "+",      ","},
    {"lt",    ",", STANDARD, INF, MINUS,     "NaN",       "+",      NBSP},
    {"lv",    ",", STANDARD, INF, "-",       "NS",        "+",      NBSP},
    {"nb",    ",", STANDARD, INF, MINUS,     "NaN",       "+",      NBSP},
    {"nl",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"pl",    ",", STANDARD, INF, "-",       "NaN",       "+",      NBSP},
    {"pt",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"pt-PT", ",", STANDARD, INF, "-",       "NaN",       "+",      NBSP},
    {"rm",    ".", STANDARD, INF, MINUS,     "NaN",       "+",      RSQUO},
    {"ro",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"ru",    ",", STANDARD, INF, "-",
        "\xd0\xbd\xd0\xb5\xc2\xa0\xd1\x87\xd0\xb8\xd1\x81\xd0\xbb\xd0\xbe",
                                                          "+",      NBSP},
    {"sk",    ",", STANDARD, INF, "-",       "NaN",       "+",      NBSP},
    {"sl",    ",", STANDARD, INF, MINUS,     "NaN",       "+",      "."},
    {"sv",    ",", STANDARD, INF, MINUS,     "NaN",       "+",      NBSP},
    {"ta",    ".", INDIAN,   INF, "-",       "NaN",       "+",      ","},
    {"te",    ".", INDIAN,   INF, "-",       "NaN",       "+",      ","},
    {"th",    ".", STANDARD, INF, "-",       "NaN",       "+",      ","},
    {"tr",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"uk",    ",", STANDARD, INF, "-",       "NaN",       "+",      NBSP},
    {"vi",    ",", STANDARD, INF, "-",       "NaN",       "+",      "."},
    {"zh",    ".", STANDARD, INF, "-",       "NaN",       "+",      ","},
};

std::size_t const LOCALE_COUNT = sizeof(LOCALES)/sizeof(LOCALES[0]);

locale_data const* find_locale(std::string name)
{
    std::replace(name.begin(), name.end(), '_', '-');
    locale_data const* pend = LOCALES + LOCALE_COUNT;
    locale_data const* p = std::lower_bound(LOCALES, pend, name.c_str(),
        [](locale_data const& entry, char const* key)
        {
            return std::strcmp(entry.name, key) < 0;
        });
    if(p == pend || std::strcmp(p->name, name.c_str()) != 0)
        return nullptr;
    return p;
}

}   // anonymous namespace

namespace detail {

locale_data const* locale_table()
{
    return LOCALES;
}

std::size_t locale_table_size()
{
    return LOCALE_COUNT;
}

}   // namespace detail

locale::locale() :
    locale(*find_locale("en"))
{
}

locale::locale(detail::locale_data const& data) :
    name_(data.name),
    decimal_(data.decimal),
    grouping_(data.grouping),
    infinity_(data.infinity),
    minus_sign_(data.minus_sign),
    nan_(data.nan),
    plus_sign_(data.plus_sign),
    separator_(data.separator)
{
}

locale locale::from_name(std::string const& name)
{
    std::error_code ec;
    locale loc = from_name(name, ec);
    if(ec)
        throw error(ec, "no locale named \"" + name + "\"");
    return loc;
}

locale locale::from_name(std::string const& name, std::error_code& ec)
{
    locale_data const* pdata = find_locale(name);
    if(!pdata) {
        ec = make_error_code(errc::unknown_locale_name);
        return locale();
    }
    ec.clear();
    return locale(*pdata);
}

std::set<std::string> locale::available_names()
{
    std::set<std::string> names;
    for(std::size_t i=0; i!=LOCALE_COUNT; ++i)
        names.insert(LOCALES[i].name);
    return names;
}

}   // namespace numformat
