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
#include "unit_test.hpp"

#include <numformat/system_locale.hpp>
#include <numformat/write_formatted.hpp>

#include <string>

namespace numformat {

class system_locale_suite {
public:
    void c_locale()
    {
#if defined(_WIN32)
        // Windows has no "C" locale in its locale database.
        system_locale loc = system_locale::from_name("en-US");
        TEST(loc.decimal() == ".");
        TEST(loc.separator() == ",");
        TEST(loc.grouping() == grouping_policy::standard);
        TEST(to_formatted_string(-1000000, loc) == "-1,000,000");
#else
        system_locale loc = system_locale::from_name("C");
        TEST(loc.name() == "C");
        TEST(loc.decimal() == ".");
        TEST(loc.separator().empty());
        TEST(loc.grouping() == grouping_policy::posix);
        TEST(loc.minus_sign() == "-");
        TEST(loc.infinity() == "inf");
        TEST(loc.nan() == "NaN");
        TEST(to_formatted_string(-1000000, loc) == "-1000000");

        system_locale posix = system_locale::from_name("POSIX");
        TEST(posix.grouping() == grouping_policy::posix);
#endif
    }

    void special_symbols()
    {
#if defined(_WIN32)
        system_locale loc = system_locale::from_name("en-US");
#else
        system_locale loc = system_locale::from_name("C");
#endif
        loc.set_infinity("\xe2\x88\x9e");     // U+221E INFINITY
        loc.set_nan("not a number");
        TEST(loc.infinity() == "\xe2\x88\x9e");
        TEST(loc.nan() == "not a number");

        buffer buf;
        TEST(buf.write_infinity(true, loc) == std::string("-\xe2\x88\x9e"));
        TEST(buf.write_nan(loc) == std::string("not a number"));

        std::error_code ec;
        loc.set_nan("", ec);
        TEST(ec == errc::contains_forbidden_character);
        TEST(loc.nan() == "not a number");
        loc.set_infinity(std::string(infinity_string::max_size + 1, 'i'), ec);
        TEST(ec == errc::exceeds_maximum_length);
        TEST(loc.infinity() == "\xe2\x88\x9e");
        TEST_THROWS(loc.set_nan(""), error);

        loc.set_infinity("1/0", ec);
        TEST(!ec);
        TEST(loc.infinity() == "1/0");
    }

    void unknown_name()
    {
        std::error_code ec;
        system_locale::from_name("no_such_locale.UTF-99", ec);
        TEST(ec == errc::unknown_locale_name);
        TEST_THROWS(system_locale::from_name("no_such_locale.UTF-99"), error);
    }

    void default_locale()
    {
        // What the environment selects is outside our control, but the
        // result must either be usable or a provider error.
        std::error_code ec;
        system_locale loc = system_locale::default_locale(ec);
        if(ec) {
            TEST(ec == errc::provider_unavailable
                || ec == errc::contains_forbidden_character
                || ec == errc::exceeds_maximum_length);
        } else {
            TEST(!loc.name().empty());
            TEST(to_formatted_string(0, loc) == "0");
        }
    }

    void available_names()
    {
        std::error_code ec;
        std::set<std::string> names = system_locale::available_names(ec);
        if(ec) {
            TEST(ec == errc::provider_unavailable);
            return;
        }
#if !defined(_WIN32)
        TEST(names.count("C") == 1 || names.count("POSIX") == 1);
#else
        TEST(!names.empty());
#endif
    }
};

unit_test::suite<system_locale_suite> tests = {
    TESTCASE(system_locale_suite::c_locale),
    TESTCASE(system_locale_suite::special_symbols),
    TESTCASE(system_locale_suite::unknown_name),
    TESTCASE(system_locale_suite::default_locale),
    TESTCASE(system_locale_suite::available_names)
};

}   // namespace numformat

UNIT_TEST_MAIN();
