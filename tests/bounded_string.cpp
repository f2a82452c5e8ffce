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

#include <numformat/bounded_string.hpp>

#include <string>

namespace numformat {

class bounded_string_suite {
public:
    void default_is_fallback()
    {
        TEST(decimal_string() == ".");
        TEST(separator_string() == ",");
        TEST(minus_sign_string() == "-");
        TEST(plus_sign_string().empty());
        TEST(infinity_string() == "inf");
        TEST(nan_string() == "NaN");
    }

    void accepts_multibyte()
    {
        std::error_code ec;
        // U+202F NARROW NO-BREAK SPACE
        separator_string s = separator_string::create(std::string("\xe2\x80\xaf"), ec);
        TEST(!ec);
        TEST(s.size() == 3);
        TEST(s == "\xe2\x80\xaf");
        TEST(s.c_str()[3] == '\0');
    }

    void accepts_maximum_length()
    {
        std::string s(minus_sign_string::max_size, '~');
        std::error_code ec;
        minus_sign_string m = minus_sign_string::create(s, ec);
        TEST(!ec);
        TEST(m.str() == s);
    }

    void rejects_too_long()
    {
        std::string s(separator_string::max_size + 1, ' ');
        std::error_code ec;
        separator_string sep = separator_string::create(s, ec);
        TEST(ec == errc::exceeds_maximum_length);
        TEST(sep == ",");

        std::string inf(infinity_string::max_size + 1, 'x');
        infinity_string::create(inf, ec);
        TEST(ec == errc::exceeds_maximum_length);
    }

    void rejects_digits()
    {
        std::error_code ec;
        separator_string::create(std::string("1"), ec);
        TEST(ec == errc::contains_forbidden_character);
        decimal_string::create(std::string(".5"), ec);
        TEST(ec == errc::contains_forbidden_character);
        minus_sign_string::create(std::string("-0"), ec);
        TEST(ec == errc::contains_forbidden_character);
        plus_sign_string::create(std::string("9"), ec);
        TEST(ec == errc::contains_forbidden_character);
    }

    void digits_allowed_in_special_values()
    {
        std::error_code ec;
        infinity_string inf = infinity_string::create(std::string("1/0"), ec);
        TEST(!ec);
        TEST(inf == "1/0");
        nan_string nan = nan_string::create(std::string("0/0"), ec);
        TEST(!ec);
        TEST(nan == "0/0");
    }

    void empty_where_required()
    {
        std::error_code ec;
        decimal_string::create(std::string(), ec);
        TEST(ec == errc::contains_forbidden_character);
        minus_sign_string::create(std::string(), ec);
        TEST(ec == errc::contains_forbidden_character);
        infinity_string::create(std::string(), ec);
        TEST(ec == errc::contains_forbidden_character);
        nan_string::create(std::string(), ec);
        TEST(ec == errc::contains_forbidden_character);

        separator_string sep = separator_string::create(std::string(), ec);
        TEST(!ec);
        TEST(sep.empty());
        plus_sign_string plus = plus_sign_string::create(std::string(), ec);
        TEST(!ec);
        TEST(plus.empty());
    }

    void rejects_nul_and_bad_utf8()
    {
        std::error_code ec;
        separator_string::create(std::string(" \0", 2), ec);
        TEST(ec == errc::contains_forbidden_character);
        // Truncated sequence.
        separator_string::create(std::string("\xe2\x80"), ec);
        TEST(ec == errc::contains_forbidden_character);
        // Overlong encoding of '/'.
        separator_string::create(std::string("\xc0\xaf"), ec);
        TEST(ec == errc::contains_forbidden_character);
        // UTF-16 surrogate.
        separator_string::create(std::string("\xed\xa0\x80"), ec);
        TEST(ec == errc::contains_forbidden_character);
        separator_string::create(std::string("\xff"), ec);
        TEST(ec == errc::contains_forbidden_character);
    }

    void throwing_constructor()
    {
        TEST_THROWS(separator_string("12"), error);
        try {
            decimal_string d("");
            TEST(false);
        } catch(error const& e) {
            TEST(e.code() == errc::contains_forbidden_character);
        }
        decimal_string d(",");
        TEST(d == ",");
    }

    void comparison()
    {
        TEST(separator_string(".") == separator_string("."));
        TEST(separator_string(".") != separator_string(","));
        TEST(separator_string(".") != ".,");
        TEST("." == separator_string("."));
    }
};

unit_test::suite<bounded_string_suite> tests = {
    TESTCASE(bounded_string_suite::default_is_fallback),
    TESTCASE(bounded_string_suite::accepts_multibyte),
    TESTCASE(bounded_string_suite::accepts_maximum_length),
    TESTCASE(bounded_string_suite::rejects_too_long),
    TESTCASE(bounded_string_suite::rejects_digits),
    TESTCASE(bounded_string_suite::digits_allowed_in_special_values),
    TESTCASE(bounded_string_suite::empty_where_required),
    TESTCASE(bounded_string_suite::rejects_nul_and_bad_utf8),
    TESTCASE(bounded_string_suite::throwing_constructor),
    TESTCASE(bounded_string_suite::comparison)
};

}   // namespace numformat

UNIT_TEST_MAIN();
