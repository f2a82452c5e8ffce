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

#include <numformat/grouping.hpp>

#include <climits>  // CHAR_MAX
#include <vector>

namespace numformat {

namespace {
std::vector<unsigned> positions(std::initializer_list<unsigned> l)
{
    return std::vector<unsigned>(l);
}
}

class grouping_suite {
public:
    void standard()
    {
        TEST(group_positions(grouping_policy::standard, 0).empty());
        TEST(group_positions(grouping_policy::standard, 1).empty());
        TEST(group_positions(grouping_policy::standard, 3).empty());
        TEST(group_positions(grouping_policy::standard, 4) == positions({3}));
        TEST(group_positions(grouping_policy::standard, 7) == positions({3, 6}));
        TEST(group_positions(grouping_policy::standard, 10) == positions({3, 6, 9}));
    }

    void indian()
    {
        TEST(group_positions(grouping_policy::indian, 0).empty());
        TEST(group_positions(grouping_policy::indian, 1).empty());
        TEST(group_positions(grouping_policy::indian, 3).empty());
        TEST(group_positions(grouping_policy::indian, 4) == positions({3}));
        TEST(group_positions(grouping_policy::indian, 6) == positions({3, 5}));
        TEST(group_positions(grouping_policy::indian, 10) == positions({3, 5, 7, 9}));
    }

    void posix()
    {
        for(unsigned digits=0; digits!=25; ++digits)
            TEST(group_positions(grouping_policy::posix, digits).empty());
    }

    void separator_count_matches_positions()
    {
        grouping_policy const policies[] = {grouping_policy::standard,
            grouping_policy::indian, grouping_policy::posix};
        for(grouping_policy policy : policies) {
            for(unsigned digits=0; digits!=40; ++digits) {
                TEST(separator_count(policy, digits)
                    == group_positions(policy, digits).size());
            }
        }
        static_assert(separator_count(grouping_policy::standard, 20) == 6,
            "20 digits have 6 standard separators");
        static_assert(separator_count(grouping_policy::indian, 20) == 9,
            "20 digits have 9 indian separators");
    }

    void names()
    {
        grouping_policy policy = grouping_policy::standard;
        TEST(from_string("indian", &policy));
        TEST(policy == grouping_policy::indian);
        TEST(from_string("none", &policy));
        TEST(policy == grouping_policy::posix);
        TEST(from_string("standard", &policy));
        TEST(policy == grouping_policy::standard);
        TEST(!from_string("chinese", &policy));
        TEST(policy == grouping_policy::standard);

        TEST(std::string(to_string(grouping_policy::indian)) == "indian");
        TEST(from_string(to_string(grouping_policy::posix), &policy));
        TEST(policy == grouping_policy::posix);
    }

    void lconv()
    {
        grouping_policy policy = grouping_policy::indian;
        TEST(detail::grouping_from_lconv("", &policy));
        TEST(policy == grouping_policy::posix);
        TEST(detail::grouping_from_lconv("\3", &policy));
        TEST(policy == grouping_policy::standard);
        TEST(detail::grouping_from_lconv("\3\3", &policy));
        TEST(policy == grouping_policy::standard);
        TEST(detail::grouping_from_lconv("\3\2", &policy));
        TEST(policy == grouping_policy::indian);

        char const no_repeat[] = {3, CHAR_MAX, 0};
        TEST(!detail::grouping_from_lconv(no_repeat, &policy));
        TEST(!detail::grouping_from_lconv("\4", &policy));
        TEST(!detail::grouping_from_lconv("\3\2\3", &policy));
    }

    void win32()
    {
        grouping_policy policy = grouping_policy::indian;
        TEST(detail::grouping_from_win32("3;0", &policy));
        TEST(policy == grouping_policy::standard);
        TEST(detail::grouping_from_win32("3;2;0", &policy));
        TEST(policy == grouping_policy::indian);
        TEST(detail::grouping_from_win32("0", &policy));
        TEST(policy == grouping_policy::posix);

        TEST(!detail::grouping_from_win32("3", &policy));
        TEST(!detail::grouping_from_win32("4;0", &policy));
        TEST(!detail::grouping_from_win32("3;x", &policy));
    }
};

unit_test::suite<grouping_suite> tests = {
    TESTCASE(grouping_suite::standard),
    TESTCASE(grouping_suite::indian),
    TESTCASE(grouping_suite::posix),
    TESTCASE(grouping_suite::separator_count_matches_positions),
    TESTCASE(grouping_suite::names),
    TESTCASE(grouping_suite::lconv),
    TESTCASE(grouping_suite::win32)
};

}   // namespace numformat

UNIT_TEST_MAIN();
