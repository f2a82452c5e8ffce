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

#include <cstdio>   // FILE, fread
#include <string>

#include <stdio.h>      // popen, pclose
#include <sys/wait.h>   // WIFEXITED, WEXITSTATUS

// Runs the numfmt executable built alongside this test. NUMFMT_PATH is set
// by the build.
class numfmt_suite {
public:
    void negative_arguments()
    {
        TEST(run("-l en-IN 1000000 -42") == 0);
        TEST(output_ == "10,00,000\n-42\n");
        TEST(run("-42") == 0);
        TEST(output_ == "-42\n");
        TEST(run("-9223372036854775808 -1000") == 0);
        TEST(output_ == "-9,223,372,036,854,775,808\n-1,000\n");
    }

    void option_terminator()
    {
        TEST(run("-- -42 7") == 0);
        TEST(output_ == "-42\n7\n");
    }

    void options()
    {
        TEST(run("-g posix 1234567") == 0);
        TEST(output_ == "1234567\n");
        TEST(run("-p 5 -5 0") == 0);
        TEST(output_ == "+5\n-5\n0\n");
        TEST(run("--minus '~' --separator _ -1234567") == 0);
        TEST(output_ == "~1_234_567\n");
        TEST(run("-l de 1234567") == 0);
        TEST(output_ == "1.234.567\n");
    }

    void long_numbers()
    {
        TEST(run("-123456789012345678901234567890") == 0);
        TEST(output_ == "-123,456,789,012,345,678,901,234,567,890\n");
    }

    void standard_input()
    {
        TEST(run("-l en-IN", "100000 -2000\n3\n") == 0);
        TEST(output_ == "1,00,000\n-2,000\n3\n");
    }

    void errors()
    {
        TEST(run("12 abc 34") == 1);
        TEST(output_ == "12\n34\n");
        TEST(run("-l xx-YY 1") == 1);
        TEST(output_.empty());
        TEST(run("--separator 1 5") == 1);
        TEST(run("-g roman 1") == 2);
        TEST(run("-x 1") == 2);
    }

private:
    // Returns the exit status and keeps standard output in output_.
    // Standard error is discarded.
    int run(std::string const& arguments, char const* input = nullptr)
    {
        std::string command;
        if(input)
            command = "printf '" + std::string(input) + "' | ";
        command += "'" NUMFMT_PATH "' " + arguments + " 2>/dev/null";

        output_.clear();
        FILE* pipe = popen(command.c_str(), "r");
        if(!pipe)
            throw unit_test::error("popen(\"" + command + "\")", __FILE__, __LINE__);
        char buf[256];
        std::size_t n;
        while((n = std::fread(buf, 1, sizeof(buf), pipe)) != 0)
            output_.append(buf, n);
        int status = pclose(pipe);
        if(status == -1 || !WIFEXITED(status))
            throw unit_test::error("exit status of \"" + command + "\"", __FILE__, __LINE__);
        return WEXITSTATUS(status);
    }

    std::string output_;
};

unit_test::suite<numfmt_suite> tests = {
    TESTCASE(numfmt_suite::negative_arguments),
    TESTCASE(numfmt_suite::option_terminator),
    TESTCASE(numfmt_suite::options),
    TESTCASE(numfmt_suite::long_numbers),
    TESTCASE(numfmt_suite::standard_input),
    TESTCASE(numfmt_suite::errors)
};

UNIT_TEST_MAIN();
