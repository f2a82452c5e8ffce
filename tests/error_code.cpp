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

#include <numformat/error.hpp>
#include <numformat/stdout_writer.hpp>

#include <string>
#include <system_error>

#if !defined(_WIN32)
#include <errno.h>      // EBADF
#include <unistd.h>     // pipe, read, close
#endif

namespace numformat {

class error_code_suite {
public:
    void category()
    {
        TEST(std::string(error_category().name()) == "numformat");
        std::error_code ec = errc::unknown_locale_name;
        TEST(ec.category() == error_category());
        TEST(ec.value() == 5);
        TEST(ec.message() == "unknown locale name");
        TEST(make_error_code(errc::exceeds_maximum_length).message()
            == "symbol exceeds maximum length");
        TEST(make_error_code(errc::contains_forbidden_character).message()
            == "symbol contains forbidden character");
        TEST(make_error_code(errc::invalid_combination).message()
            == "invalid combination of symbols");
        TEST(make_error_code(errc::provider_unavailable).message()
            == "locale provider unavailable");
    }

    void comparison()
    {
        std::error_code ec;
        TEST(!ec);
        TEST(ec != errc::provider_unavailable);
        ec = make_error_code(errc::provider_unavailable);
        TEST(ec == errc::provider_unavailable);
        TEST(errc::provider_unavailable == ec);
        TEST(ec != errc::unknown_locale_name);
        TEST(ec != writer::temporary_failure);
    }

    void exception()
    {
        try {
            throw error(make_error_code(errc::invalid_combination), "separator");
        } catch(std::system_error const& e) {
            TEST(e.code() == errc::invalid_combination);
            TEST(std::string(e.what()).find("separator") != std::string::npos);
        }
    }

    void writer_category()
    {
        TEST(std::string(writer::error_category().name()) == "numformat::writer");
        std::error_code ec = make_error_code(writer::temporary_failure);
        TEST(ec == writer::temporary_failure);
        TEST(ec != writer::permanent_failure);
    }

#if !defined(_WIN32)
    void fd_writer_output()
    {
        int fds[2];
        TEST(pipe(fds) == 0);
        fd_writer w(fds[1]);
        std::error_code ec;
        TEST(w.write("1,000", 5, ec) == 5);
        TEST(!ec);
        char buf[8];
        TEST(read(fds[0], buf, sizeof(buf)) == 5);
        TEST(std::string(buf, 5) == "1,000");
        close(fds[0]);
        close(fds[1]);
    }

    void fd_writer_failure()
    {
        int fds[2];
        TEST(pipe(fds) == 0);
        close(fds[0]);
        close(fds[1]);
        fd_writer w(fds[1]);
        std::error_code ec;
        TEST(w.write("1", 1, ec) == 0);
        TEST(ec);
        TEST(ec.value() == EBADF);
        TEST(ec == writer::permanent_failure);
        TEST(ec != writer::temporary_failure);
        TEST(ec == std::errc::bad_file_descriptor);
    }
#endif
};

unit_test::suite<error_code_suite> tests = {
    TESTCASE(error_code_suite::category),
    TESTCASE(error_code_suite::comparison),
    TESTCASE(error_code_suite::exception),
    TESTCASE(error_code_suite::writer_category),
#if !defined(_WIN32)
    TESTCASE(error_code_suite::fd_writer_output),
    TESTCASE(error_code_suite::fd_writer_failure)
#endif
};

}   // namespace numformat

UNIT_TEST_MAIN();
