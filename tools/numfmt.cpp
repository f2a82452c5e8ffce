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
// numfmt: print integers grouped according to a locale.
//
//   $ numfmt -l en-IN 1000000 -42
//   10,00,000
//   -42
#include <numformat/buffer.hpp>
#include <numformat/custom_format.hpp>
#include <numformat/error.hpp>
#include <numformat/locale.hpp>
#include <numformat/stdout_writer.hpp>
#include <numformat/system_locale.hpp>
#include <numformat/template_formatter.hpp>
#include <numformat/write_formatted.hpp>

#include <cerrno>   // errno, ERANGE
#include <cstdlib>  // strtoll, strtoull
#include <iostream> // cin
#include <set>
#include <stdexcept>    // invalid_argument
#include <string>
#include <utility>  // forward

#include <getopt.h>     // getopt_long

namespace {

int const EXIT_ERROR = 1;
int const EXIT_USAGE = 2;

enum long_only_option {
    OPTION_SEPARATOR = 256,
    OPTION_MINUS,
    OPTION_PLUS,
    OPTION_LIST,
    OPTION_LIST_SYSTEM
};

struct option const long_options[] = {
    {"locale", required_argument, nullptr, 'l'},
    {"system", no_argument, nullptr, 's'},
    {"system-locale", required_argument, nullptr, 'S'},
    {"grouping", required_argument, nullptr, 'g'},
    {"separator", required_argument, nullptr, OPTION_SEPARATOR},
    {"minus", required_argument, nullptr, OPTION_MINUS},
    {"plus", required_argument, nullptr, OPTION_PLUS},
    {"plus-sign", no_argument, nullptr, 'p'},
    {"list", no_argument, nullptr, OPTION_LIST},
    {"list-system", no_argument, nullptr, OPTION_LIST_SYSTEM},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0}
};

char const USAGE[] =
    "usage: numfmt [options] [number...]\n"
    "Print each number grouped according to a locale. Numbers are read from\n"
    "standard input when none are given. Options must come before the first\n"
    "number.\n"
    "\n"
    "  -l, --locale NAME         built-in locale (default: en)\n"
    "  -s, --system              locale selected by the environment\n"
    "  -S, --system-locale NAME  named locale of the operating system\n"
    "  -g, --grouping POLICY     standard, indian, posix or none\n"
    "      --separator TEXT      group separator\n"
    "      --minus TEXT          minus sign\n"
    "      --plus TEXT           plus sign\n"
    "  -p, --plus-sign           show the plus sign on positive numbers\n"
    "      --list                list built-in locales\n"
    "      --list-system         list locales of the operating system\n"
    "  -h, --help                show this text\n";

// Diagnostics use the built-in "en" locale no matter what is being
// formatted, so that they stay readable.
numformat::locale const g_diagnostic_locale;

template <typename... Args>
void report(char const* pformat, Args&&... args)
{
    std::string s("numfmt: ");
    numformat::template_formatter::format(&s, g_diagnostic_locale, pformat,
        std::forward<Args>(args)...);
    s += '\n';
    numformat::stderr_writer err;
    std::error_code ec;
    // Nothing sensible to do if standard error is gone.
    err.write(s.data(), s.size(), ec);
}

bool write_line(numformat::writer* pwriter, char const* p, std::size_t size)
{
    std::error_code ec;
    pwriter->write(p, size, ec);
    if(!ec)
        pwriter->write("\n", 1, ec);
    if(ec) {
        report("unable to write output: %s", ec.message());
        return false;
    }
    return true;
}

bool write_names(std::set<std::string> const& names)
{
    numformat::stdout_writer out;
    for(std::string const& name : names) {
        if(!write_line(&out, name.data(), name.size()))
            return false;
    }
    return true;
}

bool is_decimal_number(std::string const& s)
{
    std::size_t first = (!s.empty() && (s[0] == '-' || s[0] == '+'))? 1 : 0;
    if(first == s.size())
        return false;
    return s.find_first_not_of("0123456789", first) == std::string::npos;
}

class number_printer {
public:
    number_printer(numformat::custom_format const& format,
            numformat::sign_display sign) :
        format_(format),
        sign_(sign),
        count_(0),
        failed_(0)
    {
    }

    // Returns false if output can no longer be written.
    bool print(std::string const& token)
    {
        ++count_;
        if(!is_decimal_number(token)) {
            report("not a decimal number: \"%s\"", token);
            ++failed_;
            return true;
        }

        errno = 0;
        if(token[0] == '-') {
            long long v = std::strtoll(token.c_str(), nullptr, 10);
            if(errno != ERANGE) {
                buffer_.write_formatted(v, format_, sign_);
                return write_line(&out_, buffer_.data(), buffer_.size());
            }
        } else {
            unsigned long long v = std::strtoull(token.c_str(), nullptr, 10);
            if(errno != ERANGE) {
                buffer_.write_formatted(v, format_, sign_);
                return write_line(&out_, buffer_.data(), buffer_.size());
            }
        }

        // Too large for any integer type.
        std::string s = numformat::format_decimal_digits(token, format_, sign_);
        return write_line(&out_, s.data(), s.size());
    }

    unsigned count() const
    {
        return count_;
    }

    unsigned failed() const
    {
        return failed_;
    }

private:
    numformat::custom_format format_;
    numformat::sign_display sign_;
    numformat::buffer buffer_;
    numformat::stdout_writer out_;
    unsigned count_;
    unsigned failed_;
};

struct options {
    options() :
        locale_name("en"),
        use_system(false),
        use_default_system(false),
        has_grouping(false),
        grouping(numformat::grouping_policy::standard),
        has_separator(false),
        has_minus(false),
        has_plus(false),
        sign(numformat::sign_display::negative_only),
        list(false),
        list_system(false)
    {
    }

    std::string locale_name;
    bool use_system;
    bool use_default_system;
    std::string system_name;
    bool has_grouping;
    numformat::grouping_policy grouping;
    bool has_separator;
    std::string separator;
    bool has_minus;
    std::string minus;
    bool has_plus;
    std::string plus;
    numformat::sign_display sign;
    bool list;
    bool list_system;
};

// Throws numformat::error if the locale does not exist or the overrides
// are not valid symbols.
numformat::custom_format make_format(options const& opts)
{
    numformat::custom_format_builder builder;
    if(opts.use_default_system)
        builder = numformat::custom_format_builder(numformat::system_locale::default_locale());
    else if(opts.use_system)
        builder = numformat::custom_format_builder(numformat::system_locale::from_name(opts.system_name));
    else
        builder = numformat::custom_format_builder(numformat::locale::from_name(opts.locale_name));

    if(opts.has_grouping)
        builder.grouping(opts.grouping);
    if(opts.has_separator)
        builder.separator(opts.separator);
    if(opts.has_minus)
        builder.minus_sign(opts.minus);
    if(opts.has_plus)
        builder.plus_sign(opts.plus);
    return builder.build();
}

}   // anonymous namespace

int main(int argc, char** argv)
{
    options opts;
    int option;
    // The leading '+' stops option parsing at the first number, and a
    // negative number such as -42 is checked for before getopt_long would
    // take it for the option -4.
    while(optind < argc && !is_decimal_number(argv[optind])
        && (option = getopt_long(argc, argv, "+l:sS:g:ph", long_options, nullptr)) != -1)
    {
        switch(option) {
        case 'l':
            opts.locale_name = optarg;
            break;
        case 's':
            opts.use_default_system = true;
            break;
        case 'S':
            opts.use_system = true;
            opts.system_name = optarg;
            break;
        case 'g':
            if(!numformat::from_string(optarg, &opts.grouping)) {
                report("unknown grouping policy \"%s\"", optarg);
                return EXIT_USAGE;
            }
            opts.has_grouping = true;
            break;
        case OPTION_SEPARATOR:
            opts.has_separator = true;
            opts.separator = optarg;
            break;
        case OPTION_MINUS:
            opts.has_minus = true;
            opts.minus = optarg;
            break;
        case OPTION_PLUS:
            opts.has_plus = true;
            opts.plus = optarg;
            break;
        case 'p':
            opts.sign = numformat::sign_display::always;
            break;
        case OPTION_LIST:
            opts.list = true;
            break;
        case OPTION_LIST_SYSTEM:
            opts.list_system = true;
            break;
        case 'h': {
            numformat::stdout_writer out;
            std::error_code ec;
            out.write(USAGE, sizeof(USAGE) - 1, ec);
            return ec? EXIT_ERROR : 0;
        }
        case '?':
            // getopt_long already printed an error message.
        default:
            report("try 'numfmt --help' for more information");
            return EXIT_USAGE;
        }
    }

    try {
        if(opts.list)
            return write_names(numformat::locale::available_names())? 0 : EXIT_ERROR;
        if(opts.list_system)
            return write_names(numformat::system_locale::available_names())? 0 : EXIT_ERROR;

        number_printer printer(make_format(opts), opts.sign);
        if(optind != argc) {
            for(int i=optind; i!=argc; ++i) {
                if(!printer.print(argv[i]))
                    return EXIT_ERROR;
            }
        } else {
            std::string token;
            while(std::cin >> token) {
                if(!printer.print(token))
                    return EXIT_ERROR;
            }
        }

        if(printer.failed() != 0) {
            report("%d of %d numbers could not be formatted", printer.failed(),
                printer.count());
            return EXIT_ERROR;
        }
    } catch(numformat::error const& e) {
        report("%s", e.what());
        return EXIT_ERROR;
    }
    return 0;
}
