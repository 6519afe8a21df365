/*
 * Prints the current time in decimal time:
 *
 *   $ decimal_clock
 *   UTC  2025.073.5
 *   $ decimal_clock --offset 1 --zone CET
 *   CET  2025.073.5416666666666666
 *
 * or converts a given calendar timestamp or decimal time:
 *
 *   $ decimal_clock --at "2025-03-14 18:00:00" "%Y.%D.%F"
 *   2025.73.75
 *   $ decimal_clock --at "2025-03-14 06:00:00" "Day %D, %f"
 *   Day 73, 0.25
 *   $ decimal_clock --from-decimal 2024 366 0.5
 *   2024-12-31 12:00:00.000000
 */

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include "unit_tests.h"
#include "calendar.h"
#include "decimal_time.h"

namespace
{
    char const * const default_format = "%Y.%d.%F";

    struct Options
    {
        std::string format = default_format;

        bool have_offset = false;
        int32_t offset_seconds = 0;
        std::string zone;

        bool have_at = false;
        Ymdhms at;

        bool from_decimal = false;
        DecimalTime decimal;

        bool self_test = false;
        bool help = false;
    };

    void print_usage(FILE * out)
    {
        fprintf(out,
                "Usage: decimal_clock [options] [FORMAT]\n"
                "\n"
                "  FORMAT                         %%Y year, %%d day (3 digits), %%D day,\n"
                "                                 %%f fraction of day, %%F fraction digits, %%%% percent.\n"
                "                                 Default \"%s\".\n"
                "  --offset HOURS                 Fixed offset from UTC of the displayed clock.\n"
                "  --zone NAME                    Abbreviation shown in front of the time.\n"
                "  --at \"YYYY-MM-DD hh:mm:ss[.ffffff]\"\n"
                "                                 Convert this timestamp instead of the current time.\n"
                "  --from-decimal YEAR DAY FRACTION\n"
                "                                 Convert a decimal time to a calendar timestamp.\n"
                "  --self-test                    Run the self test.\n"
                "  --help\n",
                default_format);
    }

    template <typename T>
    T parse_number(std::string text, std::string const & what)
    {
        if (!text.empty() && text[0] == '+')
        {
            text.erase(0, 1);
        }

        T value{};
        auto const result = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || result.ec != std::errc() || result.ptr != text.data() + text.size())
        {
            throw std::runtime_error("Bad " + what + ": \"" + text + "\"");
        }
        return value;
    }

    Ymdhms parse_timestamp(std::string const & text)
    {
        std::regex const timestamp_regex(
            "^(-?\\d+)-(\\d\\d)-(\\d\\d)[ T](\\d\\d):(\\d\\d):(\\d\\d)(?:\\.(\\d{1,6}))?$",
            std::regex_constants::ECMAScript);

        std::smatch match;
        if (!std::regex_match(text, match, timestamp_regex))
        {
            throw std::runtime_error("Bad timestamp: \"" + text + "\"");
        }

        std::string usec_digits = match[7].str();
        usec_digits.resize(6, '0');

        return Ymdhms(parse_number<int32_t>(match[1].str(), "year"),
                      parse_number<uint8_t>(match[2].str(), "month"),
                      parse_number<uint8_t>(match[3].str(), "day"),
                      parse_number<uint8_t>(match[4].str(), "hour"),
                      parse_number<uint8_t>(match[5].str(), "minute"),
                      parse_number<uint8_t>(match[6].str(), "second"),
                      parse_number<uint32_t>(usec_digits, "fraction of second"));
    }

    Options parse_args(std::vector<std::string> const & args)
    {
        Options options;
        bool have_format = false;

        auto value_after = [&args](size_t & i) -> std::string const &
        {
            if (i + 1 >= args.size())
            {
                throw std::runtime_error("Missing value after " + args[i]);
            }
            return args[++i];
        };

        for (size_t i = 0; i < args.size(); ++i)
        {
            std::string const & arg = args[i];
            if (arg == "--help" || arg == "-h")
            {
                options.help = true;
            }
            else if (arg == "--self-test")
            {
                options.self_test = true;
            }
            else if (arg == "--offset")
            {
                double const hours = parse_number<double>(value_after(i), "offset");
                if (!(std::fabs(hours) < hour_per_day))
                {
                    throw std::runtime_error("Offset must be less than 24 hours");
                }
                options.offset_seconds = static_cast<int32_t>(std::lround(hours * secs_per_hour));
                if (std::abs(options.offset_seconds) >= secs_per_day)
                {
                    throw std::runtime_error("Offset must be less than 24 hours");
                }
                options.have_offset = true;
            }
            else if (arg == "--zone")
            {
                options.zone = value_after(i);
            }
            else if (arg == "--at")
            {
                options.at = parse_timestamp(value_after(i));
                options.have_at = true;
            }
            else if (arg == "--from-decimal")
            {
                int32_t const year = parse_number<int32_t>(value_after(i), "year");
                uint32_t const day_of_year = parse_number<uint32_t>(value_after(i), "day of year");
                double const decimal_day = parse_number<double>(value_after(i), "fraction of day");
                options.decimal = DecimalTime(year, day_of_year, decimal_day);
                options.from_decimal = true;
            }
            else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-')
            {
                throw std::runtime_error("Unknown option " + arg);
            }
            else if (!have_format)
            {
                options.format = arg;
                have_format = true;
            }
            else
            {
                throw std::runtime_error("Unexpected argument \"" + arg + "\"");
            }
        }

        if (options.have_at && options.from_decimal)
        {
            throw std::runtime_error("--at and --from-decimal cannot be combined");
        }

        return options;
    }

    int show_now(Options const & options)
    {
        std::shared_ptr<TimeRepresentation> time_rep;
        if (options.have_offset || !options.zone.empty())
        {
            time_rep = std::make_shared<TimeZoneFixed>(options.zone.empty() ? "LOC" : options.zone, options.offset_seconds);
        }
        else
        {
            time_rep = std::make_shared<TimeRepUtc>();
        }

        UtcTimestamp const now = std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now());

        Ymdhms ymdhms;
        if (!time_rep->make_ymdhms(now, ymdhms))
        {
            throw std::runtime_error("System clock is outside the supported calendar range");
        }

        // The offset is already applied, so the fields are a naive local time.
        DecimalTime dt;
        ConversionError const error = from_calendar_timestamp(ymdhms, dt);
        if (error != ConversionError::none)
        {
            fprintf(stderr, "decimal_clock: %s\n", conversion_error_name(error));
            return 1;
        }

        printf("%-4s %s\n", time_rep->abbrev().c_str(), dt.format(options.format).c_str());
        return 0;
    }

    int show_decimal(Ymdhms const & ymdhms, std::string const & format)
    {
        DecimalTime dt;
        ConversionError const error = from_calendar_timestamp(ymdhms, dt);
        if (error != ConversionError::none)
        {
            fprintf(stderr, "decimal_clock: %s\n", conversion_error_name(error));
            return 1;
        }

        printf("%s\n", dt.format(format).c_str());
        return 0;
    }

    int show_calendar(DecimalTime const & dt)
    {
        Ymdhms ymdhms;
        ConversionError const error = to_calendar_timestamp(dt, ymdhms);
        if (error != ConversionError::none)
        {
            fprintf(stderr, "decimal_clock: %s\n", conversion_error_name(error));
            return 1;
        }

        ymdhms.print();
        printf("\n");
        return 0;
    }
}

int main(int argc, char const * argv[])
{
    try
    {
        Options const options = parse_args(std::vector<std::string>(argv + 1, argv + argc));

        if (options.help)
        {
            print_usage(stdout);
            return 0;
        }

        if (options.self_test)
        {
            printf("Running self test...\n");
            if (!unit_tests())
            {
                printf("Failed self test.\n");
                return 1;
            }
            printf("Self test passed.\n");
            return 0;
        }

        if (options.from_decimal)
        {
            return show_calendar(options.decimal);
        }

        if (options.have_at)
        {
            return show_decimal(options.at, options.format);
        }

        return show_now(options);
    }
    catch (std::exception const & e)
    {
        std::cerr << "decimal_clock: " << e.what() << std::endl;
        print_usage(stderr);
        return 1;
    }
}
