#include "decimal_time.h"
#include "util.h"

#include <array>
#include <charconv>
#include <cmath>
#include <system_error>

char const * conversion_error_name(ConversionError error)
{
    switch (error)
    {
    case ConversionError::none:                 return "None";
    case ConversionError::invalid_timestamp:    return "InvalidTimestamp";
    case ConversionError::invalid_decimal_time: return "InvalidDecimalTime";
    }
    return "Unknown";
}

ConversionError from_calendar_timestamp(LocalTimestamp timestamp, DecimalTime & dt)
{
    Ymdhms ymdhms;
    if (!Ymdhms::from_local_time(timestamp, ymdhms))
    {
        return ConversionError::invalid_timestamp;
    }

    auto const usec_of_day = (timestamp - std::chrono::floor<std::chrono::days>(timestamp)).count();

    dt = DecimalTime(ymdhms.year,
                     ymdhms.day_of_year(),
                     static_cast<double>(usec_of_day) / static_cast<double>(usec_per_day));
    return ConversionError::none;
}

ConversionError from_calendar_timestamp(Ymdhms const & ymdhms, DecimalTime & dt)
{
    LocalTimestamp timestamp;
    if (!ymdhms.make_local_time(timestamp))
    {
        return ConversionError::invalid_timestamp;
    }
    return from_calendar_timestamp(timestamp, dt);
}

ConversionError from_calendar_timestamp_utc(UtcTimestamp instant, DecimalTime & dt)
{
    return from_calendar_timestamp(LocalTimestamp{instant.time_since_epoch()}, dt);
}

ConversionError to_calendar_timestamp(DecimalTime const & dt, LocalTimestamp & timestamp)
{
    using namespace std::chrono;

    if (dt.year < static_cast<int>(year::min()) || dt.year > static_cast<int>(year::max()))
    {
        return ConversionError::invalid_decimal_time;
    }

    // Written so that NaN fails too.
    if (!(dt.decimal_day >= 0.0 && dt.decimal_day < 1.0))
    {
        return ConversionError::invalid_decimal_time;
    }

    year const y{dt.year};
    local_days const jan_1{y / January / 1};
    local_days const dec_31{y / December / 31};
    int64_t const days_in_year = (dec_31 - jan_1).count() + 1;
    if (dt.day_of_year == 0 || dt.day_of_year > days_in_year)
    {
        return ConversionError::invalid_decimal_time;
    }

    int64_t usec_of_day = std::llround(dt.decimal_day * static_cast<double>(usec_per_day));
    if (usec_of_day >= usec_per_day)
    {
        usec_of_day = usec_per_day - 1;
    }

    timestamp = jan_1 + days{dt.day_of_year - 1} + microseconds{usec_of_day};
    return ConversionError::none;
}

ConversionError to_calendar_timestamp(DecimalTime const & dt, Ymdhms & ymdhms)
{
    LocalTimestamp timestamp;
    ConversionError const error = to_calendar_timestamp(dt, timestamp);
    if (error != ConversionError::none)
    {
        return error;
    }
    if (!Ymdhms::from_local_time(timestamp, ymdhms))
    {
        return ConversionError::invalid_decimal_time;
    }
    return ConversionError::none;
}

ConversionError to_calendar_timestamp_utc(DecimalTime const & dt, UtcTimestamp & instant)
{
    LocalTimestamp timestamp;
    ConversionError const error = to_calendar_timestamp(dt, timestamp);
    if (error != ConversionError::none)
    {
        return error;
    }
    instant = UtcTimestamp{timestamp.time_since_epoch()};
    return ConversionError::none;
}

namespace
{
    // Shortest fixed point text that reads back as the same double, with at
    // least one digit after the point.
    std::string fraction_text(double fraction)
    {
        // -0.0 is a valid fraction and must print as "0.0".
        if (fraction == 0.0)
        {
            fraction = 0.0;
        }

        // Wide enough for any double in fixed notation.
        std::array<char, 512> buffer;
        auto const result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), fraction, std::chars_format::fixed);
        if (result.ec != std::errc())
        {
            return std::to_string(fraction);
        }

        std::string text(buffer.data(), result.ptr);
        if (std::isfinite(fraction) && text.find('.') == std::string::npos)
        {
            text += ".0";
        }
        return text;
    }
}

std::string DecimalTime::format(std::string const & fmt) const
{
    std::string out;
    out.reserve(fmt.size() + 16);

    for (size_t i = 0; i < fmt.size(); ++i)
    {
        char const ch = fmt[i];
        if (ch != '%' || i + 1 == fmt.size())
        {
            out += ch;
            continue;
        }

        char const directive = fmt[++i];
        switch (directive)
        {
        case 'Y':
            out += std::to_string(year);
            break;
        case 'd':
        {
            std::array<char, 16> padded;
            snprintf(padded.data(), padded.size(), "%03" PRIu32, day_of_year);
            out += padded.data();
            break;
        }
        case 'D':
            out += std::to_string(day_of_year);
            break;
        case 'f':
            out += fraction_text(decimal_day);
            break;
        case 'F':
        {
            std::string const text = fraction_text(decimal_day);
            if (text.compare(0, 2, "0.") == 0)
            {
                out.append(text, 2, std::string::npos);
            }
            else
            {
                out += text;
            }
            break;
        }
        case '%':
            out += '%';
            break;
        default:
            out += ch;
            out += directive;
            break;
        }
    }

    return out;
}

bool from_calendar_test()
{
    DecimalTime dt;

    test_assert(from_calendar_timestamp(Ymdhms(2025, 3, 14, 12, 0, 0), dt) == ConversionError::none);
    test_assert_signed_eq(dt.year, 2025);
    test_assert_unsigned_eq(dt.day_of_year, 73u);
    test_assert(dt.decimal_day == 0.5);

    test_assert(from_calendar_timestamp(Ymdhms(2025, 1, 1, 0, 0, 0), dt) == ConversionError::none);
    test_assert_unsigned_eq(dt.day_of_year, 1u);
    test_assert(dt.decimal_day == 0.0);

    test_assert(from_calendar_timestamp(Ymdhms(2024, 12, 31, 18, 0, 0), dt) == ConversionError::none);
    test_assert_unsigned_eq(dt.day_of_year, 366u);
    test_assert(dt.decimal_day == 0.75);

    test_assert(from_calendar_timestamp(Ymdhms(2025, 1, 1, 23, 59, 59), dt) == ConversionError::none);
    test_assert(dt.decimal_day < 1.0);
    test_assert_near(dt.decimal_day, 0.99999, 0.0001);

    {
        UtcTimestamp utc;
        test_assert(Ymdhms(2025, 3, 14, 6, 0, 0).make_utc_time(utc));
        test_assert(from_calendar_timestamp_utc(utc, dt) == ConversionError::none);
        test_assert(dt == DecimalTime(2025, 73, 0.25));
    }

    {
        DecimalTime noon;
        DecimalTime one_second_later;
        test_assert(from_calendar_timestamp(Ymdhms(2025, 1, 1, 12, 0, 0), noon) == ConversionError::none);
        test_assert(from_calendar_timestamp(Ymdhms(2025, 1, 1, 12, 0, 1), one_second_later) == ConversionError::none);
        test_assert_near(one_second_later.decimal_day - noon.decimal_day, 1.0 / secs_per_day, 1e-15);
    }

    {
        test_assert(from_calendar_timestamp(Ymdhms(-44, 3, 15, 0, 0, 0), dt) == ConversionError::none);
        test_assert_signed_eq(dt.year, -44);
        // -44 is a leap year in the proleptic calendar.
        test_assert_unsigned_eq(dt.day_of_year, 75u);
    }

    return true;
}

bool invalid_timestamp_test()
{
    DecimalTime dt(1, 2, 0.5);
    DecimalTime const untouched = dt;

    test_assert(from_calendar_timestamp(Ymdhms(2025, 13, 1, 0, 0, 0), dt) == ConversionError::invalid_timestamp);
    test_assert(from_calendar_timestamp(Ymdhms(2025, 2, 30, 0, 0, 0), dt) == ConversionError::invalid_timestamp);
    test_assert(from_calendar_timestamp(Ymdhms(2025, 2, 29, 0, 0, 0), dt) == ConversionError::invalid_timestamp);
    test_assert(from_calendar_timestamp(Ymdhms(2025, 1, 1, 25, 0, 0), dt) == ConversionError::invalid_timestamp);
    test_assert(from_calendar_timestamp(Ymdhms(2025, 1, 1, 0, 60, 0), dt) == ConversionError::invalid_timestamp);
    test_assert(from_calendar_timestamp(Ymdhms(2025, 1, 1, 0, 0, 61), dt) == ConversionError::invalid_timestamp);
    test_assert(from_calendar_timestamp(Ymdhms(2025, 1, 1, 0, 0, 60), dt) == ConversionError::invalid_timestamp);
    test_assert(from_calendar_timestamp(Ymdhms(2025, 1, 1, 0, 0, 0, 1000000), dt) == ConversionError::invalid_timestamp);
    test_assert(dt == untouched);

    LocalTimestamp const far = LocalTimestamp{} + std::chrono::years{40000};
    test_assert(from_calendar_timestamp(far, dt) == ConversionError::invalid_timestamp);

    UtcTimestamp const far_utc = UtcTimestamp{} - std::chrono::years{40000};
    test_assert(from_calendar_timestamp_utc(far_utc, dt) == ConversionError::invalid_timestamp);
    test_assert(dt == untouched);

    return true;
}

bool to_calendar_test()
{
    Ymdhms ymdhms;

    test_assert(to_calendar_timestamp(DecimalTime(2025, 73, 0.5), ymdhms) == ConversionError::none);
    test_assert(ymdhms == Ymdhms(2025, 3, 14, 12, 0, 0));

    test_assert(to_calendar_timestamp(DecimalTime(2025, 1, 0.0), ymdhms) == ConversionError::none);
    test_assert(ymdhms == Ymdhms(2025, 1, 1, 0, 0, 0));

    test_assert(to_calendar_timestamp(DecimalTime(2024, 366, 0.5), ymdhms) == ConversionError::none);
    test_assert(ymdhms == Ymdhms(2024, 12, 31, 12, 0, 0));

    test_assert(to_calendar_timestamp(DecimalTime(2024, 60, 0.0), ymdhms) == ConversionError::none);
    test_assert(ymdhms == Ymdhms(2024, 2, 29, 0, 0, 0));

    test_assert(to_calendar_timestamp(DecimalTime(2025, 60, 0.0), ymdhms) == ConversionError::none);
    test_assert(ymdhms == Ymdhms(2025, 3, 1, 0, 0, 0));

    {
        // Rounds up to a whole day but must stay on day 365.
        test_assert(to_calendar_timestamp(DecimalTime(2025, 365, 0.9999999999999), ymdhms) == ConversionError::none);
        test_assert(ymdhms == Ymdhms(2025, 12, 31, 23, 59, 59, 999999));
    }

    {
        test_assert(to_calendar_timestamp(DecimalTime(2025, 1, 1.0 / 86400.0), ymdhms) == ConversionError::none);
        test_assert(ymdhms == Ymdhms(2025, 1, 1, 0, 0, 1));
    }

    {
        UtcTimestamp utc;
        test_assert(to_calendar_timestamp_utc(DecimalTime(2025, 73, 0.75), utc) == ConversionError::none);
        test_assert(Ymdhms::from_utc_time(utc, ymdhms));
        test_assert_signed_eq(ymdhms.year, 2025);
        test_assert_unsigned_eq(ymdhms.day_of_year(), 73u);
        test_assert(ymdhms == Ymdhms(2025, 3, 14, 18, 0, 0));
    }

    return true;
}

bool invalid_decimal_time_test()
{
    LocalTimestamp t;
    Ymdhms ymdhms(1999, 9, 9, 9, 9, 9);
    Ymdhms const untouched = ymdhms;

    test_assert(to_calendar_timestamp(DecimalTime(2025, 366, 0.5), t) == ConversionError::invalid_decimal_time);
    test_assert(to_calendar_timestamp(DecimalTime(2025, 0, 0.5), t) == ConversionError::invalid_decimal_time);
    test_assert(to_calendar_timestamp(DecimalTime(2025, 367, 0.5), t) == ConversionError::invalid_decimal_time);
    test_assert(to_calendar_timestamp(DecimalTime(2024, 367, 0.5), t) == ConversionError::invalid_decimal_time);
    test_assert(to_calendar_timestamp(DecimalTime(1900, 366, 0.5), t) == ConversionError::invalid_decimal_time);
    test_assert(to_calendar_timestamp(DecimalTime(2025, 4294967295u, 0.5), t) == ConversionError::invalid_decimal_time);
    test_assert(to_calendar_timestamp(DecimalTime(2025, 10, 1.0), t) == ConversionError::invalid_decimal_time);
    test_assert(to_calendar_timestamp(DecimalTime(2025, 10, -0.1), t) == ConversionError::invalid_decimal_time);
    test_assert(to_calendar_timestamp(DecimalTime(2025, 10, std::nan("")), t) == ConversionError::invalid_decimal_time);
    test_assert(to_calendar_timestamp(DecimalTime(40000, 10, 0.5), t) == ConversionError::invalid_decimal_time);

    test_assert(to_calendar_timestamp(DecimalTime(2025, 366, 0.5), ymdhms) == ConversionError::invalid_decimal_time);
    test_assert(ymdhms == untouched);

    UtcTimestamp utc;
    test_assert(to_calendar_timestamp_utc(DecimalTime(2025, 0, 0.5), utc) == ConversionError::invalid_decimal_time);

    test_assert(std::string(conversion_error_name(ConversionError::invalid_decimal_time)) == "InvalidDecimalTime");
    test_assert(std::string(conversion_error_name(ConversionError::invalid_timestamp)) == "InvalidTimestamp");

    return true;
}

bool round_trip_test()
{
    Ymdhms const timestamps[] = {
        Ymdhms(2025, 3, 14, 15, 9, 26, 535897),
        Ymdhms(2025, 12, 31, 23, 59, 59),
        Ymdhms(2024, 2, 29, 0, 0, 0, 1),
        Ymdhms(2000, 12, 31, 23, 59, 59, 999999),
        Ymdhms(1969, 7, 20, 20, 17, 40),
        Ymdhms(0, 1, 1, 6, 30, 0),
        Ymdhms(-4713, 11, 24, 12, 0, 0),
    };

    for (Ymdhms const & original : timestamps)
    {
        DecimalTime dt;
        test_assert(from_calendar_timestamp(original, dt) == ConversionError::none);
        test_assert(dt.decimal_day >= 0.0 && dt.decimal_day < 1.0);

        Ymdhms back;
        test_assert(to_calendar_timestamp(dt, back) == ConversionError::none);
        test_assert(back == original);

        UtcTimestamp utc;
        UtcTimestamp utc_back;
        test_assert(original.make_utc_time(utc));
        test_assert(from_calendar_timestamp_utc(utc, dt) == ConversionError::none);
        test_assert(to_calendar_timestamp_utc(dt, utc_back) == ConversionError::none);
        test_assert(utc == utc_back);
    }

    DecimalTime const decimals[] = {
        DecimalTime(2025, 100, 0.123456),
        DecimalTime(2024, 366, 0.999),
        DecimalTime(2025, 1, 0.0),
        DecimalTime(1583, 200, 1.0 / 3.0),
    };

    for (DecimalTime const & original : decimals)
    {
        LocalTimestamp t;
        DecimalTime back;
        test_assert(to_calendar_timestamp(original, t) == ConversionError::none);
        test_assert(from_calendar_timestamp(t, back) == ConversionError::none);
        test_assert_signed_eq(back.year, original.year);
        test_assert_unsigned_eq(back.day_of_year, original.day_of_year);
        test_assert_near(back.decimal_day, original.decimal_day, 1e-9);
    }

    return true;
}

bool format_test()
{
    test_assert_str_eq(DecimalTime(2025, 73, 0.5).format("%Y.%D.%F"), "2025.73.5");
    test_assert_str_eq(DecimalTime(2025, 73, 0.5).format("Year: %Y, Day: %d, Time: %f"), "Year: 2025, Day: 073, Time: 0.5");
    test_assert_str_eq(DecimalTime(2025, 5, 0.75).format("%Y.%D.%F"), "2025.5.75");
    test_assert_str_eq(DecimalTime(2025, 5, 0.5).format("Date => %Y-%d frac:%f"), "Date => 2025-005 frac:0.5");
    test_assert_str_eq(DecimalTime(2025, 100, 0.123456).format("Year=%Y Day=%d Fraction=%f"), "Year=2025 Day=100 Fraction=0.123456");
    test_assert_str_eq(DecimalTime(2025, 100, 0.123).format("%F"), "123");

    test_assert_str_eq(DecimalTime(2025, 1, 0.0).format("%f"), "0.0");
    test_assert_str_eq(DecimalTime(2025, 1, 0.0).format("%F"), "0");
    test_assert_str_eq(DecimalTime(2025, 1, 0.0).format("%d"), "001");

    test_assert_str_eq(DecimalTime(-44, 74, 0.25).format("%Y/%D"), "-44/74");
    test_assert_str_eq(DecimalTime(2025, 1000, 0.25).format("%d"), "1000");

    test_assert_str_eq(DecimalTime(2025, 73, 0.5).format("100%% %%Y"), "100% %Y");
    test_assert_str_eq(DecimalTime(2025, 73, 0.5).format("%x %Q %"), "%x %Q %");
    test_assert_str_eq(DecimalTime(2025, 73, 0.5).format(""), "");
    test_assert_str_eq(DecimalTime(2025, 73, 0.5).format("no directives"), "no directives");

    // Negative zero is midnight.
    test_assert_str_eq(DecimalTime(2025, 1, -0.0).format("%f|%F"), "0.0|0");
    {
        LocalTimestamp t;
        test_assert(to_calendar_timestamp(DecimalTime(2025, 1, -0.0), t) == ConversionError::none);
    }

    // Unvalidated values still format.
    test_assert_str_eq(DecimalTime(2025, 73, 1.5).format("%f %F"), "1.5 1.5");

    return true;
}

bool decimal_time_test()
{
    test_assert(from_calendar_test());
    test_assert(invalid_timestamp_test());
    test_assert(to_calendar_test());
    test_assert(invalid_decimal_time_test());
    test_assert(round_trip_test());
    test_assert(format_test());

    return true;
}
