#pragma once

#include <cstdint>
#include <string>

#include "calendar.h"

bool decimal_time_test();

enum class ConversionError
{
    none,
    invalid_timestamp,     // calendar fields do not form a valid date and time
    invalid_decimal_time,  // day_of_year or decimal_day out of range for the year
};

char const * conversion_error_name(ConversionError error);

/*
 * A point in time written as a year, a 1-based day of that year and the
 * elapsed fraction of the day:
 *
 *   2025.073.5     noon on 14 March 2025
 *   2024.366.75    18:00 on 31 December 2024
 *
 * Construction never validates. Out of range values are reported as
 * ConversionError::invalid_decimal_time when converted to a calendar
 * timestamp.
 */
struct DecimalTime
{
    int32_t year;
    uint32_t day_of_year;
    // [0.0, 1.0). 0.0 is midnight at the start of the day, 0.5 is noon.
    double decimal_day;

    DecimalTime(): DecimalTime(0, 1, 0.0) {}

    DecimalTime(int32_t year_, uint32_t day_of_year_, double decimal_day_):
        year(year_),
        day_of_year(day_of_year_),
        decimal_day(decimal_day_)
    {}

    /*
     * Directives:
     *   %Y  year
     *   %d  day of year, zero padded to 3 digits
     *   %D  day of year, unpadded
     *   %f  fraction of the day, e.g. "0.5" ("0.0" at midnight)
     *   %F  digits of %f after "0.", e.g. "5" ("0" at midnight)
     *   %%  "%"
     * Anything else, including unknown directives, is copied as is.
     */
    std::string format(std::string const & fmt) const;

    bool operator==(DecimalTime const & other) const
    {
        return year == other.year
            && day_of_year == other.day_of_year
            && decimal_day == other.decimal_day;
    }

    bool operator!=(DecimalTime const & other) const
    {
        return !(*this == other);
    }
};

ConversionError from_calendar_timestamp(LocalTimestamp timestamp, DecimalTime & dt);
ConversionError from_calendar_timestamp(Ymdhms const & ymdhms, DecimalTime & dt);
ConversionError from_calendar_timestamp_utc(UtcTimestamp instant, DecimalTime & dt);

// Time of day is rounded to the nearest microsecond. A fraction that rounds
// up to a whole day stays on the last microsecond of day_of_year.
ConversionError to_calendar_timestamp(DecimalTime const & dt, LocalTimestamp & timestamp);
ConversionError to_calendar_timestamp(DecimalTime const & dt, Ymdhms & ymdhms);
ConversionError to_calendar_timestamp_utc(DecimalTime const & dt, UtcTimestamp & instant);
