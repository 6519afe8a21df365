#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cinttypes>
#include <string>

int32_t constexpr secs_per_min = 60;
int32_t constexpr min_per_hour = 60;
int32_t constexpr hour_per_day = 24;
int32_t constexpr secs_per_hour = secs_per_min * min_per_hour;
int32_t constexpr secs_per_day = secs_per_hour * hour_per_day;
int32_t constexpr min_per_day = min_per_hour * hour_per_day;

int64_t constexpr usec_per_sec = 1000000;
int64_t constexpr usec_per_day = secs_per_day * usec_per_sec;

// Naive timestamp: calendar date and clock time with no time zone attached.
using LocalTimestamp = std::chrono::local_time<std::chrono::microseconds>;

// Instant tagged as UTC.
using UtcTimestamp = std::chrono::sys_time<std::chrono::microseconds>;

bool calendar_test();

// Calendar fields of a timestamp, proleptic Gregorian. All calendar math
// (leap years, month lengths, ordinal days) is answered by <chrono>.
struct Ymdhms
{
    int32_t year;
    uint8_t month;
    uint8_t day;
    uint8_t hour;
    uint8_t min;
    uint8_t sec;
    uint32_t usec;

    Ymdhms(): Ymdhms(0, 0, 0, 0, 0, 0) {}

    Ymdhms(int32_t year_, uint8_t month_, uint8_t day_, uint8_t hour_, uint8_t min_, uint8_t sec_, uint32_t usec_ = 0);

    void set(int32_t year_, uint8_t month_, uint8_t day_, uint8_t hour_, uint8_t min_, uint8_t sec_, uint32_t usec_ = 0);

    // False if the fields do not name a real date and time of day.
    bool make_local_time(LocalTimestamp & t) const;
    bool make_utc_time(UtcTimestamp & t) const;

    // False if t lies outside the years std::chrono::year can hold.
    static bool from_local_time(LocalTimestamp t, Ymdhms & ymdhms);
    static bool from_utc_time(UtcTimestamp t, Ymdhms & ymdhms);

    // Leaves the fields untouched and returns false if they are invalid or
    // the result would leave the calendar's range.
    bool add_seconds(int32_t dt_seconds);

    // 1-based. 0 if the date fields are invalid.
    uint16_t day_of_year() const;
    bool is_leap_year() const;

    bool operator==(Ymdhms const & other) const
    {
        return year == other.year
            && month == other.month
            && day == other.day
            && hour == other.hour
            && min == other.min
            && sec == other.sec
            && usec == other.usec;
    }

    bool operator<(Ymdhms const & other) const
    {
        if (year  < other.year ) { return true; } else if (year  > other.year ) { return false; } else
        if (month < other.month) { return true; } else if (month > other.month) { return false; } else
        if (day   < other.day  ) { return true; } else if (day   > other.day  ) { return false; } else
        if (hour  < other.hour ) { return true; } else if (hour  > other.hour ) { return false; } else
        if (min   < other.min  ) { return true; } else if (min   > other.min  ) { return false; } else
        if (sec   < other.sec  ) { return true; } else if (sec   > other.sec  ) { return false; } else
        if (usec  < other.usec ) { return true; } else { return false; }
    }

    bool operator!=(Ymdhms const & other) const
    {
        return !(*this == other);
    }

    bool operator<=(Ymdhms const & other) const
    {
        return (*this < other) || (*this == other);
    }

    bool operator>(Ymdhms const & other) const
    {
        return !(*this <= other);
    }

    bool operator>=(Ymdhms const & other) const
    {
        return !(*this < other);
    }

    void print() const
    {
        printf("%" PRId32 "-%02d-%02d %02d:%02d:%02d.%06" PRIu32, year, month, day, hour, min, sec, usec);
    }

private:
    bool _make_date(std::chrono::year_month_day & ymd) const;
};

class TimeRepresentation
{
public:
    virtual ~TimeRepresentation() = default;

    virtual bool make_ymdhms(UtcTimestamp utc, Ymdhms & ymdhms) const = 0;
    virtual std::string abbrev() const = 0;
};

class TimeRepUtc: public TimeRepresentation
{
public:
    bool make_ymdhms(UtcTimestamp utc, Ymdhms & ymdhms) const override
    {
        return Ymdhms::from_utc_time(utc, ymdhms);
    }

    std::string abbrev() const override
    {
        return _abbrev;
    }

private:
    static constexpr char const * _abbrev = "UTC";
};

class TimeZoneFixed: public TimeRepresentation
{
public:
    TimeZoneFixed(std::string const & abbrev, int32_t utc_offset_seconds):
        _abbrev(abbrev),
        _utc_offset_seconds(utc_offset_seconds)
    {}

    bool make_ymdhms(UtcTimestamp utc, Ymdhms & ymdhms) const override
    {
        Ymdhms shifted;
        if (!Ymdhms::from_utc_time(utc, shifted) || !shifted.add_seconds(_utc_offset_seconds))
        {
            return false;
        }
        ymdhms = shifted;
        return true;
    }

    std::string abbrev() const override
    {
        return _abbrev;
    }

    int32_t utc_offset_seconds() const { return _utc_offset_seconds; }

private:
    std::string const _abbrev;
    int32_t _utc_offset_seconds;
};
