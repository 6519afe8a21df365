#include "calendar.h"
#include "util.h"

#include <memory>

namespace
{
    std::chrono::local_days first_day()
    {
        return std::chrono::local_days{std::chrono::year::min() / std::chrono::January / 1};
    }

    std::chrono::local_days last_day()
    {
        return std::chrono::local_days{std::chrono::year::max() / std::chrono::December / 31};
    }
}

Ymdhms::Ymdhms(int32_t year_, uint8_t month_, uint8_t day_, uint8_t hour_, uint8_t min_, uint8_t sec_, uint32_t usec_)
{
    set(year_, month_, day_, hour_, min_, sec_, usec_);
}

void Ymdhms::set(int32_t year_, uint8_t month_, uint8_t day_, uint8_t hour_, uint8_t min_, uint8_t sec_, uint32_t usec_)
{
    year = year_;
    month = month_;
    day = day_;
    hour = hour_;
    min = min_;
    sec = sec_;
    usec = usec_;
}

bool Ymdhms::_make_date(std::chrono::year_month_day & ymd) const
{
    if (year < static_cast<int>(std::chrono::year::min()) || year > static_cast<int>(std::chrono::year::max()))
    {
        return false;
    }
    ymd = std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day};
    return ymd.ok();
}

bool Ymdhms::make_local_time(LocalTimestamp & t) const
{
    std::chrono::year_month_day ymd;
    if (!_make_date(ymd))
    {
        return false;
    }

    bool const clock_ok = hour < hour_per_day
                       && min < min_per_hour
                       && sec < secs_per_min
                       && usec < usec_per_sec;
    if (!clock_ok)
    {
        return false;
    }

    t = std::chrono::local_days{ymd}
      + std::chrono::hours{hour}
      + std::chrono::minutes{min}
      + std::chrono::seconds{sec}
      + std::chrono::microseconds{usec};
    return true;
}

bool Ymdhms::make_utc_time(UtcTimestamp & t) const
{
    LocalTimestamp local;
    if (!make_local_time(local))
    {
        return false;
    }
    t = UtcTimestamp{local.time_since_epoch()};
    return true;
}

bool Ymdhms::from_local_time(LocalTimestamp t, Ymdhms & ymdhms)
{
    using namespace std::chrono;

    local_days const date = floor<days>(t);
    if (date < first_day() || date > last_day())
    {
        return false;
    }

    year_month_day const ymd{date};
    hh_mm_ss<microseconds> const tod{t - date};

    ymdhms.set(static_cast<int>(ymd.year()),
               static_cast<uint8_t>(static_cast<unsigned>(ymd.month())),
               static_cast<uint8_t>(static_cast<unsigned>(ymd.day())),
               static_cast<uint8_t>(tod.hours().count()),
               static_cast<uint8_t>(tod.minutes().count()),
               static_cast<uint8_t>(tod.seconds().count()),
               static_cast<uint32_t>(tod.subseconds().count()));
    return true;
}

bool Ymdhms::from_utc_time(UtcTimestamp t, Ymdhms & ymdhms)
{
    return from_local_time(LocalTimestamp{t.time_since_epoch()}, ymdhms);
}

bool Ymdhms::add_seconds(int32_t dt_seconds)
{
    LocalTimestamp t;
    if (!make_local_time(t))
    {
        return false;
    }
    return from_local_time(t + std::chrono::seconds{dt_seconds}, *this);
}

uint16_t Ymdhms::day_of_year() const
{
    std::chrono::year_month_day ymd;
    if (!_make_date(ymd))
    {
        return 0;
    }
    std::chrono::sys_days const jan_1{ymd.year() / std::chrono::January / 1};
    return static_cast<uint16_t>((std::chrono::sys_days{ymd} - jan_1).count() + 1);
}

bool Ymdhms::is_leap_year() const
{
    return std::chrono::year{year}.is_leap();
}

bool ymdhms_test()
{
    {
        Ymdhms ymdhms(2022, 1, 1, 0, 0, 0);
        test_assert(ymdhms.add_seconds(30 * secs_per_day));
        test_assert_signed_eq(ymdhms.year, 2022);
        test_assert_signed_eq(ymdhms.month, 1);
        test_assert_signed_eq(ymdhms.day, 31);
    }

    {
        Ymdhms ymdhms(2022, 1, 1, 0, 0, 0);
        test_assert(ymdhms.add_seconds(-secs_per_day));
        test_assert_signed_eq(ymdhms.year, 2021);
        test_assert_signed_eq(ymdhms.month, 12);
        test_assert_signed_eq(ymdhms.day, 31);
    }

    {
        Ymdhms ymdhms(2024, 2, 28, 12, 0, 0);
        test_assert(ymdhms.add_seconds(secs_per_day));
        test_assert_signed_eq(ymdhms.month, 2);
        test_assert_signed_eq(ymdhms.day, 29);
        test_assert_signed_eq(ymdhms.hour, 12);
    }

    {
        Ymdhms ymdhms(1776, 7, 4, 0, 0, 0, 250000);
        test_assert(ymdhms.add_seconds(-1));
        test_assert(ymdhms == Ymdhms(1776, 7, 3, 23, 59, 59, 250000));
    }

    {
        Ymdhms ymdhms(1776, 7, 4, 3, 32, 17);
        test_assert(ymdhms.add_seconds(146));
        test_assert(ymdhms == Ymdhms(1776, 7, 4, 3, 34, 43));
    }

    {
        // Invalid fields are left alone.
        Ymdhms ymdhms(2023, 2, 29, 0, 0, 0);
        test_assert(!ymdhms.add_seconds(1));
        test_assert(ymdhms == Ymdhms(2023, 2, 29, 0, 0, 0));
    }

    test_assert(Ymdhms(2024, 1, 1, 0, 0, 0) < Ymdhms(2024, 1, 1, 0, 0, 0, 1));
    test_assert(Ymdhms(2023, 12, 31, 23, 59, 59, 999999) < Ymdhms(2024, 1, 1, 0, 0, 0));
    test_assert(Ymdhms(2024, 3, 1, 0, 0, 0) >= Ymdhms(2024, 2, 29, 0, 0, 0));

    return true;
}

bool day_of_year_test()
{
    test_assert_unsigned_eq(Ymdhms(2025, 1, 1, 0, 0, 0).day_of_year(), 1u);
    test_assert_unsigned_eq(Ymdhms(2025, 3, 14, 0, 0, 0).day_of_year(), 73u);
    test_assert_unsigned_eq(Ymdhms(2024, 3, 14, 0, 0, 0).day_of_year(), 74u);
    test_assert_unsigned_eq(Ymdhms(2025, 12, 31, 0, 0, 0).day_of_year(), 365u);
    test_assert_unsigned_eq(Ymdhms(2024, 12, 31, 0, 0, 0).day_of_year(), 366u);
    test_assert_unsigned_eq(Ymdhms(1900, 12, 31, 0, 0, 0).day_of_year(), 365u);
    test_assert_unsigned_eq(Ymdhms(2000, 12, 31, 0, 0, 0).day_of_year(), 366u);
    test_assert_unsigned_eq(Ymdhms(2025, 2, 30, 0, 0, 0).day_of_year(), 0u);

    test_assert(Ymdhms(2024, 1, 1, 0, 0, 0).is_leap_year());
    test_assert(!Ymdhms(2025, 1, 1, 0, 0, 0).is_leap_year());
    test_assert(!Ymdhms(1900, 1, 1, 0, 0, 0).is_leap_year());
    test_assert(Ymdhms(2000, 1, 1, 0, 0, 0).is_leap_year());
    test_assert(Ymdhms(0, 1, 1, 0, 0, 0).is_leap_year());

    return true;
}

bool validation_test()
{
    LocalTimestamp t;

    test_assert(Ymdhms(2025, 3, 14, 15, 9, 26, 535897).make_local_time(t));
    test_assert(Ymdhms(2024, 2, 29, 23, 59, 59, 999999).make_local_time(t));
    test_assert(Ymdhms(-44, 3, 15, 12, 0, 0).make_local_time(t));

    test_assert(!Ymdhms(2025, 2, 29, 0, 0, 0).make_local_time(t));
    test_assert(!Ymdhms(2025, 13, 1, 0, 0, 0).make_local_time(t));
    test_assert(!Ymdhms(2025, 0, 1, 0, 0, 0).make_local_time(t));
    test_assert(!Ymdhms(2025, 4, 31, 0, 0, 0).make_local_time(t));
    test_assert(!Ymdhms(2025, 1, 1, 24, 0, 0).make_local_time(t));
    test_assert(!Ymdhms(2025, 1, 1, 25, 0, 0).make_local_time(t));
    test_assert(!Ymdhms(2025, 1, 1, 0, 60, 0).make_local_time(t));
    test_assert(!Ymdhms(2025, 1, 1, 0, 0, 60).make_local_time(t));
    test_assert(!Ymdhms(2025, 1, 1, 0, 0, 0, 1000000).make_local_time(t));
    test_assert(!Ymdhms(40000, 1, 1, 0, 0, 0).make_local_time(t));
    test_assert(!Ymdhms().make_local_time(t));

    return true;
}

bool local_time_test()
{
    Ymdhms const original(2025, 3, 14, 15, 9, 26, 535897);
    LocalTimestamp t;
    test_assert(original.make_local_time(t));

    Ymdhms back;
    test_assert(Ymdhms::from_local_time(t, back));
    test_assert(back == original);

    UtcTimestamp u;
    test_assert(original.make_utc_time(u));
    test_assert(u.time_since_epoch() == t.time_since_epoch());

    {
        // Before the epoch, floor<days> must still land on the right date.
        Ymdhms const early(1969, 12, 31, 23, 59, 59, 500000);
        test_assert(early.make_local_time(t));
        test_assert(Ymdhms::from_local_time(t, back));
        test_assert(back == early);
    }

    {
        Ymdhms const epoch(1970, 1, 1, 0, 0, 0);
        test_assert(Ymdhms::from_utc_time(UtcTimestamp{}, back));
        test_assert(back == epoch);
    }

    {
        LocalTimestamp const far = LocalTimestamp{} + std::chrono::years{40000};
        Ymdhms untouched(2000, 1, 1, 0, 0, 0);
        test_assert(!Ymdhms::from_local_time(far, untouched));
        test_assert(untouched == Ymdhms(2000, 1, 1, 0, 0, 0));
    }

    return true;
}

bool time_representation_test()
{
    Ymdhms ymdhms;
    UtcTimestamp utc;

    test_assert(Ymdhms(2025, 12, 31, 23, 30, 0).make_utc_time(utc));

    std::shared_ptr<TimeRepresentation> rep = std::make_shared<TimeRepUtc>();
    test_assert(rep->abbrev() == "UTC");
    test_assert(rep->make_ymdhms(utc, ymdhms));
    test_assert(ymdhms == Ymdhms(2025, 12, 31, 23, 30, 0));

    rep = std::make_shared<TimeZoneFixed>("CET", 1 * secs_per_hour);
    test_assert(rep->abbrev() == "CET");
    test_assert(rep->make_ymdhms(utc, ymdhms));
    test_assert(ymdhms == Ymdhms(2026, 1, 1, 0, 30, 0));

    test_assert(Ymdhms(2025, 1, 1, 2, 0, 0).make_utc_time(utc));
    rep = std::make_shared<TimeZoneFixed>("NST", -(3 * secs_per_hour + 30 * secs_per_min));
    test_assert(rep->make_ymdhms(utc, ymdhms));
    test_assert(ymdhms == Ymdhms(2024, 12, 31, 22, 30, 0));

    {
        std::unique_ptr<TimeRepresentation> owned = std::make_unique<TimeZoneFixed>("JST", 9 * secs_per_hour);
        test_assert(owned->abbrev() == "JST");
        test_assert(owned->make_ymdhms(utc, ymdhms));
        test_assert(ymdhms == Ymdhms(2025, 1, 1, 11, 0, 0));
    }

    return true;
}

bool calendar_test()
{
    test_assert(ymdhms_test());
    test_assert(day_of_year_test());
    test_assert(validation_test());
    test_assert(local_time_test());
    test_assert(time_representation_test());

    return true;
}
