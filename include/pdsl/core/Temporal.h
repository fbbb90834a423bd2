// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <optional>
#include <fmt/format.h>

#include <pdsl/support/types.h>
#include <pdsl/support/string.h>
#include <pdsl/support/logging.h>
#include <pdsl/support/exception.h>

namespace pdsl {

/////////////////////////////////////////////////////////////////////////////
/// A calendar date, in one of two mutually exclusive forms:
/// - year, month, day-of-month, rendered `YYYY-MM-DD`
/// - year, day-of-year, rendered `YYYY-DDD`; the month is absent.
/////////////////////////////////////////////////////////////////////////////
class Date
{
  public:
    Date(int year, std::optional<int> month, int day);

    static bool is_leap_year(int year) { return (year % 4 == 0) && (year % 100 != 0 || year % 400 == 0); }
    static int days_in_month(int year, int month);
    static int days_in_year(int year) { return is_leap_year(year)? 366: 365; }

    int year() const                       { return m_year; }
    const std::optional<int>& month() const { return m_month; }
    int day() const                        { return m_day; }

    bool is_day_of_year() const { return !m_month; }

    String to_str() const;

    bool operator == (const Date& other) const = default;

  private:
    int m_year;
    std::optional<int> m_month;
    int m_day;
};

inline
int Date::days_in_month(int year, int month) {
    static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    PDSL_ASSERT(month >= 1 && month <= 12);
    return days[month - 1] + ((month == 2 && is_leap_year(year))? 1: 0);
}

inline
Date::Date(int year, std::optional<int> month, int day) : m_year{year}, m_month{month}, m_day{day} {
    if (year < 0 || year > 9999)
        throw ValidationError(fmt::format("year {} is not between 0 and 9999", year));

    int max_day;
    if (month) {
        if (*month < 1 || *month > 12)
            throw ValidationError(fmt::format("month {} is not between 1 and 12", *month));
        max_day = days_in_month(year, *month);
    } else {
        max_day = days_in_year(year);
    }

    if (day < 1 || day > max_day)
        throw ValidationError(fmt::format("day {} is not between 1 and {}", day, max_day));
}

inline
String Date::to_str() const {
    if (m_month) return fmt::format("{:04d}-{:02d}-{:02d}", m_year, *m_month, m_day);
    return fmt::format("{:04d}-{:03d}", m_year, m_day);
}


/////////////////////////////////////////////////////////////////////////////
/// A time of day, which is either local, UTC, or offset by a zone.
/// - When the UTC flag is set, any zone offset passed to the constructor is
///   discarded, and `zone_hour` and `zone_minute` are absent.
/// - The second, if present, may have a fractional part.
/////////////////////////////////////////////////////////////////////////////
class Time
{
  public:
    Time(int hour, int minute,
         std::optional<Float> second = std::nullopt,
         bool utc = false,
         std::optional<int> zone_hour = std::nullopt,
         std::optional<int> zone_minute = std::nullopt);

    int hour() const                            { return m_hour; }
    int minute() const                          { return m_minute; }
    const std::optional<Float>& second() const  { return m_second; }
    bool utc() const                            { return m_utc; }
    const std::optional<int>& zone_hour() const   { return m_zone_hour; }
    const std::optional<int>& zone_minute() const { return m_zone_minute; }

    bool is_local() const { return !m_utc && !m_zone_hour; }

    String to_str() const;

    bool operator == (const Time& other) const = default;

  private:
    int m_hour;
    int m_minute;
    std::optional<Float> m_second;
    bool m_utc;
    std::optional<int> m_zone_hour;
    std::optional<int> m_zone_minute;
};

inline
Time::Time(int hour, int minute, std::optional<Float> second, bool utc,
           std::optional<int> zone_hour, std::optional<int> zone_minute)
  : m_hour{hour}
  , m_minute{minute}
  , m_second{second}
  , m_utc{utc}
{
    if (hour < 0 || hour > 23)
        throw ValidationError(fmt::format("hour {} is not between 0 and 23", hour));
    if (minute < 0 || minute > 59)
        throw ValidationError(fmt::format("minute {} is not between 0 and 59", minute));
    if (second && !(*second >= 0 && *second < 60))
        throw ValidationError(fmt::format("second {} is not in [0, 60)", *second));

    if (utc) {
        if (zone_hour || zone_minute)
            PDSL_WARN("zone offset discarded from UTC time {:02d}:{:02d}", hour, minute);
        return;
    }

    if (zone_minute && !zone_hour)
        throw ValidationError("zone minute given without zone hour");
    if (zone_hour && (*zone_hour < -12 || *zone_hour > 12))
        throw ValidationError(fmt::format("zone hour {} is not between -12 and 12", *zone_hour));
    if (zone_minute && (*zone_minute < 0 || *zone_minute > 59))
        throw ValidationError(fmt::format("zone minute {} is not between 0 and 59", *zone_minute));

    m_zone_hour = zone_hour;
    m_zone_minute = zone_minute;
}

inline
String Time::to_str() const {
    auto str = fmt::format("{:02d}:{:02d}", m_hour, m_minute);

    if (m_second) {
        auto sec = float_to_str(*m_second, true);
        auto int_digits = sec.find('.');
        if (int_digits == String::npos) int_digits = sec.size();
        str += ':';
        if (int_digits < 2) str += '0';
        str += sec;
    }

    if (m_utc) {
        str += 'Z';
    } else if (m_zone_hour) {
        str += fmt::format("{:+03d}", *m_zone_hour);
        if (m_zone_minute) str += fmt::format(":{:02d}", *m_zone_minute);
    }

    return str;
}


/// A date and a time, rendered `DATE`T`TIME`.
class DateTime
{
  public:
    DateTime(const Date& date, const Time& time) : m_date{date}, m_time{time} {}

    const Date& date() const { return m_date; }
    const Time& time() const { return m_time; }

    String to_str() const { return m_date.to_str() + 'T' + m_time.to_str(); }

    bool operator == (const DateTime& other) const = default;

  private:
    Date m_date;
    Time m_time;
};

} // namespace pdsl
