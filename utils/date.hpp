#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

// Calendar date stored as days since 1970-01-01.
using Date = int32_t;

inline Date make_date(int year, unsigned month, unsigned day) {
    using namespace std::chrono;
    year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!ymd.ok()) throw std::invalid_argument("invalid calendar date");
    return static_cast<Date>(sys_days{ymd}.time_since_epoch().count());
}

inline Date first_day_of_month(int year, unsigned month) {
    return make_date(year, month, 1);
}

inline Date first_day_of_next_month(int year, unsigned month) {
    using namespace std::chrono;
    year_month ym = std::chrono::year{year} / std::chrono::month{month};
    if (!ym.ok()) throw std::invalid_argument("invalid calendar month");
    ym += months{1};
    return static_cast<Date>(sys_days{ym / 1}.time_since_epoch().count());
}

// "YYYY-MM-DD", used by log lines and the driver output.
inline std::string date_to_string(Date d) {
    using namespace std::chrono;
    year_month_day ymd{sys_days{days{d}}};
    char buf[16];
    ::snprintf(
        buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return std::string(buf);
}

// Half-open range [from, to).
struct DateRange {
    Date from;
    Date to;

    bool contains(Date d) const noexcept { return from <= d && d < to; }

    static DateRange month(int year, unsigned month) {
        return DateRange{first_day_of_month(year, month), first_day_of_next_month(year, month)};
    }
};

struct CalendarDate {
    int year;
    unsigned month;
    unsigned day;
};

inline CalendarDate to_calendar_date(Date d) {
    using namespace std::chrono;
    year_month_day ymd{sys_days{days{d}}};
    return CalendarDate{
        static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day())};
}

inline Date today() {
    using namespace std::chrono;
    return static_cast<Date>(floor<days>(system_clock::now()).time_since_epoch().count());
}
