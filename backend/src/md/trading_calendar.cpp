#include "md/trading_calendar.hpp"

#include <algorithm>

using namespace std::chrono;

namespace {

constexpr hours kJstOffset{9};
constexpr minutes kOpen = hours{9};
constexpr minutes kClose = hours{15} + minutes{30};

struct FixedDay { unsigned month; unsigned day; const char* name; bool national; };

constexpr FixedDay kFixed[] = {
    {1, 1, "New Year's Day", true},
    {1, 2, "Market Holiday", false},
    {1, 3, "Market Holiday", false},
    {2, 11, "National Foundation Day", true},
    {2, 23, "Emperor's Birthday", true},
    {3, 21, "Vernal Equinox Day", true},
    {4, 29, "Showa Day", true},
    {5, 3, "Constitution Memorial Day", true},
    {5, 4, "Greenery Day", true},
    {5, 5, "Children's Day", true},
    {8, 11, "Mountain Day", true},
    {9, 23, "Autumnal Equinox Day", true},
    {11, 3, "Culture Day", true},
    {11, 23, "Labor Thanksgiving Day", true},
    {12, 31, "Market Holiday", false},
};

sys_days nth_monday(int y, unsigned m, unsigned n) {
    return sys_days{year{y} / month{m} / weekday_indexed{Monday, n}};
}

} // namespace

std::vector<Holiday> TradingCalendar::holidays(int y) const {
    std::lock_guard<std::mutex> lk(m_);
    auto it = cache_.find(y);
    if (it != cache_.end()) return it->second;

    std::vector<Holiday> out;
    std::vector<sys_days> closures; // exchange-only days, never substituted
    for (const auto& f : kFixed) {
        const sys_days d{year{y} / month{f.month} / day{f.day}};
        out.push_back({d, f.name});
        if (!f.national) closures.push_back(d);
    }

    out.push_back({nth_monday(y, 1, 2), "Coming of Age Day"});
    out.push_back({nth_monday(y, 9, 3), "Respect for the Aged Day"});
    if (y == 2020) {
        out.push_back({sys_days{year{2020} / July / 23}, "Marine Day"});
        out.push_back({sys_days{year{2020} / July / 24}, "Sports Day"});
        out.push_back({sys_days{year{2020} / August / 10}, "Mountain Day"});
    } else if (y == 2021) {
        out.push_back({sys_days{year{2021} / July / 22}, "Marine Day"});
        out.push_back({sys_days{year{2021} / July / 23}, "Sports Day"});
        out.push_back({sys_days{year{2021} / August / 8}, "Mountain Day"});
    } else {
        out.push_back({nth_monday(y, 7, 3), "Marine Day"});
        out.push_back({nth_monday(y, 10, 2), "Sports Day"});
    }
    if (y == 2020 || y == 2021) {
        // Mountain Day moved off 08-11 in the Olympic years
        out.erase(std::remove_if(out.begin(), out.end(), [&](const Holiday& h) {
            return h.date == sys_days{year{y} / August / 11};
        }), out.end());
    }

    std::sort(out.begin(), out.end(),
              [](const Holiday& a, const Holiday& b) { return a.date < b.date; });

    // A national holiday on Sunday moves to the next day that is not one
    std::vector<Holiday> subs;
    for (const auto& h : out) {
        if (weekday{h.date} != Sunday) continue;
        if (std::find(closures.begin(), closures.end(), h.date) != closures.end()) continue;
        sys_days d = h.date + days{1};
        auto taken = [&](sys_days x) {
            const bool closure = std::find(closures.begin(), closures.end(), x) != closures.end();
            return (!closure && std::any_of(out.begin(), out.end(),
                                            [&](const Holiday& o) { return o.date == x; })) ||
                   std::any_of(subs.begin(), subs.end(), [&](const Holiday& o) { return o.date == x; });
        };
        while (taken(d)) d += days{1};
        subs.push_back({d, h.name + " (substitute)"});
    }
    out.insert(out.end(), subs.begin(), subs.end());
    std::sort(out.begin(), out.end(),
              [](const Holiday& a, const Holiday& b) { return a.date < b.date; });

    cache_.emplace(y, out);
    return out;
}

bool TradingCalendar::is_holiday(year_month_day d) const {
    const sys_days sd{d};
    const auto hs = holidays(static_cast<int>(d.year()));
    return std::any_of(hs.begin(), hs.end(), [&](const Holiday& h) { return h.date == sd; });
}

bool TradingCalendar::is_trading_day(year_month_day d) const {
    const weekday wd{sys_days{d}};
    if (wd == Saturday || wd == Sunday) return false;
    return !is_holiday(d);
}

year_month_day TradingCalendar::next_trading_day(year_month_day from) const {
    sys_days d = sys_days{from} + days{1};
    while (!is_trading_day(year_month_day{d})) d += days{1};
    return year_month_day{d};
}

year_month_day TradingCalendar::previous_trading_day(year_month_day from) const {
    sys_days d = sys_days{from} - days{1};
    while (!is_trading_day(year_month_day{d})) d -= days{1};
    return year_month_day{d};
}

bool TradingCalendar::is_market_open(system_clock::time_point t) const {
    const auto local = floor<minutes>(t) + kJstOffset;
    const sys_days day_start = floor<days>(local);
    if (!is_trading_day(year_month_day{day_start})) return false;
    const minutes since_midnight = local - day_start;
    return since_midnight >= kOpen && since_midnight < kClose;
}
