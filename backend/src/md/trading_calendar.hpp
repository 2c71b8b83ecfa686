#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct Holiday {
    std::chrono::sys_days date;
    std::string name;
};

// Tokyo Stock Exchange calendar: weekends, national holidays (fixed,
// nth-Monday and the 2020/2021 Olympic moves), Sunday substitutes and the
// exchange's year-end/new-year closure. Equinox days use the usual dates.
class TradingCalendar {
public:
    // Sorted by date; computed once per year.
    std::vector<Holiday> holidays(int year) const;

    bool is_holiday(std::chrono::year_month_day d) const;
    bool is_trading_day(std::chrono::year_month_day d) const;
    std::chrono::year_month_day next_trading_day(std::chrono::year_month_day from) const;
    std::chrono::year_month_day previous_trading_day(std::chrono::year_month_day from) const;

    // Continuous session 09:00-15:30 JST (UTC+9, no DST) on a trading day.
    bool is_market_open(std::chrono::system_clock::time_point t) const;

private:
    mutable std::mutex m_;
    mutable std::map<int, std::vector<Holiday>> cache_;
};
