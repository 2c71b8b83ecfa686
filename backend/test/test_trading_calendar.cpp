#include "../src/md/poll_schedule.hpp"
#include "../src/md/trading_calendar.hpp"

#include <cassert>
#include <iostream>
#include <memory>

using namespace std::chrono;

static system_clock::time_point utc(year_month_day d, int h, int m) {
    return sys_days{d} + hours{h} + minutes{m};
}

int main() {
    TradingCalendar cal;

    // Fixed, nth-Monday and substitute holidays
    assert(cal.is_holiday(2024y / January / 1));
    assert(cal.is_holiday(2024y / January / 3));
    assert(cal.is_holiday(2024y / January / 8));      // Coming of Age, 2nd Monday
    assert(cal.is_holiday(2024y / February / 12));    // Feb 11 was a Sunday
    assert(cal.is_holiday(2024y / July / 15));        // Marine Day, 3rd Monday
    assert(cal.is_holiday(2024y / September / 16));   // Respect for the Aged, 3rd Monday
    assert(cal.is_holiday(2024y / October / 14));     // Sports Day, 2nd Monday
    assert(cal.is_holiday(2024y / December / 31));
    assert(!cal.is_holiday(2024y / January / 9));
    assert(!cal.is_holiday(2024y / July / 20));

    // Golden Week 2025: May 4 is a Sunday, May 5 and 6 follow
    assert(cal.is_holiday(2025y / May / 6));

    // Olympic years moved the summer holidays
    assert(cal.is_holiday(2021y / July / 22));
    assert(cal.is_holiday(2021y / July / 23));
    assert(cal.is_holiday(2021y / August / 9));       // Aug 8 was a Sunday
    assert(!cal.is_holiday(2021y / October / 11));

    assert(cal.is_trading_day(2024y / January / 9));
    assert(!cal.is_trading_day(2024y / January / 6)); // Saturday
    assert(!cal.is_trading_day(2024y / January / 7)); // Sunday
    assert(!cal.is_trading_day(2024y / January / 8));

    assert(cal.next_trading_day(2024y / December / 30) == 2025y / January / 6);
    assert(cal.previous_trading_day(2024y / January / 9) == 2024y / January / 5);
    assert(cal.previous_trading_day(2024y / January / 4) == 2023y / December / 29);
    assert(cal.is_trading_day(2024y / January / 4));     // Dec 31 2023 was a Sunday: no substitute for exchange closures

    const auto hs = cal.holidays(2024);
    for (std::size_t i = 1; i < hs.size(); ++i) assert(hs[i - 1].date <= hs[i].date);

    // 09:00-15:30 JST is 00:00-06:30 UTC
    assert(cal.is_market_open(utc(2024y / January / 9, 0, 0)));
    assert(cal.is_market_open(utc(2024y / January / 9, 6, 29)));
    assert(!cal.is_market_open(utc(2024y / January / 9, 6, 30)));
    assert(!cal.is_market_open(utc(2024y / January / 8, 23, 59)));   // 08:59 JST
    assert(!cal.is_market_open(utc(2024y / January / 8, 1, 0)));     // holiday
    assert(!cal.is_market_open(utc(2024y / January / 6, 1, 0)));     // Saturday

    // Poll interval
    PollSchedule s;
    s.dev_interval = milliseconds(5000);
    s.trading_interval = milliseconds(7000);
    s.off_hours_interval = milliseconds(60000);
    s.calendar = std::make_shared<const TradingCalendar>();
    assert(s.interval_at(utc(2024y / January / 6, 1, 0)) == milliseconds(5000));
    s.development = false;
    assert(s.interval_at(utc(2024y / January / 9, 1, 0)) == milliseconds(7000));
    assert(s.interval_at(utc(2024y / January / 9, 8, 0)) == milliseconds(60000));
    assert(s.interval_at(utc(2024y / January / 6, 1, 0)) == milliseconds(60000));
    s.calendar.reset();
    assert(s.interval_at(utc(2024y / January / 6, 1, 0)) == milliseconds(7000));

    assert(PollSchedule::fixed(milliseconds(100)).interval_at(system_clock::now()) ==
           milliseconds(100));

    std::cout << "OK\n";
    return 0;
}
