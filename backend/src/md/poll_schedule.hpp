#pragma once
#include <chrono>
#include <memory>

#include "md/trading_calendar.hpp"

// How long a topic worker waits between polls.
struct PollSchedule {
    bool development{true};
    std::chrono::milliseconds dev_interval{5000};
    std::chrono::milliseconds trading_interval{5000};
    std::chrono::milliseconds off_hours_interval{60000};
    std::shared_ptr<const TradingCalendar> calendar; // null: always trading hours

    std::chrono::milliseconds interval_at(std::chrono::system_clock::time_point now) const {
        if (development) return dev_interval;
        if (!calendar || calendar->is_market_open(now)) return trading_interval;
        return off_hours_interval;
    }

    static PollSchedule fixed(std::chrono::milliseconds every) {
        PollSchedule s;
        s.dev_interval = every;
        return s;
    }
};
