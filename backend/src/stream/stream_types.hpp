#pragma once
#include <cstdint>

using TopicId = std::int64_t; // watchlist id
using UserId  = std::int64_t;

// Authenticated caller.
struct Principal {
    UserId user_id{0};
};
