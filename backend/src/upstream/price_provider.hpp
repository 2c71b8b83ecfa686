#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "md/price_quote.hpp"

// The provider as a whole could not be reached (DNS, connect, TLS).
class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Upstream price data. fetch() returns one entry per requested symbol;
// a symbol the provider had nothing for comes back as an unavailable
// quote. Throws ProviderError only when no symbol could be attempted.
class IPriceProvider {
public:
    virtual ~IPriceProvider() = default;
    virtual QuoteMap fetch(const std::vector<std::string>& symbols) = 0;
};
