#pragma once
#include <string>
#include <vector>

#include "price_provider.hpp"

// Yahoo Finance chart API client (one GET per ticker).
class YahooRest : public IPriceProvider {
public:
    explicit YahooRest(std::string base_url = "https://query1.finance.yahoo.com",
                       long timeout_ms = 3000);

    QuoteMap fetch(const std::vector<std::string>& symbols) override;

    // Parse a /v8/finance/chart response body. Unavailable quote on any
    // missing field.
    static PriceQuote parse_chart(const std::string& symbol, const std::string& body,
                                  std::int64_t now_ms);

private:
    // Returns false on transport failure; http_status 0 in that case.
    bool http_get(const std::string& url, std::string& body, long& http_status,
                  std::string& error) const;

    std::string base_url_;
    long timeout_ms_;
};
