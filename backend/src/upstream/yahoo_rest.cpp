#include "yahoo_rest.hpp"
#include "md/symbol_codec.hpp"

#include <curl/curl.h>
#include <simdjson.h>

#include <chrono>
#include <iostream>
#include <utility>

// Helper for CURL write callback
static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s) {
    size_t new_length = size * nmemb;
    s->append(static_cast<char*>(contents), new_length);
    return new_length;
}

static std::int64_t wall_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

YahooRest::YahooRest(std::string base_url, long timeout_ms)
    : base_url_(std::move(base_url))
    , timeout_ms_(timeout_ms)
{
}

bool YahooRest::http_get(const std::string& url, std::string& body, long& http_status,
                         std::string& error) const {
    http_status = 0;
    CURL* curl = curl_easy_init();
    if (!curl) {
        error = "curl_easy_init failed";
        return false;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    headers = curl_slist_append(headers, "User-Agent: watchlist-stream/1.0");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    bool ok = (res == CURLE_OK);
    if (ok) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    } else {
        error = curl_easy_strerror(res);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return ok;
}

PriceQuote YahooRest::parse_chart(const std::string& symbol, const std::string& body,
                                  std::int64_t now_ms) {
    PriceQuote q = PriceQuote::unavailable(symbol, now_ms);

    simdjson::ondemand::parser parser;
    simdjson::padded_string pj(body);
    auto doc_res = parser.iterate(pj);
    if (auto err = doc_res.error()) {
        std::cerr << "[yahoo] " << symbol << " parse error: " << err << "\n";
        return q;
    }
    simdjson::ondemand::document doc = std::move(doc_res.value());

    simdjson::ondemand::array results;
    if (doc["chart"]["result"].get_array().get(results)) return q;

    try {
        for (simdjson::ondemand::value r : results) {
            simdjson::ondemand::object meta;
            if (r["meta"].get_object().get(meta)) break;

            double price = 0.0;
            if (!meta["regularMarketPrice"].get_double().get(price)) q.price = price;

            double prev = 0.0;
            if (!meta["chartPreviousClose"].get_double().get(prev)) {
                q.previous_close = prev;
            } else if (!meta["previousClose"].get_double().get(prev)) {
                q.previous_close = prev;
            }

            std::int64_t t = 0;
            if (!meta["regularMarketTime"].get_int64().get(t) && t > 0) q.ts_ms = t * 1000;
            break; // one result per ticker
        }
    } catch (const simdjson::simdjson_error& e) {
        std::cerr << "[yahoo] " << symbol << " malformed chart: " << e.what() << "\n";
        return PriceQuote::unavailable(symbol, now_ms);
    }
    return q;
}

QuoteMap YahooRest::fetch(const std::vector<std::string>& symbols) {
    QuoteMap out;
    std::size_t transport_failures = 0;
    std::string last_error;

    for (const auto& sym : symbols) {
        const std::string ticker = SymbolCodec::to_provider("yahoo", sym);
        const std::string url = base_url_ + "/v8/finance/chart/" + ticker + "?range=2d&interval=1d";

        std::string body;
        long status = 0;
        std::string error;
        if (!http_get(url, body, status, error)) {
            ++transport_failures;
            last_error = error;
            std::cerr << "[yahoo] " << ticker << " CURL error: " << error << "\n";
            out[sym] = PriceQuote::unavailable(sym, wall_ms());
            continue;
        }
        if (status != 200) {
            std::cerr << "[yahoo] " << ticker << " HTTP " << status << "\n";
            out[sym] = PriceQuote::unavailable(sym, wall_ms());
            continue;
        }
        out[sym] = parse_chart(sym, body, wall_ms());
    }

    if (!symbols.empty() && transport_failures == symbols.size()) {
        throw ProviderError("yahoo unreachable: " + last_error);
    }
    return out;
}
