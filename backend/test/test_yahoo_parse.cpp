#include "../src/md/symbol_codec.hpp"
#include "../src/upstream/yahoo_rest.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main() {
    // Tokyo codes
    assert(SymbolCodec::to_provider("yahoo", "7203") == "7203.T");
    assert(SymbolCodec::to_provider("Yahoo", "7203.T") == "7203.T");
    assert(SymbolCodec::to_provider("other", "7203") == "7203");
    assert(SymbolCodec::to_canonical("yahoo", "7203.T") == "7203");
    assert(SymbolCodec::to_canonical("yahoo", "AAPL") == "AAPL");

    const std::string chart = R"({"chart":{"result":[{"meta":{
        "currency":"JPY","symbol":"7203.T","regularMarketPrice":2500.5,
        "chartPreviousClose":2450.0,"regularMarketTime":1762664400},
        "timestamp":[1762664400],"indicators":{"quote":[{}]}}],"error":null}})";
    PriceQuote q = YahooRest::parse_chart("7203", chart, 42);
    assert(q.symbol == "7203");
    assert(q.available() && *q.price == 2500.5);
    assert(q.previous_close && *q.previous_close == 2450.0);
    assert(q.ts_ms == 1762664400000LL);

    // previousClose is the fallback reference; missing time keeps now
    const std::string alt = R"({"chart":{"result":[{"meta":{
        "regularMarketPrice":100,"previousClose":90}}],"error":null}})";
    PriceQuote a = YahooRest::parse_chart("9984", alt, 42);
    assert(a.available() && *a.price == 100.0 && *a.previous_close == 90.0);
    assert(a.ts_ms == 42);

    // Unknown ticker
    const std::string not_found = R"({"chart":{"result":null,"error":{
        "code":"Not Found","description":"No data found, symbol may be delisted"}}})";
    PriceQuote nf = YahooRest::parse_chart("0000", not_found, 7);
    assert(!nf.available() && nf.symbol == "0000" && nf.ts_ms == 7);

    // Garbage
    assert(!YahooRest::parse_chart("1", "<html>rate limited</html>", 0).available());
    assert(!YahooRest::parse_chart("1", R"({"chart":{"result":[{"meta":{}}]}})", 0).available());

    std::cout << "OK\n";
    return 0;
}
