#pragma once
#include <string>

struct SymbolCodec
{
    // Convert a canonical listing code ("7203") to the provider's ticker ("7203.T").
    static std::string to_provider(const std::string &provider, const std::string &canonical);
    // Convert a provider ticker ("7203.T") back to the canonical code ("7203").
    static std::string to_canonical(const std::string &provider, const std::string &provider_sym);
};
