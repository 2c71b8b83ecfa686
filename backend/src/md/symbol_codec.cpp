#include "symbol_codec.hpp"

#include <cctype>

namespace
{
    const std::string kTokyoSuffix = ".T";

    std::string lower(std::string s)
    {
        for (auto &ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        return s;
    }

    bool ends_with(const std::string &s, const std::string &suffix)
    {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

std::string SymbolCodec::to_provider(const std::string &provider, const std::string &c)
{
    if (lower(provider) == "yahoo")
    {
        // Tokyo listings are addressed as "<code>.T"
        if (c.empty() || ends_with(c, kTokyoSuffix))
            return c;
        return c + kTokyoSuffix;
    }
    return c;
}

std::string SymbolCodec::to_canonical(const std::string &provider, const std::string &v)
{
    if (lower(provider) == "yahoo" && ends_with(v, kTokyoSuffix))
    {
        return v.substr(0, v.size() - kTokyoSuffix.size());
    }
    return v;
}
