#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>

namespace protolayout {

// =============================================================================
// Text helpers
// =============================================================================

inline std::string_view trimView(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

inline std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool startsWith(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size()
        && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Fixed-point rendering with trailing zeros removed ("2.500000" -> "2.5").
inline std::string formatNumber(double value, int decimals = 6) {
    if (value == 0.0 || std::fabs(value) < 0.5 * std::pow(10.0, -decimals)) return "0";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    std::string out(buf);
    if (out.find('.') != std::string::npos) {
        while (!out.empty() && out.back() == '0') out.pop_back();
        if (!out.empty() && out.back() == '.') out.pop_back();
    }
    if (out == "-0") out = "0";
    return out;
}

// =============================================================================
// Digest helpers (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashU64(std::uint64_t h, std::uint64_t v) {
    h = hashU32(h, static_cast<std::uint32_t>(v & 0xFFFFFFFFu));
    return hashU32(h, static_cast<std::uint32_t>(v >> 32));
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint64_t hashString(std::uint64_t h, std::string_view text) {
    h = hashU32(h, static_cast<std::uint32_t>(text.size()));
    if (!text.empty()) {
        h = hashBytes(h, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    }
    return h;
}

} // namespace protolayout
