#pragma once
#include <cstdint>
#include <charconv>
#include <string>
#include <string_view>
#include <vector>

// FNV-1a, used for switch-based command and keyword dispatch
constexpr uint32_t fnv1a(std::string_view sv)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
        hash = (hash ^ static_cast<uint8_t>(c)) * 16777619u;
    return hash;
}

// Case-insensitive variant: protocol verbs and enum names are accepted in any case
constexpr uint32_t fnv1a_lower(std::string_view sv)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
    {
        char lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
        hash = (hash ^ static_cast<uint8_t>(lower)) * 16777619u;
    }
    return hash;
}

inline std::string_view trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
        sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n'))
        sv.remove_suffix(1);
    return sv;
}

// Splits on `sep`, dropping empty pieces ("a,,b" -> {"a","b"})
inline std::vector<std::string> split(std::string_view sv, char sep)
{
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= sv.size())
    {
        size_t pos = sv.find(sep, start);
        if (pos == std::string_view::npos)
            pos = sv.size();
        auto piece = trim(sv.substr(start, pos - start));
        if (!piece.empty())
            out.emplace_back(piece);
        start = pos + 1;
    }
    return out;
}

inline bool parse_int64(std::string_view sv, int64_t& out)
{
    if (sv.empty())
        return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

inline std::string to_upper(std::string_view sv)
{
    std::string out(sv);
    for (auto& c : out)
    {
        if (c >= 'a' && c <= 'z')
            c = static_cast<char>(c - 32);
    }
    return out;
}
