#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <cstring>
#include <charconv>

// RESP2 encoder/decoder. Used on the wire by resp_kv_store and, for list
// values, as the cache serialization of relationship arrays.

namespace resp {

// Safety limits to prevent resource exhaustion
constexpr int RESP_MAX_ARRAY_SIZE = 1024 * 1024;
constexpr int RESP_MAX_BULK_LEN = 64 * 1024 * 1024;
constexpr int RESP_MAX_DEPTH = 8;

// memchr for '\r' then check '\n'; memchr is SIMD-optimized
inline const char* find_crlf(const char* data, size_t len) noexcept
{
    const char* end = data + len;
    while (true)
    {
        const char* p = static_cast<const char*>(std::memchr(data, '\r', static_cast<size_t>(end - data)));
        if (__builtin_expect(!p || p + 1 >= end, 0))
            return nullptr;
        if (__builtin_expect(p[1] == '\n', 1))
            return p;
        data = p + 1;
    }
}

// ─── Encoding (appends to caller's buffer) ───

inline void encode_bulk_into(std::string& buf, std::string_view str)
{
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), str.size());
    buf += '$';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
    buf.append(str.data(), str.size());
    buf.append("\r\n", 2);
}

inline void encode_array_header_into(std::string& buf, size_t n)
{
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), n);
    buf += '*';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
}

// Command = array of bulk strings
inline void encode_command_into(std::string& buf, const std::vector<std::string_view>& args)
{
    encode_array_header_into(buf, args.size());
    for (auto a : args)
        encode_bulk_into(buf, a);
}

inline std::string encode_command(const std::vector<std::string_view>& args)
{
    std::string out;
    encode_command_into(out, args);
    return out;
}

inline std::string encode_list(const std::vector<std::string>& items)
{
    std::string out;
    encode_array_header_into(out, items.size());
    for (const auto& item : items)
        encode_bulk_into(out, item);
    return out;
}

// ─── Decoding ───

enum class parse_result { ok, incomplete, error };

// Parses one array-of-bulk-strings message (a command, or an encoded list).
// `consumed` is set to the number of bytes used from `buf`.
inline parse_result parse_message(std::string_view buf, std::vector<std::string>& args, size_t& consumed)
{
    args.clear();
    consumed = 0;

    const char* data = buf.data();
    size_t sz = buf.size();

    if (sz == 0)
        return parse_result::incomplete;

    if (data[0] != '*')
        return parse_result::error;

    const char* crlf = find_crlf(data + 1, sz - 1);
    if (!crlf)
        return parse_result::incomplete;

    int count = 0;
    auto [ptr, ec] = std::from_chars(data + 1, crlf, count);
    if (ec != std::errc{} || ptr != crlf || count < 0 || count > RESP_MAX_ARRAY_SIZE)
        return parse_result::error;

    size_t offset = static_cast<size_t>(crlf - data) + 2;

    for (int i = 0; i < count; i++)
    {
        if (offset >= sz)
            return parse_result::incomplete;

        if (data[offset] != '$')
            return parse_result::error;

        const char* end_crlf = find_crlf(data + offset + 1, sz - offset - 1);
        if (!end_crlf)
            return parse_result::incomplete;

        int len = 0;
        auto [p2, e2] = std::from_chars(data + offset + 1, end_crlf, len);
        if (e2 != std::errc{} || len < 0 || len > RESP_MAX_BULK_LEN)
            return parse_result::error;

        offset = static_cast<size_t>(end_crlf - data) + 2;

        if (offset + static_cast<size_t>(len) + 2 > sz)
            return parse_result::incomplete;

        args.emplace_back(data + offset, static_cast<size_t>(len));
        offset += static_cast<size_t>(len) + 2;
    }

    consumed = offset;
    return parse_result::ok;
}

// Decodes a value produced by encode_list; false on malformed input
inline bool decode_list(std::string_view buf, std::vector<std::string>& out)
{
    size_t consumed = 0;
    return parse_message(buf, out, consumed) == parse_result::ok && consumed == buf.size();
}

// ─── Server replies ───

enum class reply_type : uint8_t { simple, error, integer, bulk, nil, array };

struct reply
{
    reply_type type{reply_type::nil};
    std::string str;         // simple / error / bulk payload
    int64_t integer{0};
    std::vector<reply> elements;

    bool is_error() const { return type == reply_type::error; }
    bool is_nil() const { return type == reply_type::nil; }
};

namespace detail {

inline parse_result parse_reply_at(std::string_view buf, size_t& offset, reply& out, int depth)
{
    if (depth > RESP_MAX_DEPTH)
        return parse_result::error;
    if (offset >= buf.size())
        return parse_result::incomplete;

    const char* data = buf.data();
    char marker = data[offset];
    const char* crlf = find_crlf(data + offset + 1, buf.size() - offset - 1);
    if (!crlf)
        return parse_result::incomplete;

    std::string_view line(data + offset + 1, static_cast<size_t>(crlf - (data + offset + 1)));
    size_t next = static_cast<size_t>(crlf - data) + 2;

    switch (marker)
    {
        case '+':
            out.type = reply_type::simple;
            out.str.assign(line.data(), line.size());
            offset = next;
            return parse_result::ok;
        case '-':
            out.type = reply_type::error;
            out.str.assign(line.data(), line.size());
            offset = next;
            return parse_result::ok;
        case ':':
        {
            auto [p, ec] = std::from_chars(line.data(), line.data() + line.size(), out.integer);
            if (ec != std::errc{} || p != line.data() + line.size())
                return parse_result::error;
            out.type = reply_type::integer;
            offset = next;
            return parse_result::ok;
        }
        case '$':
        {
            int64_t len = 0;
            auto [p, ec] = std::from_chars(line.data(), line.data() + line.size(), len);
            if (ec != std::errc{} || len < -1 || len > RESP_MAX_BULK_LEN)
                return parse_result::error;
            if (len == -1)
            {
                out.type = reply_type::nil;
                offset = next;
                return parse_result::ok;
            }
            if (next + static_cast<size_t>(len) + 2 > buf.size())
                return parse_result::incomplete;
            out.type = reply_type::bulk;
            out.str.assign(data + next, static_cast<size_t>(len));
            offset = next + static_cast<size_t>(len) + 2;
            return parse_result::ok;
        }
        case '*':
        {
            int64_t count = 0;
            auto [p, ec] = std::from_chars(line.data(), line.data() + line.size(), count);
            if (ec != std::errc{} || count < -1 || count > RESP_MAX_ARRAY_SIZE)
                return parse_result::error;
            if (count == -1)
            {
                out.type = reply_type::nil;
                offset = next;
                return parse_result::ok;
            }
            out.type = reply_type::array;
            out.elements.clear();
            out.elements.resize(static_cast<size_t>(count));
            size_t pos = next;
            for (auto& el : out.elements)
            {
                auto r = parse_reply_at(buf, pos, el, depth + 1);
                if (r != parse_result::ok)
                    return r;
            }
            offset = pos;
            return parse_result::ok;
        }
        default:
            return parse_result::error;
    }
}

} // namespace detail

// Parses one complete reply from the front of `buf`
inline parse_result parse_reply(std::string_view buf, reply& out, size_t& consumed)
{
    size_t offset = 0;
    auto r = detail::parse_reply_at(buf, offset, out, 0);
    consumed = (r == parse_result::ok) ? offset : 0;
    return r;
}

} // namespace resp
