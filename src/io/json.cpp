#include "io/json.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>

namespace cursorfx::json
{

namespace
{

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

size_t skip_space(std::string_view s, size_t pos)
{
    while (pos < s.size() && is_space(s[pos]))
        ++pos;
    return pos;
}

// Index one past the JSON value starting at pos, or npos if unterminated.
size_t skip_value(std::string_view s, size_t pos)
{
    if (pos >= s.size())
        return std::string_view::npos;

    if (s[pos] == '"')
    {
        for (size_t i = pos + 1; i < s.size(); ++i)
        {
            if (s[i] == '\\')
                ++i;
            else if (s[i] == '"')
                return i + 1;
        }
        return std::string_view::npos;
    }

    if (s[pos] == '{' || s[pos] == '[')
    {
        int  depth     = 0;
        bool in_string = false;
        for (size_t i = pos; i < s.size(); ++i)
        {
            char c = s[i];
            if (in_string)
            {
                if (c == '\\')
                    ++i;
                else if (c == '"')
                    in_string = false;
                continue;
            }
            if (c == '"')
                in_string = true;
            else if (c == '{' || c == '[')
                ++depth;
            else if (c == '}' || c == ']')
            {
                if (--depth == 0)
                    return i + 1;
            }
        }
        return std::string_view::npos;
    }

    size_t i = pos;
    while (i < s.size() && s[i] != ',' && s[i] != '}' && s[i] != ']' && !is_space(s[i]))
        ++i;
    return i;
}

void append_utf8(std::string& out, unsigned cp)
{
    if (cp < 0x80)
    {
        out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Four hex digits at s[pos..pos+4).
std::optional<unsigned> parse_hex4(std::string_view s, size_t pos)
{
    if (pos + 4 > s.size())
        return std::nullopt;
    unsigned cp  = 0;
    auto     hex = s.substr(pos, 4);
    auto [p, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), cp, 16);
    if (ec != std::errc{} || p != hex.data() + hex.size())
        return std::nullopt;
    return cp;
}

constexpr unsigned REPLACEMENT_CHAR = 0xFFFD;

}   // anonymous namespace

// ─── Writing ────────────────────────────────────────────────────────────────

void write_string(std::ostringstream& ss, std::string_view s)
{
    ss << '"';
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                ss << "\\\"";
                break;
            case '\\':
                ss << "\\\\";
                break;
            case '\n':
                ss << "\\n";
                break;
            case '\r':
                ss << "\\r";
                break;
            case '\t':
                ss << "\\t";
                break;
            case '\b':
                ss << "\\b";
                break;
            case '\f':
                ss << "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    ss << buf;
                }
                else
                {
                    ss << c;
                }
                break;
        }
    }
    ss << '"';
}

void write_number(std::ostringstream& ss, double v)
{
    if (!std::isfinite(v))
    {
        ss << "null";
        return;
    }
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc{})
    {
        ss << "null";
        return;
    }
    ss.write(buf, end - buf);
}

void write_key(std::ostringstream& ss, std::string_view key, bool& first)
{
    if (!first)
        ss << ',';
    first = false;
    write_string(ss, key);
    ss << ':';
}

// ─── Reading ────────────────────────────────────────────────────────────────

std::string_view trim(std::string_view s)
{
    size_t b = 0;
    while (b < s.size() && is_space(s[b]))
        ++b;
    size_t e = s.size();
    while (e > b && is_space(s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

bool is_object(std::string_view value)
{
    value = trim(value);
    return value.size() >= 2 && value.front() == '{' && value.back() == '}';
}

bool is_array(std::string_view value)
{
    value = trim(value);
    return value.size() >= 2 && value.front() == '[' && value.back() == ']';
}

std::optional<std::string_view> find_member(std::string_view object, std::string_view key)
{
    object = trim(object);
    if (object.empty() || object.front() != '{')
        return std::nullopt;

    size_t pos = 1;
    while (true)
    {
        pos = skip_space(object, pos);
        if (pos >= object.size() || object[pos] != '"')
            return std::nullopt;

        size_t key_end = skip_value(object, pos);
        if (key_end == std::string_view::npos)
            return std::nullopt;
        std::string_view name = object.substr(pos + 1, key_end - pos - 2);

        pos = skip_space(object, key_end);
        if (pos >= object.size() || object[pos] != ':')
            return std::nullopt;
        pos = skip_space(object, pos + 1);

        size_t value_end = skip_value(object, pos);
        if (value_end == std::string_view::npos)
            return std::nullopt;
        if (name == key)
            return trim(object.substr(pos, value_end - pos));

        pos = skip_space(object, value_end);
        if (pos >= object.size() || object[pos] != ',')
            return std::nullopt;
        ++pos;
    }
}

std::vector<std::string_view> array_elements(std::string_view array)
{
    std::vector<std::string_view> out;
    array = trim(array);
    if (array.empty() || array.front() != '[')
        return out;

    size_t pos = skip_space(array, 1);
    if (pos < array.size() && array[pos] == ']')
        return out;

    while (pos < array.size())
    {
        size_t end = skip_value(array, pos);
        if (end == std::string_view::npos)
            break;
        out.push_back(trim(array.substr(pos, end - pos)));

        pos = skip_space(array, end);
        if (pos >= array.size() || array[pos] != ',')
            break;
        pos = skip_space(array, pos + 1);
    }
    return out;
}

std::optional<double> as_number(std::string_view value)
{
    value = trim(value);
    if (value.empty() || (value.front() != '-' && (value.front() < '0' || value.front() > '9')))
        return std::nullopt;

    const char* first = value.data();
    const char* last  = value.data() + value.size();
    double      v     = 0.0;
    auto [p, ec]      = std::from_chars(first, last, v);
    if (ec != std::errc{} || p != last)
        return std::nullopt;
    return v;
}

std::optional<std::string> as_string(std::string_view value)
{
    value = trim(value);
    if (value.size() < 2 || value.front() != '"' || value.back() != '"')
        return std::nullopt;

    std::string out;
    out.reserve(value.size() - 2);
    for (size_t i = 1; i + 1 < value.size(); ++i)
    {
        char c = value[i];
        if (c != '\\')
        {
            out += c;
            continue;
        }
        if (++i + 1 > value.size() - 1)
            break;
        switch (value[i])
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            case 'u':
            {
                auto cp = parse_hex4(value, i + 1);
                if (!cp || i + 4 >= value.size())
                    return std::nullopt;
                i += 4;
                if (*cp >= 0xD800 && *cp <= 0xDBFF)
                {
                    // High surrogate: combine with a following \uDC00-\uDFFF.
                    std::optional<unsigned> low;
                    if (i + 2 < value.size() && value[i + 1] == '\\' && value[i + 2] == 'u')
                        low = parse_hex4(value, i + 3);
                    if (low && *low >= 0xDC00 && *low <= 0xDFFF && i + 6 < value.size())
                    {
                        append_utf8(out, 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00));
                        i += 6;
                    }
                    else
                    {
                        append_utf8(out, REPLACEMENT_CHAR);
                    }
                }
                else if (*cp >= 0xDC00 && *cp <= 0xDFFF)
                {
                    append_utf8(out, REPLACEMENT_CHAR);
                }
                else
                {
                    append_utf8(out, *cp);
                }
                break;
            }
            default:
                out += value[i];
                break;
        }
    }
    return out;
}

std::optional<bool> as_bool(std::string_view value)
{
    value = trim(value);
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    return std::nullopt;
}

std::optional<double> read_number(std::string_view object, std::string_view key)
{
    auto v = find_member(object, key);
    return v ? as_number(*v) : std::nullopt;
}

std::optional<int> read_int(std::string_view object, std::string_view key, int lo, int hi)
{
    auto v = read_number(object, key);
    if (!v || !std::isfinite(*v))
        return std::nullopt;
    return static_cast<int>(std::clamp(*v, static_cast<double>(lo), static_cast<double>(hi)));
}

std::optional<std::string> read_string(std::string_view object, std::string_view key)
{
    auto v = find_member(object, key);
    return v ? as_string(*v) : std::nullopt;
}

std::optional<bool> read_bool(std::string_view object, std::string_view key)
{
    auto v = find_member(object, key);
    return v ? as_bool(*v) : std::nullopt;
}

}   // namespace cursorfx::json
