/**
 * @file json_text.cpp
 * @brief Scope-aware JSON text scanning and writing
 */

#include "nightfall/net/json_text.h"
#include <charconv>
#include <cstdio>

namespace nightfall::net::json {

namespace {

constexpr SizeT npos = std::string::npos;

SizeT skip_ws(const std::string& s, SizeT pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\n' || s[pos] == '\r')) {
        ++pos;
    }
    return pos;
}

// Returns the index just past the closing quote
SizeT scan_string(const std::string& s, SizeT pos) {
    if (pos >= s.size() || s[pos] != '"') return npos;
    ++pos;
    while (pos < s.size()) {
        char c = s[pos];
        if (c == '\\') {
            pos += 2;
            continue;
        }
        if (c == '"') {
            return pos + 1;
        }
        ++pos;
    }
    return npos;
}

SizeT scan_value(const std::string& s, SizeT pos) {
    if (pos >= s.size()) return npos;

    char c = s[pos];
    if (c == '"') {
        return scan_string(s, pos);
    }

    if (c == '{' || c == '[') {
        int depth = 0;
        while (pos < s.size()) {
            char ch = s[pos];
            if (ch == '"') {
                pos = scan_string(s, pos);
                if (pos == npos) return npos;
                continue;
            }
            if (ch == '{' || ch == '[') {
                ++depth;
            } else if (ch == '}' || ch == ']') {
                --depth;
                if (depth == 0) {
                    return pos + 1;
                }
            }
            ++pos;
        }
        return npos;
    }

    // Number or literal
    SizeT end = pos;
    while (end < s.size()) {
        char ch = s[end];
        if (ch == ',' || ch == '}' || ch == ']' || ch == ' ' ||
            ch == '\t' || ch == '\n' || ch == '\r') {
            break;
        }
        ++end;
    }
    return end == pos ? npos : end;
}

void append_utf8(std::string& out, UInt32 cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool parse_hex4(const std::string& s, SizeT pos, UInt32& out) {
    if (pos + 4 > s.size()) return false;
    unsigned int value = 0;
    auto result = std::from_chars(s.data() + pos, s.data() + pos + 4, value, 16);
    if (result.ec != std::errc() || result.ptr != s.data() + pos + 4) return false;
    out = value;
    return true;
}

} // anonymous namespace

// ============================================================================
// Reading
// ============================================================================

std::optional<std::vector<std::pair<std::string, std::string>>>
object_members(const std::string& object_text) {
    std::vector<std::pair<std::string, std::string>> members;

    SizeT pos = skip_ws(object_text, 0);
    if (pos >= object_text.size() || object_text[pos] != '{') return std::nullopt;
    pos = skip_ws(object_text, pos + 1);

    if (pos < object_text.size() && object_text[pos] == '}') {
        pos = skip_ws(object_text, pos + 1);
        if (pos != object_text.size()) return std::nullopt;
        return members;
    }

    while (true) {
        SizeT key_end = scan_string(object_text, pos);
        if (key_end == npos) return std::nullopt;
        std::string key = unquote(object_text.substr(pos, key_end - pos));

        pos = skip_ws(object_text, key_end);
        if (pos >= object_text.size() || object_text[pos] != ':') return std::nullopt;
        pos = skip_ws(object_text, pos + 1);

        SizeT value_end = scan_value(object_text, pos);
        if (value_end == npos) return std::nullopt;
        members.emplace_back(std::move(key), object_text.substr(pos, value_end - pos));

        pos = skip_ws(object_text, value_end);
        if (pos >= object_text.size()) return std::nullopt;
        if (object_text[pos] == ',') {
            pos = skip_ws(object_text, pos + 1);
            continue;
        }
        if (object_text[pos] == '}') {
            ++pos;
            break;
        }
        return std::nullopt;
    }

    if (skip_ws(object_text, pos) != object_text.size()) return std::nullopt;
    return members;
}

std::optional<std::vector<std::string>> array_elements(const std::string& array_text) {
    std::vector<std::string> elements;

    SizeT pos = skip_ws(array_text, 0);
    if (pos >= array_text.size() || array_text[pos] != '[') return std::nullopt;
    pos = skip_ws(array_text, pos + 1);

    if (pos < array_text.size() && array_text[pos] == ']') {
        pos = skip_ws(array_text, pos + 1);
        if (pos != array_text.size()) return std::nullopt;
        return elements;
    }

    while (true) {
        SizeT value_end = scan_value(array_text, pos);
        if (value_end == npos) return std::nullopt;
        elements.push_back(array_text.substr(pos, value_end - pos));

        pos = skip_ws(array_text, value_end);
        if (pos >= array_text.size()) return std::nullopt;
        if (array_text[pos] == ',') {
            pos = skip_ws(array_text, pos + 1);
            continue;
        }
        if (array_text[pos] == ']') {
            ++pos;
            break;
        }
        return std::nullopt;
    }

    if (skip_ws(array_text, pos) != array_text.size()) return std::nullopt;
    return elements;
}

std::optional<std::string> find_raw(const std::string& object_text, const std::string& key) {
    auto members = object_members(object_text);
    if (!members) return std::nullopt;
    for (auto& [name, value] : *members) {
        if (name == key) {
            return std::move(value);
        }
    }
    return std::nullopt;
}

std::string find_string(const std::string& object_text, const std::string& key,
                        const std::string& fallback) {
    auto raw = find_raw(object_text, key);
    if (!raw || *raw == "null") return fallback;
    return unquote(*raw);
}

Int64 find_int(const std::string& object_text, const std::string& key, Int64 fallback) {
    auto raw = find_raw(object_text, key);
    if (!raw) return fallback;
    return to_int(*raw, fallback);
}

bool find_bool(const std::string& object_text, const std::string& key, bool fallback) {
    auto raw = find_raw(object_text, key);
    if (!raw) return fallback;
    if (*raw == "true") return true;
    if (*raw == "false") return false;
    return fallback;
}

bool is_string_token(const std::string& raw) {
    return raw.size() >= 2 && raw.front() == '"' && raw.back() == '"';
}

Int64 to_int(const std::string& raw, Int64 fallback) {
    std::string text = unquote(raw);
    Int64 value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr == text.data()) {
        return fallback;
    }
    return value;
}

std::string unquote(const std::string& raw) {
    if (!is_string_token(raw)) {
        return raw;
    }

    std::string out;
    out.reserve(raw.size());
    SizeT end = raw.size() - 1;
    for (SizeT i = 1; i < end; ++i) {
        char c = raw[i];
        if (c != '\\' || i + 1 >= end) {
            out.push_back(c);
            continue;
        }
        char esc = raw[++i];
        switch (esc) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                UInt32 cp = 0;
                if (!parse_hex4(raw, i + 1, cp)) {
                    out.push_back('u');
                    break;
                }
                i += 4;
                // Surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 < end &&
                    raw[i + 1] == '\\' && raw[i + 2] == 'u') {
                    UInt32 low = 0;
                    if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, cp);
                break;
            }
            default:
                out.push_back(esc);
                break;
        }
    }
    return out;
}

// ============================================================================
// Writing
// ============================================================================

std::string quote(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
    return out;
}

ObjectBuilder& ObjectBuilder::add(const std::string& key, const std::string& value) {
    return add_raw(key, quote(value));
}

ObjectBuilder& ObjectBuilder::add(const std::string& key, const char* value) {
    return add_raw(key, quote(value ? value : ""));
}

ObjectBuilder& ObjectBuilder::add_int(const std::string& key, Int64 value) {
    return add_raw(key, std::to_string(value));
}

ObjectBuilder& ObjectBuilder::add_bool(const std::string& key, bool value) {
    return add_raw(key, value ? "true" : "false");
}

ObjectBuilder& ObjectBuilder::add_raw(const std::string& key, const std::string& raw_value) {
    if (!body_.empty()) {
        body_.push_back(',');
    }
    body_ += quote(key);
    body_.push_back(':');
    body_ += raw_value.empty() ? std::string("null") : raw_value;
    return *this;
}

std::string ObjectBuilder::str() const {
    return "{" + body_ + "}";
}

std::string make_array(const std::vector<std::string>& raw_values) {
    std::string out = "[";
    for (SizeT i = 0; i < raw_values.size(); ++i) {
        if (i > 0) out.push_back(',');
        out += raw_values[i];
    }
    out.push_back(']');
    return out;
}

} // namespace nightfall::net::json
