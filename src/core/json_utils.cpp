/**
 * @file json_utils.cpp
 * @brief Implementation of the minimal JSON helpers
 */

#include "kcenon/delta_fetch/core/json_utils.h"

#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>

namespace kcenon::delta_fetch::detail {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\n' || c == '\t' || c == '\r';
}

auto skip_space(std::string_view json, std::size_t pos) -> std::size_t {
    while (pos < json.size() && is_space(json[pos])) {
        ++pos;
    }
    return pos;
}

// Returns the index of the closing quote of the string opening at pos.
auto find_string_end(std::string_view json, std::size_t pos) -> std::size_t {
    for (std::size_t i = pos + 1; i < json.size(); ++i) {
        if (json[i] == '\\') {
            ++i;
        } else if (json[i] == '"') {
            return i;
        }
    }
    return std::string_view::npos;
}

// Returns the index just past the value opening at pos (balanced for
// objects and arrays, quote-aware).
auto find_value_end(std::string_view json, std::size_t pos) -> std::size_t {
    if (pos >= json.size()) {
        return std::string_view::npos;
    }
    char open = json[pos];
    if (open == '"') {
        auto end = find_string_end(json, pos);
        return end == std::string_view::npos ? end : end + 1;
    }
    if (open == '{' || open == '[') {
        int depth = 0;
        for (std::size_t i = pos; i < json.size(); ++i) {
            char c = json[i];
            if (c == '"') {
                i = find_string_end(json, i);
                if (i == std::string_view::npos) {
                    return i;
                }
            } else if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                if (--depth == 0) {
                    return i + 1;
                }
            }
        }
        return std::string_view::npos;
    }
    auto end = pos;
    while (end < json.size() && json[end] != ',' && json[end] != '}' &&
           json[end] != ']' && !is_space(json[end])) {
        ++end;
    }
    return end;
}

// Locates the first occurrence of "key" used as an object key and returns
// the position of its value.
auto find_value_start(std::string_view json, std::string_view key) -> std::size_t {
    std::string needle = "\"" + escape_json_string(key) + "\"";
    std::size_t search_from = 0;
    while (true) {
        auto key_pos = json.find(needle, search_from);
        if (key_pos == std::string_view::npos) {
            return key_pos;
        }
        auto colon_pos = skip_space(json, key_pos + needle.size());
        if (colon_pos < json.size() && json[colon_pos] == ':') {
            auto value_start = skip_space(json, colon_pos + 1);
            return value_start < json.size() ? value_start : std::string_view::npos;
        }
        search_from = key_pos + needle.size();
    }
}

}  // namespace

auto escape_json_string(std::string_view s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4)
                      << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

auto unescape_json_string(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            switch (s[i + 1]) {
                case '"': result += '"'; ++i; break;
                case '\\': result += '\\'; ++i; break;
                case '/': result += '/'; ++i; break;
                case 'b': result += '\b'; ++i; break;
                case 'f': result += '\f'; ++i; break;
                case 'n': result += '\n'; ++i; break;
                case 'r': result += '\r'; ++i; break;
                case 't': result += '\t'; ++i; break;
                case 'u':
                    if (i + 5 < s.size()) {
                        try {
                            auto code = std::stoi(std::string(s.substr(i + 2, 4)), nullptr, 16);
                            result += static_cast<char>(code);
                        } catch (const std::exception&) {
                            result += '?';
                        }
                        i += 5;
                    }
                    break;
                default: result += s[i]; break;
            }
        } else {
            result += s[i];
        }
    }
    return result;
}

auto extract_json_value(std::string_view json, std::string_view key)
    -> std::optional<std::string> {
    auto start = find_value_start(json, key);
    if (start == std::string_view::npos) {
        return std::nullopt;
    }
    auto end = find_value_end(json, start);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    if (json[start] == '"') {
        return unescape_json_string(json.substr(start + 1, end - start - 2));
    }
    return std::string(json.substr(start, end - start));
}

auto extract_json_array(std::string_view json, std::string_view key)
    -> std::optional<std::vector<std::string>> {
    auto start = find_value_start(json, key);
    if (start == std::string_view::npos || json[start] != '[') {
        return std::nullopt;
    }
    auto end = find_value_end(json, start);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }

    std::vector<std::string> elements;
    auto pos = skip_space(json, start + 1);
    while (pos < end - 1) {
        if (json[pos] == ',') {
            pos = skip_space(json, pos + 1);
            continue;
        }
        auto element_end = find_value_end(json, pos);
        if (element_end == std::string_view::npos || element_end == pos || element_end > end) {
            return std::nullopt;
        }
        if (json[pos] == '"') {
            elements.push_back(unescape_json_string(json.substr(pos + 1, element_end - pos - 2)));
        } else {
            elements.emplace_back(json.substr(pos, element_end - pos));
        }
        pos = skip_space(json, element_end);
    }
    return elements;
}

auto extract_json_object(std::string_view json, std::string_view key)
    -> std::optional<std::string> {
    auto start = find_value_start(json, key);
    if (start == std::string_view::npos || json[start] != '{') {
        return std::nullopt;
    }
    auto end = find_value_end(json, start);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(json.substr(start, end - start));
}

auto to_epoch_ms(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto from_epoch_ms(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(ms)));
}

auto compact_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%dT%H%M%S");
    return oss.str();
}

auto iso8601_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

auto to_system_time(std::filesystem::file_time_type ft) -> std::chrono::system_clock::time_point {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ft));
}

auto to_file_time(std::chrono::system_clock::time_point tp) -> std::filesystem::file_time_type {
    return std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(
        std::chrono::file_clock::from_sys(tp));
}

}  // namespace kcenon::delta_fetch::detail
