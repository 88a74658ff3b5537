/**
 * @file path_filter.cpp
 * @brief Implementation of glob_path_filter and profile loading
 */

#include "kcenon/delta_fetch/remote/path_filter.h"
#include "kcenon/delta_fetch/core/json_utils.h"

#include <fstream>
#include <sstream>

namespace kcenon::delta_fetch {

auto glob_to_regex(const std::string& pattern) -> std::string {
    std::string regex_pattern;
    for (char c : pattern) {
        switch (c) {
            case '*':
                regex_pattern += ".*";
                break;
            case '?':
                regex_pattern += ".";
                break;
            case '.':
            case '+':
            case '^':
            case '$':
            case '(':
            case ')':
            case '[':
            case ']':
            case '{':
            case '}':
            case '|':
            case '\\':
                regex_pattern += '\\';
                regex_pattern += c;
                break;
            default:
                regex_pattern += c;
                break;
        }
    }
    return regex_pattern;
}

glob_path_filter::glob_path_filter(std::vector<std::string> include,
                                   std::vector<std::string> exclude)
    : include_(std::move(include))
    , exclude_(std::move(exclude))
    , include_compiled_(compile(include_))
    , exclude_compiled_(compile(exclude_)) {
}

auto glob_path_filter::compile(const std::vector<std::string>& patterns)
    -> std::vector<compiled_pattern> {
    std::vector<compiled_pattern> compiled;
    compiled.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        if (pattern.empty()) {
            continue;
        }
        compiled_pattern entry;
        entry.expression = std::regex(glob_to_regex(pattern));
        entry.match_path = pattern.find('/') != std::string::npos;
        compiled.push_back(std::move(entry));
    }
    return compiled;
}

auto glob_path_filter::any_match(const std::vector<compiled_pattern>& patterns,
                                 const std::string& relative_path,
                                 const std::string& name) -> bool {
    for (const auto& pattern : patterns) {
        const auto& subject = pattern.match_path ? relative_path : name;
        if (std::regex_match(subject, pattern.expression)) {
            return true;
        }
    }
    return false;
}

auto glob_path_filter::should_include(const std::string& relative_path,
                                      item_kind kind) const -> bool {
    auto slash = relative_path.find_last_of('/');
    auto name = slash == std::string::npos ? relative_path : relative_path.substr(slash + 1);

    if (any_match(exclude_compiled_, relative_path, name)) {
        return false;
    }
    if (kind == item_kind::directory || include_compiled_.empty()) {
        return true;
    }
    return any_match(include_compiled_, relative_path, name);
}

auto load_filter_profile(const std::filesystem::path& profile_file,
                         const std::string& name) -> result<glob_path_filter> {
    std::ifstream file(profile_file);
    if (!file) {
        return unexpected(error(error_code::profile_parse_error,
            "cannot open profile file " + profile_file.string()));
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    auto json = oss.str();

    auto start = json.find_first_not_of(" \t\r\n");
    if (start == std::string::npos || json[start] != '{') {
        return unexpected(error(error_code::profile_parse_error,
            "profile file is not a JSON object: " + profile_file.string()));
    }

    auto body = detail::extract_json_object(json, name);
    if (!body) {
        return unexpected(error(error_code::profile_not_found,
            "profile '" + name + "' not found in " + profile_file.string()));
    }

    std::vector<std::string> include;
    std::vector<std::string> exclude;
    if (body->find("\"include\"") != std::string::npos) {
        auto parsed = detail::extract_json_array(*body, "include");
        if (!parsed) {
            return unexpected(error(error_code::profile_parse_error,
                "profile '" + name + "': include must be an array of strings"));
        }
        include = std::move(*parsed);
    }
    if (body->find("\"exclude\"") != std::string::npos) {
        auto parsed = detail::extract_json_array(*body, "exclude");
        if (!parsed) {
            return unexpected(error(error_code::profile_parse_error,
                "profile '" + name + "': exclude must be an array of strings"));
        }
        exclude = std::move(*parsed);
    }

    try {
        return glob_path_filter(std::move(include), std::move(exclude));
    } catch (const std::regex_error& e) {
        return unexpected(error(error_code::profile_parse_error,
            "profile '" + name + "': invalid pattern: " + e.what()));
    }
}

}  // namespace kcenon::delta_fetch
