/**
 * @file path_filter.h
 * @brief Include/exclude filtering of remote paths
 */

#ifndef KCENON_DELTA_FETCH_REMOTE_PATH_FILTER_H
#define KCENON_DELTA_FETCH_REMOTE_PATH_FILTER_H

#include "kcenon/delta_fetch/core/chunk_types.h"
#include "kcenon/delta_fetch/core/types.h"

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace kcenon::delta_fetch {

/**
 * @brief Decides which remote items the tree walk visits
 *
 * The relative path handed in is '/' separated and relative to the run's
 * remote root.
 */
class path_filter {
public:
    virtual ~path_filter() = default;

    [[nodiscard]] virtual auto should_include(const std::string& relative_path,
                                              item_kind kind) const -> bool = 0;
};

/**
 * @brief Filter that admits everything
 */
class accept_all_filter final : public path_filter {
public:
    [[nodiscard]] auto should_include(const std::string&, item_kind) const -> bool override {
        return true;
    }
};

/**
 * @brief Glob-based filter
 *
 * `*` matches any run of characters (including '/'), `?` a single one.
 * A pattern without '/' is matched against the last path component,
 * otherwise against the whole relative path. Excludes are checked first and
 * apply to files and directories; includes apply to files only, and an empty
 * include list admits every file.
 */
class glob_path_filter final : public path_filter {
public:
    glob_path_filter() = default;
    glob_path_filter(std::vector<std::string> include, std::vector<std::string> exclude);

    [[nodiscard]] auto should_include(const std::string& relative_path,
                                      item_kind kind) const -> bool override;

    [[nodiscard]] auto include_patterns() const -> const std::vector<std::string>& {
        return include_;
    }
    [[nodiscard]] auto exclude_patterns() const -> const std::vector<std::string>& {
        return exclude_;
    }

private:
    struct compiled_pattern {
        std::regex expression;
        bool match_path = false;
    };

    [[nodiscard]] static auto compile(const std::vector<std::string>& patterns)
        -> std::vector<compiled_pattern>;

    [[nodiscard]] static auto any_match(const std::vector<compiled_pattern>& patterns,
                                        const std::string& relative_path,
                                        const std::string& name) -> bool;

    std::vector<std::string> include_;
    std::vector<std::string> exclude_;
    std::vector<compiled_pattern> include_compiled_;
    std::vector<compiled_pattern> exclude_compiled_;
};

/**
 * @brief Convert a glob pattern into an anchored regular expression source
 */
[[nodiscard]] auto glob_to_regex(const std::string& pattern) -> std::string;

/**
 * @brief Load a named filter profile
 *
 * The file holds `{"<name>": {"include": [...], "exclude": [...]}, ...}`.
 *
 * @return The filter, or profile_not_found / profile_parse_error
 */
[[nodiscard]] auto load_filter_profile(const std::filesystem::path& profile_file,
                                       const std::string& name) -> result<glob_path_filter>;

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_REMOTE_PATH_FILTER_H
