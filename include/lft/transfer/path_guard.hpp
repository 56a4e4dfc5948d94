#pragma once

#include "lft/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace lft::transfer {

/**
 * @brief Maps names and paths received from the wire to local paths
 *
 * Wire paths are '/'-separated and relative. A path that is absolute, has an
 * empty, "." or ".." segment, or contains a backslash or control character
 * is rejected with InvalidPath. Characters that Windows cannot store
 * (<>:"|?*) are replaced with '_'.
 */
class PathGuard {
public:
    static constexpr std::size_t kMaxRenameAttempts = 10000;

    /// True when a receiver would accept name as a path segment
    static bool is_acceptable_segment(const std::string& name);

    /// Validate a single path segment (the Header name)
    static Result<std::string> sanitize_name(const std::string& name);

    /// Resolve a relative wire path under base; the result never escapes base
    static Result<std::filesystem::path> resolve(const std::filesystem::path& base,
                                                 const std::string& relative_path);

    /// desired if free, otherwise "<stem>_<n><ext>" with the smallest free n
    static Result<std::filesystem::path> unique_path(const std::filesystem::path& desired);
};

} // namespace lft::transfer
