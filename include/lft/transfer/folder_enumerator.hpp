#pragma once

#include "lft/core/result.hpp"
#include "lft/transfer/types.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace lft::transfer {

/**
 * @brief Builds the manifest of a folder before anything is sent
 *
 * Entries come out in depth-first pre-order with siblings sorted by name,
 * so every directory precedes its contents. Symbolic links and special
 * files are listed in Manifest::skipped and never followed.
 */
class FolderEnumerator {
public:
    static constexpr std::size_t kMaxDepth = 128;

    explicit FolderEnumerator(std::size_t max_depth = kMaxDepth);

    Result<Manifest> enumerate(const std::filesystem::path& root) const;

    std::size_t max_depth() const noexcept { return max_depth_; }

private:
    Result<void> walk(const std::filesystem::path& directory,
                      const std::string& prefix,
                      std::size_t depth,
                      Manifest& manifest) const;

    static bool is_system_directory(const std::string& name);

    std::size_t max_depth_;
};

/// Display name for a root path, tolerating trailing separators
std::string root_display_name(const std::filesystem::path& path);

/**
 * Snapshot a file or folder into a TransferRequest.
 * A regular file becomes a File request, a directory is enumerated into a
 * Folder request. Anything else is InvalidArgument.
 */
Result<TransferRequest> make_transfer_request(const std::filesystem::path& path,
                                              const FolderEnumerator& enumerator = FolderEnumerator{});

} // namespace lft::transfer
