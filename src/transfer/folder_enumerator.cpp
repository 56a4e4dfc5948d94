#include "lft/transfer/folder_enumerator.hpp"
#include "lft/protocol/codec.hpp"
#include "lft/transfer/path_guard.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace lft::transfer {
namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void skip(Manifest& manifest, std::string relative_path, std::string reason) {
    spdlog::warn("Skipping '{}': {}", relative_path, reason);
    manifest.skipped.push_back(SkippedEntry{std::move(relative_path), std::move(reason)});
}

} // namespace

FolderEnumerator::FolderEnumerator(std::size_t max_depth) : max_depth_(max_depth) {}

bool FolderEnumerator::is_system_directory(const std::string& name) {
    const std::string lowered = to_lower(name);
    return lowered == "$recycle.bin" || lowered == "system volume information";
}

Result<Manifest> FolderEnumerator::enumerate(const fs::path& root) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Err<Manifest>(ErrorCode::InvalidArgument,
                             "Not a directory: " + root.string());
    }

    Manifest manifest;
    if (auto walked = walk(root, "", 0, manifest); walked.is_error()) {
        return Err<Manifest>(walked.error());
    }

    spdlog::info("Enumerated '{}': {} items, {} bytes, {} skipped", root.string(),
                 manifest.total_items, manifest.total_bytes, manifest.skipped.size());
    return Ok(std::move(manifest));
}

Result<void> FolderEnumerator::walk(const fs::path& directory,
                                    const std::string& prefix,
                                    std::size_t depth,
                                    Manifest& manifest) const {
    if (depth > max_depth_) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "Folder nesting deeper than " + std::to_string(max_depth_) +
                             " levels at '" + prefix + "'");
    }

    std::error_code ec;
    std::vector<fs::directory_entry> children;
    fs::directory_iterator it(directory, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        children.push_back(*it);
    }
    if (ec) {
        return Err<void>(ErrorCode::IOFailure,
                         "Cannot read directory " + directory.string() + ": " + ec.message());
    }

    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& lhs, const fs::directory_entry& rhs) {
                  return lhs.path().filename().string() < rhs.path().filename().string();
              });

    for (const auto& child : children) {
        const std::string name = child.path().filename().string();
        const std::string relative = prefix.empty() ? name : prefix + "/" + name;

        const auto status = child.symlink_status(ec);
        if (ec) {
            return Err<void>(ErrorCode::IOFailure,
                             "Cannot stat " + child.path().string() + ": " + ec.message());
        }

        if (fs::is_symlink(status)) {
            skip(manifest, relative, "symbolic link");
            continue;
        }
        if (!protocol::FrameCodec::is_wire_string(relative)) {
            skip(manifest, relative, "name is not valid UTF-8 or too long");
            continue;
        }
        if (!PathGuard::is_acceptable_segment(name)) {
            skip(manifest, relative, "name contains a backslash or control character");
            continue;
        }

        if (fs::is_directory(status)) {
            if (is_system_directory(name)) {
                skip(manifest, relative, "system directory");
                continue;
            }
            manifest.entries.push_back(
                ManifestEntry{relative, EntryKind::Directory, 0, manifest.entries.size()});
            ++manifest.total_items;

            if (auto nested = walk(child.path(), relative, depth + 1, manifest); nested.is_error()) {
                return nested;
            }
        } else if (fs::is_regular_file(status)) {
            const auto size = fs::file_size(child.path(), ec);
            if (ec) {
                return Err<void>(ErrorCode::IOFailure,
                                 "Cannot read size of " + child.path().string() + ": " + ec.message());
            }
            manifest.entries.push_back(
                ManifestEntry{relative, EntryKind::File, size, manifest.entries.size()});
            ++manifest.total_items;
            manifest.total_bytes += size;
        } else {
            skip(manifest, relative, "special file");
        }
    }

    return Ok();
}

std::string root_display_name(const fs::path& path) {
    fs::path normalized = path.lexically_normal();
    if (normalized.filename().empty()) {
        normalized = normalized.parent_path();
    }
    std::string name = normalized.filename().string();
    if (name.empty() || name == "." || name == "..") {
        std::error_code ec;
        const auto absolute = fs::weakly_canonical(path, ec);
        if (!ec) {
            name = absolute.filename().string();
        }
    }
    return name;
}

Result<TransferRequest> make_transfer_request(const fs::path& path,
                                              const FolderEnumerator& enumerator) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec) {
        return Err<TransferRequest>(ErrorCode::InvalidArgument,
                                    "Cannot access " + path.string() + ": " + ec.message());
    }

    TransferRequest request;
    request.root_path = path;
    request.name = root_display_name(path);
    if (request.name.empty() || !protocol::FrameCodec::is_wire_string(request.name) ||
        !PathGuard::is_acceptable_segment(request.name)) {
        return Err<TransferRequest>(ErrorCode::InvalidArgument,
                                    "Cannot derive a transferable name from " + path.string());
    }

    if (fs::is_regular_file(status)) {
        const auto size = fs::file_size(path, ec);
        if (ec) {
            return Err<TransferRequest>(ErrorCode::IOFailure,
                                        "Cannot read size of " + path.string() + ": " + ec.message());
        }
        request.kind = TransferKind::File;
        request.declared_item_count = 1;
        request.declared_total_bytes = size;
        return Ok(std::move(request));
    }

    if (fs::is_directory(status)) {
        auto manifest = enumerator.enumerate(path);
        if (manifest.is_error()) {
            return Err<TransferRequest>(manifest.error());
        }
        request.kind = TransferKind::Folder;
        request.manifest = std::move(manifest.value());
        request.declared_item_count = request.manifest.total_items;
        request.declared_total_bytes = request.manifest.total_bytes;
        return Ok(std::move(request));
    }

    return Err<TransferRequest>(ErrorCode::InvalidArgument,
                                "Neither a regular file nor a directory: " + path.string());
}

} // namespace lft::transfer
