#include "lft/transfer/path_guard.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace lft::transfer {
namespace {

bool is_reserved_char(char c) {
    switch (c) {
        case '<': case '>': case ':': case '"': case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

Result<std::string> sanitize_segment(const std::string& segment, const std::string& full_path) {
    if (segment.empty() || segment == "." || segment == "..") {
        return Err<std::string>(ErrorCode::InvalidPath,
                                "Path '" + full_path + "' has an empty, '.' or '..' segment");
    }

    std::string cleaned;
    cleaned.reserve(segment.size());
    for (char c : segment) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7F || c == '\\') {
            return Err<std::string>(ErrorCode::InvalidPath,
                                    "Path '" + full_path + "' contains a forbidden character");
        }
        cleaned.push_back(is_reserved_char(c) ? '_' : c);
    }
    return Ok(std::move(cleaned));
}

bool is_within(const fs::path& base, const fs::path& candidate) {
    const auto normal_base = base.lexically_normal();
    const auto normal_candidate = candidate.lexically_normal();
    auto base_it = normal_base.begin();
    auto cand_it = normal_candidate.begin();
    for (; base_it != normal_base.end(); ++base_it, ++cand_it) {
        if (base_it->empty()) {
            continue;  // trailing separator
        }
        if (cand_it == normal_candidate.end() || *base_it != *cand_it) {
            return false;
        }
    }
    return true;
}

} // namespace

bool PathGuard::is_acceptable_segment(const std::string& name) {
    return name.find('/') == std::string::npos && sanitize_segment(name, name).is_ok();
}

Result<std::string> PathGuard::sanitize_name(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return Err<std::string>(ErrorCode::InvalidPath, "Name '" + name + "' contains a separator");
    }
    return sanitize_segment(name, name);
}

Result<fs::path> PathGuard::resolve(const fs::path& base, const std::string& relative_path) {
    if (relative_path.empty()) {
        return Err<fs::path>(ErrorCode::InvalidPath, "Empty path");
    }
    if (relative_path.front() == '/') {
        return Err<fs::path>(ErrorCode::InvalidPath, "Absolute path '" + relative_path + "'");
    }

    fs::path resolved = base;
    std::size_t start = 0;
    while (start <= relative_path.size()) {
        const std::size_t slash = relative_path.find('/', start);
        const std::size_t end = slash == std::string::npos ? relative_path.size() : slash;

        auto segment = sanitize_segment(relative_path.substr(start, end - start), relative_path);
        if (segment.is_error()) {
            return Err<fs::path>(segment.error());
        }
        resolved /= segment.value();

        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }

    if (!is_within(base, resolved)) {
        return Err<fs::path>(ErrorCode::InvalidPath,
                             "Path '" + relative_path + "' escapes the destination folder");
    }
    return Ok(std::move(resolved));
}

Result<fs::path> PathGuard::unique_path(const fs::path& desired) {
    std::error_code ec;
    if (!fs::exists(desired, ec) && !ec) {
        return Ok(desired);
    }

    const auto parent = desired.parent_path();
    const auto stem = desired.stem().string();
    const auto extension = desired.extension().string();
    for (std::size_t n = 1; n <= kMaxRenameAttempts; ++n) {
        fs::path candidate = parent / (stem + "_" + std::to_string(n) + extension);
        if (!fs::exists(candidate, ec) && !ec) {
            return Ok(std::move(candidate));
        }
    }
    return Err<fs::path>(ErrorCode::IOFailure,
                         "No free name for " + desired.string() + " after " +
                             std::to_string(kMaxRenameAttempts) + " attempts");
}

} // namespace lft::transfer
