#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace mirulog {

// Returns path, or path with "-1", "-2", ... before the extension when taken.
inline std::filesystem::path uniquePath(const std::filesystem::path &path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return path;
    }
    const auto parent = path.parent_path();
    const auto stem = path.stem().string();
    const auto extension = path.extension().string();
    for (int i = 1;; ++i) {
        auto candidate = parent / (stem + "-" + std::to_string(i) + extension);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

} // namespace mirulog
