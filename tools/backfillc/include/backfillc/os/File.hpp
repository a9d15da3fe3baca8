// tools/backfillc/include/backfillc/os/File.hpp
#pragma once
#include <filesystem>
#include <string>
#include <string_view>


namespace backfillc::os {

    /// @brief Reads the whole file as raw bytes (no newline normalization).
    bool read_file(const std::filesystem::path& path, std::string& out_content, std::string& out_error);

    /// @brief Writes `<path>.tmp` then renames it over `path`; parent directories are created.
    bool write_file_atomic(const std::filesystem::path& path, std::string_view content, std::string& out_error);

    /// @brief Copies an existing `path` to `<path>.bak`; nothing to do when `path` does not exist.
    bool backup_existing(const std::filesystem::path& path, std::string& out_error);

    /// @brief `path` resolves to `root` or somewhere below it (lexically, after normalization).
    bool is_inside(const std::filesystem::path& root, const std::filesystem::path& path);

    /// @brief `path` relative to `root`, with forward slashes.
    std::string relative_generic(const std::filesystem::path& root, const std::filesystem::path& path);

} // namespace backfillc::os
