// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
namespace BlobVfs::Driver::Core
{
    struct FileEntry
    {
        std::string Path;
        int64_t Size;
        std::chrono::system_clock::time_point ModTime;
    };

    // Directories only exist as a common prefix of blob keys; nothing is stored for them.
    struct DirectoryEntry
    {
        std::string Path;
    };

    using FileInfo = std::variant<FileEntry, DirectoryEntry>;

    [[nodiscard]] bool IsDirectory(const FileInfo& info) noexcept;
    [[nodiscard]] const std::string& GetPath(const FileInfo& info) noexcept;

    // 0 for directories.
    [[nodiscard]] int64_t GetSize(const FileInfo& info) noexcept;
}
