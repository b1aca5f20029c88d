// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/FileInfo.hpp"
namespace BlobVfs::Driver::Core
{
    bool IsDirectory(const FileInfo& info) noexcept
    {
        return std::holds_alternative<DirectoryEntry>(info);
    }

    const std::string& GetPath(const FileInfo& info) noexcept
    {
        return std::visit([](const auto& entry) -> const std::string& { return entry.Path; }, info);
    }

    int64_t GetSize(const FileInfo& info) noexcept
    {
        if (const auto* file = std::get_if<FileEntry>(&info))
        {
            return file->Size;
        }

        return 0;
    }
}
