// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/Walk.hpp"
#include "BlobVfs/Driver/Core/Errors.hpp"

#include <algorithm>
#include <optional>
namespace BlobVfs::Driver::Core
{
    void Walk(BlobFilesystem& filesystem, const std::string_view path, const WalkVisitor& visitor)
    {
        auto children = filesystem.List(path);
        std::sort(children.begin(), children.end());

        for (const auto& child : children)
        {
            std::optional<FileInfo> info;
            try
            {
                info = filesystem.Stat(child);
            }
            catch (const PathNotFoundError&)
            {
                // Removed after the listing was taken.
                continue;
            }

            const auto action = visitor(*info);
            if (IsDirectory(*info) && action != WalkAction::SkipDirectory)
            {
                Walk(filesystem, child, visitor);
            }
        }
    }
}
