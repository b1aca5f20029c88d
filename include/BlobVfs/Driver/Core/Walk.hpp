// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/BlobFilesystem.hpp"
#include "BlobVfs/Driver/Core/FileInfo.hpp"

#include <functional>
#include <string_view>
namespace BlobVfs::Driver::Core
{
    enum class WalkAction
    {
        Continue,

        // Do not descend into the directory just visited. Same as Continue for files.
        SkipDirectory,
    };

    using WalkVisitor = std::function<WalkAction(const FileInfo&)>;

    /// <summary>
    /// Visits everything below <paramref name="path"/> depth-first, children in lexical order.
    /// The starting directory itself is not visited. Entries that disappear between
    /// listing and visiting are skipped; every other error escapes.
    /// </summary>
    void Walk(BlobFilesystem& filesystem, std::string_view path, const WalkVisitor& visitor);
}
