// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <string>
#include <string_view>
namespace BlobVfs::Driver::Core
{
    class PathMapper
    {
        std::string m_rootDirectory;
        std::string m_rootPrefix;

    public:
        explicit PathMapper(std::string rootDirectory);

        [[nodiscard]] std::string ToBlobKey(std::string_view virtualPath) const;

        // NOTE: When the root prefix is empty, a '/' is prepended so listed keys stay valid virtual paths.
        [[nodiscard]] std::string ToVirtualPath(std::string_view blobKey) const;

        [[nodiscard]] const std::string& GetRootDirectory() const noexcept;
        [[nodiscard]] const std::string& GetRootPrefix() const noexcept;
    };
}
