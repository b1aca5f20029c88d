// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/PathMapper.hpp"
namespace BlobVfs::Driver::Core
{
    static const constexpr char g_separator = '/';

    PathMapper::PathMapper(std::string rootDirectory)
        : m_rootDirectory(std::move(rootDirectory))
    {
        m_rootPrefix = ToBlobKey("");
    }

    std::string PathMapper::ToBlobKey(const std::string_view virtualPath) const
    {
        const auto rootEnd = m_rootDirectory.find_last_not_of(g_separator);
        std::string key = rootEnd == std::string::npos ? std::string() : m_rootDirectory.substr(0, rootEnd + 1);
        key.append(virtualPath);

        const auto keyStart = key.find_first_not_of(g_separator);
        if (keyStart == std::string::npos)
        {
            return {};
        }

        return key.substr(keyStart);
    }

    std::string PathMapper::ToVirtualPath(const std::string_view blobKey) const
    {
        std::string path(blobKey);
        if (m_rootPrefix.empty())
        {
            path.insert(path.begin(), g_separator);
            return path;
        }

        const auto startPos = path.find(m_rootPrefix);
        if (startPos != std::string::npos)
        {
            path.erase(startPos, m_rootPrefix.length());
        }

        return path;
    }

    const std::string& PathMapper::GetRootDirectory() const noexcept
    {
        return m_rootDirectory;
    }

    const std::string& PathMapper::GetRootPrefix() const noexcept
    {
        return m_rootPrefix;
    }
}
