// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/BlobProperties.hpp"
namespace BlobVfs::Driver::Core
{
    BlobProperties::BlobProperties(const int64_t size, const std::chrono::system_clock::time_point lastModified, const BlobType type)
        : m_size(size), m_lastModified(lastModified), m_type(type)
    {
    }

    int64_t BlobProperties::GetSize() const noexcept
    {
        return m_size;
    }

    std::chrono::system_clock::time_point BlobProperties::GetLastModified() const noexcept
    {
        return m_lastModified;
    }

    BlobType BlobProperties::GetType() const noexcept
    {
        return m_type;
    }
}
