// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/BlobReader.hpp"

#include <algorithm>
#include <stdexcept>
namespace BlobVfs::Driver::Core
{
    BlobReader::BlobReader()
        : m_offset(0),
        m_size(0)
    {
    }

    BlobReader::BlobReader(const std::string_view name,
        std::shared_ptr<BlobClient> blobClient,
        const int64_t size,
        const int64_t offset)
        : m_name(name),
        m_blobClient(std::move(blobClient)),
        m_offset(offset),
        m_size(size)
    {
        if (m_offset < 0)
        {
            throw std::invalid_argument("Offset must not be negative");
        }
    }

    int64_t BlobReader::Read(const std::span<char> buffer)
    {
        const auto bytesRequested = std::min(m_size - m_offset, static_cast<int64_t>(buffer.size()));
        if (bytesRequested <= 0 || !m_blobClient)
        {
            return 0;
        }

        const auto result = m_blobClient->DownloadTo(buffer.first(static_cast<std::size_t>(bytesRequested)), m_offset, bytesRequested);
        const auto bytesRead = result > 0 ? result : 0;

        m_offset += bytesRead;
        return bytesRead;
    }

    void BlobReader::Skip(const int64_t n)
    {
        if (n < 0)
        {
            throw std::invalid_argument("Cannot skip backwards");
        }

        m_offset = std::min(m_size, m_offset + n);
    }

    int64_t BlobReader::GetOffset() const noexcept
    {
        return m_offset;
    }

    int64_t BlobReader::GetSize() const noexcept
    {
        return m_size;
    }

    const std::string& BlobReader::GetName() const noexcept
    {
        return m_name;
    }
}
