// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/ChunkAppender.hpp"

#include <algorithm>
#include <stdexcept>
namespace BlobVfs::Driver::Core
{
    ChunkAppender::ChunkAppender(std::shared_ptr<BlobClient> blobClient, const int64_t offset, const int64_t maxChunkSize)
        : m_blobClient(std::move(blobClient)),
        m_maxChunkSize(maxChunkSize),
        m_offset(offset)
    {
        if (m_maxChunkSize <= 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
    }

    int64_t ChunkAppender::Append(const std::span<const char> data)
    {
        int64_t appended = 0;
        const auto total = static_cast<int64_t>(data.size());
        while (appended < total)
        {
            const auto chunkSize = std::min(m_maxChunkSize, total - appended);
            m_blobClient->AppendBlock(data.subspan(static_cast<size_t>(appended), static_cast<size_t>(chunkSize)), m_offset);
            appended += chunkSize;
            m_offset += chunkSize;
        }

        return appended;
    }

    int64_t ChunkAppender::GetOffset() const noexcept
    {
        return m_offset;
    }

    int64_t ChunkAppender::GetMaxChunkSize() const noexcept
    {
        return m_maxChunkSize;
    }

    BlobClient& ChunkAppender::GetBlobClient() const noexcept
    {
        return *m_blobClient;
    }
}
