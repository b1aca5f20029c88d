// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/BlobClient.hpp"
#include "BlobVfs/Driver/Core/Configuration.hpp"

#include <cstdint>
#include <memory>
#include <span>
namespace BlobVfs::Driver::Core
{
    /// <summary>
    /// Splits a block of bytes into chunks of at most the maximum chunk size and appends
    /// them to an append-capable blob, one call per chunk, in increasing offset order.
    ///
    /// The first failed append aborts the block and the backend's exception escapes
    /// unchanged. GetOffset() then tells how far the blob really got.
    /// </summary>
    class ChunkAppender
    {
        std::shared_ptr<BlobClient> m_blobClient;
        int64_t m_maxChunkSize;
        int64_t m_offset;

    public:
        ChunkAppender(std::shared_ptr<BlobClient> blobClient, int64_t offset, int64_t maxChunkSize = Configuration::MaxChunkSize);

        // Returns the number of bytes appended, which is always data.size() when no exception is thrown.
        int64_t Append(std::span<const char> data);

        [[nodiscard]] int64_t GetOffset() const noexcept;
        [[nodiscard]] int64_t GetMaxChunkSize() const noexcept;
        [[nodiscard]] BlobClient& GetBlobClient() const noexcept;
    };
}
