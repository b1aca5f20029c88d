// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/BlobClient.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
namespace BlobVfs::Driver::Core
{
    /// <summary>
    /// Sequential reader over a blob, one ranged download per Read call.
    /// The size is captured when the reader is created; bytes appended later are not seen.
    /// </summary>
    class BlobReader
    {
        std::string m_name;
        std::shared_ptr<BlobClient> m_blobClient;
        int64_t m_offset;
        int64_t m_size;

    public:
        // A reader that yields nothing.
        BlobReader();
        BlobReader(std::string_view name, std::shared_ptr<BlobClient> blobClient, int64_t size, int64_t offset);

        /// <summary>
        /// Reads up to buffer.size() bytes at the current offset and advances past them.
        /// </summary>
        /// <returns>The number of bytes read, 0 at the end of the blob.</returns>
        int64_t Read(std::span<char> buffer);
        void Skip(int64_t n);

        [[nodiscard]] int64_t GetOffset() const noexcept;
        [[nodiscard]] int64_t GetSize() const noexcept;
        [[nodiscard]] const std::string& GetName() const noexcept;
    };
}
