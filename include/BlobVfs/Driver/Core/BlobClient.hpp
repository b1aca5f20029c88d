// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/BlobProperties.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>
namespace BlobVfs::Driver::Core
{
    /// <summary>
    /// Handle to a single object in the flat backend namespace.
    /// Carries nothing but its key; every call goes to the backend.
    /// Operations on an object that does not exist throw BlobNotFoundError.
    /// </summary>
    class BlobClient
    {
    public:
        virtual ~BlobClient() = default;

        /// <returns>The key this handle addresses.</returns>
        virtual const std::string& GetKey() const noexcept = 0;

        /// <summary>
        /// Fetches the current properties of the blob.
        /// </summary>
        /// <returns>Size, last modification time and object type.</returns>
        virtual BlobProperties GetProperties() = 0;

        /// <returns>True if an object is stored under the key.</returns>
        virtual bool Exists() = 0;

        /// <summary>
        /// Downloads the whole object.
        /// </summary>
        /// <returns>The object's bytes.</returns>
        virtual std::vector<char> Download() = 0;

        /// <summary>
        /// Downloads a range of the object into the provided buffer.
        /// </summary>
        /// <param name="buffer">A span of bytes where the downloaded data will be stored.</param>
        /// <param name="blobOffset">The starting position (in bytes) in the blob from which to begin downloading.</param>
        /// <param name="length">The number of bytes to download from the offset.</param>
        /// <returns>The number of bytes actually downloaded.</returns>
        virtual int64_t DownloadTo(std::span<char> buffer, int64_t blobOffset, int64_t length) = 0;

        /// <summary>
        /// Replaces the object with the given content in a single call, creating a block blob.
        /// </summary>
        /// <param name="data">The complete content of the object.</param>
        virtual void Upload(std::span<const char> data) = 0;

        /// <summary>
        /// Creates an empty append-capable object under the key.
        /// </summary>
        virtual void CreateAppendBlob() = 0;

        /// <summary>
        /// Appends a chunk to the end of an append-capable object.
        /// </summary>
        /// <param name="data">The chunk, no larger than the backend's maximum chunk size.</param>
        /// <param name="offset">The position the chunk is expected to land at, i.e. the current object size.</param>
        virtual void AppendBlock(std::span<const char> data, int64_t offset) = 0;

        /// <summary>
        /// Removes the object.
        /// </summary>
        virtual void Delete() = 0;

        /// <returns>True if an object was removed.</returns>
        virtual bool DeleteIfExists() = 0;

        /// <summary>
        /// Makes this object a server-side copy of <paramref name="source"/>.
        /// </summary>
        /// <param name="source">The object to copy from. Must live in the same namespace.</param>
        virtual void CopyFrom(BlobClient& source) = 0;
    };
}
