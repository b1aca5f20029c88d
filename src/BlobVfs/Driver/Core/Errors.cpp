// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/Errors.hpp"
namespace BlobVfs::Driver::Core
{
    StorageError::StorageError(const std::string& message)
        : std::runtime_error(message)
    {
    }

    BlobNotFoundError::BlobNotFoundError(std::string key)
        : StorageError("Blob not found: '" + key + "'"),
        m_key(std::move(key))
    {
    }

    const std::string& BlobNotFoundError::GetKey() const noexcept
    {
        return m_key;
    }

    PathNotFoundError::PathNotFoundError(std::string path)
        : StorageError("Path not found: " + path),
        m_path(std::move(path))
    {
    }

    const std::string& PathNotFoundError::GetPath() const noexcept
    {
        return m_path;
    }

    SizeLimitExceededError::SizeLimitExceededError(const int64_t size, const int64_t limit)
        : StorageError("Uploading " + std::to_string(size) + " bytes in a single call is not supported; limit: " + std::to_string(limit) + " bytes"),
        m_size(size),
        m_limit(limit)
    {
    }

    int64_t SizeLimitExceededError::GetSize() const noexcept
    {
        return m_size;
    }

    int64_t SizeLimitExceededError::GetLimit() const noexcept
    {
        return m_limit;
    }

    InvalidStateError::InvalidStateError(const std::string& message)
        : StorageError(message)
    {
    }

    PaginationError::PaginationError(const std::string& message, std::vector<std::string> partialResults)
        : StorageError(message),
        m_partialResults(std::move(partialResults))
    {
    }

    const std::vector<std::string>& PaginationError::GetPartialResults() const noexcept
    {
        return m_partialResults;
    }
}
