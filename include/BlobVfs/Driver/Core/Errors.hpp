// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
namespace BlobVfs::Driver::Core
{
    class StorageError : public std::runtime_error
    {
    public:
        explicit StorageError(const std::string& message);
    };

    // Raised by backend adapters when the addressed key holds no object.
    class BlobNotFoundError : public StorageError
    {
        std::string m_key;
    public:
        explicit BlobNotFoundError(std::string key);
        [[nodiscard]] const std::string& GetKey() const noexcept;
    };

    class PathNotFoundError : public StorageError
    {
        std::string m_path;
    public:
        explicit PathNotFoundError(std::string path);
        [[nodiscard]] const std::string& GetPath() const noexcept;
    };

    class SizeLimitExceededError : public StorageError
    {
        int64_t m_size;
        int64_t m_limit;
    public:
        SizeLimitExceededError(int64_t size, int64_t limit);
        [[nodiscard]] int64_t GetSize() const noexcept;
        [[nodiscard]] int64_t GetLimit() const noexcept;
    };

    class InvalidStateError : public StorageError
    {
    public:
        explicit InvalidStateError(const std::string& message);
    };

    class PaginationError : public StorageError
    {
        std::vector<std::string> m_partialResults;
    public:
        PaginationError(const std::string& message, std::vector<std::string> partialResults = {});
        [[nodiscard]] const std::vector<std::string>& GetPartialResults() const noexcept;
    };
}
