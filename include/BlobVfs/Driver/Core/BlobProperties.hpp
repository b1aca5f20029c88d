// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <chrono>
#include <cstdint>
namespace BlobVfs::Driver::Core
{
    enum class BlobType
    {
        Block,
        Append,
        Page,
    };

    class BlobProperties
    {
        int64_t m_size;
        std::chrono::system_clock::time_point m_lastModified;
        BlobType m_type;

    public:
        BlobProperties(int64_t size, std::chrono::system_clock::time_point lastModified, BlobType type);
        [[nodiscard]] int64_t GetSize() const noexcept;
        [[nodiscard]] std::chrono::system_clock::time_point GetLastModified() const noexcept;
        [[nodiscard]] BlobType GetType() const noexcept;
    };
}
