// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <chrono>
#include <cstdint>
namespace BlobVfs::Driver::Core
{
    struct Configuration
    {
        // Largest single append-block call accepted by the backend.
        static const constexpr int64_t MaxChunkSize = static_cast<int64_t>(4) * 1024 * 1024; // 4MB

        // Largest single "Put Blob" call accepted by the backend.
        static const constexpr int64_t MaxPutContentSize = static_cast<int64_t>(256) * 1024 * 1024; // 256MB

        static const constexpr int32_t StatPageSizeHint = 1;
        static const constexpr int MaxClientRetries = 8;
        static const constexpr std::chrono::milliseconds CopyPollInterval = std::chrono::milliseconds(500);
    };
}
