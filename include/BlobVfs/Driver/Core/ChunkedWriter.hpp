// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/ChunkAppender.hpp"
#include "BlobVfs/Driver/Core/Configuration.hpp"

#include <boost/log/trivial.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace BlobVfs::Driver::Core
{
    /// <summary>
    /// Buffered writer on top of an append-capable blob.
    ///
    /// Open --Write--> Open
    /// Open --Commit--> Committed --Close--> Closed
    /// Open --Cancel--> Cancelled --Close--> Closed
    /// Open --Close--> Closed
    ///
    /// Anything else throws InvalidStateError. Close from Open flushes everything but does not
    /// commit; whether that counts as a commit is up to the caller.
    /// Instances are single-owner; concurrent calls must be serialized by the caller.
    /// </summary>
    class ChunkedWriter
    {
    public:
        enum class State
        {
            Open,
            Committed,
            Cancelled,
            Closed,
        };

        enum class Operation
        {
            Write,
            Commit,
            Cancel,
            Close,
        };

    private:
        std::string m_name;
        ChunkAppender m_appender;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

        int64_t m_size;
        int64_t m_bufferOffset;
        State m_state;

        std::vector<char> m_buffer;

    public:
        ChunkedWriter(std::string_view name,
            std::shared_ptr<BlobClient> blobClient,
            int64_t size,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            int64_t chunkSize = Configuration::MaxChunkSize);
        ~ChunkedWriter();
        ChunkedWriter(const ChunkedWriter&) = delete;
        ChunkedWriter& operator=(const ChunkedWriter&) = delete;
        ChunkedWriter(ChunkedWriter&&) noexcept;
        ChunkedWriter& operator=(ChunkedWriter&&) noexcept;

        /// <summary>
        /// Buffers the data, appending every full chunk to the blob.
        ///
        /// If an append fails, Size() drops back to the number of bytes the blob really holds,
        /// whatever was still buffered is discarded, the writer stays open and the backend's
        /// exception is rethrown. Writing can resume from Size().
        /// </summary>
        /// <returns>The number of bytes accepted.</returns>
        int64_t Write(std::span<const char> data);

        void Commit();
        void Cancel();
        void Close();

        [[nodiscard]] int64_t Size() const noexcept;
        [[nodiscard]] State GetState() const noexcept;
        [[nodiscard]] const std::string& GetName() const noexcept;

        [[nodiscard]] static std::optional<State> Transition(State from, Operation operation) noexcept;

    private:
        State Require(Operation operation) const;
        void Flush();
    };
}
