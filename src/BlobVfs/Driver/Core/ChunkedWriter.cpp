// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/ChunkedWriter.hpp"
#include "BlobVfs/Driver/Core/Errors.hpp"

#include <algorithm>
#include <array>
#include <utility>
using namespace boost::log::trivial;
namespace BlobVfs::Driver::Core
{
    namespace
    {
        struct TransitionEntry
        {
            ChunkedWriter::State From;
            ChunkedWriter::Operation Operation;
            ChunkedWriter::State To;
        };

        using State = ChunkedWriter::State;
        using Operation = ChunkedWriter::Operation;
        static const constexpr std::array<TransitionEntry, 6> g_transitions =
        { {
            { State::Open, Operation::Write, State::Open },
            { State::Open, Operation::Commit, State::Committed },
            { State::Open, Operation::Cancel, State::Cancelled },
            { State::Open, Operation::Close, State::Closed },
            { State::Committed, Operation::Close, State::Closed },
            { State::Cancelled, Operation::Close, State::Closed },
        } };
    }

    ChunkedWriter::ChunkedWriter(const std::string_view name,
        std::shared_ptr<BlobClient> blobClient,
        const int64_t size,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        const int64_t chunkSize)
        : m_name(name),
        m_appender(std::move(blobClient), size, chunkSize),
        m_logger(std::move(logger)),
        m_size(size),
        m_bufferOffset(0),
        m_state(State::Open)
    {
        m_buffer.resize(static_cast<size_t>(chunkSize));
    }

    ChunkedWriter::~ChunkedWriter()
    {
        if (m_state == State::Open && m_logger)
        {
            BOOST_LOG_SEV(*m_logger, warning) << "Writer for '" << m_name << "' destroyed while open, "
                << m_bufferOffset << " buffered bytes were never appended";
        }
    }

    ChunkedWriter::ChunkedWriter(ChunkedWriter&& other) noexcept
        : m_name(std::move(other.m_name)),
        m_appender(std::move(other.m_appender)),
        m_logger(std::move(other.m_logger)),
        m_size(other.m_size),
        m_bufferOffset(std::exchange(other.m_bufferOffset, 0)),
        m_state(std::exchange(other.m_state, State::Closed)),
        m_buffer(std::move(other.m_buffer))
    {
    }

    ChunkedWriter& ChunkedWriter::operator=(ChunkedWriter&& other) noexcept
    {
        m_name = std::move(other.m_name);
        m_appender = std::move(other.m_appender);
        m_logger = std::move(other.m_logger);
        m_size = other.m_size;
        m_bufferOffset = std::exchange(other.m_bufferOffset, 0);
        m_state = std::exchange(other.m_state, State::Closed);
        m_buffer = std::move(other.m_buffer);
        return *this;
    }

    int64_t ChunkedWriter::Write(const std::span<const char> data)
    {
        Require(Operation::Write);

        const auto bufferSize = static_cast<int64_t>(m_buffer.size());
        const char* dataPos = data.data();
        auto dataSize = static_cast<int64_t>(data.size());
        int64_t accepted = 0;
        while (dataSize > 0)
        {
            const auto bytesToCopy = std::min(bufferSize - m_bufferOffset, dataSize);
            std::copy(dataPos, dataPos + bytesToCopy, m_buffer.begin() + m_bufferOffset);

            dataSize -= bytesToCopy;
            dataPos += bytesToCopy;
            accepted += bytesToCopy;
            m_bufferOffset += bytesToCopy;
            m_size += bytesToCopy;

            if (m_bufferOffset == bufferSize)
            {
                Flush();
            }
        }

        return accepted;
    }

    void ChunkedWriter::Commit()
    {
        const auto next = Require(Operation::Commit);
        Flush();
        m_state = next;
        BOOST_LOG_SEV(*m_logger, debug) << "Committed '" << m_name << "' at " << m_size << " bytes";
    }

    void ChunkedWriter::Cancel()
    {
        const auto next = Require(Operation::Cancel);
        m_state = next;
        m_bufferOffset = 0;
        BOOST_LOG_SEV(*m_logger, debug) << "Cancelling '" << m_name << "', deleting blob";
        m_appender.GetBlobClient().Delete();
    }

    void ChunkedWriter::Close()
    {
        const auto next = Require(Operation::Close);
        if (m_state == State::Open)
        {
            Flush();
            BOOST_LOG_SEV(*m_logger, debug) << "Closed '" << m_name << "' without commit at " << m_size << " bytes";
        }

        m_state = next;
    }

    int64_t ChunkedWriter::Size() const noexcept
    {
        return m_size;
    }

    ChunkedWriter::State ChunkedWriter::GetState() const noexcept
    {
        return m_state;
    }

    const std::string& ChunkedWriter::GetName() const noexcept
    {
        return m_name;
    }

    std::optional<ChunkedWriter::State> ChunkedWriter::Transition(const State from, const Operation operation) noexcept
    {
        const auto it = std::find_if(g_transitions.begin(),
            g_transitions.end(),
            [from, operation](const auto& entry)
            {
                return entry.From == from && entry.Operation == operation;
            });

        if (it == g_transitions.end())
        {
            return std::nullopt;
        }

        return it->To;
    }

    ChunkedWriter::State ChunkedWriter::Require(const Operation operation) const
    {
        const auto next = Transition(m_state, operation);
        if (next)
        {
            return *next;
        }

        switch (m_state)
        {
        case State::Committed:
            throw InvalidStateError("already committed");
        case State::Cancelled:
            throw InvalidStateError("already cancelled");
        case State::Closed:
            throw InvalidStateError("already closed");
        default:
            throw InvalidStateError("invalid writer state");
        }
    }

    void ChunkedWriter::Flush()
    {
        if (m_bufferOffset == 0)
        {
            return;
        }

        try
        {
            m_appender.Append(std::span<const char>(m_buffer.data(), static_cast<size_t>(m_bufferOffset)));
        }
        catch (...)
        {
            // Whatever did not reach the blob is gone; report the durable size.
            BOOST_LOG_SEV(*m_logger, debug) << "Append to '" << m_name << "' failed, dropping "
                << (m_size - m_appender.GetOffset()) << " bytes not yet appended";
            m_size = m_appender.GetOffset();
            m_bufferOffset = 0;
            throw;
        }

        BOOST_LOG_SEV(*m_logger, debug) << "Flushed " << m_bufferOffset << " bytes to '" << m_name << "'";
        m_bufferOffset = 0;
    }
}
