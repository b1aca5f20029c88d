// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/BlobFilesystem.hpp"
#include "BlobVfs/Driver/Core/Errors.hpp"

#include <stdexcept>
using namespace boost::log::trivial;
namespace BlobVfs::Driver::Core
{
    BlobFilesystem::BlobFilesystem(std::string name,
        std::shared_ptr<ContainerClient> container,
        std::string rootDirectory,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        const int64_t chunkSize)
        : m_name(std::move(name)),
        m_container(std::move(container)),
        m_mapper(std::move(rootDirectory)),
        m_lister(m_container, m_mapper, logger),
        m_logger(std::move(logger)),
        m_chunkSize(chunkSize)
    {
        if (m_chunkSize <= 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
    }

    const std::string& BlobFilesystem::Name() const noexcept
    {
        return m_name;
    }

    std::vector<char> BlobFilesystem::GetContent(const std::string_view path)
    {
        const auto blob = GetBlobClient(path);
        if (!blob)
        {
            throw PathNotFoundError(std::string(path));
        }

        try
        {
            return blob->Download();
        }
        catch (const BlobNotFoundError&)
        {
            throw PathNotFoundError(std::string(path));
        }
    }

    void BlobFilesystem::PutContent(const std::string_view path, const std::span<const char> content)
    {
        const auto size = static_cast<int64_t>(content.size());
        if (size > Configuration::MaxPutContentSize)
        {
            throw SizeLimitExceededError(size, Configuration::MaxPutContentSize);
        }

        const auto blob = GetBlobClient(path);
        if (!blob)
        {
            throw std::invalid_argument("Cannot store content at the root directory");
        }

        ReplaceLegacyBlob(path);
        blob->Upload(content);
        BOOST_LOG_SEV(*m_logger, debug) << "Uploaded " << size << " bytes to '" << blob->GetKey() << "'";
    }

    bool BlobFilesystem::ReplaceLegacyBlob(const std::string_view path)
    {
        const auto blob = GetBlobClient(path);
        if (!blob)
        {
            return false;
        }

        const auto properties = TryGetProperties(*blob);
        if (!properties || properties->GetType() == BlobType::Block)
        {
            return false;
        }

        // An upload cannot overwrite append or page blobs.
        BOOST_LOG_SEV(*m_logger, debug) << "Deleting non-block blob '" << blob->GetKey() << "' before upload";
        return blob->DeleteIfExists();
    }

    BlobReader BlobFilesystem::Reader(const std::string_view path, const int64_t offset)
    {
        if (offset < 0)
        {
            throw std::invalid_argument("Offset must not be negative");
        }

        const auto blob = GetBlobClient(path);
        std::optional<BlobProperties> properties;
        if (blob)
        {
            properties = TryGetProperties(*blob);
        }

        if (!properties)
        {
            throw PathNotFoundError(std::string(path));
        }

        if (offset >= properties->GetSize())
        {
            return BlobReader();
        }

        return BlobReader(path, blob, properties->GetSize(), offset);
    }

    ChunkedWriter BlobFilesystem::Writer(const std::string_view path, const bool append)
    {
        const auto blob = GetBlobClient(path);
        if (!blob)
        {
            throw std::invalid_argument("Cannot write to the root directory");
        }

        int64_t size = 0;
        if (append)
        {
            const auto properties = TryGetProperties(*blob);
            if (!properties)
            {
                throw PathNotFoundError(std::string(path));
            }

            size = properties->GetSize();
        }
        else
        {
            if (blob->Exists())
            {
                BOOST_LOG_SEV(*m_logger, debug) << "Truncating '" << blob->GetKey() << "'";
                blob->Delete();
            }

            blob->CreateAppendBlob();
        }

        BOOST_LOG_SEV(*m_logger, debug) << "Opened writer for '" << blob->GetKey() << "' at " << size << " bytes";
        return ChunkedWriter(path, blob, size, m_logger, m_chunkSize);
    }

    FileInfo BlobFilesystem::Stat(const std::string_view path)
    {
        if (const auto blob = GetBlobClient(path))
        {
            if (const auto properties = TryGetProperties(*blob))
            {
                return FileEntry{ std::string(path), properties->GetSize(), properties->GetLastModified() };
            }
        }

        if (m_lister.HasDescendants(path))
        {
            return DirectoryEntry{ std::string(path) };
        }

        throw PathNotFoundError(std::string(path));
    }

    std::vector<std::string> BlobFilesystem::List(const std::string_view path)
    {
        const std::string directory = path == "/" ? std::string() : std::string(path);
        auto descendants = BlobLister::DirectDescendants(m_lister.ListBlobs(directory), directory);
        if (!directory.empty() && descendants.empty())
        {
            throw PathNotFoundError(std::string(path));
        }

        return descendants;
    }

    void BlobFilesystem::Move(const std::string_view sourcePath, const std::string_view destinationPath)
    {
        const auto source = GetBlobClient(sourcePath);
        const auto destination = GetBlobClient(destinationPath);
        if (!source)
        {
            throw PathNotFoundError(std::string(sourcePath));
        }

        if (!destination)
        {
            throw std::invalid_argument("Cannot move onto the root directory");
        }

        try
        {
            destination->CopyFrom(*source);
        }
        catch (const BlobNotFoundError&)
        {
            throw PathNotFoundError(std::string(sourcePath));
        }

        source->Delete();

        BOOST_LOG_SEV(*m_logger, debug) << "Moved '" << source->GetKey() << "' to '" << destination->GetKey() << "'";
    }

    void BlobFilesystem::Delete(const std::string_view path)
    {
        if (const auto blob = GetBlobClient(path); blob && blob->DeleteIfExists())
        {
            return;
        }

        const auto blobs = m_lister.ListBlobs(std::string(path));
        if (blobs.empty())
        {
            throw PathNotFoundError(std::string(path));
        }

        for (const auto& blobPath : blobs)
        {
            try
            {
                m_container->GetBlobClient(m_mapper.ToBlobKey(blobPath))->Delete();
            }
            catch (const BlobNotFoundError&)
            {
                throw PathNotFoundError(blobPath);
            }
        }

        BOOST_LOG_SEV(*m_logger, debug) << "Deleted " << blobs.size() << " blobs under '" << path << "'";
    }

    // Returns null for the root directory, which has no blob of its own.
    std::shared_ptr<BlobClient> BlobFilesystem::GetBlobClient(const std::string_view path) const
    {
        if (path.find_first_not_of('/') == std::string_view::npos)
        {
            return nullptr;
        }

        return m_container->GetBlobClient(m_mapper.ToBlobKey(path));
    }

    std::optional<BlobProperties> BlobFilesystem::TryGetProperties(BlobClient& blobClient)
    {
        try
        {
            return blobClient.GetProperties();
        }
        catch (const BlobNotFoundError&)
        {
            return std::nullopt;
        }
    }
}
