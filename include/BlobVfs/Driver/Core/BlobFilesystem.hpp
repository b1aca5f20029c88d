// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/BlobLister.hpp"
#include "BlobVfs/Driver/Core/BlobReader.hpp"
#include "BlobVfs/Driver/Core/ChunkedWriter.hpp"
#include "BlobVfs/Driver/Core/Configuration.hpp"
#include "BlobVfs/Driver/Core/ContainerClient.hpp"
#include "BlobVfs/Driver/Core/FileInfo.hpp"
#include "BlobVfs/Driver/Core/PathMapper.hpp"

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
    /// Hierarchical view over a flat blob namespace.
    ///
    /// Paths are absolute, '/'-separated virtual paths. Directories are implied by key prefixes.
    /// Every missing path is reported as PathNotFoundError; any other backend failure escapes unchanged.
    /// </summary>
    class BlobFilesystem
    {
        std::string m_name;
        std::shared_ptr<ContainerClient> m_container;
        PathMapper m_mapper;
        BlobLister m_lister;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
        int64_t m_chunkSize;

    public:
        BlobFilesystem(std::string name,
            std::shared_ptr<ContainerClient> container,
            std::string rootDirectory,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            int64_t chunkSize = Configuration::MaxChunkSize);

        [[nodiscard]] const std::string& Name() const noexcept;

        /// <summary>
        /// Downloads the whole content stored at the path.
        /// </summary>
        [[nodiscard]] std::vector<char> GetContent(std::string_view path);

        /// <summary>
        /// Stores the content at the path in a single upload, replacing what was there.
        ///
        /// Content over Configuration::MaxPutContentSize is rejected before the backend is touched.
        /// An existing blob of a type the upload cannot overwrite is deleted first; if the upload
        /// then fails, the path is left empty.
        /// </summary>
        void PutContent(std::string_view path, std::span<const char> content);

        /// <summary>
        /// Deletes the blob at the path if it is not a block blob.
        /// </summary>
        /// <returns>True if a blob was deleted.</returns>
        bool ReplaceLegacyBlob(std::string_view path);

        /// <summary>
        /// Opens a reader positioned at <paramref name="offset"/>.
        /// </summary>
        /// <returns>A reader that yields nothing when the offset is at or past the end.</returns>
        [[nodiscard]] BlobReader Reader(std::string_view path, int64_t offset);

        /// <summary>
        /// Opens a write session.
        /// </summary>
        /// <param name="path">Virtual path of the file.</param>
        /// <param name="append">Continue an existing file instead of starting from an empty one.</param>
        [[nodiscard]] ChunkedWriter Writer(std::string_view path, bool append);

        [[nodiscard]] FileInfo Stat(std::string_view path);

        // Direct children of a directory, in lexical order.
        [[nodiscard]] std::vector<std::string> List(std::string_view path);

        // Copy then delete; a failure in between leaves both paths populated.
        void Move(std::string_view sourcePath, std::string_view destinationPath);

        // Deletes a file, or everything below a directory.
        void Delete(std::string_view path);

    private:
        std::shared_ptr<BlobClient> GetBlobClient(std::string_view path) const;
        static std::optional<BlobProperties> TryGetProperties(BlobClient& blobClient);
    };
}
