// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/ContainerClient.hpp"
#include "BlobVfs/Driver/Core/PathMapper.hpp"

#include <boost/log/trivial.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>
namespace BlobVfs::Driver::Core
{
    class BlobLister
    {
        std::shared_ptr<ContainerClient> m_container;
        PathMapper m_mapper;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

    public:
        BlobLister(std::shared_ptr<ContainerClient> container,
            PathMapper mapper,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        /// <summary>
        /// Lists every blob below a virtual directory, following continuation markers to the last page.
        /// </summary>
        /// <param name="virtualDirectory">Virtual path of the directory, empty for the root.</param>
        /// <returns>Virtual paths of all blobs under the directory, at any depth.</returns>
        [[nodiscard]] std::vector<std::string> ListBlobs(std::string virtualDirectory) const;

        // True if at least one blob lives below the virtual directory. Reads a single page.
        [[nodiscard]] bool HasDescendants(std::string_view virtualDirectory) const;

        /// <summary>
        /// Direct descendants (blobs or virtual directories) of <paramref name="prefix"/> in a list of blob paths.
        ///
        /// Example: the direct descendants of "/" in {"/foo", "/bar/1", "/bar/2"} are {"/foo", "/bar"},
        /// and those of "/bar" are {"/bar/1", "/bar/2"}.
        /// </summary>
        /// <param name="paths">Virtual paths, each starting with '/'.</param>
        /// <param name="prefix">Virtual directory, with or without leading and trailing '/'.</param>
        /// <returns>The de-duplicated descendants in lexical order.</returns>
        [[nodiscard]] static std::vector<std::string> DirectDescendants(const std::vector<std::string>& paths, std::string prefix);
    };
}
