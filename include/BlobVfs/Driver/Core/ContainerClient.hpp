// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/BlobClient.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
namespace BlobVfs::Driver::Core
{
    struct BlobListPage
    {
        std::vector<std::string> Keys;

        // Empty on the final page.
        std::string NextMarker;
    };

    class ContainerClient
    {
    public:
        ContainerClient() = default;
        virtual ~ContainerClient() = default;

        virtual std::unique_ptr<BlobClient> GetBlobClient(const std::string& key) = 0;

        /// <summary>
        /// Lists one page of keys starting with <paramref name="prefix"/>.
        /// </summary>
        /// <param name="prefix">Key prefix, empty for the whole namespace.</param>
        /// <param name="marker">Continuation marker from the previous page, empty for the first page.</param>
        /// <param name="pageSizeHint">Upper bound on the keys returned, backend default if not set.</param>
        virtual BlobListPage ListBlobs(const std::string& prefix,
            const std::string& marker,
            std::optional<int32_t> pageSizeHint = {}) = 0;

        /// <returns>True if the namespace had to be created.</returns>
        virtual bool CreateIfNotExists() = 0;
    };
}
