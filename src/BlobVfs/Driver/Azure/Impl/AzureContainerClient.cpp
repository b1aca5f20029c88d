// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Azure/Impl/AzureContainerClient.hpp"
#include "BlobVfs/Driver/Azure/Impl/AzureBlob.hpp"
namespace BlobVfs::Driver::Azure::Impl
{
    AzureContainerClient::AzureContainerClient(::Azure::Storage::Blobs::BlobContainerClient client)
        : m_client(std::move(client))
    {
    }

    std::unique_ptr<Core::BlobClient> AzureContainerClient::GetBlobClient(const std::string& key)
    {
        return std::make_unique<AzureBlob>(key, m_client.GetBlobClient(key));
    }

    Core::BlobListPage AzureContainerClient::ListBlobs(const std::string& prefix,
        const std::string& marker,
        const std::optional<int32_t> pageSizeHint)
    {
        ::Azure::Storage::Blobs::ListBlobsOptions options;
        if (!prefix.empty())
        {
            options.Prefix = prefix;
        }

        if (!marker.empty())
        {
            options.ContinuationToken = marker;
        }

        if (pageSizeHint)
        {
            options.PageSizeHint = *pageSizeHint;
        }

        const auto response = m_client.ListBlobs(options);

        Core::BlobListPage page;
        page.Keys.reserve(response.Blobs.size());
        for (const auto& blob : response.Blobs)
        {
            page.Keys.push_back(blob.Name);
        }

        if (response.NextPageToken.HasValue())
        {
            page.NextMarker = response.NextPageToken.Value();
        }

        return page;
    }

    bool AzureContainerClient::CreateIfNotExists()
    {
        return m_client.CreateIfNotExists().Value.Created;
    }
}
