// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/ContainerClient.hpp"

#include <azure/storage/blobs.hpp>
namespace BlobVfs::Driver::Azure::Impl
{
    class AzureContainerClient final : public Core::ContainerClient
    {
        ::Azure::Storage::Blobs::BlobContainerClient m_client;

    public:
        AzureContainerClient(::Azure::Storage::Blobs::BlobContainerClient client);
        virtual std::unique_ptr<Core::BlobClient> GetBlobClient(const std::string& key) override;
        virtual Core::BlobListPage ListBlobs(const std::string& prefix,
            const std::string& marker,
            std::optional<int32_t> pageSizeHint = {}) override;
        virtual bool CreateIfNotExists() override;
    };
}
