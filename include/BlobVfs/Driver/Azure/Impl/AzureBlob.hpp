// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/BlobClient.hpp"

#include <azure/storage/blobs/blob_client.hpp>

#include <string>
namespace BlobVfs::Driver::Azure::Impl
{
    class AzureBlob final : public Core::BlobClient
    {
        std::string m_key;
        ::Azure::Storage::Blobs::BlobClient m_client;

    public:
        AzureBlob(std::string key, ::Azure::Storage::Blobs::BlobClient client);

        virtual const std::string& GetKey() const noexcept override;
        virtual Core::BlobProperties GetProperties() override;
        virtual bool Exists() override;
        virtual std::vector<char> Download() override;
        virtual int64_t DownloadTo(std::span<char> buffer, int64_t blobOffset, int64_t length) override;
        virtual void Upload(std::span<const char> data) override;
        virtual void CreateAppendBlob() override;
        virtual void AppendBlock(std::span<const char> data, int64_t offset) override;
        virtual void Delete() override;
        virtual bool DeleteIfExists() override;

        // The source must be another AzureBlob readable by this account.
        virtual void CopyFrom(Core::BlobClient& source) override;
    };
}
