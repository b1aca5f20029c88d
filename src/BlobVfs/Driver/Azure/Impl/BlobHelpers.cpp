// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Azure/Impl/BlobHelpers.hpp"
#include "BlobVfs/Driver/Core/Configuration.hpp"

#include <azure/storage/common/storage_credential.hpp>

#include <memory>
namespace BlobVfs::Driver::Azure::Impl
{
    ::Azure::Storage::Blobs::BlobClientOptions BlobHelpers::CreateBlobClientOptions()
    {
        auto opts = ::Azure::Storage::Blobs::BlobClientOptions();
        opts.Retry.MaxRetries = Core::Configuration::MaxClientRetries;
        return opts;
    }

    ::Azure::Storage::Blobs::BlobContainerClient BlobHelpers::CreateContainerClient(const Models::DriverParameters& parameters)
    {
        const auto options = CreateBlobClientOptions();
        if (const auto& connectionString = parameters.GetConnectionString())
        {
            return ::Azure::Storage::Blobs::BlobContainerClient::CreateFromConnectionString(*connectionString,
                parameters.GetContainer(),
                options);
        }

        auto credential = std::make_shared<::Azure::Storage::StorageSharedKeyCredential>(parameters.GetAccountName(),
            parameters.GetAccountKey());
        return ::Azure::Storage::Blobs::BlobContainerClient
        {
            parameters.GetServiceUrl() + "/" + parameters.GetContainer(),
            std::move(credential),
            options
        };
    }

    Core::BlobType BlobHelpers::ToBlobType(const ::Azure::Storage::Blobs::Models::BlobType& type)
    {
        using ::Azure::Storage::Blobs::Models::BlobType;

        if (type == BlobType::AppendBlob)
        {
            return Core::BlobType::Append;
        }

        if (type == BlobType::PageBlob)
        {
            return Core::BlobType::Page;
        }

        return Core::BlobType::Block;
    }
}
