// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Azure/Models/DriverParameters.hpp"
#include "BlobVfs/Driver/Core/BlobProperties.hpp"

#include <azure/storage/blobs/blob_container_client.hpp>
#include <azure/storage/blobs/blob_options.hpp>
#include <azure/storage/blobs/rest_client.hpp>
namespace BlobVfs::Driver::Azure::Impl
{
    struct BlobHelpers
    {
        static ::Azure::Storage::Blobs::BlobClientOptions CreateBlobClientOptions();
        static ::Azure::Storage::Blobs::BlobContainerClient CreateContainerClient(const Models::DriverParameters& parameters);
        static Core::BlobType ToBlobType(const ::Azure::Storage::Blobs::Models::BlobType& type);
    };
}
