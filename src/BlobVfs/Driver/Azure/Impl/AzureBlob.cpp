// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Azure/Impl/AzureBlob.hpp"
#include "BlobVfs/Driver/Azure/Impl/BlobHelpers.hpp"
#include "BlobVfs/Driver/Azure/AzureErrorTranslator.hpp"
#include "BlobVfs/Driver/Core/Configuration.hpp"

#include <azure/core/io/body_stream.hpp>
#include <azure/storage/blobs/append_blob_client.hpp>
#include <azure/storage/blobs/block_blob_client.hpp>

#include <chrono>
#include <stdexcept>
namespace BlobVfs::Driver::Azure::Impl
{
    AzureBlob::AzureBlob(std::string key, ::Azure::Storage::Blobs::BlobClient client)
        : m_key(std::move(key)),
        m_client(std::move(client))
    {
    }

    const std::string& AzureBlob::GetKey() const noexcept
    {
        return m_key;
    }

    Core::BlobProperties AzureBlob::GetProperties()
    {
        return AzureErrorTranslator::Call(m_key, [this]()
            {
                const auto props = m_client.GetProperties().Value;
                return Core::BlobProperties(props.BlobSize,
                    std::chrono::system_clock::time_point{ props.LastModified },
                    BlobHelpers::ToBlobType(props.BlobType));
            });
    }

    bool AzureBlob::Exists()
    {
        try
        {
            m_client.GetProperties();
            return true;
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            if (AzureErrorTranslator::IsNotFound(ex.StatusCode))
            {
                return false;
            }

            throw;
        }
    }

    std::vector<char> AzureBlob::Download()
    {
        return AzureErrorTranslator::Call(m_key, [this]()
            {
                auto result = m_client.Download();
                const auto bytes = result.Value.BodyStream->ReadToEnd();
                return std::vector<char>(bytes.begin(), bytes.end());
            });
    }

    int64_t AzureBlob::DownloadTo(std::span<char> buffer, int64_t blobOffset, int64_t length)
    {
        ::Azure::Storage::Blobs::DownloadBlobToOptions options
        {
            .Range = ::Azure::Core::Http::HttpRange { blobOffset, length }
        };

        return AzureErrorTranslator::Call(m_key, [this, buffer, &options]()
            {
                const auto result = m_client.DownloadTo(reinterpret_cast<uint8_t*>(buffer.data()), buffer.size(), options);
                const auto& downloadedLength = result.Value.ContentRange.Length;
                return downloadedLength.ValueOr(-1);
            });
    }

    void AzureBlob::Upload(std::span<const char> data)
    {
        ::Azure::Core::IO::MemoryBodyStream dataStream(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        m_client.AsBlockBlobClient().Upload(dataStream);
    }

    void AzureBlob::CreateAppendBlob()
    {
        m_client.AsAppendBlobClient().Create();
    }

    void AzureBlob::AppendBlock(std::span<const char> data, int64_t offset)
    {
        ::Azure::Storage::Blobs::AppendBlockOptions options;
        options.AccessConditions.IfAppendPositionEqual = offset;

        AzureErrorTranslator::Call(m_key, [this, data, &options]()
            {
                ::Azure::Core::IO::MemoryBodyStream dataStream(reinterpret_cast<const uint8_t*>(data.data()), data.size());
                m_client.AsAppendBlobClient().AppendBlock(dataStream, options);
            });
    }

    void AzureBlob::Delete()
    {
        AzureErrorTranslator::Call(m_key, [this]()
            {
                m_client.Delete();
            });
    }

    bool AzureBlob::DeleteIfExists()
    {
        return m_client.DeleteIfExists().Value.Deleted;
    }

    void AzureBlob::CopyFrom(Core::BlobClient& source)
    {
        const auto* azureSource = dynamic_cast<const AzureBlob*>(&source);
        if (!azureSource)
        {
            throw std::invalid_argument("Copy source '" + source.GetKey() + "' is not an Azure blob");
        }

        AzureErrorTranslator::Call(source.GetKey(), [this, azureSource]()
            {
                auto operation = m_client.StartCopyFromUri(azureSource->m_client.GetUrl());
                operation.PollUntilDone(Core::Configuration::CopyPollInterval);
            });
    }
}
