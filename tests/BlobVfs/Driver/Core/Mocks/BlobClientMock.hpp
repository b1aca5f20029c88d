// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/BlobClient.hpp"
#include <gmock/gmock.h>
namespace BlobVfs::Driver::Core::Mocks
{
    class BlobClientMock : public BlobClient
    {
    public:
        BlobClientMock();
        virtual ~BlobClientMock();

        MOCK_METHOD(const std::string&, GetKey, (), (const, noexcept, override));
        MOCK_METHOD(BlobProperties, GetProperties, (), (override));
        MOCK_METHOD(bool, Exists, (), (override));
        MOCK_METHOD(std::vector<char>, Download, (), (override));
        MOCK_METHOD(int64_t, DownloadTo, (std::span<char> buffer, int64_t blobOffset, int64_t length), (override));
        MOCK_METHOD(void, Upload, (std::span<const char> data), (override));
        MOCK_METHOD(void, CreateAppendBlob, (), (override));
        MOCK_METHOD(void, AppendBlock, (std::span<const char> data, int64_t offset), (override));
        MOCK_METHOD(void, Delete, (), (override));
        MOCK_METHOD(bool, DeleteIfExists, (), (override));
        MOCK_METHOD(void, CopyFrom, (BlobClient& source), (override));
    };
}
