// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Azure/AzureErrorTranslator.hpp"
namespace BlobVfs::Driver::Azure
{
    bool AzureErrorTranslator::IsNotFound(const ::Azure::Core::Http::HttpStatusCode& statusCode) noexcept
    {
        using ::Azure::Core::Http::HttpStatusCode;

        switch (statusCode)
        {
        case HttpStatusCode::NotFound:
            return true;
        default:
            return false;
        }
    }
}
