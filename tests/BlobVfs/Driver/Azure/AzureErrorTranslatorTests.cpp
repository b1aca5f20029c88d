// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Azure/AzureErrorTranslator.hpp"

#include <gtest/gtest.h>

using BlobVfs::Driver::Azure::AzureErrorTranslator;
using BlobVfs::Driver::Core::BlobNotFoundError;
using ::Azure::Core::Http::HttpStatusCode;
using ::Azure::Core::RequestFailedException;

namespace
{
    RequestFailedException MakeException(const HttpStatusCode statusCode)
    {
        RequestFailedException ex("request failed");
        ex.StatusCode = statusCode;
        return ex;
    }
}

TEST(AzureErrorTranslatorTests, IsNotFound)
{
    // Assert
    ASSERT_TRUE(AzureErrorTranslator::IsNotFound(HttpStatusCode::NotFound));
    ASSERT_FALSE(AzureErrorTranslator::IsNotFound(HttpStatusCode::Forbidden));
    ASSERT_FALSE(AzureErrorTranslator::IsNotFound(HttpStatusCode::Conflict));
    ASSERT_FALSE(AzureErrorTranslator::IsNotFound(HttpStatusCode::PreconditionFailed));
}

TEST(AzureErrorTranslatorTests, Call_ReturnsValue)
{
    // Act
    const auto result = AzureErrorTranslator::Call("a/b", [] { return 42; });

    // Assert
    ASSERT_EQ(42, result);
}

TEST(AzureErrorTranslatorTests, Call_NotFound_BlobNotFoundError)
{
    // Act & Assert
    try
    {
        AzureErrorTranslator::Call("a/b", []() -> int { throw MakeException(HttpStatusCode::NotFound); });
        FAIL() << "Expected BlobNotFoundError";
    }
    catch (const BlobNotFoundError& ex)
    {
        ASSERT_EQ("a/b", ex.GetKey());
    }
}

TEST(AzureErrorTranslatorTests, Call_OtherStatus_Rethrown)
{
    // Act & Assert
    try
    {
        AzureErrorTranslator::Call("a/b", []() -> int { throw MakeException(HttpStatusCode::PreconditionFailed); });
        FAIL() << "Expected RequestFailedException";
    }
    catch (const RequestFailedException& ex)
    {
        ASSERT_EQ(HttpStatusCode::PreconditionFailed, ex.StatusCode);
    }
}
