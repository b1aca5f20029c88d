// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/BlobReader.hpp"
#include "BlobVfs/Driver/Core/Mocks/BlobClientMock.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

using BlobVfs::Driver::Core::BlobReader;
using BlobVfs::Driver::Core::Mocks::BlobClientMock;
using ::testing::_;
using ::testing::Return;

class BlobReaderTests : public ::testing::Test
{
protected:
    std::shared_ptr<BlobClientMock> m_blobClient;

    void TearDown() override
    {
        ASSERT_TRUE(::testing::Mock::VerifyAndClearExpectations(m_blobClient.get()));
    }

    void SetUp() override
    {
        m_blobClient = std::make_shared<BlobClientMock>();
    }
};

TEST_F(BlobReaderTests, Read_FromOffset_RangedDownloadAndAdvance)
{
    // Arrange
    EXPECT_CALL(*m_blobClient, DownloadTo(_, 3, 4))
        .WillOnce([](std::span<char> buffer, int64_t, int64_t length)
            {
                std::fill_n(buffer.begin(), length, 'r');
                return length;
            });
    BlobReader reader{ "/file", m_blobClient, 10, 3 };
    std::vector<char> buffer(4);

    // Act
    const auto bytesRead = reader.Read(buffer);

    // Assert
    ASSERT_EQ(4, bytesRead);
    ASSERT_EQ(7, reader.GetOffset());
    ASSERT_EQ(std::vector<char>(4, 'r'), buffer);
}

TEST_F(BlobReaderTests, Read_BufferLargerThanRemainder_ClampedToSize)
{
    // Arrange
    EXPECT_CALL(*m_blobClient, DownloadTo(_, 8, 2))
        .WillOnce(Return(2));
    BlobReader reader{ "/file", m_blobClient, 10, 8 };
    std::vector<char> buffer(100);

    // Act
    const auto bytesRead = reader.Read(buffer);

    // Assert
    ASSERT_EQ(2, bytesRead);
    ASSERT_EQ(10, reader.GetOffset());
}

TEST_F(BlobReaderTests, Read_AtEnd_NoDownload)
{
    // Arrange
    EXPECT_CALL(*m_blobClient, DownloadTo(_, _, _)).Times(0);
    BlobReader reader{ "/file", m_blobClient, 10, 10 };
    std::vector<char> buffer(4);

    // Act & Assert
    ASSERT_EQ(0, reader.Read(buffer));
}

TEST_F(BlobReaderTests, Skip_ClampedToSize)
{
    // Arrange
    BlobReader reader{ "/file", m_blobClient, 10, 2 };

    // Act
    reader.Skip(5);
    const auto afterSkip = reader.GetOffset();
    reader.Skip(50);

    // Assert
    ASSERT_EQ(7, afterSkip);
    ASSERT_EQ(10, reader.GetOffset());
    ASSERT_THROW(reader.Skip(-1), std::invalid_argument);
}

TEST_F(BlobReaderTests, DefaultReader_ReadsNothing)
{
    // Arrange
    BlobReader reader;
    std::vector<char> buffer(4);

    // Act & Assert
    ASSERT_EQ(0, reader.Read(buffer));
    ASSERT_EQ(0, reader.GetSize());
}

TEST_F(BlobReaderTests, Constructor_NegativeOffset_Throws)
{
    // Act & Assert
    ASSERT_THROW(BlobReader("/file", m_blobClient, 10, -1), std::invalid_argument);
}
