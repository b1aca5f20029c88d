// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/Errors.hpp"
#include "BlobVfs/Driver/Core/Walk.hpp"
#include "IntegrationTestHelpers.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using BlobVfs::Driver::Azure::Impl::Testing::AzureIntegrationTestBase;
using BlobVfs::Driver::Core::FileInfo;
using BlobVfs::Driver::Core::PathNotFoundError;
using BlobVfs::Driver::Core::Walk;
using BlobVfs::Driver::Core::WalkAction;

namespace
{
    std::span<const char> Bytes(const std::string_view data)
    {
        return { data.data(), data.size() };
    }

    std::string AsString(const std::vector<char>& data)
    {
        return { data.begin(), data.end() };
    }
}

class BlobFilesystemIntegrationTests : public AzureIntegrationTestBase
{
};

TEST_F(BlobFilesystemIntegrationTests, PutContent_ThenGetContent_SameBytes)
{
    // Arrange
    m_filesystem->PutContent("/a/b", Bytes("hello"));

    // Act
    const auto content = m_filesystem->GetContent("/a/b");

    // Assert
    EXPECT_EQ("hello", AsString(content));
    EXPECT_EQ(5, GetSize(m_filesystem->Stat("/a/b")));
    EXPECT_TRUE(IsDirectory(m_filesystem->Stat("/a")));
}

TEST_F(BlobFilesystemIntegrationTests, Writer_ChunkedThenResumed_FullContent)
{
    // Arrange
    std::string expected(5 * 1024 * 1024, 'x');
    expected += "tail";

    // Act
    {
        auto writer = m_filesystem->Writer("/uploads/data", false);
        writer.Write(Bytes(std::string_view(expected).substr(0, expected.size() - 4)));
        writer.Close();
    }

    auto writer = m_filesystem->Writer("/uploads/data", true);
    writer.Write(Bytes("tail"));
    writer.Commit();
    writer.Close();

    // Assert
    EXPECT_EQ(static_cast<int64_t>(expected.size()), writer.Size());
    EXPECT_EQ(expected, AsString(m_filesystem->GetContent("/uploads/data")));
}

TEST_F(BlobFilesystemIntegrationTests, PutContent_OverAppendBlob_Replaced)
{
    // Arrange
    {
        auto writer = m_filesystem->Writer("/legacy", false);
        writer.Write(Bytes("old"));
        writer.Commit();
        writer.Close();
    }

    // Act
    m_filesystem->PutContent("/legacy", Bytes("new"));

    // Assert
    EXPECT_EQ("new", AsString(m_filesystem->GetContent("/legacy")));
}

TEST_F(BlobFilesystemIntegrationTests, Reader_FromOffset_ReadsRemainder)
{
    // Arrange
    m_filesystem->PutContent("/file", Bytes("0123456789"));
    std::vector<char> buffer(16);

    // Act
    auto reader = m_filesystem->Reader("/file", 6);
    const auto bytesRead = reader.Read(buffer);

    // Assert
    EXPECT_EQ(4, bytesRead);
    EXPECT_EQ("6789", std::string(buffer.data(), static_cast<size_t>(bytesRead)));
}

TEST_F(BlobFilesystemIntegrationTests, ListMoveDelete)
{
    // Arrange
    m_filesystem->PutContent("/d/1", Bytes("1"));
    m_filesystem->PutContent("/d/e/2", Bytes("2"));

    // Act
    m_filesystem->Move("/d/1", "/moved");

    // Assert
    const std::vector<std::string> expected = { "/d/e" };
    EXPECT_EQ(expected, m_filesystem->List("/d"));
    EXPECT_EQ("1", AsString(m_filesystem->GetContent("/moved")));

    m_filesystem->Delete("/d");
    EXPECT_THROW((void)m_filesystem->Stat("/d/e/2"), PathNotFoundError);
    EXPECT_THROW(m_filesystem->Delete("/d"), PathNotFoundError);
}

TEST_F(BlobFilesystemIntegrationTests, Walk_VisitsEveryFile)
{
    // Arrange
    m_filesystem->PutContent("/w/a", Bytes("a"));
    m_filesystem->PutContent("/w/b/c", Bytes("c"));
    std::vector<std::string> visited;

    // Act
    Walk(*m_filesystem, "/w", [&visited](const FileInfo& info)
        {
            visited.push_back(GetPath(info));
            return WalkAction::Continue;
        });

    // Assert
    const std::vector<std::string> expected = { "/w/a", "/w/b", "/w/b/c" };
    EXPECT_EQ(expected, visited);
}

TEST_F(BlobFilesystemIntegrationTests, GetContent_Missing_PathNotFound)
{
    // Act & Assert
    EXPECT_THROW((void)m_filesystem->GetContent("/missing"), PathNotFoundError);
}
