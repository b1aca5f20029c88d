// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/ContainerClient.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
namespace BlobVfs::Driver::Core
{
    /// <summary>
    /// Lazily walks the listing pages of one key prefix.
    ///
    /// The sequence ends on a page without a continuation marker or without keys.
    /// A marker the backend already handed out during this run means the listing
    /// would never terminate; NextPage throws PaginationError instead of looping.
    /// </summary>
    class BlobPager
    {
        ContainerClient& m_container;
        std::string m_prefix;
        std::optional<int32_t> m_pageSizeHint;
        std::string m_marker;
        std::unordered_set<std::string> m_seenMarkers;
        bool m_done;

    public:
        BlobPager(ContainerClient& container, std::string prefix, std::optional<int32_t> pageSizeHint = {});

        [[nodiscard]] bool HasMore() const noexcept;
        [[nodiscard]] BlobListPage NextPage();

        // Starts over from the first page.
        void Reset() noexcept;

        [[nodiscard]] const std::string& GetPrefix() const noexcept;
    };
}
