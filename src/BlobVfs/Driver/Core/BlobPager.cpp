// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/BlobPager.hpp"
#include "BlobVfs/Driver/Core/Errors.hpp"

#include <sstream>
namespace BlobVfs::Driver::Core
{
    BlobPager::BlobPager(ContainerClient& container, std::string prefix, const std::optional<int32_t> pageSizeHint)
        : m_container(container),
        m_prefix(std::move(prefix)),
        m_pageSizeHint(pageSizeHint),
        m_done(false)
    {
    }

    bool BlobPager::HasMore() const noexcept
    {
        return !m_done;
    }

    BlobListPage BlobPager::NextPage()
    {
        if (m_done)
        {
            throw std::out_of_range("No listing pages left for prefix '" + m_prefix + "'");
        }

        auto page = m_container.ListBlobs(m_prefix, m_marker, m_pageSizeHint);
        if (page.Keys.empty() || page.NextMarker.empty())
        {
            m_done = true;
            return page;
        }

        if (page.NextMarker == m_marker || !m_seenMarkers.insert(page.NextMarker).second)
        {
            m_done = true;
            std::stringstream ss;
            ss << "Listing of prefix '" << m_prefix << "' returned the continuation marker '" << page.NextMarker << "' twice";
            throw PaginationError(ss.str(), std::move(page.Keys));
        }

        m_marker = page.NextMarker;
        return page;
    }

    void BlobPager::Reset() noexcept
    {
        m_marker.clear();
        m_seenMarkers.clear();
        m_done = false;
    }

    const std::string& BlobPager::GetPrefix() const noexcept
    {
        return m_prefix;
    }
}
