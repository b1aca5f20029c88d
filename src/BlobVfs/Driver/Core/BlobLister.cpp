// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Core/BlobLister.hpp"
#include "BlobVfs/Driver/Core/BlobPager.hpp"
#include "BlobVfs/Driver/Core/Configuration.hpp"
#include "BlobVfs/Driver/Core/Errors.hpp"

#include <set>
using namespace boost::log::trivial;
namespace BlobVfs::Driver::Core
{
    BlobLister::BlobLister(std::shared_ptr<ContainerClient> container,
        PathMapper mapper,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_container(std::move(container)),
        m_mapper(std::move(mapper)),
        m_logger(std::move(logger))
    {
    }

    std::vector<std::string> BlobLister::ListBlobs(std::string virtualDirectory) const
    {
        // containerify the path
        if (virtualDirectory.empty() || virtualDirectory.back() != '/')
        {
            virtualDirectory += '/';
        }

        std::vector<std::string> blobs;
        BlobPager pager{ *m_container, m_mapper.ToBlobKey(virtualDirectory) };
        int pages = 0;
        try
        {
            while (pager.HasMore())
            {
                const auto page = pager.NextPage();
                pages++;
                for (const auto& key : page.Keys)
                {
                    blobs.push_back(m_mapper.ToVirtualPath(key));
                }
            }
        }
        catch (const PaginationError& ex)
        {
            for (const auto& key : ex.GetPartialResults())
            {
                blobs.push_back(m_mapper.ToVirtualPath(key));
            }

            throw PaginationError(ex.what(), std::move(blobs));
        }

        BOOST_LOG_SEV(*m_logger, debug) << "Listed " << blobs.size() << " blobs under '" << pager.GetPrefix() << "' in " << pages << " pages";
        return blobs;
    }

    bool BlobLister::HasDescendants(const std::string_view virtualDirectory) const
    {
        auto prefix = m_mapper.ToBlobKey(virtualDirectory);
        if (!prefix.empty() && prefix.back() != '/')
        {
            prefix += '/';
        }

        BlobPager pager{ *m_container, std::move(prefix), Configuration::StatPageSizeHint };
        return !pager.NextPage().Keys.empty();
    }

    std::vector<std::string> BlobLister::DirectDescendants(const std::vector<std::string>& paths, std::string prefix)
    {
        if (prefix.empty() || prefix.front() != '/')
        {
            prefix.insert(prefix.begin(), '/');
        }

        if (prefix.back() != '/')
        {
            prefix += '/';
        }

        std::set<std::string> descendants;
        for (const auto& path : paths)
        {
            if (!path.starts_with(prefix))
            {
                continue;
            }

            const auto relative = std::string_view(path).substr(prefix.size());
            const auto separator = relative.find('/');
            if (separator == std::string_view::npos)
            {
                descendants.insert(path);
            }
            else
            {
                descendants.insert(prefix + std::string(relative.substr(0, separator)));
            }
        }

        return { descendants.begin(), descendants.end() };
    }
}
