// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Azure/Driver.hpp"
#include "BlobVfs/Driver/Azure/Impl/AzureContainerClient.hpp"
#include "BlobVfs/Driver/Azure/Impl/BlobHelpers.hpp"
using namespace boost::log::trivial;
namespace BlobVfs::Driver::Azure
{
    std::unique_ptr<Core::BlobFilesystem> Driver::FromParameters(const std::map<std::string, std::string>& parameters,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
    {
        return Create(Models::DriverParameters::FromMap(parameters), std::move(logger));
    }

    std::unique_ptr<Core::BlobFilesystem> Driver::Create(const Models::DriverParameters& parameters,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        const int64_t chunkSize)
    {
        auto container = std::make_shared<Impl::AzureContainerClient>(Impl::BlobHelpers::CreateContainerClient(parameters));
        if (container->CreateIfNotExists())
        {
            BOOST_LOG_SEV(*logger, info) << "Created container '" << parameters.GetContainer() << "'";
        }

        return std::make_unique<Core::BlobFilesystem>(std::string(Name),
            std::move(container),
            parameters.GetRootDirectory(),
            std::move(logger),
            chunkSize);
    }
}
