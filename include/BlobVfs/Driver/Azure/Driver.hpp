// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Azure/Models/DriverParameters.hpp"
#include "BlobVfs/Driver/Core/BlobFilesystem.hpp"
#include "BlobVfs/Driver/Core/Configuration.hpp"

#include <boost/log/trivial.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
namespace BlobVfs::Driver::Azure
{
    struct Driver
    {
        static const constexpr std::string_view Name = "azure";

        /// <summary>
        /// Builds a filesystem on an Azure blob container, creating the container if it does not exist.
        /// </summary>
        /// <param name="parameters">container, rootdirectory, and either connectionstring or accountname/accountkey/realm.</param>
        static std::unique_ptr<Core::BlobFilesystem> FromParameters(const std::map<std::string, std::string>& parameters,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        static std::unique_ptr<Core::BlobFilesystem> Create(const Models::DriverParameters& parameters,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            int64_t chunkSize = Core::Configuration::MaxChunkSize);
    };
}
