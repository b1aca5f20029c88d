// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "IntegrationTestHelpers.hpp"
#include "BlobVfs/Driver/Azure/Driver.hpp"
#include "BlobVfs/Driver/Azure/Models/DriverParameters.hpp"
#include "BlobVfs/Driver/Core/Errors.hpp"

#include <azure/core/http/http_status_code.hpp>

#include <cstdlib>
#include <random>
using namespace boost::log::trivial;

namespace BlobVfs::Driver::Azure::Impl::Testing
{
    std::optional<std::map<std::string, std::string>> LoadDriverParametersFromEnvironment()
    {
        const char* connectionString = std::getenv("AZURE_STORAGE_CONNECTION_STRING");
        const char* container = std::getenv("AZURE_TEST_CONTAINER");

        if (!connectionString)
        {
            return std::nullopt;
        }

        return std::map<std::string, std::string>{
            { Models::DriverParameters::ConnectionStringKey, connectionString },
            { Models::DriverParameters::ContainerKey, container ? container : "blobvfs-integration-tests" },
        };
    }

    std::string GenerateRandomName(const std::string& prefix)
    {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(100000, 999999);
        return prefix + "-" + std::to_string(dis(gen));
    }

    void AzureIntegrationTestBase::SetUp()
    {
        m_parameters = LoadDriverParametersFromEnvironment();
        if (!m_parameters)
        {
            GTEST_SKIP() << "Azure storage settings not found in environment variables. "
                << "Set AZURE_STORAGE_CONNECTION_STRING to run integration tests.";
        }

        m_rootDirectory = "/" + GenerateRandomName("blobvfs");
        (*m_parameters)[Models::DriverParameters::RootDirectoryKey] = m_rootDirectory;
        m_logger = std::make_shared<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>>();

        try
        {
            m_filesystem = Driver::FromParameters(*m_parameters, m_logger);
        }
        catch (const ::Azure::Core::RequestFailedException& e)
        {
            HandleAuthenticationError(e);
            GTEST_SKIP() << "Failed to connect to Azure: " << e.what();
        }
    }

    void AzureIntegrationTestBase::TearDown()
    {
        CleanupRootDirectory();
    }

    void AzureIntegrationTestBase::HandleAuthenticationError(const ::Azure::Core::RequestFailedException& e)
    {
        if (e.StatusCode == ::Azure::Core::Http::HttpStatusCode::Unauthorized ||
            e.StatusCode == ::Azure::Core::Http::HttpStatusCode::Forbidden)
        {
            GTEST_SKIP() << "Azure authentication failed: " << e.what()
                << ". Please check the connection string is valid.";
        }
    }

    void AzureIntegrationTestBase::CleanupRootDirectory()
    {
        if (!m_filesystem)
        {
            return;
        }

        try
        {
            m_filesystem->Delete("/");
        }
        catch (const Core::PathNotFoundError&)
        {
            // Nothing was written.
        }
        catch (const std::exception& e)
        {
            BOOST_LOG_SEV(*m_logger, error) << "Cleanup of '" << m_rootDirectory << "' failed: " << e.what();
        }
    }
}
