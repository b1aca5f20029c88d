// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "BlobVfs/Driver/Azure/Models/DriverParameters.hpp"

#include <stdexcept>
namespace BlobVfs::Driver::Azure::Models
{
    static std::optional<std::string> Lookup(const std::map<std::string, std::string>& parameters, const std::string& key)
    {
        const auto it = parameters.find(key);
        if (it == parameters.end() || it->second.empty())
        {
            return std::nullopt;
        }

        return it->second;
    }

    static std::string Require(const std::map<std::string, std::string>& parameters, const std::string& key)
    {
        auto value = Lookup(parameters, key);
        if (!value)
        {
            throw std::invalid_argument("no " + key + " parameter provided");
        }

        return *value;
    }

    DriverParameters::DriverParameters(std::string container, std::string rootDirectory, std::string connectionString)
        : m_container(std::move(container)),
        m_rootDirectory(std::move(rootDirectory)),
        m_connectionString(std::move(connectionString)),
        m_realm(DefaultRealm)
    {
    }

    DriverParameters::DriverParameters(std::string container,
        std::string rootDirectory,
        std::string accountName,
        std::string accountKey,
        std::string realm)
        : m_container(std::move(container)),
        m_rootDirectory(std::move(rootDirectory)),
        m_accountName(std::move(accountName)),
        m_accountKey(std::move(accountKey)),
        m_realm(std::move(realm))
    {
    }

    DriverParameters DriverParameters::FromMap(const std::map<std::string, std::string>& parameters)
    {
        auto rootDirectory = Lookup(parameters, RootDirectoryKey).value_or("");
        auto container = Require(parameters, ContainerKey);
        if (auto connectionString = Lookup(parameters, ConnectionStringKey))
        {
            return DriverParameters(std::move(container), std::move(rootDirectory), std::move(*connectionString));
        }

        auto accountName = Require(parameters, AccountNameKey);
        auto accountKey = Require(parameters, AccountKeyKey);
        auto realm = Lookup(parameters, RealmKey).value_or(DefaultRealm);
        return DriverParameters(std::move(container),
            std::move(rootDirectory),
            std::move(accountName),
            std::move(accountKey),
            std::move(realm));
    }

    const std::string& DriverParameters::GetContainer() const noexcept
    {
        return m_container;
    }

    const std::string& DriverParameters::GetRootDirectory() const noexcept
    {
        return m_rootDirectory;
    }

    const std::optional<std::string>& DriverParameters::GetConnectionString() const noexcept
    {
        return m_connectionString;
    }

    const std::string& DriverParameters::GetAccountName() const noexcept
    {
        return m_accountName;
    }

    const std::string& DriverParameters::GetAccountKey() const noexcept
    {
        return m_accountKey;
    }

    const std::string& DriverParameters::GetRealm() const noexcept
    {
        return m_realm;
    }

    std::string DriverParameters::GetServiceUrl() const
    {
        return "https://" + m_accountName + ".blob." + m_realm;
    }
}
