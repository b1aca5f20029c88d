// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <map>
#include <optional>
#include <string>
namespace BlobVfs::Driver::Azure::Models
{
    class DriverParameters
    {
        std::string m_container;
        std::string m_rootDirectory;
        std::optional<std::string> m_connectionString;
        std::string m_accountName;
        std::string m_accountKey;
        std::string m_realm;

    public:
        static const constexpr char* ContainerKey = "container";
        static const constexpr char* RootDirectoryKey = "rootdirectory";
        static const constexpr char* ConnectionStringKey = "connectionstring";
        static const constexpr char* AccountNameKey = "accountname";
        static const constexpr char* AccountKeyKey = "accountkey";
        static const constexpr char* RealmKey = "realm";
        static const constexpr char* DefaultRealm = "core.windows.net";

        // Connection string based parameters.
        DriverParameters(std::string container, std::string rootDirectory, std::string connectionString);

        // Shared key based parameters.
        DriverParameters(std::string container,
            std::string rootDirectory,
            std::string accountName,
            std::string accountKey,
            std::string realm);

        /// <summary>
        /// Reads the driver parameters from a key/value map.
        ///
        /// A non-empty connectionstring wins over accountname/accountkey. Missing or empty
        /// required keys throw std::invalid_argument("no &lt;key&gt; parameter provided").
        /// </summary>
        static DriverParameters FromMap(const std::map<std::string, std::string>& parameters);

        const std::string& GetContainer() const noexcept;
        const std::string& GetRootDirectory() const noexcept;
        const std::optional<std::string>& GetConnectionString() const noexcept;
        const std::string& GetAccountName() const noexcept;
        const std::string& GetAccountKey() const noexcept;
        const std::string& GetRealm() const noexcept;

        // https://<accountname>.blob.<realm>
        std::string GetServiceUrl() const;
    };
}
