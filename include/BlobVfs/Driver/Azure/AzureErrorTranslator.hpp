// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "BlobVfs/Driver/Core/Errors.hpp"

#include <azure/core/exception.hpp>
#include <azure/core/http/http_status_code.hpp>

#include <string>
#include <utility>
namespace BlobVfs::Driver::Azure
{
    struct AzureErrorTranslator
    {
        static bool IsNotFound(const ::Azure::Core::Http::HttpStatusCode& statusCode) noexcept;

        /// <summary>
        /// Runs a storage call, reporting a 404 as Core::BlobNotFoundError for <paramref name="key"/>.
        /// Every other exception escapes unchanged.
        /// </summary>
        template <typename Func>
        static decltype(auto) Call(const std::string& key, Func&& func)
        {
            try
            {
                return std::forward<Func>(func)();
            }
            catch (const ::Azure::Core::RequestFailedException& ex)
            {
                if (IsNotFound(ex.StatusCode))
                {
                    throw Core::BlobNotFoundError(key);
                }

                throw;
            }
        }
    };
}
