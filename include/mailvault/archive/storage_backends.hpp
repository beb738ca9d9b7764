/*

storage_backends.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <memory>

#include <mailvault/archive/curl_share.hpp>
#include <mailvault/archive/mounted_share.hpp>
#include <mailvault/archive/profile.hpp>
#include <mailvault/archive/remote_storage.hpp>
#include <mailvault/detail/result.hpp>

namespace mailvault::archive
{

/// Storage adapter matching the profile: a mount point wins over a URL.
[[nodiscard]] inline result<std::unique_ptr<remote_storage>> make_remote_storage(const nas_profile& profile)
{
    storage_backend backend;
    MAILVAULT_TRY_ASSIGN(backend, profile.backend());
    switch (backend)
    {
        case storage_backend::mounted:
            return std::unique_ptr<remote_storage>(std::make_unique<mounted_share>());
        case storage_backend::curl:
            return std::unique_ptr<remote_storage>(std::make_unique<curl_share>());
    }
    return fail<std::unique_ptr<remote_storage>>(errc::internal_error, "Unknown storage backend.");
}

} // namespace mailvault::archive
