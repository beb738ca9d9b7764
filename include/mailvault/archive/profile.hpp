/*

profile.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <format>
#include <string>
#include <string_view>

#include <mailvault/detail/redact.hpp>
#include <mailvault/detail/result.hpp>
#include <mailvault/net/tls_mode.hpp>

namespace mailvault::archive
{

/**
Resolved mail account: where to connect and how to authenticate.

Built once by the configuration layer and passed by const reference from then
on; nothing below the CLI mutates it.
**/
struct connection_profile
{
    std::string provider;
    std::string display_name;
    std::string host;
    unsigned short port = 993;
    mailvault::net::tls_mode security = mailvault::net::tls_mode::implicit;
    std::string email;
    std::string password;
    std::chrono::seconds timeout{30};
    bool verify_peer = true;
    std::string ca_file;                  ///< extra PEM bundle, for self-signed server certificates
    bool allow_cleartext_auth = false;

    /// Local part of the address, used as the account directory on the share.
    [[nodiscard]] std::string account_identifier() const
    {
        const auto at = email.find('@');
        return at == std::string::npos ? email : email.substr(0, at);
    }

    /// One line description without the password.
    [[nodiscard]] std::string describe() const
    {
        return std::format("{} <{}> at {}:{} ({})", display_name.empty() ? provider : display_name,
            email, host, port, mailvault::net::to_string(security));
    }
};

enum class storage_backend
{
    mounted,
    curl
};

/**
Resolved network share.

`mount` names a share already mounted into the local filesystem; `url` an
ftp, ftps or sftp location reached through libcurl. `base_path` is relative to
either of them.
**/
struct nas_profile
{
    std::string url;
    std::string mount;
    std::string host;
    std::string share;
    std::string username;
    std::string password;
    std::string base_path = "/mail-archive";
    std::chrono::seconds timeout{30};
    bool verify_peer = true;

    /// Backend selected by the fields present; host and share alone are not enough.
    [[nodiscard]] result<storage_backend> backend() const
    {
        if (!mount.empty())
            return storage_backend::mounted;
        if (!url.empty())
            return storage_backend::curl;
        if (!host.empty() || !share.empty())
            return fail<storage_backend>(errc::config_missing,
                "NAS_MOUNT or NAS_URL must be set; host and share alone do not locate the share.",
                std::format("host={} share={}", host, share));
        return fail<storage_backend>(errc::config_missing, "No NAS configured (set NAS_MOUNT or NAS_URL).");
    }

    [[nodiscard]] std::string describe() const
    {
        if (!mount.empty())
            return std::format("mount {} path {}", mount, base_path);
        return std::format("{} path {}", mailvault::detail::redact_url(url), base_path);
    }
};

} // namespace mailvault::archive
