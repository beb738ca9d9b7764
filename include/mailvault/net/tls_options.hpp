/*

tls_options.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <openssl/ssl.h>

namespace mailvault::net
{

/// Lowest protocol version offered to a mail server.
inline constexpr int MIN_TLS_VERSION = TLS1_2_VERSION;

/**
Certificate checks for one connection, filled from the `verify` and `ca_file`
keys of the account profile.

The system trust store is always loaded; `ca_file` adds a PEM bundle for a
server with a self-signed or private CA certificate.
**/
struct tls_options
{
    bool verify_peer = true;    ///< chain and host name; cleared only with `verify = false`
    std::string ca_file;
};

} // namespace mailvault::net
