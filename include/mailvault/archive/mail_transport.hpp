/*

mail_transport.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <mailvault/archive/profile.hpp>
#include <mailvault/archive/types.hpp>
#include <mailvault/detail/result.hpp>

namespace mailvault::archive
{

/// What the connectivity probe reports besides success.
struct session_info
{
    std::size_t capabilities = 0;
    bool tls = false;
};

/**
Open mailbox session.

A session is owned by one caller and is not shared between threads. Handles it
returns stay valid only until it is closed; the destructor closes it on every
exit path.
**/
class mail_session
{
public:
    virtual ~mail_session() = default;

    [[nodiscard]] virtual session_info info() const = 0;

    /// All folders; an account without folders yields an empty sequence.
    virtual result<std::vector<folder_summary>> list_folders() = 0;

    /**
    Messages of `folder` in ascending sequence order.

    @param before Only messages whose internal date lies before this day
                  (server side day granularity, so a superset of the exact
                  instant comparison the caller still has to apply).
    **/
    virtual result<std::vector<message_handle>> list_messages(std::string_view folder,
        std::optional<std::chrono::sys_seconds> before = std::nullopt) = 0;

    /// Full RFC 5322 source; network class errors are worth one retry.
    virtual result<std::string> fetch_raw(const message_handle& handle) = 0;

    /// Permanently remove the messages (flag then expunge); returns the count removed.
    virtual result<std::size_t> delete_messages(std::string_view folder, std::span<const message_handle> handles) = 0;

    /**
    Make the session usable again after a network failure.

    Succeeds at once on a healthy connection. An error means the server cannot
    be reached any more and the caller should stop.
    **/
    virtual result_void reopen() = 0;

    virtual result_void close() = 0;
};

class mail_transport
{
public:
    virtual ~mail_transport() = default;

    /**
    Connect and authenticate.

    Failures carry errc::net_resolve_failed (bad host), errc::imap_auth_failed,
    a TLS code or a network code; see `classify_connection_error()`.
    **/
    virtual result<std::unique_ptr<mail_session>> connect(const connection_profile& profile) = 0;
};

} // namespace mailvault::archive
