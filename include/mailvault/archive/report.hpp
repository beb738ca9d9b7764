/*

report.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailvault/detail/result.hpp>

namespace mailvault::archive
{

/// Per-folder state machine of the orchestrator.
enum class run_state
{
    listing,
    downloading,
    mirroring,
    local_cleanup,
    retention_deleting,
    done,
    failed
};

[[nodiscard]] constexpr std::string_view to_string(run_state state) noexcept
{
    switch (state)
    {
        case run_state::listing: return "Listing";
        case run_state::downloading: return "Downloading";
        case run_state::mirroring: return "Mirroring";
        case run_state::local_cleanup: return "LocalCleanup";
        case run_state::retention_deleting: return "RetentionDeleting";
        case run_state::done: return "Done";
        case run_state::failed: return "Failed";
    }
    return "Unknown";
}

enum class failure_kind
{
    connection,
    fetch,
    write,
    deletion,
    parse
};

[[nodiscard]] constexpr std::string_view to_string(failure_kind kind) noexcept
{
    switch (kind)
    {
        case failure_kind::connection: return "ConnectionError";
        case failure_kind::fetch: return "FetchError";
        case failure_kind::write: return "WriteError";
        case failure_kind::deletion: return "DeleteError";
        case failure_kind::parse: return "ParseError";
    }
    return "Error";
}

/// Kind of a failure raised while working in `phase`; malformed content is always a parse error.
[[nodiscard]] constexpr failure_kind classify_failure(errc code, failure_kind phase) noexcept
{
    if (code == errc::mime_parse_error || code == errc::codec_error)
        return failure_kind::parse;
    return phase;
}

/// Sub-kinds of a connection failure, reported by the probes and the CLI.
enum class connection_error_kind
{
    bad_host,
    auth_rejected,
    tls_negotiation,
    network,
    protocol,
    configuration
};

[[nodiscard]] constexpr std::string_view to_string(connection_error_kind kind) noexcept
{
    switch (kind)
    {
        case connection_error_kind::bad_host: return "bad host";
        case connection_error_kind::auth_rejected: return "authentication rejected";
        case connection_error_kind::tls_negotiation: return "TLS negotiation failed";
        case connection_error_kind::network: return "network error";
        case connection_error_kind::protocol: return "protocol error";
        case connection_error_kind::configuration: return "configuration error";
    }
    return "error";
}

[[nodiscard]] constexpr connection_error_kind classify_connection_error(errc code) noexcept
{
    switch (code)
    {
        case errc::net_resolve_failed:
            return connection_error_kind::bad_host;
        case errc::imap_auth_failed:
        case errc::storage_auth_failed:
            return connection_error_kind::auth_rejected;
        case errc::tls_handshake_failed:
        case errc::tls_verify_failed:
        case errc::tls_required:
            return connection_error_kind::tls_negotiation;
        case errc::invalid_argument:
        case errc::config_missing:
        case errc::config_invalid:
            return connection_error_kind::configuration;
        default:
            break;
    }
    if (is_network_error(code) || code == errc::storage_connect_failed)
        return connection_error_kind::network;
    return connection_error_kind::protocol;
}

/// One failed item; `item` is a message id (`folder:uid`) or a file path.
struct item_error
{
    std::string folder;
    std::string item;
    failure_kind kind = failure_kind::fetch;
    errc code = errc::ok;
    std::string reason;
    std::string detail;

    [[nodiscard]] std::string to_string() const
    {
        return std::format("[{}] {} {}: {}", archive::to_string(kind), folder, item, reason);
    }
};

struct folder_report
{
    std::string name;
    run_state state = run_state::listing;
    std::size_t listed = 0;
    std::optional<std::string> failure;
};

/**
Aggregate result of one run.

Counters count messages except `uploaded` and `skipped_existing`, which count
files on the share. The id lists name the messages acted upon (or, in
preview, that would have been) so that a preview and a real run can be
compared item by item.
**/
struct run_outcome
{
    bool preview = false;

    std::size_t listed = 0;
    std::size_t downloaded = 0;
    std::size_t attachments = 0;
    std::size_t uploaded = 0;
    std::size_t skipped_existing = 0;
    std::size_t deleted_local = 0;
    std::size_t deleted_remote = 0;
    std::size_t failed = 0;

    std::vector<std::string> downloaded_ids;
    std::vector<std::string> mirrored_ids;
    std::vector<std::string> deleted_local_ids;
    std::vector<std::string> deleted_remote_ids;

    std::vector<item_error> errors;
    std::vector<folder_report> folders;

    /// Deletion was requested but not confirmed by the caller.
    bool deletion_skipped = false;

    /// Set when the run stopped early (connection lost, folder cannot be opened...).
    std::optional<error_info> fatal;

    [[nodiscard]] bool ok() const noexcept
    {
        if (fatal.has_value() || !errors.empty())
            return false;
        for (const auto& folder : folders)
        {
            if (folder.state == run_state::failed)
                return false;
        }
        return true;
    }

    void record(item_error err)
    {
        ++failed;
        errors.push_back(std::move(err));
    }
};

/// Multi-line human readable summary.
[[nodiscard]] inline std::string format_summary(const run_outcome& outcome)
{
    std::string out;
    if (outcome.preview)
        out += "Preview, nothing was changed:\n";
    out += std::format("Listed:           {}\n", outcome.listed);
    out += std::format("Downloaded:       {} ({} attachments)\n", outcome.downloaded, outcome.attachments);
    out += std::format("Uploaded files:   {}\n", outcome.uploaded);
    out += std::format("Skipped existing: {}\n", outcome.skipped_existing);
    out += std::format("Deleted local:    {}\n", outcome.deleted_local);
    out += std::format("Deleted remote:   {}\n", outcome.deleted_remote);
    out += std::format("Failed:           {}\n", outcome.failed);
    if (outcome.deletion_skipped)
        out += "Deletion skipped: not confirmed\n";
    for (const auto& folder : outcome.folders)
    {
        out += std::format("Folder {}: {}", folder.name, to_string(folder.state));
        if (folder.failure)
            out += std::format(" ({})", *folder.failure);
        out += '\n';
    }
    for (const auto& err : outcome.errors)
        out += err.to_string() + '\n';
    if (outcome.fatal)
        out += std::format("Run aborted: {}\n", outcome.fatal->to_string());
    return out;
}

} // namespace mailvault::archive
