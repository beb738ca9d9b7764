/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mailvault::archive
{

/// Snapshot of one folder taken by `mail_session::list_folders()`.
struct folder_summary
{
    std::string name;      ///< UTF-8, server hierarchy separator kept as is
    char delimiter = '/';
    std::optional<std::uint32_t> total;
    std::optional<std::uint32_t> unseen;
};

/**
Message reference valid for the session that listed it.

`session_id` ties the handle to its session; passing it to another session is
an error rather than a silent mis-targeting of UIDs.
**/
struct message_handle
{
    std::uint64_t session_id = 0;
    std::string folder;
    std::uint32_t uid = 0;
    std::uint32_t seq = 0;
    std::chrono::sys_seconds internal_date{};
    std::uint64_t size = 0;

    /// `folder:uid`, the identifier used in reports.
    [[nodiscard]] std::string id() const
    {
        return std::format("{}:{}", folder, uid);
    }
};

enum class write_result
{
    written,
    skipped
};

[[nodiscard]] constexpr std::string_view to_string(write_result res) noexcept
{
    return res == write_result::written ? "written" : "skipped";
}

/// Message stored on the local disk by the materializer.
struct materialized_message
{
    std::filesystem::path directory;
    std::filesystem::path raw_file;
    std::vector<std::filesystem::path> attachments;
    std::string subject;                 ///< sanitized fragment used in the name
    std::chrono::sys_seconds timestamp{};
    bool reused = false;                 ///< complete copy found from an earlier run

    /// Directory name relative to the folder directory.
    [[nodiscard]] std::string name() const
    {
        return directory.filename().string();
    }

    /// Raw file followed by the attachments.
    [[nodiscard]] std::vector<std::filesystem::path> files() const
    {
        std::vector<std::filesystem::path> out;
        out.reserve(attachments.size() + 1);
        out.push_back(raw_file);
        out.insert(out.end(), attachments.begin(), attachments.end());
        return out;
    }
};

} // namespace mailvault::archive
