/*

materializer.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include <unistd.h>

#include <mailvault/archive/types.hpp>
#include <mailvault/detail/ascii.hpp>
#include <mailvault/detail/log.hpp>
#include <mailvault/detail/result.hpp>
#include <mailvault/mime/entity.hpp>

namespace mailvault::archive
{

/// Name of the raw message file inside each message directory.
inline constexpr std::string_view RAW_FILE_NAME = "email.raw";

inline constexpr std::size_t SUBJECT_MAX_LENGTH = 50;
inline constexpr std::size_t FILE_NAME_MAX_LENGTH = 100;
inline constexpr std::string_view NO_SUBJECT = "no_subject";
inline constexpr std::string_view NO_FILE_NAME = "attachment";

/**
Keep ASCII letters, digits, `-`, `_` and `.`; every other run of bytes becomes
one `_`. Leading and trailing `_`/`.` are dropped and the result is cut to
`max_length`. An empty result yields `placeholder`.
**/
[[nodiscard]] inline std::string sanitize_component(std::string_view text, std::size_t max_length, std::string_view placeholder)
{
    std::string out;
    out.reserve(std::min(text.size(), max_length));
    bool pending_gap = false;
    for (char ch : text)
    {
        const bool keep = mailvault::detail::is_alnum_ascii(ch) || ch == '-' || ch == '_' || ch == '.';
        if (!keep)
        {
            pending_gap = true;
            continue;
        }
        if (pending_gap && !out.empty() && out.back() != '_')
            out.push_back('_');
        pending_gap = false;
        if (ch == '_' && !out.empty() && out.back() == '_')
            continue;
        out.push_back(ch);
    }

    auto strip = [](char ch) { return ch == '_' || ch == '.'; };
    std::size_t begin = 0;
    while (begin < out.size() && strip(out[begin]))
        ++begin;
    out.erase(0, begin);
    if (out.size() > max_length)
        out.resize(max_length);
    while (!out.empty() && strip(out.back()))
        out.pop_back();

    if (out.empty())
        return std::string(placeholder);
    return out;
}

/// Attachment file name: stem and extension sanitized separately so the extension survives truncation.
[[nodiscard]] inline std::string sanitize_file_name(std::string_view name)
{
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size())
        return sanitize_component(name, FILE_NAME_MAX_LENGTH, NO_FILE_NAME);

    const std::string ext = sanitize_component(name.substr(dot + 1), 16, "");
    if (ext.empty())
        return sanitize_component(name, FILE_NAME_MAX_LENGTH, NO_FILE_NAME);
    const std::string stem = sanitize_component(name.substr(0, dot), FILE_NAME_MAX_LENGTH - ext.size() - 1, NO_FILE_NAME);
    return stem + "." + ext;
}

/**
Relative directory for a folder, `/` separated.

The folder name is kept as the server reports it; only empty, `.` and `..`
segments are neutralized so the result stays below the output directory.
**/
[[nodiscard]] inline std::string folder_relative_path(std::string_view folder)
{
    std::string out;
    std::size_t start = 0;
    while (start <= folder.size())
    {
        auto end = folder.find('/', start);
        if (end == std::string_view::npos)
            end = folder.size();
        std::string segment(folder.substr(start, end - start));
        std::erase(segment, '\0');
        if (segment == "." || segment == "..")
            segment.replace(0, segment.size(), segment.size(), '_');
        if (!segment.empty())
        {
            if (!out.empty())
                out.push_back('/');
            out += segment;
        }
        start = end + 1;
    }
    return out.empty() ? std::string("_") : out;
}

struct attachment_plan
{
    std::string file_name;
    std::string bytes;
};

/// Everything needed to write one message, computed without touching the disk.
struct message_plan
{
    std::string folder;
    std::string message_id;           ///< handle id, `folder:uid`
    std::filesystem::path folder_dir;
    std::string stamp;                ///< YYYYMMDD_HHMMSS
    unsigned int index = 0;
    std::string subject;
    std::chrono::sys_seconds timestamp{};
    std::string raw;
    std::vector<attachment_plan> attachments;

    [[nodiscard]] std::string dir_name() const
    {
        return std::format("{}_{:03}_{}", stamp, index, subject);
    }
};

/**
Turns fetched messages into `<output>/<folder>/<stamp>_<NNN>_<subject>/`
directories holding `email.raw` and the decoded attachments.

Names are assigned by `plan()` in call order, so a preview that plans the same
messages in the same order gets the same names as the real run.
**/
class materializer
{
public:
    explicit materializer(std::filesystem::path output_dir)
        : output_dir_(std::move(output_dir))
    {
    }

    [[nodiscard]] const std::filesystem::path& output_dir() const noexcept { return output_dir_; }

    [[nodiscard]] std::filesystem::path folder_directory(std::string_view folder) const
    {
        return output_dir_ / std::filesystem::path(folder_relative_path(folder));
    }

    /**
    Parse `raw` and compute the directory name and attachment files.

    @return errc::mime_parse_error for a malformed message.
    **/
    result<message_plan> plan(std::string raw, const message_handle& handle)
    {
        auto parsed = mailvault::mime::entity::parse(raw);
        if (!parsed)
        {
            auto err = std::move(parsed).error();
            err.detail = std::format("message={} {}", handle.id(), err.detail);
            return fail<message_plan>(std::move(err));
        }

        message_plan out;
        out.folder = handle.folder;
        out.message_id = handle.id();
        out.folder_dir = folder_directory(handle.folder);
        out.timestamp = handle.internal_date;
        if (out.timestamp.time_since_epoch().count() == 0)
        {
            if (auto sent = parsed->date())
                out.timestamp = *sent;
        }
        out.stamp = std::format("{:%Y%m%d_%H%M%S}", out.timestamp);
        out.index = next_index(handle.folder, out.timestamp);
        out.subject = sanitize_component(parsed->subject(), SUBJECT_MAX_LENGTH, NO_SUBJECT);

        std::vector<const mailvault::mime::entity*> parts;
        parsed->collect_attachments(parts);
        std::set<std::string> used{std::string(RAW_FILE_NAME)};
        for (const auto* part : parts)
        {
            std::string body;
            MAILVAULT_TRY_ASSIGN(body, part->decoded_body());
            std::string name = unique_name(sanitize_file_name(part->filename().value_or(std::string(NO_FILE_NAME))), used);
            out.attachments.push_back(attachment_plan{std::move(name), std::move(body)});
        }
        out.raw = std::move(raw);
        return out;
    }

    /**
    Write a planned message.

    Files are written into a hidden staging directory renamed into place at the
    end, so the final directory holds either everything or does not exist. A
    directory from an earlier run holding the same raw bytes and attachments is
    reused; any other directory already using the name, or one handed out
    earlier in this run, moves this message to the next free index.
    **/
    result<materialized_message> commit(message_plan plan)
    {
        std::error_code ec;
        std::filesystem::create_directories(plan.folder_dir, ec);
        if (ec)
            return fail_sys<materialized_message>(errc::fs_io_failed, "Cannot create folder directory.", ec,
                std::format("path={}", plan.folder_dir.string()));

        bool reused = false;
        std::filesystem::path target;
        MAILVAULT_TRY_ASSIGN(target, locate(plan, reused));
        if (reused)
        {
            MAILVAULT_DEBUG(std::format("materializer: reusing {}", target.string()));
            return describe(target, plan, true);
        }

        const std::filesystem::path staging = plan.folder_dir /
            std::format(".{}.partial-{}", plan.dir_name(), ::getpid());
        std::filesystem::remove_all(staging, ec);
        std::filesystem::create_directory(staging, ec);
        if (ec)
            return fail_sys<materialized_message>(errc::fs_io_failed, "Cannot create staging directory.", ec,
                std::format("path={}", staging.string()));

        auto written = write_all(staging, plan);
        if (written)
        {
            std::filesystem::rename(staging, target, ec);
            if (ec)
                written = fail_sys<void>(errc::fs_io_failed, "Cannot move message directory into place.", ec,
                    std::format("path={}", target.string()));
        }
        if (!written)
        {
            std::error_code cleanup_ec;
            std::filesystem::remove_all(staging, cleanup_ec);
            return fail<materialized_message>(std::move(written).error());
        }
        return describe(target, plan, false);
    }

    /// The message commit() would produce, computed without writing anything.
    result<materialized_message> preview(message_plan plan)
    {
        bool reused = false;
        std::filesystem::path target;
        MAILVAULT_TRY_ASSIGN(target, locate(plan, reused));
        return describe(target, plan, reused);
    }

    /// Remove a message directory after it was mirrored.
    static result_void remove(const materialized_message& message)
    {
        std::error_code ec;
        std::filesystem::remove_all(message.directory, ec);
        if (ec)
            return fail_sys<void>(errc::fs_io_failed, "Cannot delete local message directory.", ec,
                std::format("path={}", message.directory.string()));
        return ok();
    }

    /// Forget the per-timestamp counters and the directories handed out so far.
    void reset()
    {
        counters_.clear();
        claimed_.clear();
    }

private:
    unsigned int next_index(const std::string& folder, std::chrono::sys_seconds stamp)
    {
        auto& counter = counters_[std::make_pair(folder, stamp.time_since_epoch().count())];
        return counter++;
    }

    /**
    First free name from `plan.index` on, or a complete copy left by an earlier
    run. A name is handed out once per run; later messages never land in it.
    **/
    result<std::filesystem::path> locate(message_plan& plan, bool& reused)
    {
        for (;; ++plan.index)
        {
            std::filesystem::path target = plan.folder_dir / plan.dir_name();
            if (!claimed_.contains(target))
            {
                std::error_code ec;
                if (!std::filesystem::exists(target, ec))
                {
                    claimed_.insert(target);
                    return target;
                }
                if (is_complete_copy(target, plan))
                {
                    claimed_.insert(target);
                    reused = true;
                    return target;
                }
            }
            if (plan.index >= 9999)
                return fail<std::filesystem::path>(errc::fs_io_failed, "No free directory name for message.",
                    std::format("message={}", plan.message_id));
        }
    }

    static std::string unique_name(std::string name, std::set<std::string>& used)
    {
        if (used.insert(name).second)
            return name;
        const auto dot = name.rfind('.');
        const std::string stem = dot == std::string::npos || dot == 0 ? name : name.substr(0, dot);
        const std::string ext = dot == std::string::npos || dot == 0 ? std::string{} : name.substr(dot);
        for (unsigned int counter = 1;; ++counter)
        {
            std::string candidate = std::format("{}_{}{}", stem, counter, ext);
            if (used.insert(candidate).second)
                return candidate;
        }
    }

    /// True when `path` holds exactly `bytes`.
    static bool same_content(const std::filesystem::path& path, std::string_view bytes)
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec || size != bytes.size())
            return false;
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs)
            return false;
        std::string content(bytes.size(), '\0');
        ifs.read(content.data(), static_cast<std::streamsize>(content.size()));
        return ifs.gcount() == static_cast<std::streamsize>(content.size()) && content == bytes;
    }

    static bool is_complete_copy(const std::filesystem::path& dir, const message_plan& plan)
    {
        if (!same_content(dir / RAW_FILE_NAME, plan.raw))
            return false;
        for (const auto& attachment : plan.attachments)
        {
            if (!same_content(dir / attachment.file_name, attachment.bytes))
                return false;
        }
        return true;
    }

    static result_void write_file(const std::filesystem::path& path, std::string_view bytes)
    {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        if (!ofs)
            return fail<void>(errc::fs_io_failed, "Cannot create file.", std::format("path={}", path.string()));
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        ofs.close();
        if (!ofs)
            return fail<void>(errc::fs_io_failed, "Cannot write file.", std::format("path={} bytes={}", path.string(), bytes.size()));
        return ok();
    }

    static result_void write_all(const std::filesystem::path& dir, const message_plan& plan)
    {
        MAILVAULT_TRY_VOID(write_file(dir / RAW_FILE_NAME, plan.raw));
        for (const auto& attachment : plan.attachments)
            MAILVAULT_TRY_VOID(write_file(dir / attachment.file_name, attachment.bytes));
        return ok();
    }

    static materialized_message describe(const std::filesystem::path& dir, const message_plan& plan, bool reused)
    {
        materialized_message out;
        out.directory = dir;
        out.raw_file = dir / RAW_FILE_NAME;
        for (const auto& attachment : plan.attachments)
            out.attachments.push_back(dir / attachment.file_name);
        out.subject = plan.subject;
        out.timestamp = plan.timestamp;
        out.reused = reused;
        return out;
    }

    std::filesystem::path output_dir_;
    std::map<std::pair<std::string, std::int64_t>, unsigned int> counters_;
    std::set<std::filesystem::path> claimed_;
};

} // namespace mailvault::archive
