/*

mounted_share.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>

#include <mailvault/archive/remote_storage.hpp>
#include <mailvault/detail/log.hpp>
#include <mailvault/detail/result.hpp>

namespace mailvault::archive
{

/**
Share mounted into the local filesystem (CIFS, NFS...).

A file is written to a hidden sibling and renamed over the target once every
byte reached the mount, so an interrupted copy never looks present.
**/
class mounted_share_session final : public storage_session
{
public:
    explicit mounted_share_session(std::filesystem::path root)
        : root_(std::move(root))
    {
    }

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    result<bool> exists(std::string_view path) override
    {
        std::filesystem::path target;
        MAILVAULT_TRY_ASSIGN(target, resolve(path));
        std::error_code ec;
        const bool present = std::filesystem::exists(target, ec);
        if (ec)
            return fail_sys<bool>(errc::storage_io_failed, "Cannot stat share path.", ec, std::format("path={}", path));
        return present;
    }

    result_void ensure_dir(std::string_view path) override
    {
        std::filesystem::path target;
        MAILVAULT_TRY_ASSIGN(target, resolve(path));
        std::error_code ec;
        std::filesystem::create_directories(target, ec);
        if (ec)
            return fail_sys<void>(errc::storage_io_failed, "Cannot create share directory.", ec, std::format("path={}", path));
        if (!std::filesystem::is_directory(target, ec))
            return fail<void>(errc::storage_io_failed, "Share path exists and is not a directory.", std::format("path={}", path));
        return ok();
    }

    result<write_result> write_file(std::string_view path, std::string_view bytes, bool overwrite) override
    {
        std::filesystem::path target;
        MAILVAULT_TRY_ASSIGN(target, resolve(path));
        std::error_code ec;
        if (!overwrite && std::filesystem::exists(target, ec))
            return write_result::skipped;
        if (ec)
            return fail_sys<write_result>(errc::storage_io_failed, "Cannot stat share path.", ec, std::format("path={}", path));

        const std::filesystem::path staging = target.parent_path() /
            std::format(".{}.part-{}-{}", target.filename().string(), ::getpid(), ++staging_counter_);
        {
            std::ofstream ofs(staging, std::ios::binary | std::ios::trunc);
            if (!ofs)
                return fail<write_result>(errc::storage_io_failed, "Cannot open staging file.", std::format("path={}", staging.string()));
            ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            ofs.flush();
            ofs.close();
            if (!ofs)
            {
                discard(staging);
                return fail<write_result>(errc::storage_partial_write, "Write to share failed.", std::format("path={} bytes={}", path, bytes.size()));
            }
        }

        const auto written = std::filesystem::file_size(staging, ec);
        if (ec || written != bytes.size())
        {
            discard(staging);
            return fail<write_result>(errc::storage_partial_write, "Short write on share.",
                std::format("path={} expected={} written={}", path, bytes.size(), ec ? 0 : written));
        }

        std::filesystem::rename(staging, target, ec);
        if (ec)
        {
            discard(staging);
            return fail_sys<write_result>(errc::storage_io_failed, "Cannot move staged file into place.", ec, std::format("path={}", path));
        }
        return write_result::written;
    }

    result_void close() override
    {
        return ok();
    }

private:
    result<std::filesystem::path> resolve(std::string_view path) const
    {
        MAILVAULT_TRY_VOID(validate_remote_path(path));
        std::filesystem::path out = root_;
        if (!path.empty())
            out /= std::filesystem::path(std::string(path)).relative_path();
        return out;
    }

    static void discard(const std::filesystem::path& staging)
    {
        std::error_code ec;
        std::filesystem::remove(staging, ec);
        if (ec)
            MAILVAULT_WARN(std::format("nas: cannot remove staging file {}: {}", staging.string(), ec.message()));
    }

    std::filesystem::path root_;
    std::atomic<unsigned long> staging_counter_{0};
};

class mounted_share final : public remote_storage
{
public:
    result<std::unique_ptr<storage_session>> connect(const nas_profile& profile) override
    {
        if (profile.mount.empty())
            return fail<std::unique_ptr<storage_session>>(errc::config_missing, "NAS mount point is not configured.");

        const std::filesystem::path mount(profile.mount);
        std::error_code ec;
        if (!std::filesystem::is_directory(mount, ec))
            return fail<std::unique_ptr<storage_session>>(errc::storage_connect_failed,
                "NAS mount point is not an accessible directory.", std::format("mount={}", profile.mount));

        std::filesystem::path root = mount;
        const std::string base = join_remote_path({profile.base_path});
        if (!base.empty())
        {
            MAILVAULT_TRY_VOID(validate_remote_path(base));
            root /= base;
        }
        MAILVAULT_DEBUG(std::format("nas: using mounted share {}", root.string()));
        return std::unique_ptr<storage_session>(std::make_unique<mounted_share_session>(std::move(root)));
    }
};

} // namespace mailvault::archive
