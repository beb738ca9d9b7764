/*

curl_share.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cstddef>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <curl/curl.h>

#include <mailvault/archive/remote_storage.hpp>
#include <mailvault/detail/ascii.hpp>
#include <mailvault/detail/log.hpp>
#include <mailvault/detail/redact.hpp>
#include <mailvault/detail/result.hpp>
#include <mailvault/detail/sanitize.hpp>

namespace mailvault::archive
{

namespace curl_detail
{

struct curl_easy_deleter
{
    void operator()(CURL* handle) const noexcept
    {
        if (handle)
            curl_easy_cleanup(handle);
    }
};

using unique_curl_easy = std::unique_ptr<CURL, curl_easy_deleter>;

struct curl_slist_deleter
{
    void operator()(curl_slist* list) const noexcept
    {
        if (list)
            curl_slist_free_all(list);
    }
};

using unique_curl_slist = std::unique_ptr<curl_slist, curl_slist_deleter>;

struct curl_string_deleter
{
    void operator()(char* text) const noexcept
    {
        if (text)
            curl_free(text);
    }
};

using unique_curl_string = std::unique_ptr<char, curl_string_deleter>;

[[nodiscard]] inline result_void ensure_global_init()
{
    static std::once_flag once;
    static CURLcode init_code = CURLE_OK;
    std::call_once(once, []()
    {
        init_code = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    if (init_code != CURLE_OK)
        return fail<void>(errc::internal_error, "libcurl initialization failed.", curl_easy_strerror(init_code));
    return ok();
}

[[nodiscard]] constexpr errc map_curl_error(CURLcode code) noexcept
{
    switch (code)
    {
        case CURLE_OK: return errc::ok;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY: return errc::net_resolve_failed;
        case CURLE_COULDNT_CONNECT: return errc::storage_connect_failed;
        case CURLE_LOGIN_DENIED: return errc::storage_auth_failed;
        case CURLE_OPERATION_TIMEDOUT: return errc::net_timeout;
        case CURLE_SSL_CONNECT_ERROR: return errc::tls_handshake_failed;
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ISSUER_ERROR: return errc::tls_verify_failed;
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_UPLOAD_FAILED:
        case CURLE_ABORTED_BY_CALLBACK: return errc::storage_partial_write;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT: return errc::config_invalid;
        default: return errc::storage_io_failed;
    }
}

struct upload_source
{
    std::string_view data;
    std::size_t offset = 0;
};

inline std::size_t read_from_buffer(char* buffer, std::size_t size, std::size_t nitems, void* instream) noexcept
{
    auto* source = static_cast<upload_source*>(instream);
    const std::size_t room = size * nitems;
    const std::size_t count = std::min(room, source->data.size() - source->offset);
    std::copy_n(source->data.data() + source->offset, count, buffer);
    source->offset += count;
    return count;
}

inline std::size_t discard_body(char*, std::size_t size, std::size_t nmemb, void*) noexcept
{
    return size * nmemb;
}

/// `"..."` with backslash escapes, as the SFTP quote parser expects.
[[nodiscard]] inline std::string sftp_quote(std::string_view path)
{
    std::string out = "\"";
    for (char ch : path)
    {
        if (ch == '"' || ch == '\\')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

} // namespace curl_detail

/**
Share reached through libcurl: ftp://, ftps:// or sftp://.

One easy handle per session keeps the control connection open between
requests. Uploads go to `<name>.part`, renamed by a post-transfer command;
on any failure the partial file is removed.
**/
class curl_share_session final : public storage_session
{
public:
    enum class protocol
    {
        ftp,
        sftp
    };

    curl_share_session(nas_profile profile, protocol proto, std::string origin, std::string root_path,
        curl_detail::unique_curl_easy curl)
        : profile_(std::move(profile)), proto_(proto), origin_(std::move(origin)),
          root_path_(std::move(root_path)), curl_(std::move(curl))
    {
    }

    result<bool> exists(std::string_view path) override
    {
        MAILVAULT_TRY_VOID(ensure_open());
        MAILVAULT_TRY_VOID(validate_remote_path(path));
        char error_buffer[CURL_ERROR_SIZE]{};
        const std::string url = url_for(path, false);
        prepare(url, error_buffer);
        curl_easy_setopt(curl_.get(), CURLOPT_NOBODY, 1L);

        const CURLcode code = curl_easy_perform(curl_.get());
        if (code == CURLE_OK)
            return true;
        if (code == CURLE_REMOTE_FILE_NOT_FOUND || code == CURLE_FTP_COULDNT_RETR_FILE)
            return false;
        return curl_fail<bool>(code, error_buffer, "exists", path);
    }

    result_void ensure_dir(std::string_view path) override
    {
        MAILVAULT_TRY_VOID(ensure_open());
        MAILVAULT_TRY_VOID(validate_remote_path(path));
        std::vector<std::string> pre;
        if (proto_ == protocol::sftp)
        {
            // "*" lets a mkdir of an existing directory fail silently.
            std::string current = root_path_;
            for (const auto& segment : split_path(join_remote_path({profile_base(), path})))
            {
                current += "/" + segment;
                pre.push_back("*mkdir " + curl_detail::sftp_quote(current));
            }
        }
        return perform_in_dir(path, pre, {}, "ensure_dir");
    }

    result<write_result> write_file(std::string_view path, std::string_view bytes, bool overwrite) override
    {
        MAILVAULT_TRY_VOID(ensure_open());
        MAILVAULT_TRY_VOID(validate_remote_path(path));
        if (!overwrite)
        {
            bool present = false;
            MAILVAULT_TRY_ASSIGN(present, exists(path));
            if (present)
                return write_result::skipped;
        }

        const std::string_view parent = remote_parent(path);
        const std::string_view name = parent.empty() ? path : path.substr(parent.size() + 1);
        const std::string part_name = std::string(name) + ".part";
        const std::string part_path = join_remote_path({parent, part_name});

        std::vector<std::string> post;
        if (proto_ == protocol::ftp)
        {
            if (overwrite)
                post.push_back("*DELE " + std::string(name));
            post.push_back("RNFR " + part_name);
            post.push_back("RNTO " + std::string(name));
        }
        else
        {
            if (overwrite)
                post.push_back("*rm " + curl_detail::sftp_quote(fs_path(path)));
            post.push_back("rename " + curl_detail::sftp_quote(fs_path(part_path)) + " " + curl_detail::sftp_quote(fs_path(path)));
        }
        curl_detail::unique_curl_slist post_list;
        MAILVAULT_TRY_VOID(build_list(post, post_list));

        char error_buffer[CURL_ERROR_SIZE]{};
        curl_detail::upload_source source{bytes, 0};
        prepare(url_for(part_path, false), error_buffer);
        curl_easy_setopt(curl_.get(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl_.get(), CURLOPT_READFUNCTION, curl_detail::read_from_buffer);
        curl_easy_setopt(curl_.get(), CURLOPT_READDATA, &source);
        curl_easy_setopt(curl_.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(bytes.size()));
        curl_easy_setopt(curl_.get(), CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_RETRY));
        curl_easy_setopt(curl_.get(), CURLOPT_POSTQUOTE, post_list.get());

        const CURLcode code = curl_easy_perform(curl_.get());
        curl_off_t uploaded = 0;
        curl_easy_getinfo(curl_.get(), CURLINFO_SIZE_UPLOAD_T, &uploaded);
        curl_easy_setopt(curl_.get(), CURLOPT_POSTQUOTE, nullptr);

        if (code != CURLE_OK)
        {
            auto failure = curl_fail<write_result>(code, error_buffer, "upload", path);
            remove_partial(parent, part_name, part_path);
            return failure;
        }
        if (static_cast<std::size_t>(uploaded) != bytes.size())
        {
            remove_partial(parent, name, path);
            return fail<write_result>(errc::storage_partial_write, "Short upload to share.",
                std::format("path={} expected={} uploaded={}", path, bytes.size(), uploaded));
        }
        return write_result::written;
    }

    result_void close() override
    {
        curl_.reset();
        return ok();
    }

    /// List the server root once, so an unreachable host or a rejected login fails at connect time.
    result_void check_login()
    {
        MAILVAULT_TRY_VOID(ensure_open());
        char error_buffer[CURL_ERROR_SIZE]{};
        prepare(origin_ + "/", error_buffer);
        curl_easy_setopt(curl_.get(), CURLOPT_DIRLISTONLY, 1L);
        const CURLcode code = curl_easy_perform(curl_.get());
        if (code != CURLE_OK)
            return curl_fail<void>(code, error_buffer, "connect", "/");
        return ok();
    }

private:
    result_void ensure_open() const
    {
        if (!curl_)
            return fail<void>(errc::imap_invalid_state, "NAS session is closed.");
        return ok();
    }

    void prepare(const std::string& url, char* error_buffer)
    {
        CURL* curl = curl_.get();
        curl_easy_reset(curl);
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(profile_.timeout.count() * 1000));
        // Abort stalled transfers instead of hanging forever.
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(profile_.timeout.count()));
        if (!profile_.verify_peer)
        {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }
        if (!profile_.username.empty())
            curl_easy_setopt(curl, CURLOPT_USERNAME, profile_.username.c_str());
        if (!profile_.password.empty())
            curl_easy_setopt(curl, CURLOPT_PASSWORD, profile_.password.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_detail::discard_body);
        MAILVAULT_DEBUG(std::format("nas: {}", mailvault::detail::redact_url(url)));
    }

    /// Directory listing of `dir` with optional commands before and after it.
    result_void perform_in_dir(std::string_view dir, const std::vector<std::string>& pre,
        const std::vector<std::string>& post, std::string_view operation)
    {
        curl_detail::unique_curl_slist pre_list;
        MAILVAULT_TRY_VOID(build_list(pre, pre_list));
        curl_detail::unique_curl_slist post_list;
        MAILVAULT_TRY_VOID(build_list(post, post_list));

        char error_buffer[CURL_ERROR_SIZE]{};
        prepare(url_for(dir, true), error_buffer);
        curl_easy_setopt(curl_.get(), CURLOPT_DIRLISTONLY, 1L);
        curl_easy_setopt(curl_.get(), CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_RETRY));
        curl_easy_setopt(curl_.get(), CURLOPT_QUOTE, pre_list.get());
        curl_easy_setopt(curl_.get(), CURLOPT_POSTQUOTE, post_list.get());

        const CURLcode code = curl_easy_perform(curl_.get());
        curl_easy_setopt(curl_.get(), CURLOPT_QUOTE, nullptr);
        curl_easy_setopt(curl_.get(), CURLOPT_POSTQUOTE, nullptr);
        if (code != CURLE_OK)
            return curl_fail<void>(code, error_buffer, operation, dir);
        return ok();
    }

    void remove_partial(std::string_view parent, std::string_view name, std::string_view path)
    {
        std::vector<std::string> post;
        if (proto_ == protocol::ftp)
            post.push_back(std::string("*DELE ").append(name));
        else
            post.push_back("*rm " + curl_detail::sftp_quote(fs_path(path)));
        auto res = perform_in_dir(parent, {}, post, "cleanup");
        if (!res)
            MAILVAULT_WARN(std::format("nas: cannot remove partial upload {}: {}", path, res.error().to_string()));
    }

    static result_void build_list(const std::vector<std::string>& commands, curl_detail::unique_curl_slist& list)
    {
        for (const auto& cmd : commands)
        {
            curl_slist* appended = curl_slist_append(list.get(), cmd.c_str());
            if (appended == nullptr)
                return fail<void>(errc::internal_error, "Out of memory building command list.");
            list.release();
            list.reset(appended);
        }
        return ok();
    }

    template<typename T>
    result<T> curl_fail(CURLcode code, const char* error_buffer, std::string_view operation, std::string_view path) const
    {
        long response_code = 0;
        if (curl_)
            curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &response_code);
        mailvault::detail::error_detail detail;
        detail.add("op", operation);
        detail.add("path", path);
        detail.add("curl_code", static_cast<unsigned int>(code));
        detail.add("response_code", static_cast<unsigned long>(response_code));
        if (error_buffer != nullptr && error_buffer[0] != '\0')
            detail.add("error", std::string_view(error_buffer));
        errc mapped = curl_detail::map_curl_error(code);
        if (proto_ == protocol::ftp && response_code == 530)
            mapped = errc::storage_auth_failed;
        MAILVAULT_DEBUG(std::format("nas: {} failed: {}", operation, detail.str()));
        return fail<T>(mapped, std::format("NAS {} failed: {}", operation, curl_easy_strerror(code)), detail);
    }

    [[nodiscard]] std::string profile_base() const
    {
        return join_remote_path({profile_.base_path});
    }

    static std::vector<std::string> split_path(std::string_view path)
    {
        std::vector<std::string> out;
        std::size_t start = 0;
        while (start < path.size())
        {
            auto end = path.find('/', start);
            if (end == std::string_view::npos)
                end = path.size();
            if (end > start)
                out.emplace_back(path.substr(start, end - start));
            start = end + 1;
        }
        return out;
    }

    std::string url_for(std::string_view path, bool directory) const
    {
        std::string url = origin_ + root_url_path();
        for (const auto& segment : split_path(join_remote_path({profile_base(), path})))
        {
            curl_detail::unique_curl_string escaped{curl_easy_escape(curl_.get(), segment.c_str(), static_cast<int>(segment.size()))};
            url.push_back('/');
            url.append(escaped ? escaped.get() : segment.c_str());
        }
        if (directory)
            url.push_back('/');
        return url;
    }

    /// Server side path used in SFTP commands.
    std::string fs_path(std::string_view path) const
    {
        std::string out = root_path_;
        for (const auto& segment : split_path(join_remote_path({profile_base(), path})))
            out += "/" + segment;
        return out;
    }

    std::string root_url_path() const
    {
        std::string out;
        for (const auto& segment : split_path(root_path_))
        {
            curl_detail::unique_curl_string escaped{curl_easy_escape(curl_.get(), segment.c_str(), static_cast<int>(segment.size()))};
            out.push_back('/');
            out.append(escaped ? escaped.get() : segment.c_str());
        }
        return out;
    }

    nas_profile profile_;
    protocol proto_;
    std::string origin_;
    std::string root_path_;
    curl_detail::unique_curl_easy curl_;
};

class curl_share final : public remote_storage
{
public:
    result<std::unique_ptr<storage_session>> connect(const nas_profile& profile) override
    {
        using session_ptr = std::unique_ptr<storage_session>;
        if (profile.url.empty())
            return fail<session_ptr>(errc::config_missing, "NAS URL is not configured.");
        MAILVAULT_TRY_VOID(curl_detail::ensure_global_init());

        const auto scheme_end = profile.url.find("://");
        if (scheme_end == std::string::npos)
            return fail<session_ptr>(errc::config_invalid, "NAS URL has no scheme.", mailvault::detail::redact_url(profile.url));
        const std::string scheme = mailvault::detail::to_lower_copy(std::string_view(profile.url).substr(0, scheme_end));
        curl_share_session::protocol proto = curl_share_session::protocol::ftp;
        if (scheme == "sftp")
            proto = curl_share_session::protocol::sftp;
        else if (scheme != "ftp" && scheme != "ftps")
            return fail<session_ptr>(errc::config_invalid, "Unsupported NAS URL scheme (use ftp, ftps or sftp).",
                std::format("scheme={}", scheme));

        const auto path_begin = profile.url.find('/', scheme_end + 3);
        std::string origin = path_begin == std::string::npos ? profile.url : profile.url.substr(0, path_begin);
        std::string url_path = path_begin == std::string::npos ? std::string{} : profile.url.substr(path_begin);
        while (!url_path.empty() && url_path.back() == '/')
            url_path.pop_back();

        curl_detail::unique_curl_easy curl{curl_easy_init()};
        if (!curl)
            return fail<session_ptr>(errc::internal_error, "curl_easy_init failed.");

        int decoded_len = 0;
        curl_detail::unique_curl_string decoded{curl_easy_unescape(curl.get(), url_path.c_str(),
            static_cast<int>(url_path.size()), &decoded_len)};
        std::string root_path = decoded ? std::string(decoded.get(), static_cast<std::size_t>(decoded_len)) : url_path;
        MAILVAULT_TRY_VOID(mailvault::detail::ensure_single_line(root_path, "NAS URL path"));

        MAILVAULT_DEBUG(std::format("nas: using {} share {}", scheme, mailvault::detail::redact_url(profile.url)));
        auto session = std::make_unique<curl_share_session>(profile, proto, std::move(origin),
            std::move(root_path), std::move(curl));
        MAILVAULT_TRY_VOID(session->check_login());
        return session_ptr(std::move(session));
    }
};

} // namespace mailvault::archive
