/*

remote_storage.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <mailvault/archive/profile.hpp>
#include <mailvault/archive/types.hpp>
#include <mailvault/detail/result.hpp>

namespace mailvault::archive
{

/**
Open session on the archive share.

Paths are `/` separated and relative to the profile's base path. A file that
`exists()` reports present was always written in full: backends stage the
bytes under a temporary name and rename them into place.
**/
class storage_session
{
public:
    virtual ~storage_session() = default;

    virtual result<bool> exists(std::string_view path) = 0;

    /// Create `path` and every missing parent; an existing directory is not an error.
    virtual result_void ensure_dir(std::string_view path) = 0;

    /**
    Store `bytes` at `path`.

    Without `overwrite` an existing file is left untouched and nothing is
    transferred.
    **/
    virtual result<write_result> write_file(std::string_view path, std::string_view bytes, bool overwrite) = 0;

    virtual result_void close() = 0;
};

class remote_storage
{
public:
    virtual ~remote_storage() = default;

    virtual result<std::unique_ptr<storage_session>> connect(const nas_profile& profile) = 0;
};

/// Join path segments with `/`, dropping empty ones and duplicate separators.
[[nodiscard]] inline std::string join_remote_path(const std::vector<std::string_view>& segments)
{
    std::string out;
    for (auto segment : segments)
    {
        while (!segment.empty() && segment.front() == '/')
            segment.remove_prefix(1);
        while (!segment.empty() && segment.back() == '/')
            segment.remove_suffix(1);
        if (segment.empty())
            continue;
        if (!out.empty())
            out.push_back('/');
        out.append(segment);
    }
    return out;
}

/// Parent of a `/` separated path, empty for a top level entry.
[[nodiscard]] inline std::string_view remote_parent(std::string_view path)
{
    const auto pos = path.rfind('/');
    return pos == std::string_view::npos ? std::string_view{} : path.substr(0, pos);
}

/**
Reject paths that could leave the base directory.

`.` and `..` segments and embedded NUL/CR/LF are refused; everything else is
passed through verbatim.
**/
[[nodiscard]] inline result_void validate_remote_path(std::string_view path)
{
    std::size_t start = 0;
    while (start <= path.size())
    {
        const auto end = path.find('/', start);
        const std::string_view segment = path.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (segment == "." || segment == "..")
            return fail<void>(errc::invalid_argument, "Path escapes the archive base.", std::format("path={}", path));
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    for (char ch : path)
    {
        if (ch == '\0' || ch == '\r' || ch == '\n')
            return fail<void>(errc::invalid_argument, "Path contains control characters.");
    }
    return ok();
}

} // namespace mailvault::archive
