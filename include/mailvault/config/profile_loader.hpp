/*

profile_loader.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/program_options/errors.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>

#include <mailvault/archive/profile.hpp>
#include <mailvault/detail/ascii.hpp>
#include <mailvault/detail/log.hpp>
#include <mailvault/detail/result.hpp>
#include <mailvault/net/tls_mode.hpp>

namespace mailvault::config
{

namespace po = boost::program_options;

/// Flat `section.key -> value` view of one configuration layer.
using key_values = std::map<std::string, std::string, std::less<>>;

struct provider_preset
{
    std::string name;
    std::string display_name;
    std::string host;
    unsigned short port = 993;
    mailvault::net::tls_mode security = mailvault::net::tls_mode::implicit;
};

inline constexpr std::string_view DEFAULT_PROVIDER = "gmx";
inline constexpr std::string_view CONFIG_FILE_NAME = "mailvault.conf";

/// Providers known without a configuration file. `custom` has no host on purpose.
[[nodiscard]] inline const std::vector<provider_preset>& builtin_providers()
{
    using mailvault::net::tls_mode;
    static const std::vector<provider_preset> presets{
        {"gmx", "GMX Mail", "imap.gmx.net", 993, tls_mode::implicit},
        {"gmail", "Gmail", "imap.gmail.com", 993, tls_mode::implicit},
        {"outlook", "Outlook", "outlook.office365.com", 993, tls_mode::implicit},
        {"yahoo", "Yahoo Mail", "imap.mail.yahoo.com", 993, tls_mode::implicit},
        {"icloud", "iCloud Mail", "imap.mail.me.com", 993, tls_mode::implicit},
        {"custom", "Custom IMAP server", "", 993, tls_mode::implicit},
    };
    return presets;
}

/// Values given on the command line; they win over every other layer.
struct overrides
{
    std::optional<std::string> provider;
    std::optional<std::filesystem::path> config_file;
    std::optional<mailvault::log::level> log_level;
};

/// Everything the tool needs after resolution.
struct settings
{
    archive::connection_profile mail;
    archive::nas_profile nas;
    mailvault::log::level log_level = mailvault::log::level::info;
    std::filesystem::path config_file;    ///< empty when no file was read

    /// A share location of any kind was given.
    [[nodiscard]] bool nas_configured() const
    {
        return !nas.url.empty() || !nas.mount.empty() || !nas.host.empty() || !nas.share.empty();
    }
};

/// Environment variable to configuration key; empty for variables that are not ours.
[[nodiscard]] inline std::string environment_key(const std::string& variable)
{
    static const std::map<std::string, std::string, std::less<>> keys{
        {"MAIL_EMAIL", "mail.email"},
        {"MAIL_PASSWORD", "mail.password"},
        {"MAIL_PROVIDER", "mail.provider"},
        {"IMAP_HOST", "imap.host"},
        {"IMAP_PORT", "imap.port"},
        {"IMAP_TLS", "imap.tls"},
        {"NAS_URL", "nas.url"},
        {"NAS_HOST", "nas.host"},
        {"NAS_SHARE", "nas.share"},
        {"NAS_USERNAME", "nas.username"},
        {"NAS_PASSWORD", "nas.password"},
        {"NAS_PATH", "nas.path"},
        {"NAS_MOUNT", "nas.mount"},
    };
    const auto it = keys.find(variable);
    return it == keys.end() ? std::string{} : it->second;
}

/// Options description of the environment layer.
[[nodiscard]] inline po::options_description environment_options()
{
    po::options_description desc("Environment");
    desc.add_options()
        ("mail.email", po::value<std::string>())
        ("mail.password", po::value<std::string>())
        ("mail.provider", po::value<std::string>())
        ("imap.host", po::value<std::string>())
        ("imap.port", po::value<std::string>())
        ("imap.tls", po::value<std::string>())
        ("nas.url", po::value<std::string>())
        ("nas.host", po::value<std::string>())
        ("nas.share", po::value<std::string>())
        ("nas.username", po::value<std::string>())
        ("nas.password", po::value<std::string>())
        ("nas.path", po::value<std::string>())
        ("nas.mount", po::value<std::string>());
    return desc;
}

namespace detail
{

inline key_values collect(const po::parsed_options& parsed)
{
    key_values out;
    for (const auto& option : parsed.options)
    {
        if (option.value.empty())
            continue;
        out.insert_or_assign(option.string_key, option.value.back());
    }
    return out;
}

inline std::optional<std::string> pick(std::string_view key, const key_values& first, const key_values& second)
{
    if (auto it = first.find(key); it != first.end() && !it->second.empty())
        return it->second;
    if (auto it = second.find(key); it != second.end() && !it->second.empty())
        return it->second;
    return std::nullopt;
}

inline result<unsigned short> parse_port(std::string_view key, std::string_view text)
{
    unsigned int value = 0;
    const std::string_view trimmed = mailvault::detail::trim(text);
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (ec != std::errc{} || ptr != trimmed.data() + trimmed.size() || value == 0 || value > 65535)
        return fail<unsigned short>(errc::config_invalid, std::format("Invalid port '{}' for {}.", text, key),
            std::format("key={}", key));
    return static_cast<unsigned short>(value);
}

inline result<bool> parse_flag(std::string_view key, std::string_view text)
{
    using mailvault::detail::iequals_ascii;
    const std::string_view trimmed = mailvault::detail::trim(text);
    if (iequals_ascii(trimmed, "true") || iequals_ascii(trimmed, "yes") || iequals_ascii(trimmed, "on") || trimmed == "1")
        return true;
    if (iequals_ascii(trimmed, "false") || iequals_ascii(trimmed, "no") || iequals_ascii(trimmed, "off") || trimmed == "0")
        return false;
    return fail<bool>(errc::config_invalid, std::format("Invalid boolean '{}' for {}.", text, key), std::format("key={}", key));
}

inline result<std::chrono::seconds> parse_seconds(std::string_view key, std::string_view text)
{
    unsigned int value = 0;
    const std::string_view trimmed = mailvault::detail::trim(text);
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (ec != std::errc{} || ptr != trimmed.data() + trimmed.size() || value == 0)
        return fail<std::chrono::seconds>(errc::config_invalid, std::format("Invalid timeout '{}' for {}.", text, key),
            std::format("key={}", key));
    return std::chrono::seconds{value};
}

} // namespace detail

/**
Resolves the mail and share profiles from four layers.

    command line > environment > configuration file > built-in presets

The configuration file is INI:

    default_provider = gmail
    log_level = info
    timeout = 30

    [mail]
    email = user@example.org

    [imap]
    verify = true

    [nas]
    url = sftp://nas.local/volume1

    [provider.work]
    name = Work
    host = imap.example.org
    port = 993
    tls = implicit
**/
class profile_loader
{
public:
    /// Read an INI file; unknown keys are kept so `[provider.<name>]` sections work.
    static result<key_values> read_config_file(const std::filesystem::path& path)
    {
        std::ifstream ifs(path);
        if (!ifs)
            return fail<key_values>(errc::config_invalid, "Cannot open configuration file.", std::format("path={}", path.string()));
        try
        {
            const po::options_description known("Configuration");
            const auto parsed = po::parse_config_file(ifs, known, true);
            return detail::collect(parsed);
        }
        catch (const po::error& exc)
        {
            return fail<key_values>(errc::config_invalid, std::format("Malformed configuration file: {}", exc.what()),
                std::format("path={}", path.string()));
        }
    }

    /// Our variables from the process environment.
    static result<key_values> read_environment()
    {
        try
        {
            const auto desc = environment_options();
            const auto parsed = po::parse_environment(desc, [](const std::string& variable) { return environment_key(variable); });
            return detail::collect(parsed);
        }
        catch (const po::error& exc)
        {
            return fail<key_values>(errc::config_invalid, std::format("Cannot read environment: {}", exc.what()));
        }
    }

    /**
    First existing file of the search path: the explicit path, then
    `$XDG_CONFIG_HOME/mailvault/`, `~/.config/mailvault/` and `/etc/mailvault/`.
    **/
    [[nodiscard]] static std::vector<std::filesystem::path> config_search_path()
    {
        std::vector<std::filesystem::path> out;
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0')
            out.push_back(std::filesystem::path(xdg) / "mailvault" / CONFIG_FILE_NAME);
        if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0')
            out.push_back(std::filesystem::path(home) / ".config" / "mailvault" / CONFIG_FILE_NAME);
        out.push_back(std::filesystem::path("/etc/mailvault") / CONFIG_FILE_NAME);
        return out;
    }

    /// Read the environment and the configuration file, then resolve.
    static result<settings> load(const overrides& cli)
    {
        key_values env;
        MAILVAULT_TRY_ASSIGN(env, read_environment());

        key_values file;
        std::filesystem::path used;
        if (cli.config_file)
        {
            // An explicit file must exist.
            MAILVAULT_TRY_ASSIGN(file, read_config_file(*cli.config_file));
            used = *cli.config_file;
        }
        else
        {
            for (const auto& candidate : config_search_path())
            {
                std::error_code ec;
                if (!std::filesystem::is_regular_file(candidate, ec))
                    continue;
                MAILVAULT_TRY_ASSIGN(file, read_config_file(candidate));
                used = candidate;
                break;
            }
        }
        if (!used.empty())
            MAILVAULT_DEBUG(std::format("config: using {}", used.string()));

        settings out;
        MAILVAULT_TRY_ASSIGN(out, resolve(cli, env, file));
        out.config_file = std::move(used);
        return out;
    }

    /// Combine already read layers.
    static result<settings> resolve(const overrides& cli, const key_values& env, const key_values& file)
    {
        settings out;

        std::string provider_name = cli.provider.value_or(
            detail::pick("mail.provider", env, file).value_or(
                detail::pick("default_provider", file, {}).value_or(std::string(DEFAULT_PROVIDER))));
        provider_name = mailvault::detail::to_lower_copy(mailvault::detail::trim(provider_name));

        provider_preset preset;
        MAILVAULT_TRY_ASSIGN(preset, find_provider(provider_name, file));

        auto& mail = out.mail;
        mail.provider = preset.name;
        mail.display_name = preset.display_name;
        mail.host = detail::pick("imap.host", env, file).value_or(preset.host);
        mail.port = preset.port;
        if (auto port = detail::pick("imap.port", env, file))
        {
            MAILVAULT_TRY_ASSIGN(mail.port, detail::parse_port("imap.port", *port));
        }
        mail.security = preset.security;
        if (auto tls = detail::pick("imap.tls", env, file))
        {
            const auto mode = mailvault::net::parse_tls_mode(*tls);
            if (!mode)
                return fail<settings>(errc::config_invalid,
                    std::format("Invalid TLS mode '{}'; use implicit, starttls or none.", *tls), "key=imap.tls");
            mail.security = *mode;
        }
        if (mail.host.empty())
            return fail<settings>(errc::config_missing,
                std::format("No IMAP host for provider '{}'; set IMAP_HOST or imap.host.", provider_name), "key=imap.host");

        mail.email = detail::pick("mail.email", env, file).value_or(std::string{});
        mail.password = detail::pick("mail.password", env, file).value_or(std::string{});
        if (auto verify = detail::pick("imap.verify", file, {}))
        {
            MAILVAULT_TRY_ASSIGN(mail.verify_peer, detail::parse_flag("imap.verify", *verify));
        }
        mail.ca_file = detail::pick("imap.ca_file", file, {}).value_or(std::string{});
        if (auto cleartext = detail::pick("imap.allow_cleartext", file, {}))
        {
            MAILVAULT_TRY_ASSIGN(mail.allow_cleartext_auth, detail::parse_flag("imap.allow_cleartext", *cleartext));
        }

        auto& nas = out.nas;
        nas.url = detail::pick("nas.url", env, file).value_or(std::string{});
        nas.mount = detail::pick("nas.mount", env, file).value_or(std::string{});
        nas.host = detail::pick("nas.host", env, file).value_or(std::string{});
        nas.share = detail::pick("nas.share", env, file).value_or(std::string{});
        nas.username = detail::pick("nas.username", env, file).value_or(std::string{});
        nas.password = detail::pick("nas.password", env, file).value_or(std::string{});
        if (auto path = detail::pick("nas.path", env, file))
            nas.base_path = *path;
        if (auto verify = detail::pick("nas.verify", file, {}))
        {
            MAILVAULT_TRY_ASSIGN(nas.verify_peer, detail::parse_flag("nas.verify", *verify));
        }

        if (auto timeout = detail::pick("timeout", file, {}))
        {
            std::chrono::seconds value{};
            MAILVAULT_TRY_ASSIGN(value, detail::parse_seconds("timeout", *timeout));
            mail.timeout = value;
            nas.timeout = value;
        }

        if (cli.log_level)
            out.log_level = *cli.log_level;
        else if (auto level = detail::pick("log_level", file, {}))
        {
            const auto parsed = mailvault::log::level_from_string(mailvault::detail::trim(*level));
            if (!parsed)
                return fail<settings>(errc::config_invalid, std::format("Invalid log level '{}'.", *level), "key=log_level");
            out.log_level = *parsed;
        }
        return out;
    }

    /// Built-in preset, overlaid by a `[provider.<name>]` section when the file has one.
    static result<provider_preset> find_provider(const std::string& name, const key_values& file)
    {
        provider_preset preset;
        bool known = false;
        for (const auto& builtin : builtin_providers())
        {
            if (builtin.name == name)
            {
                preset = builtin;
                known = true;
                break;
            }
        }

        const std::string section = "provider." + name + ".";
        for (auto it = file.lower_bound(section); it != file.end() && it->first.starts_with(section); ++it)
        {
            known = true;
            const std::string_view key = std::string_view(it->first).substr(section.size());
            if (key == "name")
                preset.display_name = it->second;
            else if (key == "host")
                preset.host = it->second;
            else if (key == "port")
            {
                MAILVAULT_TRY_ASSIGN(preset.port, detail::parse_port(it->first, it->second));
            }
            else if (key == "tls")
            {
                const auto mode = mailvault::net::parse_tls_mode(it->second);
                if (!mode)
                    return fail<provider_preset>(errc::config_invalid,
                        std::format("Invalid TLS mode '{}' in [provider.{}].", it->second, name), std::format("key={}", it->first));
                preset.security = *mode;
            }
            else
                MAILVAULT_WARN(std::format("config: ignoring unknown key {}", it->first));
        }

        if (!known)
            return fail<provider_preset>(errc::config_invalid,
                std::format("Unknown provider '{}'. Available: {}", name, provider_names(file)), std::format("provider={}", name));
        preset.name = name;
        if (preset.display_name.empty())
            preset.display_name = name;
        return preset;
    }

    /// Built-in names followed by those defined in the file.
    [[nodiscard]] static std::string provider_names(const key_values& file)
    {
        std::vector<std::string> names;
        for (const auto& builtin : builtin_providers())
            names.push_back(builtin.name);
        for (const auto& [key, value] : file)
        {
            if (!key.starts_with("provider."))
                continue;
            const auto dot = key.find('.', 9);
            std::string name = key.substr(9, dot == std::string::npos ? std::string::npos : dot - 9);
            if (std::find(names.begin(), names.end(), name) == names.end())
                names.push_back(std::move(name));
        }
        std::string out;
        for (const auto& name : names)
        {
            if (!out.empty())
                out += ", ";
            out += name;
        }
        return out;
    }
};

} // namespace mailvault::config
