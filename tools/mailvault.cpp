/*

mailvault.cpp
-------------

Command line front end: archive IMAP folders to disk and a network share,
optionally deleting archived mail from the server.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdint>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

#include <boost/program_options.hpp>

#include <mailvault/mailvault.hpp>
#include <mailvault/detail/ascii.hpp>
#include <mailvault/throwing.hpp>


namespace po = boost::program_options;

using mailvault::archive::folder_summary;
using mailvault::archive::orchestrator;
using mailvault::archive::run_options;
using std::cerr;
using std::cout;

namespace
{

constexpr int EXIT_USAGE = mailvault::EXIT_BAD_INPUT;

struct cli_args
{
    bool list = false;
    std::vector<std::string> folders;
    std::string output = "./downloads";
    bool nas = false;
    bool overwrite = false;
    bool dry_run = false;
    bool clean = false;
    std::string since;
    bool all = false;
    bool yes = false;
    bool delete_local = false;
    bool interactive = false;
    std::string provider;
    std::string config;
    bool test_mail = false;
    bool test_nas = false;
    bool verbose = false;
    bool trace = false;
};

/// Parse argv; returns an exit status when the program should stop right away.
std::optional<int> parse_command_line(int argc, char* argv[], cli_args& args)
{
    po::options_description options("Options");
    options.add_options()
        ("help,h", "Show this help")
        ("list,l", po::bool_switch(&args.list), "List folders with message counts")
        ("folder,f", po::value<std::vector<std::string>>(&args.folders), "Folder to archive (repeatable)")
        ("output,o", po::value<std::string>(&args.output)->default_value("./downloads"), "Local output directory")
        ("nas", po::bool_switch(&args.nas), "Mirror the archive to the NAS")
        ("overwrite", po::bool_switch(&args.overwrite), "Replace files already on the NAS")
        ("dry-run,n", po::bool_switch(&args.dry_run), "Show what would be done without changing anything")
        ("clean,c", po::bool_switch(&args.clean), "Delete archived mail from the server; with --since and without --nas: clean only")
        ("since", po::value<std::string>(&args.since), "With --clean: only mail older than this (30D, 2W, 6M, 1Y)")
        ("all", po::bool_switch(&args.all), "With --clean and no --since: delete every message of the folder")
        ("yes", po::bool_switch(&args.yes), "Confirm deletion without asking")
        ("delete-local", po::bool_switch(&args.delete_local), "Remove local copies once mirrored to the NAS")
        ("interactive,i", po::bool_switch(&args.interactive), "Pick the folder from a menu")
        ("provider,p", po::value<std::string>(&args.provider), "Mail provider (gmx, gmail, outlook, yahoo, icloud, custom)")
        ("config", po::value<std::string>(&args.config), "Configuration file")
        ("test-mail", po::bool_switch(&args.test_mail), "Test the mail connection")
        ("test-nas", po::bool_switch(&args.test_nas), "Test the NAS connection")
        ("verbose,v", po::bool_switch(&args.verbose), "Debug output")
        ("trace", po::bool_switch(&args.trace), "Protocol trace (credentials redacted)");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, options), vm);
        po::notify(vm);
    }
    catch (const po::error& exc)
    {
        cerr << "mailvault: " << exc.what() << "\n\n" << options << "\n";
        return EXIT_USAGE;
    }

    if (vm.count("help"))
    {
        cout << "Usage: mailvault [options]\n\n" << options << "\n"
             << "Examples:\n"
             << "  mailvault --list\n"
             << "  mailvault --folder INBOX --dry-run\n"
             << "  mailvault --folder INBOX --nas --delete-local\n"
             << "  mailvault --folder INBOX --clean --since 1Y\n";
        return EXIT_SUCCESS;
    }
    return std::nullopt;
}

void print_folders(const std::vector<folder_summary>& folders)
{
    auto count = [](const std::optional<std::uint32_t>& value)
    {
        return value ? std::to_string(*value) : std::string("?");
    };
    cout << std::format("{:>4}  {:<40} {:>8} {:>8}\n", "#", "Folder", "Total", "Unseen");
    std::size_t index = 0;
    for (const auto& folder : folders)
        cout << std::format("{:>4}  {:<40} {:>8} {:>8}\n", ++index, folder.name, count(folder.total), count(folder.unseen));
    if (folders.empty())
        cout << "(no folders)\n";
}

/// Read one line from the terminal; empty on end of input.
std::string prompt(const std::string& question)
{
    cout << question << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer))
        return {};
    return std::string(mailvault::detail::trim(answer));
}

std::optional<std::string> choose_folder(const std::vector<folder_summary>& folders)
{
    print_folders(folders);
    const std::string answer = prompt("Folder number or name (empty to cancel): ");
    if (answer.empty())
        return std::nullopt;
    if (answer.size() <= 6 && answer.find_first_not_of("0123456789") == std::string::npos)
    {
        const auto number = std::stoul(answer);
        if (number >= 1 && number <= folders.size())
            return folders[number - 1].name;
        cerr << "No folder number " << answer << "\n";
        return std::nullopt;
    }
    for (const auto& folder : folders)
    {
        if (folder.name == answer)
            return folder.name;
    }
    cerr << "No folder named " << answer << "\n";
    return std::nullopt;
}

/// Deletion is irreversible, so the terminal user answers twice.
bool confirm_deletion(const run_options& options)
{
    std::string folders;
    for (const auto& folder : options.folders)
        folders += (folders.empty() ? "" : ", ") + folder;
    const std::string scope = options.since ? std::format("older than {}", options.since->to_string()) : std::string("ALL messages");

    const std::string first = prompt(std::format("Delete {} from {} on the server? [y/N] ", scope, folders));
    if (!mailvault::detail::iequals_ascii(first, "y") && !mailvault::detail::iequals_ascii(first, "yes"))
        return false;
    const std::string second = prompt("This cannot be undone. Type 'yes' to confirm: ");
    return mailvault::detail::iequals_ascii(second, "yes");
}

int run(const cli_args& args)
{
    mailvault::config::overrides overrides;
    if (!args.provider.empty())
        overrides.provider = args.provider;
    if (!args.config.empty())
        overrides.config_file = args.config;
    if (args.trace)
        overrides.log_level = mailvault::log::level::trace;
    else if (args.verbose)
        overrides.log_level = mailvault::log::level::debug;

    const auto settings = mailvault::unwrap(mailvault::config::profile_loader::load(overrides), "configuration");
    auto& logger = mailvault::log::logger::instance();
    logger.set_level(settings.log_level);
    logger.set_trace_enabled(args.trace);

    mailvault::archive::imap_transport mail;
    std::unique_ptr<mailvault::archive::remote_storage> storage;
    if (args.nas || args.test_nas)
        storage = mailvault::unwrap(mailvault::archive::make_remote_storage(settings.nas), "NAS");
    orchestrator engine(mail, storage.get());

    if (args.test_mail || args.test_nas)
    {
        bool passed = true;
        if (args.test_mail)
        {
            auto probe = engine.test_mail(settings.mail);
            if (probe)
            {
                cout << std::format("Mail OK: {} ({} capabilities, {} folders, INBOX {})\n", settings.mail.describe(),
                    probe->session.capabilities, probe->folders,
                    probe->inbox_messages ? std::to_string(*probe->inbox_messages) : std::string("?"));
            }
            else
            {
                passed = false;
                cout << std::format("Mail FAILED ({}): {}\n",
                    to_string(mailvault::archive::classify_connection_error(probe.error().code)), probe.error().to_string());
            }
        }
        if (args.test_nas)
        {
            auto probe = engine.test_storage(settings.nas);
            if (probe)
                cout << std::format("NAS OK: {}\n", settings.nas.describe());
            else
            {
                passed = false;
                cout << std::format("NAS FAILED ({}): {}\n",
                    to_string(mailvault::archive::classify_connection_error(probe.error().code)), probe.error().to_string());
            }
        }
        return passed ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (args.list)
    {
        print_folders(mailvault::unwrap(engine.list_folders(settings.mail), "folder list"));
        return EXIT_SUCCESS;
    }

    run_options options;
    options.output_dir = args.output;
    options.folders = args.folders;
    if (args.interactive && options.folders.empty())
    {
        auto chosen = choose_folder(mailvault::unwrap(engine.list_folders(settings.mail), "folder list"));
        if (!chosen)
            return EXIT_SUCCESS;
        options.folders.push_back(*chosen);
    }
    if (options.folders.empty())
    {
        cerr << "mailvault: give --folder, --list or --interactive (see --help)\n";
        return EXIT_USAGE;
    }

    if (!args.since.empty())
    {
        auto since = mailvault::archive::parse_retention(args.since);
        if (!since)
        {
            cerr << "mailvault: " << since.error().message << "\n";
            return EXIT_USAGE;
        }
        if (!args.clean)
        {
            cerr << "mailvault: --since only applies together with --clean\n";
            return EXIT_USAGE;
        }
        options.since = *since;
    }
    if (args.clean && !options.since && !args.all)
    {
        cerr << "mailvault: --clean without --since deletes every message; add --all to confirm that intent\n";
        return EXIT_USAGE;
    }
    if (args.delete_local && !args.nas)
    {
        cerr << "mailvault: --delete-local requires --nas\n";
        return EXIT_USAGE;
    }

    options.mirror = args.nas;
    options.overwrite = args.overwrite;
    options.delete_local = args.delete_local;
    options.preview = args.dry_run;
    options.clean = args.clean;
    options.clean_all = args.all;
    options.download = !(args.clean && options.since && !args.nas);
    options.account = settings.mail.account_identifier();

    if (options.clean && !options.preview)
    {
        if (args.yes)
            options.deletion_confirmed = true;
        else if (::isatty(STDIN_FILENO) != 0)
            options.deletion_confirmed = confirm_deletion(options);
    }

    const mailvault::archive::nas_profile* nas = args.nas ? &settings.nas : nullptr;
    const auto outcome = engine.run(settings.mail, nas, options);
    cout << mailvault::archive::format_summary(outcome);
    return outcome.ok() ? EXIT_SUCCESS : mailvault::EXIT_RUN_FAILED;
}

} // namespace


int main(int argc, char* argv[])
{
    cli_args args;
    if (auto status = parse_command_line(argc, argv, args))
        return *status;

    try
    {
        return run(args);
    }
    catch (const mailvault::exception& exc)
    {
        cerr << "mailvault: " << exc.what() << "\n";
        if (!exc.info().detail.empty())
            MAILVAULT_DEBUG(std::format("detail: {}", exc.info().detail));
        return exc.exit_status();
    }
}
