/*

check_mail.cpp
--------------

Signs in to a mailbox, lists its messages and optionally removes one.

Usage: check_mail <address> [--hosts <file>] [--delete <n>]

The secret is read from POPDESK_SECRET, or from standard input when unset.
POPDESK_LOG selects the log level (trace, debug, info, warn, error, off).


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <charconv>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "example_util.hpp"
#include <popdesk/popdesk.hpp>


namespace
{

constexpr int EXIT_STARTUP_FATAL = 2;

struct arguments
{
    std::string address;
    std::string hosts_file = popdesk::DEFAULT_HOSTS_FILE;
    std::optional<unsigned> delete_no;
};

std::optional<arguments> parse_arguments(int argc, char* argv[])
{
    arguments args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--hosts" && i + 1 < argc)
        {
            args.hosts_file = argv[++i];
        }
        else if (arg == "--delete" && i + 1 < argc)
        {
            const std::string_view value = argv[++i];
            unsigned number = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), number);
            if (ec != std::errc{} || ptr != value.data() + value.size())
                return std::nullopt;
            args.delete_no = number;
        }
        else if (args.address.empty() && !arg.starts_with("--"))
        {
            args.address = arg;
        }
        else
        {
            return std::nullopt;
        }
    }
    if (args.address.empty())
        return std::nullopt;
    return args;
}

void list_messages(const popdesk::session& conn)
{
    std::cout << conn.address() << ": " << conn.message_count() << " message(s)\n";
    for (const auto& msg : conn.messages())
        std::cout << "  " << msg.sequence_number() << "  " << msg.from() << "  " << msg.subject() << "\n";
}

} // namespace


int main(int argc, char* argv[])
{
    if (const char* lvl = std::getenv("POPDESK_LOG"))
    {
        if (auto parsed = popdesk::log::level_from_string(lvl))
        {
            popdesk::log::logger::instance().set_level(*parsed);
            popdesk::log::logger::instance().set_trace_enabled(*parsed == popdesk::log::level::trace);
        }
    }

    const auto args = parse_arguments(argc, argv);
    if (!args)
    {
        std::cerr << "Usage: check_mail <address> [--hosts <file>] [--delete <n>]\n";
        return EXIT_FAILURE;
    }

    auto hosts = popdesk::host_directory::load(args->hosts_file);
    if (!hosts)
    {
        print_error(hosts.error());
        return EXIT_STARTUP_FATAL;
    }

    std::string secret;
    if (const char* env = std::getenv("POPDESK_SECRET"))
        secret = env;
    else
    {
        std::cout << "Password: " << std::flush;
        std::getline(std::cin, secret);
    }

    popdesk::session conn(std::make_shared<const popdesk::host_directory>(std::move(*hosts)),
        std::make_unique<popdesk::pop3::transport>());

    if (auto res = conn.sign_in(args->address, secret); !res)
    {
        print_error(res.error());
        return EXIT_FAILURE;
    }
    list_messages(conn);

    int status = EXIT_SUCCESS;
    if (args->delete_no)
    {
        if (auto res = conn.delete_message(*args->delete_no); !res)
        {
            print_error(res.error());
            status = EXIT_FAILURE;
        }
        else if (auto refreshed = conn.refresh_mailbox(); !refreshed)
        {
            print_error(refreshed.error());
            status = EXIT_FAILURE;
        }
        else
        {
            list_messages(conn);
        }
    }

    conn.end_session();
    return status;
}
