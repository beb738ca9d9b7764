/*

test_imap_client.cpp
--------------------

Drives the IMAP client against a scripted loopback server.


Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#define BOOST_TEST_MODULE imap_client_test

#include <array>
#include <chrono>
#include <cstdint>
#include <istream>
#include <string>
#include <thread>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailvault/imap/client.hpp>

using mailvault::imap::client;
using mailvault::net::tls_mode;

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace
{

/// One client command and the lines the server answers with; `{tag}` is replaced by the command tag.
struct exchange
{
    std::string expected;
    std::string reply;
};

std::string read_line(tcp::socket& socket)
{
    asio::streambuf buf;
    asio::read_until(socket, buf, "\r\n");
    std::istream is(&buf);
    std::string line;
    std::getline(is, line);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

std::string with_tag(std::string text, const std::string& tag)
{
    const std::string marker = "{tag}";
    for (auto pos = text.find(marker); pos != std::string::npos; pos = text.find(marker, pos + tag.size()))
        text.replace(pos, marker.size(), tag);
    return text;
}

/// Serves `script` on a loopback port and records the commands it received.
class scripted_server
{
public:
    scripted_server(std::string greeting, std::vector<exchange> script)
        : acceptor_(context_, tcp::endpoint(asio::ip::address_v4::loopback(), 0)),
          greeting_(std::move(greeting)), script_(std::move(script))
    {
        thread_ = std::thread([this] { serve(); });
    }

    ~scripted_server()
    {
        if (thread_.joinable())
            thread_.join();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    const std::vector<std::string>& commands()
    {
        if (thread_.joinable())
            thread_.join();
        return commands_;
    }

private:
    void serve()
    {
        tcp::socket sock(context_);
        acceptor_.accept(sock);
        asio::write(sock, asio::buffer(greeting_));
        for (const auto& step : script_)
        {
            boost::system::error_code ec;
            std::string line;
            try
            {
                line = read_line(sock);
            }
            catch (const boost::system::system_error&)
            {
                return;
            }
            const auto space = line.find(' ');
            const std::string tag = line.substr(0, space);
            const std::string command = space == std::string::npos ? std::string() : line.substr(space + 1);
            commands_.push_back(command);
            if (command.rfind(step.expected, 0) != 0)
                return;
            asio::write(sock, asio::buffer(with_tag(step.reply, tag)), ec);
            if (ec)
                return;
        }
    }

    asio::io_context context_;
    tcp::acceptor acceptor_;
    std::string greeting_;
    std::vector<exchange> script_;
    std::vector<std::string> commands_;
    std::thread thread_;
};

mailvault::imap::options cleartext_options()
{
    mailvault::imap::options opts;
    opts.allow_cleartext_auth = true;
    opts.timeout = std::chrono::seconds(10);
    return opts;
}

} // namespace


BOOST_AUTO_TEST_CASE(imap_client_archive_session)
{
    const std::string body = "Subject: hi\r\n\r\nhello\r\n";
    scripted_server server("* OK [CAPABILITY IMAP4rev1 UIDPLUS] ready\r\n", {
        {"CAPABILITY", "* CAPABILITY IMAP4rev1 UIDPLUS\r\n{tag} OK done\r\n"},
        {"LOGIN \"user@example.com\" \"pa\\\"ss\"", "{tag} OK logged in\r\n"},
        {"LIST \"\" \"*\"", "* LIST (\\HasNoChildren) \"/\" \"INBOX\"\r\n"
                            "* LIST (\\HasNoChildren) \"/\" \"Entw&APw-rfe\"\r\n{tag} OK listed\r\n"},
        {"STATUS \"INBOX\" (MESSAGES UNSEEN)", "* STATUS \"INBOX\" (MESSAGES 3 UNSEEN 1)\r\n{tag} OK status\r\n"},
        {"EXAMINE \"Entw&APw-rfe\"", "* 3 EXISTS\r\n* OK [UIDVALIDITY 77] ok\r\n* OK [UIDNEXT 13] ok\r\n"
                                    "{tag} OK [READ-ONLY] examined\r\n"},
        {"UID SEARCH ALL", "* SEARCH 12 7 8\r\n{tag} OK searched\r\n"},
        {"UID FETCH 7:8,12 (UID INTERNALDATE RFC822.SIZE)",
            "* 2 FETCH (UID 8 INTERNALDATE \"02-Jan-2023 00:00:00 +0000\" RFC822.SIZE 20)\r\n"
            "* 1 FETCH (UID 7 INTERNALDATE \"01-Jan-2023 00:00:00 +0000\" RFC822.SIZE 10)\r\n"
            "* 3 FETCH (UID 12 INTERNALDATE \"03-Jan-2023 00:00:00 +0000\" RFC822.SIZE 30)\r\n{tag} OK fetched\r\n"},
        {"UID FETCH 7 (BODY.PEEK[])", "* 1 FETCH (UID 7 BODY[] {" + std::to_string(body.size()) + "}\r\n" + body +
            ")\r\n{tag} OK fetched\r\n"},
        {"UID STORE 7:8 +FLAGS.SILENT (\\Deleted)", "{tag} OK stored\r\n"},
        {"CAPABILITY", "* CAPABILITY IMAP4rev1 UIDPLUS\r\n{tag} OK done\r\n"},
        {"UID EXPUNGE 7:8", "* 1 EXPUNGE\r\n* 1 EXPUNGE\r\n{tag} OK expunged\r\n"},
        {"LOGOUT", "* BYE bye\r\n{tag} OK logout\r\n"}});

    asio::io_context client_ctx;
    auto fut = asio::co_spawn(client_ctx,
        [port = server.port(), body]() -> asio::awaitable<void>
        {
            client cli(co_await asio::this_coro::executor, cleartext_options());
            auto conn_res = co_await cli.connect("127.0.0.1", port, tls_mode::none, nullptr);
            BOOST_REQUIRE(conn_res);
            BOOST_CHECK(cli.has_capability("UIDPLUS"));

            BOOST_REQUIRE(co_await cli.capability());
            BOOST_REQUIRE(co_await cli.login("user@example.com", "pa\"ss"));

            auto folders = co_await cli.list("", "*");
            BOOST_REQUIRE(folders);
            BOOST_REQUIRE_EQUAL(folders->size(), 2u);
            BOOST_CHECK_EQUAL((*folders)[1].name, "Entw\xC3\xBCrfe");

            auto counts = co_await cli.status("INBOX");
            BOOST_REQUIRE(counts);
            BOOST_CHECK_EQUAL(counts->messages.value_or(0), 3u);
            BOOST_CHECK_EQUAL(counts->unseen.value_or(0), 1u);

            auto stat = co_await cli.select("Entw\xC3\xBCrfe", true);
            BOOST_REQUIRE(stat);
            BOOST_CHECK_EQUAL(stat->messages_no, 3u);
            BOOST_CHECK_EQUAL(stat->uid_validity, 77u);
            BOOST_CHECK(cli.selected_read_only());

            auto uids = co_await cli.uid_search("ALL");
            BOOST_REQUIRE(uids);
            BOOST_REQUIRE_EQUAL(uids->size(), 3u);
            BOOST_CHECK_EQUAL((*uids)[0], 7u);

            auto summaries = co_await cli.uid_fetch_summary(*uids);
            BOOST_REQUIRE(summaries);
            BOOST_REQUIRE_EQUAL(summaries->size(), 3u);
            BOOST_CHECK_EQUAL((*summaries)[0].uid, 7u);
            BOOST_CHECK_EQUAL((*summaries)[2].size, 30u);

            auto raw = co_await cli.uid_fetch_body(7);
            BOOST_REQUIRE(raw);
            BOOST_CHECK_EQUAL(*raw, body);

            const std::array<std::uint32_t, 2> doomed{7, 8};
            BOOST_REQUIRE(co_await cli.uid_store_deleted(doomed));
            BOOST_REQUIRE(co_await cli.expunge(doomed));
            BOOST_REQUIRE(co_await cli.logout());
            BOOST_CHECK(!cli.is_connected());
        }, asio::use_future);

    client_ctx.run();
    fut.get();

    BOOST_CHECK_EQUAL(server.commands().size(), 12u);
}

BOOST_AUTO_TEST_CASE(imap_client_login_rejected)
{
    scripted_server server("* OK ready\r\n", {
        {"LOGIN", "{tag} NO [AUTHENTICATIONFAILED] invalid credentials\r\n"}});

    asio::io_context client_ctx;
    auto fut = asio::co_spawn(client_ctx,
        [port = server.port()]() -> asio::awaitable<void>
        {
            client cli(co_await asio::this_coro::executor, cleartext_options());
            BOOST_REQUIRE(co_await cli.connect("127.0.0.1", port, tls_mode::none, nullptr));
            auto res = co_await cli.login("user", "wrong");
            BOOST_REQUIRE(!res);
            BOOST_CHECK(res.error().code == mailvault::errc::imap_auth_failed);
            BOOST_CHECK(res.error().detail.find("wrong") == std::string::npos);
        }, asio::use_future);

    client_ctx.run();
    fut.get();
}

BOOST_AUTO_TEST_CASE(imap_client_refuses_cleartext_login)
{
    scripted_server server("* OK ready\r\n", {
        {"LOGOUT", "* BYE bye\r\n{tag} OK logout\r\n"}});

    asio::io_context client_ctx;
    auto fut = asio::co_spawn(client_ctx,
        [port = server.port()]() -> asio::awaitable<void>
        {
            client cli(co_await asio::this_coro::executor);
            BOOST_REQUIRE(co_await cli.connect("127.0.0.1", port, tls_mode::none, nullptr));
            auto res = co_await cli.login("user", "secret");
            BOOST_REQUIRE(!res);
            BOOST_CHECK(res.error().code == mailvault::errc::tls_required);
            BOOST_REQUIRE(co_await cli.logout());
        }, asio::use_future);

    client_ctx.run();
    fut.get();

    const auto& commands = server.commands();
    BOOST_REQUIRE_EQUAL(commands.size(), 1u);
    BOOST_CHECK_EQUAL(commands[0], "LOGOUT");
}

BOOST_AUTO_TEST_CASE(imap_client_bye_greeting)
{
    scripted_server server("* BYE too many connections\r\n", {});

    asio::io_context client_ctx;
    auto fut = asio::co_spawn(client_ctx,
        [port = server.port()]() -> asio::awaitable<void>
        {
            client cli(co_await asio::this_coro::executor, cleartext_options());
            auto res = co_await cli.connect("127.0.0.1", port, tls_mode::none, nullptr);
            BOOST_REQUIRE(!res);
            BOOST_CHECK(res.error().code == mailvault::errc::imap_bye);
        }, asio::use_future);

    client_ctx.run();
    fut.get();
}

BOOST_AUTO_TEST_CASE(imap_client_requires_tls_context)
{
    asio::io_context client_ctx;
    auto fut = asio::co_spawn(client_ctx,
        []() -> asio::awaitable<void>
        {
            client cli(co_await asio::this_coro::executor);
            auto res = co_await cli.connect("127.0.0.1", 993, tls_mode::implicit, nullptr);
            BOOST_REQUIRE(!res);
            BOOST_CHECK(res.error().code == mailvault::errc::imap_invalid_state);
            BOOST_CHECK(!cli.is_connected());
        }, asio::use_future);

    client_ctx.run();
    fut.get();
}
