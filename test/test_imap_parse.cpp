/*

test_imap_parse.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE imap_parse_test

#include <chrono>
#include <boost/test/unit_test.hpp>
#include <mailvault/imap/types.hpp>
#include <mailvault/imap/utf7.hpp>


using namespace std::chrono;


BOOST_AUTO_TEST_CASE(imap_parse_exists)
{
    mailvault::imap::mailbox_stat stat;
    mailvault::imap::parse_mailbox_stat("* 23 EXISTS", stat);
    mailvault::imap::parse_mailbox_stat("* 7 RECENT", stat);

    BOOST_TEST(stat.messages_no == 23u);
}

BOOST_AUTO_TEST_CASE(imap_parse_ok_items)
{
    mailvault::imap::mailbox_stat stat;
    mailvault::imap::parse_mailbox_stat("* OK [UIDNEXT 33] next", stat);
    mailvault::imap::parse_mailbox_stat("* OK [UIDVALIDITY 12345] valid", stat);
    mailvault::imap::parse_mailbox_stat("* OK [PERMANENTFLAGS (\\Deleted)] flags", stat);

    BOOST_TEST(stat.uid_next == 33u);
    BOOST_TEST(stat.uid_validity == 12345u);
}

BOOST_AUTO_TEST_CASE(imap_parse_search_ids)
{
    auto ids = mailvault::imap::parse_search_ids("* SEARCH 1 2 42");
    BOOST_TEST(ids.size() == 3u);
    BOOST_TEST(ids[0] == 1u);
    BOOST_TEST(ids[2] == 42u);

    BOOST_TEST(mailvault::imap::parse_search_ids("* SEARCH").empty());
    BOOST_TEST(mailvault::imap::parse_search_ids("* OK [UIDVALIDITY 1]").empty());
}

BOOST_AUTO_TEST_CASE(imap_parse_list_line)
{
    mailvault::imap::mailbox_folder folder;
    BOOST_TEST(mailvault::imap::parse_list_line("* LIST (\\HasNoChildren) \"/\" \"INBOX\"", folder));
    BOOST_TEST(folder.name == "INBOX");
    BOOST_TEST(folder.delimiter == '/');
    BOOST_TEST(folder.selectable());

    BOOST_TEST(mailvault::imap::parse_list_line("* LIST (\\Noselect \\HasChildren) \".\" \"[Gmail]\"", folder));
    BOOST_TEST(folder.name == "[Gmail]");
    BOOST_TEST(folder.delimiter == '.');
    BOOST_TEST(folder.attributes.size() == 2u);
    BOOST_TEST(!folder.selectable());

    BOOST_TEST(mailvault::imap::parse_list_line("* LIST () \"/\" \"Entw&APw-rfe\"", folder));
    BOOST_TEST(folder.wire_name == "Entw&APw-rfe");
    BOOST_TEST(folder.name == "Entw\xC3\xBCrfe");

    BOOST_TEST(mailvault::imap::parse_list_line("* LIST (\\HasNoChildren) NIL Archive", folder));
    BOOST_TEST(folder.name == "Archive");
    BOOST_TEST(folder.delimiter == '\0');

    BOOST_TEST(!mailvault::imap::parse_list_line("* LSUB () \"/\" INBOX", folder));
    BOOST_TEST(!mailvault::imap::parse_list_line("* LIST \\HasNoChildren \"/\" INBOX", folder));
}

BOOST_AUTO_TEST_CASE(imap_parse_status_line)
{
    mailvault::imap::status_counts counts;
    BOOST_TEST(mailvault::imap::parse_status_line("* STATUS \"INBOX\" (MESSAGES 3 UNSEEN 1)", counts));
    BOOST_TEST(counts.messages.has_value());
    BOOST_TEST(*counts.messages == 3u);
    BOOST_TEST(*counts.unseen == 1u);

    mailvault::imap::status_counts partial;
    BOOST_TEST(mailvault::imap::parse_status_line("* STATUS Sent (MESSAGES 12)", partial));
    BOOST_TEST(*partial.messages == 12u);
    BOOST_TEST(!partial.unseen.has_value());

    mailvault::imap::status_counts other;
    BOOST_TEST(!mailvault::imap::parse_status_line("* 3 EXISTS", other));
}

BOOST_AUTO_TEST_CASE(imap_parse_internal_date)
{
    auto utc = mailvault::imap::parse_internal_date("01-Jan-2023 10:00:00 +0000");
    BOOST_TEST(utc.has_value());
    BOOST_TEST((*utc == sys_days{2023y / January / 1} + hours{10}));

    auto east = mailvault::imap::parse_internal_date("01-Jan-2023 10:00:00 +0130");
    BOOST_TEST((*east == sys_days{2023y / January / 1} + hours{8} + minutes{30}));

    auto west = mailvault::imap::parse_internal_date(" 1-Jun-2024 23:30:00 -0200");
    BOOST_TEST(west.has_value());
    BOOST_TEST((*west == sys_days{2024y / June / 2} + hours{1} + minutes{30}));

    BOOST_TEST(!mailvault::imap::parse_internal_date("31-Feb-2023 10:00:00 +0000").has_value());
    BOOST_TEST(!mailvault::imap::parse_internal_date("01-Foo-2023 10:00:00 +0000").has_value());
    BOOST_TEST(!mailvault::imap::parse_internal_date("01-Jan-2023 10:00").has_value());
}

BOOST_AUTO_TEST_CASE(imap_format_search_date)
{
    BOOST_TEST(mailvault::imap::format_search_date(2023y / July / 1) == "1-Jul-2023");
    BOOST_TEST(mailvault::imap::format_search_date(2024y / December / 31) == "31-Dec-2024");
}

BOOST_AUTO_TEST_CASE(imap_parse_fetch_summary)
{
    mailvault::imap::fetch_summary summary;
    BOOST_TEST(mailvault::imap::parse_fetch_summary(
        "* 4 FETCH (UID 10 INTERNALDATE \"01-Jun-2023 12:00:00 +0000\" RFC822.SIZE 1234)", summary));
    BOOST_TEST(summary.seq == 4u);
    BOOST_TEST(summary.uid == 10u);
    BOOST_TEST(summary.size == 1234u);
    BOOST_TEST((summary.internal_date == sys_days{2023y / June / 1} + hours{12}));

    mailvault::imap::fetch_summary with_flags;
    BOOST_TEST(mailvault::imap::parse_fetch_summary(
        "* 5 FETCH (FLAGS (\\Seen) INTERNALDATE \"02-Jun-2023 00:00:00 +0000\" UID 11)", with_flags));
    BOOST_TEST(with_flags.uid == 11u);

    mailvault::imap::fetch_summary missing_uid;
    BOOST_TEST(!mailvault::imap::parse_fetch_summary(
        "* 6 FETCH (INTERNALDATE \"02-Jun-2023 00:00:00 +0000\")", missing_uid));
}

BOOST_AUTO_TEST_CASE(imap_quote_astring_and_mailbox)
{
    auto quoted = mailvault::imap::to_astring("a \"b\" \\c");
    BOOST_TEST(quoted.has_value());
    BOOST_TEST(*quoted == "\"a \\\"b\\\" \\\\c\"");

    BOOST_TEST(!mailvault::imap::to_astring("evil\r\nA1 LOGOUT").has_value());

    auto mailbox = mailvault::imap::to_mailbox("Entw\xC3\xBCrfe");
    BOOST_TEST(mailbox.has_value());
    BOOST_TEST(*mailbox == "\"Entw&APw-rfe\"");
}

BOOST_AUTO_TEST_CASE(imap_modified_utf7)
{
    auto amp = mailvault::imap::encode_modified_utf7("R&D");
    BOOST_TEST(*amp == "R&-D");
    BOOST_TEST(*mailvault::imap::decode_modified_utf7("R&-D") == "R&D");

    auto decoded = mailvault::imap::decode_modified_utf7("&ZeVnLIqe-");
    BOOST_TEST(decoded.has_value());
    BOOST_TEST(*decoded == "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E");

    BOOST_TEST(!mailvault::imap::decode_modified_utf7("&ZeVn").has_value());
    BOOST_TEST(!mailvault::imap::encode_modified_utf7("\xC3").has_value());
}
