/*

test_host_directory.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE host_directory_test

#include <boost/test/unit_test.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include <popdesk/host_directory.hpp>


using popdesk::error_code;
using popdesk::host_directory;


namespace
{

host_directory parse(const std::string& text)
{
    std::istringstream in(text);
    auto dir = host_directory::parse(in);
    BOOST_TEST_REQUIRE(dir.has_value());
    return std::move(*dir);
}

} // namespace


BOOST_AUTO_TEST_CASE(resolve_known_domain)
{
    const auto dir = parse("example.com=pop.example.com\n");
    const auto host = dir.resolve("example.com");
    BOOST_TEST_REQUIRE(host.has_value());
    BOOST_TEST(host->host == "pop.example.com");
    BOOST_TEST(!host->port.has_value());
}

BOOST_AUTO_TEST_CASE(resolve_unknown_domain)
{
    const auto dir = parse("example.com=pop.example.com\n");
    const auto host = dir.resolve("unknown.org");
    BOOST_TEST_REQUIRE(!host.has_value());
    BOOST_TEST((host.error().code() == error_code::host_not_found));
}

BOOST_AUTO_TEST_CASE(resolve_is_exact_match)
{
    const auto dir = parse("example.com=pop.example.com\n");
    BOOST_TEST(!dir.resolve("Example.com").has_value());
    BOOST_TEST(!dir.resolve("mail.example.com").has_value());
}

BOOST_AUTO_TEST_CASE(separators_and_comments)
{
    const auto dir = parse(
        "# comment\n"
        "! another comment\n"
        "\n"
        "   a.org = pop.a.org\n"
        "b.org:pop.b.org\n"
        "c.org    pop.c.org\n"
        "d.org\tpop.d.org\r\n");
    BOOST_TEST(dir.size() == 4u);
    BOOST_TEST(dir.resolve("a.org")->host == "pop.a.org");
    BOOST_TEST(dir.resolve("b.org")->host == "pop.b.org");
    BOOST_TEST(dir.resolve("c.org")->host == "pop.c.org");
    BOOST_TEST(dir.resolve("d.org")->host == "pop.d.org");
}

BOOST_AUTO_TEST_CASE(continuation_and_escapes)
{
    const auto dir = parse(
        "long.org = pop.\\\n"
        "           long.org\n"
        "key\\ with\\ space = value\n"
        "unicode.org = pop.\\u0065xample.org\n");
    BOOST_TEST(dir.resolve("long.org")->host == "pop.long.org");
    BOOST_TEST(dir.resolve("key with space")->host == "value");
    BOOST_TEST(dir.resolve("unicode.org")->host == "pop.example.org");
}

BOOST_AUTO_TEST_CASE(later_duplicate_wins)
{
    const auto dir = parse("a.org=first\na.org=second\n");
    BOOST_TEST(dir.size() == 1u);
    BOOST_TEST(dir.resolve("a.org")->host == "second");
}

BOOST_AUTO_TEST_CASE(port_override)
{
    const auto dir = parse("a.org=pop.a.org:1110\nb.org=pop.b.org:notaport\nc.org=pop.c.org:0\n");
    const auto a = dir.resolve("a.org");
    BOOST_TEST(a->host == "pop.a.org");
    BOOST_TEST_REQUIRE(a->port.has_value());
    BOOST_TEST(*a->port == 1110);

    BOOST_TEST(dir.resolve("b.org")->host == "pop.b.org:notaport");
    BOOST_TEST(!dir.resolve("b.org")->port.has_value());
    BOOST_TEST(!dir.resolve("c.org")->port.has_value());
}

BOOST_AUTO_TEST_CASE(malformed_unicode_escape)
{
    std::istringstream in("a.org=pop\\u12\n");
    const auto dir = host_directory::parse(in);
    BOOST_TEST_REQUIRE(!dir.has_value());
    BOOST_TEST((dir.error().code() == error_code::startup_fatal));
    BOOST_TEST(dir.error().detail().find("line=1\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(load_missing_file)
{
    const auto dir = host_directory::load("/nonexistent/popdesk/hosts.properties");
    BOOST_TEST_REQUIRE(!dir.has_value());
    BOOST_TEST((dir.error().code() == error_code::startup_fatal));
    BOOST_TEST(dir.error().is(popdesk::error_kind::startup_fatal));
}

BOOST_AUTO_TEST_CASE(load_from_file)
{
    const std::string path = "popdesk_test_hosts.properties";
    {
        std::ofstream out(path);
        out << "example.com=pop.example.com\n";
    }
    const auto dir = host_directory::load(path);
    std::remove(path.c_str());
    BOOST_TEST_REQUIRE(dir.has_value());
    BOOST_TEST(dir->contains("example.com"));
    BOOST_TEST(!dir->empty());
}

BOOST_AUTO_TEST_CASE(empty_value_is_no_host)
{
    const auto dir = parse("example.com=\nspaces.org =   \n");
    BOOST_TEST(dir.contains("example.com"));

    const auto host = dir.resolve("example.com");
    BOOST_TEST_REQUIRE(!host.has_value());
    BOOST_TEST((host.error().code() == error_code::host_not_found));
    BOOST_TEST(!dir.resolve("spaces.org").has_value());
}
