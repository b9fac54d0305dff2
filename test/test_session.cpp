/*

test_session.cpp
----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE session_test

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <popdesk/detail/log.hpp>
#include <popdesk/host_directory.hpp>
#include <popdesk/session.hpp>
#include <popdesk/transport.hpp>


using popdesk::error_code;
using popdesk::error_kind;
using popdesk::session;


namespace
{

/// Behaviour of the scripted transport and the calls it received
struct script
{
    std::vector<std::string> calls;
    std::optional<std::uint16_t> last_port;
    std::string last_secret;
    bool connected = false;
    int cancels = 0;

    popdesk::mailbox_stat stat{2, 300};
    std::vector<popdesk::message> messages;

    std::optional<popdesk::error> connect_error;
    std::optional<popdesk::error> login_error;
    std::optional<popdesk::error> stat_error;
    std::optional<popdesk::error> messages_error;
    std::optional<popdesk::error> delete_error;
    std::optional<popdesk::error> logout_error;
};


class scripted_transport : public popdesk::transport
{
public:
    explicit scripted_transport(std::shared_ptr<script> s)
        : script_(std::move(s))
    {
    }

    popdesk::result_void connect(const std::string& host, std::optional<std::uint16_t> port) override
    {
        script_->calls.push_back("connect " + host);
        script_->last_port = port;
        if (script_->connect_error)
            return popdesk::fail(*script_->connect_error);
        script_->connected = true;
        return popdesk::ok();
    }

    popdesk::result_void login(const std::string& username, const std::string& secret) override
    {
        script_->calls.push_back("login " + username);
        script_->last_secret = secret;
        if (script_->login_error)
            return popdesk::fail(*script_->login_error);
        return popdesk::ok();
    }

    popdesk::result<popdesk::mailbox_stat> message_count() override
    {
        script_->calls.push_back("message_count");
        if (script_->stat_error)
            return popdesk::fail<popdesk::mailbox_stat>(*script_->stat_error);
        return script_->stat;
    }

    popdesk::result<std::vector<popdesk::message>> messages() override
    {
        script_->calls.push_back("messages");
        if (script_->messages_error)
            return popdesk::fail<std::vector<popdesk::message>>(*script_->messages_error);
        return script_->messages;
    }

    popdesk::result_void delete_message(unsigned sequence_number) override
    {
        script_->calls.push_back("delete " + std::to_string(sequence_number));
        if (script_->delete_error)
            return popdesk::fail(*script_->delete_error);
        return popdesk::ok();
    }

    popdesk::result_void logout() override
    {
        script_->calls.push_back("logout");
        if (script_->logout_error)
            return popdesk::fail(*script_->logout_error);
        return popdesk::ok();
    }

    popdesk::result_void disconnect() override
    {
        script_->calls.push_back("disconnect");
        script_->connected = false;
        return popdesk::ok();
    }

    bool is_connected() const noexcept override
    {
        return script_->connected;
    }

    void cancel() noexcept override
    {
        ++script_->cancels;
    }

private:
    std::shared_ptr<script> script_;
};


struct fixture
{
    fixture()
        : state(std::make_shared<script>())
    {
        state->messages.push_back(popdesk::message::parse(1, 120, "Subject: first\r\n\r\none\r\n"));
        state->messages.push_back(popdesk::message::parse(2, 180, "Subject: second\r\n\r\ntwo\r\n"));

        popdesk::host_directory::entries_t entries{
            {"example.com", "pop.example.com"},
            {"ported.org", "pop.ported.org:1995"},
            {"empty.org", ""}};
        auto hosts = std::make_shared<const popdesk::host_directory>(
            popdesk::host_directory::from_entries(std::move(entries)));
        conn = std::make_unique<session>(hosts, std::make_unique<scripted_transport>(state));
    }

    ~fixture()
    {
        popdesk::log::logger::instance().clear_callback();
        popdesk::log::logger::instance().set_level(popdesk::log::level::info);
    }

    void sign_in()
    {
        BOOST_TEST_REQUIRE(conn->sign_in("alice@example.com", "s3cr3t").has_value());
        state->calls.clear();
    }

    std::shared_ptr<script> state;
    std::unique_ptr<session> conn;
};


const std::vector<std::string> FULL_CYCLE{
    "connect pop.example.com", "login alice", "message_count", "messages", "logout", "disconnect"};

} // namespace


BOOST_FIXTURE_TEST_SUITE(session_suite, fixture)

BOOST_AUTO_TEST_CASE(sign_in_fetches_mailbox)
{
    const auto res = conn->sign_in("alice@example.com", "s3cr3t");
    BOOST_TEST_REQUIRE(res.has_value());

    BOOST_TEST((conn->state() == session::state_t::SIGNED_IN));
    BOOST_TEST(conn->address() == "alice@example.com");
    BOOST_TEST(conn->message_count() == 2u);
    BOOST_TEST_REQUIRE(conn->messages().size() == 2u);
    BOOST_TEST(conn->messages()[0].sequence_number() == 1u);
    BOOST_TEST(conn->messages()[1].subject() == "second");
    BOOST_TEST(!conn->snapshot_stale());

    BOOST_TEST(state->calls == FULL_CYCLE, boost::test_tools::per_element());
    BOOST_TEST(state->last_secret == "s3cr3t");
    BOOST_TEST(!state->last_port.has_value());
    BOOST_TEST(!state->connected);
}

BOOST_AUTO_TEST_CASE(malformed_address_touches_no_network)
{
    const auto res = conn->sign_in("alice#example.com", "s3cr3t");
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(error_kind::credentials_form));
    BOOST_TEST(state->calls.empty());
    BOOST_TEST((conn->state() == session::state_t::SIGNED_OUT));
    BOOST_TEST(conn->address().empty());
}

BOOST_AUTO_TEST_CASE(empty_secret_touches_no_network)
{
    const auto res = conn->sign_in("alice@example.com", "");
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST((res.error().code() == error_code::empty_secret));
    BOOST_TEST(state->calls.empty());
}

BOOST_AUTO_TEST_CASE(unknown_domain_touches_no_network)
{
    const auto res = conn->sign_in("alice@unknown.org", "s3cr3t");
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(error_kind::host_not_found));
    BOOST_TEST(state->calls.empty());
    BOOST_TEST((conn->state() == session::state_t::SIGNED_OUT));
}

BOOST_AUTO_TEST_CASE(domain_without_host_touches_no_network)
{
    const auto res = conn->sign_in("alice@empty.org", "s3cr3t");
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(error_kind::host_not_found));
    BOOST_TEST(state->calls.empty());
}

BOOST_AUTO_TEST_CASE(rejected_login_retains_nothing)
{
    state->login_error = popdesk::error(error_code::authentication_failed, "Password rejection.", "-ERR denied");

    const auto res = conn->sign_in("alice@example.com", "wrong");
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(error_kind::server_rejection));
    BOOST_TEST(res.error().server_response() == "-ERR denied");

    BOOST_TEST((conn->state() == session::state_t::SIGNED_OUT));
    BOOST_TEST(conn->address().empty());
    BOOST_TEST(!conn->snapshot());
    BOOST_TEST(conn->message_count() == 0u);
    BOOST_TEST(!state->connected);
    BOOST_TEST(state->calls.back() == "disconnect");
}

BOOST_AUTO_TEST_CASE(unreachable_server_during_sign_in)
{
    state->connect_error = popdesk::error(error_code::connection_failed, "Connection refused");

    const auto res = conn->sign_in("alice@example.com", "s3cr3t");
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(error_kind::transport));
    BOOST_TEST((conn->state() == session::state_t::SIGNED_OUT));
    BOOST_TEST(state->calls.size() == 1u);
}

BOOST_AUTO_TEST_CASE(sign_in_twice_is_refused)
{
    sign_in();
    const auto res = conn->sign_in("alice@example.com", "s3cr3t");
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(error_kind::invalid_state));
    BOOST_TEST(state->calls.empty());
    BOOST_TEST((conn->state() == session::state_t::SIGNED_IN));
}

BOOST_AUTO_TEST_CASE(operations_require_sign_in)
{
    const auto refresh = conn->refresh_mailbox();
    BOOST_TEST_REQUIRE(!refresh.has_value());
    BOOST_TEST(refresh.error().is(error_kind::invalid_state));

    const auto dele = conn->delete_message(1);
    BOOST_TEST_REQUIRE(!dele.has_value());
    BOOST_TEST(dele.error().is(error_kind::invalid_state));

    BOOST_TEST(state->calls.empty());
}

BOOST_AUTO_TEST_CASE(refresh_replaces_snapshot)
{
    sign_in();
    const auto before = conn->snapshot();

    state->stat = popdesk::mailbox_stat{1, 50};
    state->messages.resize(1);
    BOOST_TEST_REQUIRE(conn->refresh_mailbox().has_value());

    BOOST_TEST(conn->snapshot() != before);
    BOOST_TEST(conn->message_count() == 1u);
    BOOST_TEST(before->message_count == 2u);
    BOOST_TEST(state->calls == FULL_CYCLE, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(failed_refresh_keeps_previous_snapshot)
{
    sign_in();
    const auto before = conn->snapshot();

    state->messages_error = popdesk::error(error_code::connection_closed, "Connection closed");
    const auto res = conn->refresh_mailbox();
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(error_kind::transport));

    BOOST_TEST(conn->snapshot() == before);
    BOOST_TEST(conn->message_count() == 2u);
    BOOST_TEST((conn->state() == session::state_t::SIGNED_IN));
    BOOST_TEST(!state->connected);
}

BOOST_AUTO_TEST_CASE(cleanup_failure_keeps_primary_error_on_refresh)
{
    sign_in();
    const auto before = conn->snapshot();

    state->messages_error = popdesk::error(error_code::connection_closed, "primary");
    state->logout_error = popdesk::error(error_code::server_rejection, "cleanup", "-ERR");
    const auto res = conn->refresh_mailbox();
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().message() == "primary");
    BOOST_TEST((res.error().code() == error_code::connection_closed));

    BOOST_TEST(conn->snapshot() == before);
    BOOST_TEST((conn->state() == session::state_t::SIGNED_IN));
    BOOST_TEST(state->calls.back() == "disconnect");
    BOOST_TEST(!state->connected);
}

BOOST_AUTO_TEST_CASE(cleanup_failure_keeps_primary_error_on_sign_in)
{
    state->messages_error = popdesk::error(error_code::connection_closed, "primary");
    state->logout_error = popdesk::error(error_code::server_rejection, "cleanup", "-ERR");
    const auto res = conn->sign_in("alice@example.com", "s3cr3t");
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().message() == "primary");
    BOOST_TEST((res.error().code() == error_code::connection_closed));

    BOOST_TEST((conn->state() == session::state_t::SIGNED_OUT));
    BOOST_TEST(!conn->snapshot());
    BOOST_TEST(conn->address().empty());
    BOOST_TEST(!state->connected);
}

BOOST_AUTO_TEST_CASE(count_mismatch_is_rejected)
{
    sign_in();
    const auto before = conn->snapshot();

    state->stat = popdesk::mailbox_stat{3, 400};
    const auto res = conn->refresh_mailbox();
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST((res.error().code() == error_code::invalid_response));
    BOOST_TEST(conn->snapshot() == before);
    BOOST_TEST(!state->connected);
}

BOOST_AUTO_TEST_CASE(failed_logout_fails_refresh)
{
    sign_in();
    const auto before = conn->snapshot();

    state->logout_error = popdesk::error(error_code::server_rejection, "Quit failure.", "-ERR");
    const auto res = conn->refresh_mailbox();
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(conn->snapshot() == before);
    BOOST_TEST(state->calls.back() == "disconnect");
    BOOST_TEST(!state->connected);
}

BOOST_AUTO_TEST_CASE(delete_marks_snapshot_stale)
{
    sign_in();
    BOOST_TEST_REQUIRE(conn->delete_message(1).has_value());

    const std::vector<std::string> expected{
        "connect pop.example.com", "login alice", "delete 1", "logout", "disconnect"};
    BOOST_TEST(state->calls == expected, boost::test_tools::per_element());
    BOOST_TEST(conn->snapshot_stale());
    BOOST_TEST(conn->message_count() == 2u);
    BOOST_TEST((conn->state() == session::state_t::SIGNED_IN));

    BOOST_TEST_REQUIRE(conn->refresh_mailbox().has_value());
    BOOST_TEST(!conn->snapshot_stale());
}

BOOST_AUTO_TEST_CASE(delete_sends_number_unchecked)
{
    sign_in();
    state->delete_error = popdesk::error(error_code::message_not_found, "Removing message failure.",
        "-ERR no such message");

    const auto res = conn->delete_message(99);
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST((res.error().code() == error_code::message_not_found));
    BOOST_TEST(res.error().is(error_kind::server_rejection));
    BOOST_TEST(state->calls[2] == "delete 99");
    BOOST_TEST(!conn->snapshot_stale());
    BOOST_TEST(!state->connected);
    BOOST_TEST((conn->state() == session::state_t::SIGNED_IN));
}

BOOST_AUTO_TEST_CASE(end_session_forgets_user)
{
    sign_in();
    conn->end_session();

    BOOST_TEST((conn->state() == session::state_t::SIGNED_OUT));
    BOOST_TEST(conn->address().empty());
    BOOST_TEST(!conn->snapshot());
    BOOST_TEST(conn->message_count() == 0u);

    const auto res = conn->refresh_mailbox();
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(error_kind::invalid_state));

    BOOST_TEST_REQUIRE(conn->sign_in("alice@example.com", "s3cr3t").has_value());
}

BOOST_AUTO_TEST_CASE(end_session_releases_live_connection)
{
    state->connected = true;
    conn->end_session();
    BOOST_TEST(!state->connected);
    BOOST_TEST(state->calls == std::vector<std::string>{"disconnect"}, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(port_from_host_directory_and_options)
{
    BOOST_TEST_REQUIRE(conn->sign_in("bob@ported.org", "s3cr3t").has_value());
    BOOST_TEST(state->calls.front() == "connect pop.ported.org");
    BOOST_TEST_REQUIRE(state->last_port.has_value());
    BOOST_TEST(*state->last_port == 1995);

    auto other = std::make_shared<script>();
    other->stat = popdesk::mailbox_stat{0, 0};
    popdesk::host_directory::entries_t entries{{"example.com", "pop.example.com"}};
    session with_port(std::make_shared<const popdesk::host_directory>(std::move(entries)),
        std::make_unique<scripted_transport>(other), popdesk::session_options{std::uint16_t{1110}});
    BOOST_TEST_REQUIRE(with_port.sign_in("alice@example.com", "s3cr3t").has_value());
    BOOST_TEST_REQUIRE(other->last_port.has_value());
    BOOST_TEST(*other->last_port == 1110);
    BOOST_TEST(with_port.message_count() == 0u);
}

BOOST_AUTO_TEST_CASE(cancel_reaches_transport)
{
    conn->cancel();
    BOOST_TEST(state->cancels == 1);
}

BOOST_AUTO_TEST_CASE(secret_never_logged)
{
    std::vector<std::string> logged;
    auto& logger = popdesk::log::logger::instance();
    logger.set_level(popdesk::log::level::trace);
    logger.set_callback([&logged](const popdesk::log::entry& e)
    {
        logged.push_back(e.message);
    });

    state->login_error = popdesk::error(error_code::authentication_failed, "Password rejection.", "-ERR denied");
    BOOST_TEST(!conn->sign_in("alice@example.com", "s3cr3t").has_value());
    state->login_error.reset();
    BOOST_TEST(conn->sign_in("alice@example.com", "s3cr3t").has_value());
    BOOST_TEST(conn->delete_message(1).has_value());
    conn->end_session();

    BOOST_TEST(!logged.empty());
    for (const auto& line : logged)
        BOOST_TEST(line.find("s3cr3t") == std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()


BOOST_AUTO_TEST_CASE(session_without_transport)
{
    popdesk::host_directory::entries_t entries{{"example.com", "pop.example.com"}};
    session conn(std::make_shared<const popdesk::host_directory>(std::move(entries)), nullptr);

    const auto res = conn.sign_in("alice@example.com", "s3cr3t");
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(error_kind::invalid_state));
    BOOST_TEST(!conn.refresh_mailbox().has_value());
    BOOST_TEST(!conn.delete_message(1).has_value());

    conn.cancel();
    conn.end_session();
    BOOST_TEST((conn.state() == session::state_t::SIGNED_OUT));
}
