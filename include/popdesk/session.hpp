/*

session.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <popdesk/credentials.hpp>
#include <popdesk/detail/log.hpp>
#include <popdesk/detail/result.hpp>
#include <popdesk/detail/scoped_connection.hpp>
#include <popdesk/host_directory.hpp>
#include <popdesk/mailbox.hpp>
#include <popdesk/message.hpp>
#include <popdesk/transport.hpp>

namespace popdesk
{

struct session_options
{
    /// Port used when the host directory entry names none; protocol default when empty
    std::optional<std::uint16_t> port;
};


/**
Signed-in mailbox session of a single user.

Drives the sign-in, refresh, delete and end workflows over a transport and
keeps the mailbox snapshot of the last successful refresh. All operations are
blocking and run on the caller's thread; an operation started while another
one is in progress fails with `invalid_state`, so at most one connection is
ever open. The snapshot may be read from any thread.
**/
class session
{
public:
    enum class state_t
    {
        SIGNED_OUT,
        AUTHENTICATING,
        SIGNED_IN,
        REFRESHING,
        MUTATING,
        ENDING
    };

    session(std::shared_ptr<const host_directory> hosts, std::unique_ptr<transport> conn,
        session_options options = {})
        : hosts_(std::move(hosts)),
          transport_(std::move(conn)),
          options_(std::move(options))
    {
    }

    session(const session&) = delete;
    session& operator=(const session&) = delete;

    ~session()
    {
        end_session();
    }

    /**
    Signs the user in and fetches the mailbox.

    Checks the credentials form and resolves the domain before touching the
    network. Nothing is retained unless the whole refresh cycle succeeds.

    @param address `local@domain` mail address.
    @param secret  Password.
    @return        `credentials_form`, `host_not_found`, or any refresh failure.
    **/
    result_void sign_in(const std::string& address, const std::string& secret)
    {
        POPDESK_TRY(ensure_state(state_t::SIGNED_OUT, "sign_in"));
        if (auto valid = validate_credentials(address, secret); !valid)
        {
            POPDESK_INFO("Sign-in refused: " + valid.error().message());
            return valid;
        }
        if (!hosts_)
            return fail(error_code::startup_fatal, "Host directory not loaded.");

        auto parts = split_address(address);
        if (!parts)
            return fail(std::move(parts).error());
        auto record = hosts_->resolve(parts->domain);
        if (!record)
        {
            POPDESK_INFO("Sign-in refused: " + record.error().message());
            return fail(std::move(record).error());
        }

        credentials pending{address, parts->local_part, secret};
        transition(state_t::AUTHENTICATING);
        auto snapshot = fetch_snapshot(*record, pending);
        if (!snapshot || state_.load() != state_t::AUTHENTICATING)
        {
            pending.clear();
            if (state_.load() == state_t::AUTHENTICATING)
                transition(state_t::SIGNED_OUT);
            POPDESK_INFO("Sign-in failed for " + address);
            if (!snapshot)
                return fail(std::move(snapshot).error());
            return fail(error_code::invalid_state, "Session ended during sign-in.");
        }

        credentials_ = std::move(pending);
        host_ = std::move(*record);
        publish(std::move(*snapshot));
        transition(state_t::SIGNED_IN);
        POPDESK_INFO("Signed in as " + address + ", " + std::to_string(message_count()) + " message(s)");
        return ok();
    }

    /**
    Fetches the mailbox again: connect, login, count, list, logout, disconnect.

    The snapshot is replaced only when every step succeeds.
    **/
    result_void refresh_mailbox()
    {
        POPDESK_TRY(ensure_state(state_t::SIGNED_IN, "refresh_mailbox"));
        transition(state_t::REFRESHING);
        auto snapshot = fetch_snapshot(host_, credentials_);
        POPDESK_TRY(finish(state_t::REFRESHING, "refresh"));
        if (!snapshot)
        {
            POPDESK_INFO("Refresh failed: " + snapshot.error().to_string());
            return fail(std::move(snapshot).error());
        }
        publish(std::move(*snapshot));
        POPDESK_DEBUG("Mailbox refreshed, " + std::to_string(message_count()) + " message(s)");
        return ok();
    }

    /**
    Deletes a message on the server.

    The number is sent as is; a number the server does not know is reported by
    the server (`message_not_found`). The snapshot is not refreshed and is
    flagged stale once the deletion is committed.

    @param sequence_number Server numbering from the last refresh.
    **/
    result_void delete_message(unsigned sequence_number)
    {
        POPDESK_TRY(ensure_state(state_t::SIGNED_IN, "delete_message"));
        transition(state_t::MUTATING);
        auto res = delete_on_server(sequence_number);
        POPDESK_TRY(finish(state_t::MUTATING, "delete"));
        if (!res)
        {
            POPDESK_INFO("Delete of message " + std::to_string(sequence_number) + " failed: " + res.error().to_string());
            return res;
        }
        stale_.store(true);
        POPDESK_INFO("Deleted message " + std::to_string(sequence_number));
        return ok();
    }

    /// Closes any live connection and forgets the user. Never fails.
    void end_session() noexcept
    {
        if (!transport_ || (state_.load() == state_t::SIGNED_OUT && !transport_->is_connected()))
            return;
        transition(state_t::ENDING);
        if (auto res = transport_->disconnect(); !res)
            POPDESK_WARN("Disconnect at session end failed: " + res.error().to_string());
        credentials_.clear();
        host_ = host_record{};
        snapshot_.store(nullptr);
        stale_.store(false);
        transition(state_t::SIGNED_OUT);
    }

    /// Aborts the network call in progress; safe from another thread.
    void cancel() noexcept
    {
        if (transport_)
            transport_->cancel();
    }

    [[nodiscard]] state_t state() const noexcept { return state_.load(); }

    /// Signed-in address, empty when signed out
    [[nodiscard]] const std::string& address() const noexcept { return credentials_.address; }

    /// Snapshot of the last successful refresh, null before the first one
    [[nodiscard]] std::shared_ptr<const mailbox_snapshot> snapshot() const noexcept
    {
        return snapshot_.load();
    }

    [[nodiscard]] std::size_t message_count() const noexcept
    {
        const auto snap = snapshot_.load();
        return snap ? snap->message_count : 0;
    }

    [[nodiscard]] std::vector<message> messages() const
    {
        const auto snap = snapshot_.load();
        return snap ? snap->messages : std::vector<message>{};
    }

    /// True after a deletion, until the next successful refresh
    [[nodiscard]] bool snapshot_stale() const noexcept { return stale_.load(); }

    [[nodiscard]] static const char* state_to_string(state_t state) noexcept
    {
        switch (state)
        {
            case state_t::SIGNED_OUT: return "SIGNED_OUT";
            case state_t::AUTHENTICATING: return "AUTHENTICATING";
            case state_t::SIGNED_IN: return "SIGNED_IN";
            case state_t::REFRESHING: return "REFRESHING";
            case state_t::MUTATING: return "MUTATING";
            case state_t::ENDING: return "ENDING";
        }
        return "UNKNOWN";
    }

private:
    using snapshot_ptr = std::shared_ptr<const mailbox_snapshot>;

    [[nodiscard]] std::optional<std::uint16_t> port_for(const host_record& record) const noexcept
    {
        return record.port.has_value() ? record.port : options_.port;
    }

    result<snapshot_ptr> fetch_snapshot(const host_record& record, const credentials& creds)
    {
        detail::scoped_connection conn(*transport_);
        POPDESK_TRY(conn.open(record.host, port_for(record), creds.username, creds.secret));

        auto stat = transport_->message_count();
        if (!stat)
            return fail<snapshot_ptr>(std::move(stat).error());
        auto messages = transport_->messages();
        if (!messages)
            return fail<snapshot_ptr>(std::move(messages).error());
        if (messages->size() != stat->messages_no)
            return fail<snapshot_ptr>(error_code::invalid_response,
                "Message list does not match message count (" + std::to_string(messages->size()) +
                " listed, " + std::to_string(stat->messages_no) + " counted).");

        POPDESK_TRY(conn.close());

        auto snapshot = std::make_shared<mailbox_snapshot>();
        snapshot->message_count = stat->messages_no;
        snapshot->mailbox_size = stat->mailbox_size;
        snapshot->messages = std::move(*messages);
        return snapshot_ptr(std::move(snapshot));
    }

    result_void delete_on_server(unsigned sequence_number)
    {
        detail::scoped_connection conn(*transport_);
        POPDESK_TRY(conn.open(host_.host, port_for(host_), credentials_.username, credentials_.secret));
        POPDESK_TRY(transport_->delete_message(sequence_number));
        return conn.close();
    }

    void publish(snapshot_ptr snapshot)
    {
        snapshot_.store(std::move(snapshot));
        stale_.store(false);
    }

    void transition(state_t next) noexcept
    {
        const state_t previous = state_.exchange(next);
        if (previous != next)
            POPDESK_DEBUG(std::string("Session ") + state_to_string(previous) + " -> " + state_to_string(next));
    }

    /// Returns to SIGNED_IN, unless the session was ended meanwhile
    [[nodiscard]] result_void finish(state_t busy, const char* operation)
    {
        if (state_.load() != busy)
            return fail(error_code::invalid_state, std::string("Session ended during ") + operation + ".");
        transition(state_t::SIGNED_IN);
        return ok();
    }

    /// Also refuses every network workflow when the session was built without a transport
    [[nodiscard]] result_void ensure_state(state_t required, const char* operation) const
    {
        if (!transport_)
            return fail(error_code::invalid_state, std::string(operation) + ": no transport");
        const state_t current = state_.load();
        if (current == required)
            return ok();
        return fail(error_code::invalid_state,
            std::string(operation) + ": expected " + state_to_string(required) + ", got " + state_to_string(current));
    }

    std::shared_ptr<const host_directory> hosts_;
    std::unique_ptr<transport> transport_;
    session_options options_;
    std::atomic<state_t> state_{state_t::SIGNED_OUT};
    credentials credentials_;
    host_record host_;
    std::atomic<snapshot_ptr> snapshot_;
    std::atomic<bool> stale_{false};
};

} // namespace popdesk
