/*

transport.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <charconv>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>
#include <popdesk/detail/asio_error.hpp>
#include <popdesk/detail/log.hpp>
#include <popdesk/detail/result.hpp>
#include <popdesk/detail/sanitize.hpp>
#include <popdesk/mailbox.hpp>
#include <popdesk/message.hpp>
#include <popdesk/net/dialog.hpp>
#include <popdesk/pop3/error_mapping.hpp>
#include <popdesk/pop3/types.hpp>
#include <popdesk/transport.hpp>

namespace popdesk::pop3
{

/**
Base class for POP3 client containing common logic and constants.
**/
class pop3_base
{
public:
    using message_list_t = std::map<unsigned, std::uint64_t>;

protected:
    inline static const std::string OK_RESPONSE = "+OK";
    inline static const std::string ERR_RESPONSE = "-ERR";
    inline static const std::string END_OF_DATA = ".";

    [[nodiscard]] static result<std::tuple<std::string, std::string>> parse_status(
        const std::string& line, std::string_view command)
    {
        std::string::size_type pos = line.find(' ');
        std::string status = line.substr(0, pos);
        std::string rest = (pos != std::string::npos) ? line.substr(pos + 1) : "";
        if (status != OK_RESPONSE && status != ERR_RESPONSE)
        {
            error err(map_pop3_error(error_kind::protocol), "Unknown response status.", line);
            err.with_detail(make_pop3_detail(command, line).str());
            return fail<std::tuple<std::string, std::string>>(std::move(err));
        }
        return std::make_tuple(std::move(status), std::move(rest));
    }

    static bool is_ok(const std::string& status) { return status == OK_RESPONSE; }

    [[nodiscard]] static error make_error(error_kind kind, std::string message,
        std::string_view command, const std::string& line = {})
    {
        error err(map_pop3_error(kind), std::move(message), line);
        err.with_detail(make_pop3_detail(command, line).str());
        return err;
    }

    /// Parses the `count size` pair answered to STAT and listed by LIST; signs are rejected
    [[nodiscard]] static bool parse_number_pair(std::string_view text, unsigned& first, std::uint64_t& second)
    {
        const char* pos = text.data();
        const char* const end = text.data() + text.size();
        const auto skip_blanks = [&pos, end]() { while (pos != end && *pos == ' ') ++pos; };

        skip_blanks();
        auto res = std::from_chars(pos, end, first);
        if (res.ec != std::errc{} || res.ptr == end || *res.ptr != ' ')
            return false;
        pos = res.ptr;
        skip_blanks();
        res = std::from_chars(pos, end, second);
        if (res.ec != std::errc{})
            return false;
        // anything after the pair (LIST/STAT may add text) must be blank-separated
        return res.ptr == end || *res.ptr == ' ';
    }

    /// "VERB n"
    [[nodiscard]] static std::string numbered_command(std::string_view verb, unsigned number)
    {
        std::string cmd(verb);
        cmd += ' ';
        cmd += std::to_string(number);
        return cmd;
    }
};


/**
POP3 (RFC 1939) implementation of the blocking transport.

Each call runs its coroutine to completion on a private `io_context`, so the
calling thread blocks for the whole exchange. Reads and writes are bounded by
`options::timeout`, name resolution plus connect by `options::connect_timeout`.
Any network failure drops the connection.
**/
class transport : public popdesk::transport, private pop3_base
{
public:
    /// POP3 session state (RFC 1939)
    enum class state_t {
        DISCONNECTED,   ///< Not connected to server
        AUTHORIZATION,  ///< Greeting received, waiting for credentials
        TRANSACTION,    ///< Authenticated, ready for commands
        UPDATE          ///< QUIT acknowledged, deletions committed
    };

    explicit transport(options opts = {})
        : options_(std::move(opts)),
          state_(state_t::DISCONNECTED)
    {
    }

    transport(const transport&) = delete;
    transport& operator=(const transport&) = delete;

    ~transport() override
    {
        drop_connection();
    }

    result_void connect(const std::string& host, std::optional<std::uint16_t> port) override
    {
        return run_sync(connect_impl(host, std::to_string(port.value_or(DEFAULT_PORT))));
    }

    result_void login(const std::string& username, const std::string& secret) override
    {
        return run_sync(login_impl(username, secret));
    }

    result<mailbox_stat> message_count() override
    {
        return run_sync(stat_impl());
    }

    result<std::vector<message>> messages() override
    {
        return run_sync(messages_impl());
    }

    result_void delete_message(unsigned sequence_number) override
    {
        return run_sync(dele_impl(sequence_number));
    }

    result_void logout() override
    {
        return run_sync(quit_impl());
    }

    result_void disconnect() override
    {
        if (!dlg_.has_value())
            return ok();

        asio::error_code ec;
        auto& socket = dlg_->socket();
        // The server closes its side after QUIT, so shutdown may legitimately fail.
        socket.shutdown(asio::tcp::socket::shutdown_both, ec);
        ec.clear();
        socket.close(ec);
        dlg_.reset();
        state_ = state_t::DISCONNECTED;
        if (ec)
            return fail(error_from_asio(io_stage::write, ec, host_));
        POPDESK_DEBUG("POP3 disconnected from " + host_);
        return ok();
    }

    [[nodiscard]] bool is_connected() const noexcept override
    {
        return dlg_.has_value() && dlg_->is_open();
    }

    void cancel() noexcept override
    {
        if (!running_.load())
            return;
        const std::uint64_t generation = generation_.load();
        asio::post(io_, [this, generation]()
        {
            if (generation == generation_.load())
                abort_io();
        });
    }

    [[nodiscard]] state_t state() const noexcept { return state_; }

    [[nodiscard]] const options& get_options() const noexcept { return options_; }

private:
    template<typename T>
    T run_sync(asio::awaitable<T> op)
    {
        generation_.fetch_add(1);
        running_.store(true);
        io_.restart();

        std::optional<T> out;
        std::exception_ptr failure;
        try
        {
            asio::co_spawn(io_, std::move(op), [&out, &failure](std::exception_ptr ep, T value)
            {
                if (ep)
                    failure = ep;
                else
                    out.emplace(std::move(value));
            });
            io_.run();
        }
        catch (...)
        {
            running_.store(false);
            throw;
        }
        running_.store(false);

        if (failure)
            std::rethrow_exception(failure);
        if (!out->has_value() && out->error().is(popdesk::error_kind::transport))
            drop_connection();
        return std::move(*out);
    }

    void abort_io() noexcept
    {
        if (resolver_.has_value())
            resolver_->cancel();
        if (dlg_.has_value())
            dlg_->close();
    }

    void drop_connection() noexcept
    {
        resolver_.reset();
        if (dlg_.has_value())
        {
            dlg_->close();
            dlg_.reset();
        }
        state_ = state_t::DISCONNECTED;
    }

    asio::awaitable<result_void> connect_impl(std::string host, std::string service)
    {
        POPDESK_CO_TRY(ensure_state(state_t::DISCONNECTED, "CONNECT"));
        if (host.empty() || detail::contains_crlf_or_nul(host))
        {
            error err(error_code::dns_resolution_failed, "Invalid host name.");
            err.with_detail(make_pop3_detail("CONNECT").add("host", host).str());
            co_return fail(std::move(err));
        }

        host_ = host;
        POPDESK_DEBUG("POP3 connecting to " + host + ":" + service);
        resolver_.emplace(io_);
        dlg_.emplace(asio::tcp::socket(io_), options_.max_line_length, options_.timeout);
        dlg_->peer(host);
        dlg_->set_trace_protocol("POP3");
        dlg_->set_trace_redaction(options_.redact_secrets_in_trace);

        {
            net::deadline guard(io_.get_executor(), options_.connect_timeout, [this]() { abort_io(); });
            asio::error_code ec;
            auto endpoints = co_await resolver_->async_resolve(host, service,
                asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
                co_return fail(error_from_asio(io_stage::resolve, guard.translate(ec), host));

            co_await asio::async_connect(dlg_->socket(), endpoints, asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
                co_return fail(error_from_asio(io_stage::connect, guard.translate(ec), host));
        }
        resolver_.reset();

        auto line = co_await dlg_->read_line_r();
        if (!line)
            co_return fail(std::move(line).error());
        auto status = parse_status(*line, "GREETING");
        if (!status)
            co_return fail(std::move(status).error());
        if (!is_ok(std::get<0>(*status)))
        {
            drop_connection();
            co_return fail(make_error(error_kind::response, "Connection to server failure.", "GREETING", *line));
        }
        state_ = state_t::AUTHORIZATION;
        co_return ok();
    }

    asio::awaitable<result_void> login_impl(std::string username, std::string password)
    {
        POPDESK_CO_TRY(ensure_state(state_t::AUTHORIZATION, "LOGIN"));
        if (detail::contains_crlf_or_nul(username) || detail::contains_crlf_or_nul(password))
            co_return fail(make_error(error_kind::invalid_state, "CR/LF or NUL not allowed in credentials.", "LOGIN"));

        POPDESK_CO_TRY(co_await send_command("USER " + username));
        POPDESK_CO_TRY(co_await read_ok_response("Username rejection.", "USER", error_kind::auth));
        POPDESK_CO_TRY(co_await send_command("PASS " + password));
        POPDESK_CO_TRY(co_await read_ok_response("Password rejection.", "PASS", error_kind::auth));
        state_ = state_t::TRANSACTION;
        co_return ok();
    }

    asio::awaitable<result<mailbox_stat>> stat_impl()
    {
        POPDESK_CO_TRY(ensure_state(state_t::TRANSACTION, "STAT"));
        POPDESK_CO_TRY(co_await send_command("STAT"));
        auto msg = co_await read_ok_response("Reading statistics failure.", "STAT");
        if (!msg)
            co_return fail<mailbox_stat>(std::move(msg).error());

        unsigned count = 0;
        std::uint64_t size = 0;
        if (!parse_number_pair(*msg, count, size))
            co_return fail<mailbox_stat>(make_error(error_kind::protocol, "Parser failure.", "STAT", *msg));
        co_return mailbox_stat{count, size};
    }

    asio::awaitable<result<message_list_t>> list_impl()
    {
        POPDESK_CO_TRY(ensure_state(state_t::TRANSACTION, "LIST"));
        POPDESK_CO_TRY(co_await send_command("LIST"));
        POPDESK_CO_TRY(co_await read_ok_response("Listing all messages failure.", "LIST"));

        auto lines = co_await read_multiline();
        if (!lines)
            co_return fail<message_list_t>(std::move(lines).error());

        message_list_t msg_list;
        for (const auto& line : *lines)
        {
            unsigned num = 0;
            std::uint64_t size = 0;
            if (!parse_number_pair(line, num, size))
                co_return fail<message_list_t>(make_error(error_kind::protocol, "LIST parse failure.", "LIST", line));
            msg_list[num] = size;
        }
        co_return msg_list;
    }

    asio::awaitable<result<std::string>> retr_impl(unsigned message_no)
    {
        POPDESK_CO_TRY(ensure_state(state_t::TRANSACTION, "RETR"));
        const std::string cmd = numbered_command("RETR", message_no);
        POPDESK_CO_TRY(co_await send_command(cmd));
        POPDESK_CO_TRY(co_await read_ok_response("Fetching message failure.", cmd, error_kind::message));

        auto lines = co_await read_multiline();
        if (!lines)
            co_return fail<std::string>(std::move(lines).error());

        std::string msg_str;
        for (const auto& line : *lines)
        {
            msg_str += line;
            msg_str += "\r\n";
        }
        co_return msg_str;
    }

    asio::awaitable<result<std::vector<message>>> messages_impl()
    {
        auto listing = co_await list_impl();
        if (!listing)
            co_return fail<std::vector<message>>(std::move(listing).error());

        std::vector<message> messages;
        messages.reserve(listing->size());
        for (const auto& [number, size] : *listing)
        {
            auto raw = co_await retr_impl(number);
            if (!raw)
                co_return fail<std::vector<message>>(std::move(raw).error());
            messages.push_back(message::parse(number, size, std::move(*raw)));
        }
        co_return messages;
    }

    asio::awaitable<result_void> dele_impl(unsigned message_no)
    {
        POPDESK_CO_TRY(ensure_state(state_t::TRANSACTION, "DELE"));
        const std::string cmd = numbered_command("DELE", message_no);
        POPDESK_CO_TRY(co_await send_command(cmd));
        POPDESK_CO_TRY(co_await read_ok_response("Removing message failure.", cmd, error_kind::message));
        co_return ok();
    }

    asio::awaitable<result_void> quit_impl()
    {
        if (state_ == state_t::DISCONNECTED || state_ == state_t::UPDATE)
            co_return fail(make_error(error_kind::invalid_state, "QUIT: invalid state", "QUIT",
                state_to_string(state_)));
        POPDESK_CO_TRY(co_await send_command("QUIT"));
        POPDESK_CO_TRY(co_await read_ok_response("Quit failure.", "QUIT"));
        state_ = state_t::UPDATE;
        co_return ok();
    }

    asio::awaitable<result_void> send_command(std::string command)
    {
        co_return co_await dlg_->write_line_r(std::move(command));
    }

    asio::awaitable<result<std::string>> read_ok_response(
        std::string error_message,
        std::string command,
        error_kind kind = error_kind::response)
    {
        auto line = co_await dlg_->read_line_r();
        if (!line)
            co_return fail<std::string>(std::move(line).error());
        auto status = parse_status(*line, command);
        if (!status)
            co_return fail<std::string>(std::move(status).error());
        if (!is_ok(std::get<0>(*status)))
            co_return fail<std::string>(make_error(kind, std::move(error_message), command, *line));
        co_return std::move(std::get<1>(*status));
    }

    /// Reads a dot-terminated response body, undoing dot-stuffing
    asio::awaitable<result<std::vector<std::string>>> read_multiline()
    {
        std::vector<std::string> lines;
        while (true)
        {
            auto line = co_await dlg_->read_line_r();
            if (!line)
                co_return fail<std::vector<std::string>>(std::move(line).error());
            if (*line == END_OF_DATA)
                break;
            if (!line->empty() && line->front() == '.')
                line->erase(0, 1);
            lines.push_back(std::move(*line));
        }
        co_return lines;
    }

    static const char* state_to_string(state_t state) noexcept
    {
        switch (state)
        {
            case state_t::DISCONNECTED:
                return "DISCONNECTED";
            case state_t::AUTHORIZATION:
                return "AUTHORIZATION";
            case state_t::TRANSACTION:
                return "TRANSACTION";
            case state_t::UPDATE:
                return "UPDATE";
        }
        return "UNKNOWN";
    }

    [[nodiscard]] result_void ensure_state(state_t required, const char* operation) const
    {
        if (state_ == required)
            return ok();
        std::string details = "expected ";
        details += state_to_string(required);
        details += ", got ";
        details += state_to_string(state_);
        return fail(make_error(error_kind::invalid_state, std::string(operation) + ": invalid state",
            operation, details));
    }

    options options_;
    asio::io_context io_;
    std::optional<asio::tcp::resolver> resolver_;
    std::optional<net::dialog> dlg_;
    std::string host_;
    state_t state_{state_t::DISCONNECTED};
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> generation_{0};
};

} // namespace popdesk::pop3
