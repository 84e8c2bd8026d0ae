/*
 * File: src/bridge_link.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Reconnecting WebSocket client link to the simulation (StreamLink)
 * Notes:
 *  - Wire format: {type, data, timestamp} JSON text frames
 *  - WebSocket ping/pong keepalive on idle links
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>

#include "common/log.hpp"
#include "common/messages.hpp"

namespace websocket = boost::beast::websocket;

struct WsEndpoint
{
    std::string host;
    std::string port;
    std::string target;
};

// expects ws://host[:port][/path]
inline WsEndpoint parse_ws_url(const std::string &ws_url)
{
    const std::string scheme = "ws://";
    if (ws_url.compare(0, scheme.size(), scheme) != 0)
        throw std::invalid_argument("unsupported url (want ws://host:port/path): " + ws_url);
    auto rest = ws_url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    WsEndpoint ep;
    ep.target = (slash == std::string::npos) ? "/" : rest.substr(slash);
    auto colon = hp.find(':');
    if (colon == std::string::npos)
    {
        ep.host = hp;
        ep.port = "80";
    }
    else
    {
        ep.host = hp.substr(0, colon);
        ep.port = hp.substr(colon + 1);
    }
    if (ep.host.empty() || ep.port.empty())
        throw std::invalid_argument("missing host or port in url: " + ws_url);
    return ep;
}

enum class LinkState
{
    Idle,
    Connecting,
    Live,
    Backoff,
    Failed,
    Closed
};

inline const char *link_state_name(LinkState s)
{
    switch (s)
    {
    case LinkState::Idle:
        return "idle";
    case LinkState::Connecting:
        return "connecting";
    case LinkState::Live:
        return "live";
    case LinkState::Backoff:
        return "backoff";
    case LinkState::Failed:
        return "failed";
    case LinkState::Closed:
        return "closed";
    }
    return "?";
}

struct LinkConfig
{
    std::string name{"sim"};
    std::string url{"ws://localhost:3001"};
    std::chrono::milliseconds backoff{5000};
    int max_attempts{10};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds idle_timeout{20000};
    std::size_t max_pending_sends{256};
};

struct LinkStatus
{
    LinkState state{LinkState::Idle};
    std::string url;
    int attempts{0};
    std::uint64_t connects{0};
    std::uint64_t losses{0};
    std::uint64_t messages_in{0};
    std::uint64_t messages_out{0};
    std::uint64_t malformed{0};
    std::uint64_t handler_errors{0};
    std::uint64_t sends_rejected{0};
    std::uint64_t sends_dropped{0};
    std::int64_t last_activity_ms{0};
};

inline nlohmann::json link_status_json(const LinkStatus &s)
{
    return nlohmann::json{
        {"state", link_state_name(s.state)},
        {"url", s.url},
        {"reconnect_attempts", s.attempts},
        {"connects", s.connects},
        {"losses", s.losses},
        {"messages_in", s.messages_in},
        {"messages_out", s.messages_out},
        {"malformed_dropped", s.malformed},
        {"handler_errors", s.handler_errors},
        {"sends_rejected", s.sends_rejected},
        {"sends_dropped", s.sends_dropped},
        {"last_activity_ms", s.last_activity_ms}};
}

// One logical duplex link. All socket work and all handler calls run on the link's strand,
// so inbound handlers are never concurrent with themselves and see messages in receipt order.
// Create with std::make_shared; register handlers with on() before connect().
class StreamLink : public MessageSink,
                   public MessageSource,
                   public std::enable_shared_from_this<StreamLink>
{
    using strand_type = boost::asio::strand<boost::asio::io_context::executor_type>;

    // Exactly one live Connection per link; a reconnect builds a fresh one.
    struct Connection
    {
        websocket::stream<boost::beast::tcp_stream> ws;
        boost::asio::ip::tcp::resolver resolver;
        boost::beast::flat_buffer buffer;
        std::deque<std::string> outbox;

        explicit Connection(const strand_type &strand) : ws(strand), resolver(strand) {}
    };

    strand_type strand_;
    boost::asio::steady_timer timer_;
    LinkConfig cfg_;
    WsEndpoint ep_;
    std::shared_ptr<Connection> conn_;
    std::array<InboundHandler, 8> handlers_{};
    bool stopping_{false};

    std::atomic<LinkState> state_{LinkState::Idle};
    std::atomic<int> attempts_{0};
    std::atomic<std::uint64_t> connects_{0}, losses_{0}, messages_in_{0}, messages_out_{0};
    std::atomic<std::uint64_t> malformed_{0}, handler_errors_{0}, sends_rejected_{0}, sends_dropped_{0};
    std::atomic<std::int64_t> last_activity_ms_{0};

public:
    StreamLink(boost::asio::io_context &ioc, LinkConfig cfg)
        : strand_(boost::asio::make_strand(ioc)), timer_(strand_), cfg_(std::move(cfg)), ep_(parse_ws_url(cfg_.url))
    {
        if (cfg_.max_attempts < 1)
            throw std::invalid_argument("link max_attempts must be >= 1");
    }

    const LinkConfig &config() const { return cfg_; }
    LinkState state() const { return state_.load(); }

    void on(InboundKind kind, InboundHandler handler) override
    {
        boost::asio::post(strand_, [self = shared_from_this(), kind, h = std::move(handler)]() mutable
                          { self->handlers_[static_cast<std::size_t>(kind)] = std::move(h); });
    }

    // Catch-all for tags this build does not recognise.
    void on_unknown(InboundHandler handler) { on(InboundKind::Unknown, std::move(handler)); }

    void connect()
    {
        boost::asio::post(strand_, [self = shared_from_this()]
                          {
            auto s = self->state_.load();
            if (s == LinkState::Live || s == LinkState::Connecting || s == LinkState::Backoff)
                return;
            self->stopping_ = false;
            self->attempts_ = 0;
            self->do_connect(); });
    }

    bool send(const OutboundMessage &m) override
    {
        if (state_.load() != LinkState::Live)
        {
            ++sends_rejected_;
            log_debug(cfg_.name.c_str(), std::string("cannot send '") + outbound_tag(m) + "': not connected");
            return false;
        }
        boost::asio::post(strand_, [self = shared_from_this(), text = serialize_outbound(m)]() mutable
                          { self->enqueue(std::move(text)); });
        return true;
    }

    void disconnect()
    {
        boost::asio::post(strand_, [self = shared_from_this()]
                          { self->do_close(); });
    }

    LinkStatus status() const
    {
        LinkStatus s;
        s.state = state_.load();
        s.url = cfg_.url;
        s.attempts = attempts_.load();
        s.connects = connects_.load();
        s.losses = losses_.load();
        s.messages_in = messages_in_.load();
        s.messages_out = messages_out_.load();
        s.malformed = malformed_.load();
        s.handler_errors = handler_errors_.load();
        s.sends_rejected = sends_rejected_.load();
        s.sends_dropped = sends_dropped_.load();
        s.last_activity_ms = last_activity_ms_.load();
        return s;
    }

private:
    const char *tag() const { return cfg_.name.c_str(); }

    void touch() { last_activity_ms_ = now_epoch_ms(); }

    void do_connect()
    {
        state_ = LinkState::Connecting;
        auto conn = std::make_shared<Connection>(strand_);
        conn_ = conn;
        log_info(tag(), "connecting to " + cfg_.url + " (attempt " + std::to_string(attempts_.load() + 1) + "/" +
                            std::to_string(cfg_.max_attempts) + ")");
        conn->resolver.async_resolve(ep_.host, ep_.port,
                                     [self = shared_from_this(), conn](boost::beast::error_code ec,
                                                                       boost::asio::ip::tcp::resolver::results_type results)
                                     { self->on_resolve(conn, ec, results); });
    }

    void on_resolve(const std::shared_ptr<Connection> &conn, boost::beast::error_code ec,
                    const boost::asio::ip::tcp::resolver::results_type &results)
    {
        if (conn != conn_)
            return;
        if (ec)
            return on_failure(conn, ec, "resolve");
        auto &lowest = boost::beast::get_lowest_layer(conn->ws);
        lowest.expires_after(cfg_.connect_timeout);
        lowest.async_connect(results, [self = shared_from_this(), conn](boost::beast::error_code ec,
                                                                        const boost::asio::ip::tcp::endpoint &)
                             { self->on_connect(conn, ec); });
    }

    void on_connect(const std::shared_ptr<Connection> &conn, boost::beast::error_code ec)
    {
        if (conn != conn_)
            return;
        if (ec)
            return on_failure(conn, ec, "connect");
        boost::beast::get_lowest_layer(conn->ws).expires_never();

        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = cfg_.connect_timeout;
        opt.idle_timeout = cfg_.idle_timeout;
        opt.keep_alive_pings = true;
        conn->ws.set_option(opt);
        conn->ws.set_option(websocket::stream_base::decorator([](websocket::request_type &req)
                                                              { req.set(boost::beast::http::field::user_agent, "agmo-bridge"); }));
        conn->ws.async_handshake(ep_.host + ":" + ep_.port, ep_.target,
                                 [self = shared_from_this(), conn](boost::beast::error_code ec)
                                 { self->on_handshake(conn, ec); });
    }

    void on_handshake(const std::shared_ptr<Connection> &conn, boost::beast::error_code ec)
    {
        if (conn != conn_)
            return;
        if (ec)
            return on_failure(conn, ec, "handshake");
        state_ = LinkState::Live;
        attempts_ = 0;
        ++connects_;
        touch();
        log_info(tag(), "connected to " + cfg_.url);
        do_read(conn);
    }

    void do_read(const std::shared_ptr<Connection> &conn)
    {
        conn->ws.async_read(conn->buffer, [self = shared_from_this(), conn](boost::beast::error_code ec, std::size_t)
                            { self->on_read(conn, ec); });
    }

    void on_read(const std::shared_ptr<Connection> &conn, boost::beast::error_code ec)
    {
        if (conn != conn_)
            return;
        if (ec)
        {
            if (ec == websocket::error::closed)
                log_warn(tag(), "connection closed by remote");
            return on_failure(conn, ec, "read");
        }
        std::string text = boost::beast::buffers_to_string(conn->buffer.data());
        conn->buffer.consume(conn->buffer.size());
        ++messages_in_;
        touch();
        dispatch(text);
        if (conn == conn_)
            do_read(conn);
    }

    void dispatch(const std::string &text)
    {
        std::string why;
        auto msg = parse_inbound(text, &why);
        if (!msg)
        {
            ++malformed_;
            log_warn(tag(), "dropping malformed message: " + why);
            return;
        }
        const InboundKind kind = msg->kind();
        auto &handler = handlers_[static_cast<std::size_t>(kind)];
        if (!handler)
        {
            if (kind == InboundKind::Unknown)
                log_warn(tag(), "unknown message type: " + std::get<UnknownMsg>(msg->payload).tag);
            else
                log_debug(tag(), std::string("no handler for '") + kind_tag(kind) + "'");
            return;
        }
        try
        {
            handler(*msg);
        }
        catch (const std::exception &e)
        {
            ++handler_errors_;
            log_error(tag(), std::string("handler for '") + kind_tag(kind) + "' failed: " + e.what());
        }
    }

    void enqueue(std::string text)
    {
        if (!conn_ || state_.load() != LinkState::Live)
        {
            ++sends_dropped_;
            return;
        }
        if (conn_->outbox.size() >= cfg_.max_pending_sends)
        {
            ++sends_dropped_;
            log_warn(tag(), "outbound queue full, dropping message");
            return;
        }
        conn_->outbox.push_back(std::move(text));
        if (conn_->outbox.size() == 1)
            do_write(conn_);
    }

    void do_write(const std::shared_ptr<Connection> &conn)
    {
        conn->ws.text(true);
        conn->ws.async_write(boost::asio::buffer(conn->outbox.front()),
                             [self = shared_from_this(), conn](boost::beast::error_code ec, std::size_t)
                             { self->on_write(conn, ec); });
    }

    void on_write(const std::shared_ptr<Connection> &conn, boost::beast::error_code ec)
    {
        if (conn != conn_)
            return;
        if (ec)
            return on_failure(conn, ec, "write");
        ++messages_out_;
        touch();
        conn->outbox.pop_front();
        if (!conn->outbox.empty())
            do_write(conn);
    }

    void on_failure(const std::shared_ptr<Connection> &conn, boost::beast::error_code ec, const char *where)
    {
        if (conn != conn_)
            return;
        conn_.reset();
        boost::beast::error_code ignored;
        boost::beast::get_lowest_layer(conn->ws).socket().close(ignored);
        if (stopping_)
        {
            state_ = LinkState::Closed;
            return;
        }
        if (state_.load() == LinkState::Live)
            ++losses_;
        log_warn(tag(), std::string(where) + " failed: " + ec.message());
        schedule_reconnect();
    }

    void schedule_reconnect()
    {
        const int n = ++attempts_;
        if (n >= cfg_.max_attempts)
        {
            state_ = LinkState::Failed;
            log_error(tag(), "giving up on " + cfg_.url + " after " + std::to_string(n) + " attempts");
            return;
        }
        state_ = LinkState::Backoff;
        log_info(tag(), "reconnecting in " + std::to_string(cfg_.backoff.count()) + "ms (attempt " +
                            std::to_string(n) + "/" + std::to_string(cfg_.max_attempts) + ")");
        timer_.expires_after(cfg_.backoff);
        timer_.async_wait([self = shared_from_this()](boost::beast::error_code ec)
                          {
            if (ec || self->stopping_)
                return;
            self->do_connect(); });
    }

    void do_close()
    {
        if (stopping_ && !conn_)
            return;
        stopping_ = true;
        timer_.cancel();
        auto conn = std::move(conn_);
        conn_.reset();
        const bool was_live = state_.load() == LinkState::Live;
        state_ = LinkState::Closed;
        if (!conn)
            return;
        if (was_live && conn->outbox.empty())
        {
            conn->ws.async_close(websocket::close_code::normal, [conn, name = cfg_.name](boost::beast::error_code ec)
                                 {
                if (ec)
                    log_debug(name.c_str(), "close handshake: " + ec.message()); });
        }
        else
        {
            boost::beast::error_code ignored;
            boost::beast::get_lowest_layer(conn->ws).socket().close(ignored);
        }
        log_info(tag(), "disconnected from " + cfg_.url);
    }
};
