#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/intrusive/list.hpp>
#include <nlohmann/json.hpp>

#include "../namespaces.h"
#include "../util/condition_variable.h"
#include "../util/executor.h"
#include "../util/signal.h"

namespace rendergate { namespace cdp {

using Json = nlohmann::json;

/*
 * A DevTools protocol connection to a browser.
 *
 * Uses "flat" sessions: commands for an attached target carry its
 * `sessionId` and go over the same websocket as browser level ones
 * (which use an empty session id).
 *
 * A single coroutine reads the socket, hands replies to the pending
 * `call`s and events to the subscribers of their session. Writes are
 * serialized. The reading coroutine keeps the connection alive until
 * the socket closes, so the object must be created with `make_shared`.
 */
class Connection : public std::enable_shared_from_this<Connection> {
    using Hook = boost::intrusive::list_base_hook
        <boost::intrusive::link_mode<boost::intrusive::auto_unlink>>;

public:
    using EventHandler = std::function<void( const std::string& method
                                           , const Json& params)>;

    // Handlers stay registered as long as their subscription lives.
    class Subscription : public Hook {
    public:
        Subscription() = default;

        Subscription(Subscription&& other)
            : _session_id(std::move(other._session_id))
            , _handler(std::move(other._handler))
        {
            other.swap_nodes(*this);
        }

        Subscription& operator=(Subscription&& other) {
            if (is_linked()) unlink();
            _session_id = std::move(other._session_id);
            _handler = std::move(other._handler);
            other.swap_nodes(*this);
            return *this;
        }

    private:
        friend class Connection;
        std::string _session_id;
        EventHandler _handler;
    };

public:
    explicit Connection(const util::AsioExecutor&);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    ~Connection();

    // `ws_url` as found in `webSocketDebuggerUrl`.
    void connect(const std::string& ws_url, Cancel&, asio::yield_context);

    // Sends a command and waits for its `result`. Errors returned by
    // the browser are reported as `error::cdp_protocol_error`, a lost
    // connection as `error::browser_exited`.
    Json call( const std::string& method
             , Json params
             , const std::string& session_id
             , Cancel&
             , asio::yield_context);

    Json call( const std::string& method
             , Json params
             , const std::string& session_id
             , asio::yield_context yield)
    {
        Cancel cancel;
        return call(method, std::move(params), session_id, cancel, yield);
    }

    Subscription subscribe(std::string session_id, EventHandler);

    void close();

    bool is_open() const { return _open; }

private:
    struct PendingCall {
        ConditionVariable cv;
        bool done = false;
        sys::error_code ec;
        Json result;

        explicit PendingCall(const util::AsioExecutor& exec) : cv(exec) {}
    };

    using Subscriptions = boost::intrusive::list
        <Subscription, boost::intrusive::constant_time_size<false>>;

    void read_loop(asio::yield_context);
    void send(const std::string&, asio::yield_context);
    void on_message(const std::string&);
    void fail_pending(const sys::error_code&);

private:
    util::AsioExecutor _exec;
    websocket::stream<asio::ip::tcp::socket> _ws;
    bool _open = false;
    uint64_t _next_id = 1;
    std::map<uint64_t, PendingCall*> _pending;
    Subscriptions _subscriptions;
    bool _writing = false;
    ConditionVariable _write_cv;
};

}} // rendergate::cdp namespace
