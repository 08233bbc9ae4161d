#include "connection.h"

#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include "protocol.h"
#include "../defer.h"
#include "../error.h"
#include "../logger.h"
#include "../or_throw.h"
#include "../task.h"
#include "../util/url.h"

namespace rendergate { namespace cdp {

using namespace std;
using tcp = asio::ip::tcp;

// Full page snapshots and serialized documents can be big.
static const size_t max_message_size = 256 * 1024 * 1024;

Connection::Connection(const util::AsioExecutor& exec)
    : _exec(exec)
    , _ws(exec)
    , _write_cv(exec)
{}

Connection::~Connection()
{
    fail_pending(error::browser_exited);
}

void Connection::connect( const string& ws_url
                        , Cancel& cancel
                        , asio::yield_context yield)
{
    auto url = util::Url::from(ws_url);

    if (!url || url->scheme != "ws") {
        LOG_ERROR("Invalid DevTools endpoint: ", ws_url);
        return or_throw(yield, error::cdp_protocol_error);
    }

    sys::error_code ec;

    tcp::resolver resolver(_exec);

    auto cancel_slot = cancel.connect([&] {
        resolver.cancel();
        sys::error_code ignored;
        _ws.next_layer().close(ignored);
    });

    auto endpoints = resolver.async_resolve( url->host
                                           , url->port_or_default()
                                           , yield[ec]);
    return_or_throw_on_error(yield, cancel, ec);

    asio::async_connect(_ws.next_layer(), endpoints, yield[ec]);
    return_or_throw_on_error(yield, cancel, ec);

    _ws.read_message_max(max_message_size);

    _ws.async_handshake(url->host_and_port(), url->target(), yield[ec]);
    return_or_throw_on_error(yield, cancel, ec);

    _ws.text(true);
    _open = true;

    task::spawn_detached(_exec,
        [self = shared_from_this()] (asio::yield_context yield) {
            self->read_loop(yield);
        });
}

Json Connection::call( const string& method
                     , Json params
                     , const string& session_id
                     , Cancel& cancel
                     , asio::yield_context yield)
{
    if (!_open) return or_throw(yield, error::browser_exited, Json());

    // Keep alive until this call returns even if the owner lets go.
    auto self = shared_from_this();

    auto id = _next_id++;

    Json msg = { { "id", id }
               , { "method", method }
               , { "params", params.is_null() ? Json::object() : move(params) } };

    if (!session_id.empty()) msg["sessionId"] = session_id;

    PendingCall pending(_exec);
    _pending[id] = &pending;
    auto unregister = defer([&] { _pending.erase(id); });

    sys::error_code ec;

    send(msg.dump(), yield[ec]);
    return_or_throw_on_error(yield, cancel, ec, Json());

    while (!pending.done) {
        pending.cv.wait(cancel, yield[ec]);
        return_or_throw_on_error(yield, cancel, ec, Json());
    }

    if (pending.ec) {
        LOG_DEBUG("DevTools call ", method, " failed: ", pending.result.dump());
        return or_throw(yield, pending.ec, Json());
    }

    return move(pending.result);
}

Connection::Subscription
Connection::subscribe(string session_id, EventHandler handler)
{
    Subscription s;
    s._session_id = move(session_id);
    s._handler = move(handler);
    _subscriptions.push_back(s);
    return s;
}

void Connection::close()
{
    if (!_open) return;
    _open = false;

    sys::error_code ec;
    _ws.next_layer().shutdown(tcp::socket::shutdown_both, ec);
    _ws.next_layer().close(ec);

    fail_pending(error::browser_exited);
}

void Connection::send(const string& data, asio::yield_context yield)
{
    sys::error_code ec;

    while (_writing) {
        _write_cv.wait(yield[ec]);
        if (ec) return or_throw(yield, ec);
    }

    if (!_open) return or_throw(yield, error::browser_exited);

    _writing = true;
    auto release = defer([&] {
        _writing = false;
        _write_cv.notify();
    });

    _ws.async_write(asio::buffer(data), yield[ec]);

    if (ec) {
        LOG_DEBUG("DevTools write failed: ", ec.message());
        return or_throw(yield, error::browser_exited);
    }
}

void Connection::read_loop(asio::yield_context yield)
{
    while (true) {
        sys::error_code ec;
        beast::flat_buffer buffer;

        _ws.async_read(buffer, yield[ec]);

        if (ec) {
            if (_open) {
                LOG_DEBUG("DevTools connection lost: ", ec.message());
            }
            break;
        }

        on_message(beast::buffers_to_string(buffer.data()));
    }

    _open = false;
    fail_pending(error::browser_exited);
}

void Connection::on_message(const string& data)
{
    auto msg = Json::parse(data, nullptr, false);

    if (msg.is_discarded() || !msg.is_object()) {
        LOG_WARN("Ignoring malformed DevTools message");
        return;
    }

    if (auto id = member(msg, "id")) {
        if (!id->is_number_unsigned()) return;

        auto i = _pending.find(id->get<uint64_t>());
        if (i == _pending.end()) return;

        auto& pending = *i->second;
        pending.done = true;

        if (auto err = member(msg, "error")) {
            pending.ec = error::cdp_protocol_error;
            pending.result = *err;
        }
        else if (auto result = member(msg, "result")) {
            pending.result = *result;
        }
        else {
            pending.result = Json::object();
        }

        pending.cv.notify();
        return;
    }

    auto method = string_member(msg, "method");
    if (!method) return;

    auto session_id = string_member(msg, "sessionId").value_or("");

    Json params;
    if (auto p = member(msg, "params")) params = *p;

    // Handlers may add or drop subscriptions.
    vector<EventHandler> handlers;
    for (auto& s : _subscriptions) {
        if (s._session_id == session_id) handlers.push_back(s._handler);
    }

    for (auto& h : handlers) h(*method, params);
}

void Connection::fail_pending(const sys::error_code& ec)
{
    for (auto& p : _pending) {
        auto& pending = *p.second;
        if (pending.done) continue;
        pending.done = true;
        pending.ec = ec;
        pending.cv.notify();
    }
}

}} // rendergate::cdp namespace
