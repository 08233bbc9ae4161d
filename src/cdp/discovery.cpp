#include "discovery.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include "protocol.h"
#include "../error.h"
#include "../or_throw.h"
#include "../util/str.h"

namespace rendergate { namespace cdp {

using namespace std;
using tcp = asio::ip::tcp;

string browser_ws_url( const util::AsioExecutor& exec
                     , const string& address
                     , uint16_t port
                     , Cancel& cancel
                     , asio::yield_context yield)
{
    sys::error_code ec;

    tcp::resolver resolver(exec);
    tcp::socket socket(exec);

    auto cancel_slot = cancel.connect([&] {
        resolver.cancel();
        sys::error_code ignored;
        socket.close(ignored);
    });

    auto endpoints = resolver.async_resolve(address, to_string(port), yield[ec]);
    return_or_throw_on_error(yield, cancel, ec, string());

    asio::async_connect(socket, endpoints, yield[ec]);
    return_or_throw_on_error(yield, cancel, ec, string());

    http::request<http::empty_body> rq{http::verb::get, "/json/version", 11};
    rq.set(http::field::host, util::str(address, ':', port));
    rq.set(http::field::accept, "application/json");

    http::async_write(socket, rq, yield[ec]);
    return_or_throw_on_error(yield, cancel, ec, string());

    beast::flat_buffer buffer;
    http::response<http::string_body> rs;

    http::async_read(socket, buffer, rs, yield[ec]);
    return_or_throw_on_error(yield, cancel, ec, string());

    if (rs.result() != http::status::ok) {
        return or_throw(yield, error::cdp_protocol_error, string());
    }

    auto body = Json::parse(rs.body(), nullptr, false);
    auto url = string_member(body, "webSocketDebuggerUrl");

    if (!url) return or_throw(yield, error::cdp_protocol_error, string());

    return *url;
}

}} // rendergate::cdp namespace
