#include "context_pool.h"

#include <ostream>
#include <vector>

#include <boost/asio/error.hpp>

#include "logger.h"
#include "or_throw.h"
#include "session_config.h"
#include "util/random.h"
#include "util/str.h"

namespace rendergate {

using namespace std;

static const vector<string> user_agents = {
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/123.0.0.0 Safari/537.36",
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.0 Safari/605.1.15",
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/122.0.0.0 Safari/537.36",
};

static HeaderMap default_headers()
{
    return {
        { "Accept-Language", "zh-CN,zh;q=0.9" },
        // What the usual HTTP client libraries can decode.
        { "Accept-Encoding", "gzip, deflate, br" },
    };
}

ostream& operator<<(ostream& os, Route r)
{
    return os << (r == Route::direct ? "direct" : "proxied");
}

//------------------------------------------------------------------------------
Environment::Environment( Route route
                        , shared_ptr<BrowserContext> context
                        , shared_ptr<Page> sentinel)
    : _route(route)
    , _context(move(context))
    , _sentinel(move(sentinel))
{}

shared_ptr<Page> Environment::new_page(asio::yield_context yield)
{
    return _context->new_page(yield);
}

void Environment::close(asio::yield_context yield)
{
    if (_context->is_closed()) return;

    sys::error_code ec;
    _context->close(yield[ec]);

    if (ec) {
        LOG_ERROR("Error closing ", _route, " environment: ", ec.message());
    }
}

//------------------------------------------------------------------------------
ContextPool::ContextPool(Engine& engine, const SessionConfig& config)
    : _engine(engine)
    , _config(config)
{}

string ContextPool::sentinel_html(Route route, const ProxyDescriptor* proxy)
{
    bool proxied = route == Route::proxied;

    string what = proxied
        ? util::str("代理窗口 server : ", proxy ? proxy->server : string("?"))
        : string("直连窗口");

    return util::str(
        "<html>\n"
        "  <head>\n"
        "    <title>[", proxied ? "Proxy" : "Direct", "] \xF0\x9F\x9A\xAB DON'T CLOSE THE LAST TAB</title>\n"
        "  </head>\n"
        "  <body style=\"color: darkred; padding: 30px;\">\n"
        "    <h2 style=\"color: grey;\"><br/>此为", what, "</h2>\n"
        "    <h1>请勿手动关闭最后一个标签页，否则浏览器将退出，服务会中断，"
                "<a href=\"about:blank\" target=\"_blank\">点击新建标签页</a></h1>\n"
        "    <h2>Do not close the last tab manually, otherwise the browser "
                "will exit and the service will be interrupted</h2>\n"
        "  </body>\n"
        "</html>\n");
}

unique_ptr<Environment>
ContextPool::launch_one( Route route
                       , const fs::path& executable
                       , asio::yield_context yield)
{
    bool proxied = route == Route::proxied;

    ContextOptions opts;
    opts.name = util::str(route);
    opts.executable = executable;
    opts.user_data_dir = _config.profile_dir() / (proxied ? "proxy" : "direct");
    opts.headless = _config.headless();
    opts.user_agent = util::random::choice(user_agents);
    opts.debug_port = _config.debug_port() + (proxied ? 1 : 0);
    opts.debug_address = _config.debug_address();
    if (proxied) opts.proxy = _config.proxy();

    LOG_DEBUG("Launching ", route, " environment on port ", opts.debug_port
             , " with profile ", opts.user_data_dir);

    sys::error_code ec;

    auto context = _engine.launch_persistent_context(opts, yield[ec]);
    if (ec) return or_throw(yield, ec, unique_ptr<Environment>());

    shared_ptr<Page> sentinel;

    context->set_extra_http_headers(default_headers(), yield[ec]);

    if (!ec) sentinel = context->new_page(yield[ec]);

    if (!ec) {
        sentinel->set_content( sentinel_html(route, opts.proxy.get_ptr())
                             , yield[ec]);
    }

    if (ec) {
        sys::error_code close_ec;
        context->close(yield[close_ec]);
        if (close_ec) {
            LOG_ERROR("Error closing half launched ", route, " environment: "
                     , close_ec.message());
        }
        return or_throw(yield, ec, unique_ptr<Environment>());
    }

    return make_unique<Environment>(route, move(context), move(sentinel));
}

void ContextPool::launch( const fs::path& executable
                        , Cancel& cancel
                        , asio::yield_context yield)
{
    sys::error_code ec;

    _direct = launch_one(Route::direct, executable, yield[ec]);

    if (!ec && cancel) ec = asio::error::operation_aborted;

    if (!ec) {
        _proxied = launch_one(Route::proxied, executable, yield[ec]);
    }

    if (!ec && cancel) ec = asio::error::operation_aborted;

    if (ec) {
        if (ec != asio::error::operation_aborted) {
            LOG_ERROR("Failed to launch browser environments: ", ec.message());
        }
        // Closed but not reset, a concurrent `close` may be suspended
        // inside one of them.
        close(yield);
        return or_throw(yield, ec);
    }
}

void ContextPool::close(asio::yield_context yield)
{
    // Each environment is closed on its own: a missing or failing one
    // must not keep the other open.
    if (_direct) _direct->close(yield);
    if (_proxied) _proxied->close(yield);
}

} // rendergate namespace
