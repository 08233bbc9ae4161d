#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/process/child.hpp>

#include "connection.h"
#include "../engine.h"

namespace rendergate { namespace cdp {

class ChromiumPage : public Page {
public:
    ChromiumPage( const util::AsioExecutor&
                , std::shared_ptr<Connection>
                , std::string target_id
                , std::string session_id
                , boost::optional<ProxyDescriptor> auth);

    // Enables the domains a page needs and applies `headers`.
    void init(const HeaderMap& headers, asio::yield_context);

    void route(RouteHandler, asio::yield_context) override;

    void navigate( const std::string& url
                 , Duration timeout
                 , WaitUntil
                 , asio::yield_context) override;

    void wait_for_selector( const std::string& selector
                          , Duration timeout
                          , asio::yield_context) override;

    std::string content(asio::yield_context) override;

    void set_content(const std::string& html, asio::yield_context) override;

    void close(asio::yield_context) override;

    bool is_closed() const override { return _closed || !_conn->is_open(); }

    const std::string& target_id() const { return _target_id; }

private:
    Json call(const std::string& method, Json params, Cancel&, asio::yield_context);
    Json call(const std::string& method, Json params, asio::yield_context);

    bool do_navigate(const std::string& url, WaitUntil, Cancel&, asio::yield_context);
    bool poll_selector(const std::string& selector, Cancel&, asio::yield_context);

    void enable_fetch_domain(asio::yield_context);
    void on_fetch_event(const std::string& method, const Json& params);
    void reply(std::string method, Json params);

private:
    util::AsioExecutor _exec;
    std::shared_ptr<Connection> _conn;
    std::string _target_id;
    std::string _session_id;
    boost::optional<ProxyDescriptor> _auth;
    RouteHandler _route_handler;
    Connection::Subscription _fetch_events;
    bool _closed = false;
};

/*
 * A Chromium process with its own profile directory, driven over its
 * DevTools websocket.
 */
class ChromiumContext : public BrowserContext {
public:
    // Starts the browser and connects to it. Fails with
    // `asio::error::timed_out` if the debugging endpoint does not come
    // up in time, or with `error::browser_exited` if the process dies.
    static std::shared_ptr<ChromiumContext>
    launch(const util::AsioExecutor&, const ContextOptions&, asio::yield_context);

    ChromiumContext( const util::AsioExecutor&
                   , ContextOptions
                   , std::unique_ptr<boost::process::child>
                   , std::shared_ptr<Connection>);

    ChromiumContext(const ChromiumContext&) = delete;
    ChromiumContext& operator=(const ChromiumContext&) = delete;

    ~ChromiumContext();

    std::shared_ptr<Page> new_page(asio::yield_context) override;

    void set_extra_http_headers(HeaderMap, asio::yield_context) override;

    // Asks the browser to exit and kills it if it does not.
    void close(asio::yield_context) override;

    bool is_closed() const override { return _closed; }

    // Arguments the browser is started with.
    static std::vector<std::string> command_line(const ContextOptions&);

private:
    void wait_for_exit(asio::yield_context);

private:
    util::AsioExecutor _exec;
    ContextOptions _options;
    std::unique_ptr<boost::process::child> _process;
    std::shared_ptr<Connection> _conn;
    HeaderMap _headers;
    bool _closed = false;
};

/*
 * Launches one Chromium process per persistent context. There is no
 * driver process of its own, `stop` closes whatever contexts are still
 * open.
 */
class ChromiumEngine : public Engine {
public:
    explicit ChromiumEngine(const util::AsioExecutor&);

    void start(asio::yield_context) override;

    std::shared_ptr<BrowserContext>
    launch_persistent_context(const ContextOptions&, asio::yield_context) override;

    void stop(asio::yield_context) override;

private:
    util::AsioExecutor _exec;
    bool _started = false;
    std::vector<std::weak_ptr<ChromiumContext>> _contexts;
};

}} // rendergate::cdp namespace
