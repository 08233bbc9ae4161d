#include "chromium_engine.h"

#include <set>
#include <system_error>

#include <boost/filesystem/operations.hpp>
#include <boost/process.hpp>

#include "discovery.h"
#include "protocol.h"
#include "../async_sleep.h"
#include "../error.h"
#include "../logger.h"
#include "../or_throw.h"
#include "../task.h"
#include "../util/timeout.h"

namespace rendergate { namespace cdp {

using namespace std;
namespace bp = boost::process;

static const chrono::seconds discovery_budget(15);
static const chrono::milliseconds discovery_interval(200);
static const chrono::seconds discovery_attempt_timeout(2);
static const chrono::milliseconds selector_poll_interval(100);
static const chrono::seconds browser_close_timeout(5);
static const int exit_poll_count = 50;
static const chrono::milliseconds exit_poll_interval(100);

static
sys::error_code to_system_error(const std::error_code& ec)
{
    return boost::system::errc::make_error_code(
            static_cast<boost::system::errc::errc_t>(ec.value()));
}

//------------------------------------------------------------------------------
ChromiumPage::ChromiumPage( const util::AsioExecutor& exec
                          , shared_ptr<Connection> conn
                          , string target_id
                          , string session_id
                          , boost::optional<ProxyDescriptor> auth)
    : _exec(exec)
    , _conn(move(conn))
    , _target_id(move(target_id))
    , _session_id(move(session_id))
    , _auth(std::move(auth))
{
    _fetch_events = _conn->subscribe(_session_id,
        [this] (const string& method, const Json& params) {
            on_fetch_event(method, params);
        });
}

Json ChromiumPage::call( const string& method
                       , Json params
                       , Cancel& cancel
                       , asio::yield_context yield)
{
    return _conn->call(method, move(params), _session_id, cancel, yield);
}

Json ChromiumPage::call(const string& method, Json params, asio::yield_context yield)
{
    return _conn->call(method, move(params), _session_id, yield);
}

void ChromiumPage::init(const HeaderMap& headers, asio::yield_context yield)
{
    sys::error_code ec;

    call("Page.enable", {}, yield[ec]);
    if (!ec) call("Page.setLifecycleEventsEnabled", {{"enabled", true}}, yield[ec]);
    if (!ec) call("Network.enable", {}, yield[ec]);

    if (!ec && !headers.empty()) {
        Json h = Json::object();
        for (auto& kv : headers) h[kv.first] = kv.second;
        call("Network.setExtraHTTPHeaders", {{"headers", h}}, yield[ec]);
    }

    if (!ec && _auth && _auth->username) enable_fetch_domain(yield[ec]);

    return or_throw(yield, ec);
}

void ChromiumPage::enable_fetch_domain(asio::yield_context yield)
{
    Json patterns = Json::array();
    patterns.push_back({{"urlPattern", "*"}, {"requestStage", "Request"}});

    const bool with_auth = _auth && _auth->username;

    call("Fetch.enable", { {"patterns", patterns}
                         , {"handleAuthRequests", with_auth} }, yield);
}

void ChromiumPage::route(RouteHandler handler, asio::yield_context yield)
{
    _route_handler = move(handler);
    enable_fetch_domain(yield);
}

void ChromiumPage::on_fetch_event(const string& method, const Json& params)
{
    auto request_id = string_member(params, "requestId");
    if (!request_id) return;

    if (method == "Fetch.requestPaused") {
        InterceptedRequest rq;
        rq.resource_type = resource_type_from_protocol(
                string_member(params, "resourceType").value_or("Other"));

        if (auto r = member(params, "request")) {
            rq.url = string_member(*r, "url").value_or("");
        }

        auto decision = _route_handler ? _route_handler(rq)
                                       : RouteDecision::proceed;

        if (decision == RouteDecision::abort) {
            LOG_SILLY("Aborting ", rq.resource_type, " request: ", rq.url);
            reply("Fetch.failRequest", { {"requestId", *request_id}
                                       , {"errorReason", "BlockedByClient"} });
        }
        else {
            reply("Fetch.continueRequest", {{"requestId", *request_id}});
        }
    }
    else if (method == "Fetch.authRequired") {
        Json response;

        if (_auth && _auth->username) {
            response = { {"response", "ProvideCredentials"}
                       , {"username", *_auth->username}
                       , {"password", _auth->password.value_or("")} };
        }
        else {
            response = {{"response", "Default"}};
        }

        reply("Fetch.continueWithAuth", { {"requestId", *request_id}
                                        , {"authChallengeResponse", response} });
    }
}

void ChromiumPage::reply(string method, Json params)
{
    // The page may be gone by the time the command is written.
    task::spawn_detached(_exec,
        [ conn = _conn
        , session_id = _session_id
        , method = move(method)
        , params = move(params)
        ] (asio::yield_context yield) {
            sys::error_code ec;
            conn->call(method, params, session_id, yield[ec]);

            if (ec && conn->is_open()) {
                LOG_DEBUG("Failed to answer intercepted request: ", ec.message());
            }
        });
}

bool ChromiumPage::do_navigate( const string& url
                              , WaitUntil wait_until
                              , Cancel& cancel
                              , asio::yield_context yield)
{
    sys::error_code ec;

    ConditionVariable cv(_exec);
    // Lifecycle events seen so far, as (loaderId, name) pairs. They may
    // arrive before the `Page.navigate` reply.
    set<pair<string, string>> seen;

    auto lifecycle = _conn->subscribe(_session_id,
        [&] (const string& method, const Json& params) {
            if (method != "Page.lifecycleEvent") return;
            seen.emplace( string_member(params, "loaderId").value_or("")
                        , string_member(params, "name").value_or(""));
            cv.notify();
        });

    auto rs = call("Page.navigate", {{"url", url}}, cancel, yield[ec]);
    if (ec) return or_throw(yield, ec, false);

    auto error_text = string_member(rs, "errorText");

    if (error_text && !error_text->empty()) {
        LOG_DEBUG("Navigation to ", url, " failed: ", *error_text);
        return or_throw(yield, error::transient_fetch_error, false);
    }

    auto event = lifecycle_event_name(wait_until);
    if (!event) return true;

    auto loader_id = string_member(rs, "loaderId");

    // Same document navigations have no loader.
    if (!loader_id || loader_id->empty()) return true;

    while (!seen.count({*loader_id, *event})) {
        cv.wait(cancel, yield[ec]);
        if (ec) return or_throw(yield, ec, false);
    }

    return true;
}

void ChromiumPage::navigate( const string& url
                           , Duration timeout
                           , WaitUntil wait_until
                           , asio::yield_context yield)
{
    if (is_closed()) return or_throw(yield, error::browser_exited);

    sys::error_code ec;
    Cancel cancel;

    util::with_timeout
        ( _exec
        , cancel
        , timeout
        , [&] (Cancel& c, asio::yield_context y) {
              return do_navigate(url, wait_until, c, y);
          }
        , yield[ec]);

    if (ec == asio::error::timed_out) ec = error::navigation_timeout;

    return or_throw(yield, ec);
}

bool ChromiumPage::poll_selector( const string& selector
                                , Cancel& cancel
                                , asio::yield_context yield)
{
    const Json params = { {"expression", selector_visible_expression(selector)}
                        , {"returnByValue", true} };

    while (true) {
        sys::error_code ec;

        auto rs = call("Runtime.evaluate", params, cancel, yield[ec]);
        if (ec) return or_throw(yield, ec, false);

        if (member(rs, "exceptionDetails")) {
            LOG_DEBUG("Invalid selector: ", selector);
            return or_throw(yield, error::cdp_protocol_error, false);
        }

        auto result = member(rs, "result");
        auto value = result ? member(*result, "value") : nullptr;

        if (value && value->is_boolean() && value->get<bool>()) return true;

        if (!async_sleep(_exec, selector_poll_interval, cancel, yield)) {
            return or_throw(yield, asio::error::operation_aborted, false);
        }
    }
}

void ChromiumPage::wait_for_selector( const string& selector
                                    , Duration timeout
                                    , asio::yield_context yield)
{
    if (is_closed()) return or_throw(yield, error::browser_exited);

    sys::error_code ec;
    Cancel cancel;

    util::with_timeout
        ( _exec
        , cancel
        , timeout
        , [&] (Cancel& c, asio::yield_context y) {
              return poll_selector(selector, c, y);
          }
        , yield[ec]);

    if (ec == asio::error::timed_out) ec = error::navigation_timeout;

    return or_throw(yield, ec);
}

string ChromiumPage::content(asio::yield_context yield)
{
    sys::error_code ec;

    auto rs = call("Runtime.evaluate", { {"expression", content_expression()}
                                       , {"returnByValue", true} }, yield[ec]);
    if (ec) return or_throw(yield, ec, string());

    auto result = member(rs, "result");
    auto html = result ? string_member(*result, "value") : boost::none;

    if (!html || member(rs, "exceptionDetails")) {
        return or_throw(yield, error::cdp_protocol_error, string());
    }

    return move(*html);
}

void ChromiumPage::set_content(const string& html, asio::yield_context yield)
{
    sys::error_code ec;

    auto tree = call("Page.getFrameTree", {}, yield[ec]);
    if (ec) return or_throw(yield, ec);

    auto frame_tree = member(tree, "frameTree");
    auto frame = frame_tree ? member(*frame_tree, "frame") : nullptr;
    auto frame_id = frame ? string_member(*frame, "id") : boost::none;

    if (!frame_id) return or_throw(yield, error::cdp_protocol_error);

    call("Page.setDocumentContent", { {"frameId", *frame_id}
                                    , {"html", html} }, yield[ec]);

    return or_throw(yield, ec);
}

void ChromiumPage::close(asio::yield_context yield)
{
    if (_closed) return;
    _closed = true;

    _fetch_events = Connection::Subscription();

    if (!_conn->is_open()) return;

    sys::error_code ec;
    _conn->call("Target.closeTarget", {{"targetId", _target_id}}, "", yield[ec]);

    return or_throw(yield, ec);
}

//------------------------------------------------------------------------------
vector<string> ChromiumContext::command_line(const ContextOptions& o)
{
    vector<string> args = {
        "--remote-debugging-port=" + to_string(o.debug_port),
        "--remote-debugging-address=" + o.debug_address,
        "--user-data-dir=" + o.user_data_dir.string(),
        "--no-first-run",
        "--no-default-browser-check",
        "--no-sandbox",
        "--disable-setuid-sandbox",
        "--disable-gpu",
        "--disable-dev-shm-usage",
        "--disable-blink-features=AutomationControlled",
        "--window-size=820,750",
        "--lang=zh-CN,zh",
    };

    if (o.headless) args.push_back("--headless=new");

    if (!o.user_agent.empty()) args.push_back("--user-agent=" + o.user_agent);

    if (o.proxy) {
        args.push_back("--proxy-server=" + o.proxy->server);

        if (o.proxy->bypass) {
            args.push_back("--proxy-bypass-list=" + *o.proxy->bypass);
        }
    }

    args.push_back("about:blank");

    return args;
}

shared_ptr<ChromiumContext>
ChromiumContext::launch( const util::AsioExecutor& exec
                       , const ContextOptions& options
                       , asio::yield_context yield)
{
    using Ret = shared_ptr<ChromiumContext>;

    sys::error_code ec;

    fs::create_directories(options.user_data_dir, ec);
    if (ec) {
        LOG_ERROR("Failed to create profile directory ", options.user_data_dir
                 , ": ", ec.message());
        return or_throw<Ret>(yield, ec);
    }

    std::error_code process_ec;
    const auto args = command_line(options);

    auto process = make_unique<bp::child>(
        options.executable,
        bp::args(args),
        bp::std_in < bp::null,
        bp::std_out > bp::null,
        bp::std_err > bp::null,
        bp::error(process_ec));

    if (process_ec) {
        LOG_ERROR("Failed to start ", options.executable, ": "
                 , process_ec.message());
        return or_throw<Ret>(yield, to_system_error(process_ec));
    }

    LOG_DEBUG("Started browser for the ", options.name, " environment"
             , " (pid ", process->id(), ")");

    Cancel cancel;
    string ws_url;
    const auto deadline = chrono::steady_clock::now() + discovery_budget;

    while (true) {
        ws_url = util::with_timeout
            ( exec
            , cancel
            , discovery_attempt_timeout
            , [&] (Cancel& c, asio::yield_context y) {
                  return browser_ws_url(exec, options.debug_address
                                       , options.debug_port, c, y);
              }
            , yield[ec]);

        if (!ec) break;

        std::error_code ignored;
        if (!process->running(ignored)) {
            LOG_ERROR("Browser for the ", options.name
                     , " environment exited during startup");
            return or_throw<Ret>(yield, error::browser_exited);
        }

        if (chrono::steady_clock::now() >= deadline) {
            LOG_ERROR("Browser for the ", options.name
                     , " environment did not open its debugging port");
            process->terminate(ignored);
            return or_throw<Ret>(yield, asio::error::timed_out);
        }

        async_sleep(exec, discovery_interval, yield);
    }

    auto conn = make_shared<Connection>(exec);
    conn->connect(ws_url, cancel, yield[ec]);

    if (ec) {
        std::error_code ignored;
        process->terminate(ignored);
        return or_throw<Ret>(yield, ec);
    }

    return make_shared<ChromiumContext>(exec, options, move(process), move(conn));
}

ChromiumContext::ChromiumContext( const util::AsioExecutor& exec
                                , ContextOptions options
                                , unique_ptr<bp::child> process
                                , shared_ptr<Connection> conn)
    : _exec(exec)
    , _options(move(options))
    , _process(move(process))
    , _conn(move(conn))
{}

ChromiumContext::~ChromiumContext()
{
    _conn->close();

    std::error_code ec;
    if (_process->running(ec)) _process->terminate(ec);
}

shared_ptr<Page> ChromiumContext::new_page(asio::yield_context yield)
{
    using Ret = shared_ptr<Page>;

    if (_closed || !_conn->is_open()) {
        return or_throw<Ret>(yield, error::browser_exited);
    }

    sys::error_code ec;

    auto target = _conn->call( "Target.createTarget"
                             , {{"url", "about:blank"}}, "", yield[ec]);
    if (ec) return or_throw<Ret>(yield, ec);

    auto target_id = string_member(target, "targetId");
    if (!target_id) return or_throw<Ret>(yield, error::cdp_protocol_error);

    auto attached = _conn->call( "Target.attachToTarget"
                               , { {"targetId", *target_id}
                                 , {"flatten", true} }, "", yield[ec]);

    auto session_id = ec ? boost::none : string_member(attached, "sessionId");

    if (!session_id) {
        sys::error_code ignored;
        _conn->call("Target.closeTarget", {{"targetId", *target_id}}, "", yield[ignored]);
        return or_throw<Ret>(yield, ec ? ec : error::cdp_protocol_error);
    }

    auto page = std::make_shared<ChromiumPage>( _exec, _conn, *target_id
                                         , *session_id, _options.proxy);

    page->init(_headers, yield[ec]);

    if (ec) {
        sys::error_code ignored;
        page->close(yield[ignored]);
        return or_throw<Ret>(yield, ec);
    }

    return page;
}

void ChromiumContext::set_extra_http_headers(HeaderMap headers, asio::yield_context)
{
    _headers = move(headers);
}

void ChromiumContext::wait_for_exit(asio::yield_context yield)
{
    std::error_code ec;

    for (int i = 0; i < exit_poll_count && _process->running(ec); ++i) {
        async_sleep(_exec, exit_poll_interval, yield);
    }
}

void ChromiumContext::close(asio::yield_context yield)
{
    if (_closed) return;
    _closed = true;

    sys::error_code ec;

    if (_conn->is_open()) {
        Cancel cancel;

        util::with_timeout
            ( _exec
            , cancel
            , browser_close_timeout
            , [&] (Cancel& c, asio::yield_context y) {
                  return _conn->call("Browser.close", {}, "", c, y);
              }
            , yield[ec]);

        // The browser usually goes away before replying.
        if (ec && ec != error::browser_exited) {
            LOG_DEBUG("Browser.close for the ", _options.name
                     , " environment: ", ec.message());
        }
    }

    _conn->close();

    wait_for_exit(yield);

    std::error_code pec;

    if (_process->running(pec)) {
        LOG_WARN("Browser for the ", _options.name
                , " environment did not exit, killing it");
        _process->terminate(pec);

        if (pec) {
            LOG_ERROR("Failed to kill browser: ", pec.message());
            return or_throw(yield, error::cleanup_error);
        }
    }
}

//------------------------------------------------------------------------------
ChromiumEngine::ChromiumEngine(const util::AsioExecutor& exec)
    : _exec(exec)
{}

void ChromiumEngine::start(asio::yield_context)
{
    _started = true;
}

shared_ptr<BrowserContext>
ChromiumEngine::launch_persistent_context( const ContextOptions& options
                                         , asio::yield_context yield)
{
    if (!_started) {
        return or_throw(yield, error::not_ready, shared_ptr<BrowserContext>());
    }

    sys::error_code ec;

    auto context = ChromiumContext::launch(_exec, options, yield[ec]);
    if (ec) return or_throw(yield, ec, shared_ptr<BrowserContext>());

    _contexts.push_back(context);

    return context;
}

void ChromiumEngine::stop(asio::yield_context yield)
{
    if (!_started) return;
    _started = false;

    auto contexts = move(_contexts);

    for (auto& weak : contexts) {
        auto context = weak.lock();
        if (!context || context->is_closed()) continue;

        sys::error_code ec;
        context->close(yield[ec]);
    }
}

}} // rendergate::cdp namespace
