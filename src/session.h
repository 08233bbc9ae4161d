#pragma once

#include <memory>
#include <set>
#include <string>

#include <boost/asio/spawn.hpp>
#include <boost/optional.hpp>

#include "context_pool.h"
#include "engine.h"
#include "fetch_orchestrator.h"
#include "session_config.h"
#include "util/concurrency_gate.h"
#include "util/executor.h"
#include "util/signal.h"
#include "whitelist.h"

namespace rendergate {

/*
 * Fetches fully rendered HTML through a pair of long-lived browser
 * environments, routing whitelisted URLs through a proxy.
 *
 * Usage:
 *
 *     asio::spawn(ctx, [&] (asio::yield_context yield) {
 *         auto session = Session::create(ctx.get_executor(), config, yield);
 *         session->whitelist_update({"*.example.com"});
 *
 *         FetchRequest rq("https://www.example.com/");
 *         rq.abort = { ResourceType::image, ResourceType::media };
 *
 *         if (auto html = session->fetch(rq, yield)) {
 *             // ...
 *         }
 *
 *         session->close(yield);
 *     });
 *
 * All member functions must be called from coroutines running on the
 * session's executor.
 */
class Session {
public:
    enum class State { uninitialized, initializing, ready, closed };

public:
    Session( const util::AsioExecutor&
           , SessionConfig
           , std::unique_ptr<Engine>
           , std::unique_ptr<Provisioner>);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    ~Session();

    // A started session backed by Chromium over the DevTools protocol.
    static std::unique_ptr<Session> create( const util::AsioExecutor&
                                          , SessionConfig
                                          , asio::yield_context);

    // Provisions the browser, starts the engine and launches both
    // environments. On failure the session goes back to
    // `uninitialized`; a provisioning failure is reported as
    // `error::provisioning_failure`. A `close` while starting wins: the
    // session stays closed and this fails with `operation_aborted`.
    void start(asio::yield_context);

    // The rendered document, or none once all attempts failed. Fails
    // with `error::not_ready` unless the session is ready.
    boost::optional<std::string> fetch(const FetchRequest&, asio::yield_context);

    // Adds patterns to the proxy whitelist; existing ones stay.
    void whitelist_update(const std::set<std::string>& patterns);

    // Closes the direct environment, the proxied one and the engine.
    // Never fails; calling it more than once is fine.
    void close(asio::yield_context);

    State state() const { return _state; }

    const SessionConfig& config() const { return _config; }
    const WhitelistStore& whitelist() const { return _whitelist; }
    const ConcurrencyGate& gate() const { return _gate; }

    // Direct access to the environments for flows `fetch` does not
    // cover. Only valid while the session is ready.
    BrowserContext& direct_context() { return _pool.direct().context(); }
    BrowserContext& proxied_context() { return _pool.proxied().context(); }

private:
    void stop_engine(asio::yield_context);

private:
    util::AsioExecutor _exec;
    SessionConfig _config;
    std::unique_ptr<Engine> _engine;
    std::unique_ptr<Provisioner> _provisioner;
    State _state = State::uninitialized;
    WhitelistStore _whitelist;
    ConcurrencyGate _gate;
    ContextPool _pool;
    std::shared_ptr<Cancel> _shutdown;
    FetchOrchestrator _orchestrator;
    bool _engine_started = false;
};

std::ostream& operator<<(std::ostream&, Session::State);

} // rendergate namespace
