#pragma once

#include <memory>
#include <string>

#include <boost/asio/spawn.hpp>
#include <boost/optional.hpp>

#include "engine.h"
#include "namespaces.h"
#include "util/signal.h"

namespace rendergate {

class SessionConfig;

enum class Route { direct, proxied };

std::ostream& operator<<(std::ostream&, Route);

/*
 * A launched browser context plus its sentinel page.
 *
 * The sentinel is a placeholder tab kept open for the whole life of
 * the environment: browsers exit when their last tab goes away, and
 * fetch pages are closed all the time.
 */
class Environment {
public:
    Environment( Route
               , std::shared_ptr<BrowserContext>
               , std::shared_ptr<Page> sentinel);

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    Route route() const { return _route; }

    std::shared_ptr<Page> new_page(asio::yield_context);

    BrowserContext& context() { return *_context; }

    const Page& sentinel() const { return *_sentinel; }

    bool is_closed() const { return _context->is_closed(); }

    // Best effort; errors are logged.
    void close(asio::yield_context);

private:
    Route _route;
    std::shared_ptr<BrowserContext> _context;
    std::shared_ptr<Page> _sentinel;
};

/*
 * The two long-lived environments of a session: one reaching the
 * network directly and one going through the configured proxy. Both
 * are the same kind of browser launch, they only differ in profile
 * directory, debug port and proxy.
 */
class ContextPool {
public:
    ContextPool(Engine&, const SessionConfig&);

    ContextPool(const ContextPool&) = delete;
    ContextPool& operator=(const ContextPool&) = delete;

    // Launches the direct environment, then the proxied one. On error,
    // or if `cancel` fires meanwhile (`operation_aborted`), whatever was
    // launched is closed again.
    void launch(const fs::path& executable, Cancel& cancel, asio::yield_context);

    Environment& direct() { return *_direct; }
    Environment& proxied() { return *_proxied; }
    Environment& get(Route r) { return r == Route::direct ? direct() : proxied(); }

    // Closes the direct environment, then the proxied one. Each close
    // is attempted regardless of the other; errors are logged only.
    // Calling it again is a no-op.
    void close(asio::yield_context);

    static std::string sentinel_html(Route, const ProxyDescriptor*);

private:
    std::unique_ptr<Environment> launch_one( Route
                                           , const fs::path& executable
                                           , asio::yield_context);

private:
    Engine& _engine;
    const SessionConfig& _config;
    std::unique_ptr<Environment> _direct;
    std::unique_ptr<Environment> _proxied;
};

} // rendergate namespace
