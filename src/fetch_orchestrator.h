#pragma once

#include <chrono>
#include <memory>
#include <set>
#include <string>

#include <boost/asio/spawn.hpp>
#include <boost/optional.hpp>

#include "engine.h"
#include "route_selector.h"
#include "util/concurrency_gate.h"
#include "util/executor.h"
#include "util/signal.h"

namespace rendergate {

struct FetchRequest {
    std::string url;
    // Attempts after the first one; the session default if unset.
    boost::optional<unsigned> retries;
    // Bounds navigation and selector wait, each on its own.
    boost::optional<std::chrono::milliseconds> timeout;
    // `WaitUntil::load` if unset.
    boost::optional<WaitUntil> wait_until;
    boost::optional<std::string> selector;
    // Requests of these types are aborted while loading the page.
    std::set<ResourceType> abort;

    FetchRequest() = default;
    FetchRequest(std::string url) : url(std::move(url)) {}
};

/*
 * Per request control loop.
 *
 * A fetch holds one gate slot for its whole retry sequence and sticks
 * to the environment chosen for its URL at the start, even if the
 * whitelist changes meanwhile. Every attempt opens its own page; pages
 * are never closed inline but by a detached coroutine after a random
 * delay, which gives up if `shutdown` fires first.
 *
 * A timed out attempt is retried right away, any other failure after a
 * one second pause. Once the attempts are exhausted the fetch returns
 * none; the kind of the last failure only shows up in the log.
 */
class FetchOrchestrator {
public:
    struct Defaults {
        unsigned retries;
        std::chrono::milliseconds timeout;
    };

    static constexpr std::chrono::milliseconds retry_backoff{1000};
    static constexpr std::chrono::milliseconds page_close_delay_min{1000};
    static constexpr std::chrono::milliseconds page_close_delay_max{7000};

public:
    FetchOrchestrator( const util::AsioExecutor&
                     , ConcurrencyGate&
                     , RouteSelector
                     , Defaults
                     , std::shared_ptr<Cancel> shutdown);

    FetchOrchestrator(const FetchOrchestrator&) = delete;
    FetchOrchestrator& operator=(const FetchOrchestrator&) = delete;

    // Only fails (through `yield`) if the gate is torn down while
    // waiting for a slot.
    boost::optional<std::string>
    fetch(const FetchRequest&, asio::yield_context);

    Defaults defaults() const { return _defaults; }

private:
    std::string attempt( Environment&
                       , const FetchRequest&
                       , std::chrono::milliseconds timeout
                       , WaitUntil
                       , std::shared_ptr<Page>& page
                       , asio::yield_context);

    void schedule_close(std::shared_ptr<Page>);

private:
    util::AsioExecutor _exec;
    ConcurrencyGate& _gate;
    RouteSelector _routes;
    Defaults _defaults;
    std::shared_ptr<Cancel> _shutdown;
};

} // rendergate namespace
