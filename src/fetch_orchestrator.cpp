#include "fetch_orchestrator.h"

#include <cstdint>

#include <boost/format.hpp>

#include "async_sleep.h"
#include "error.h"
#include "logger.h"
#include "or_throw.h"
#include "task.h"
#include "util/random.h"

namespace rendergate {

using namespace std;
using Clock = chrono::steady_clock;

constexpr chrono::milliseconds FetchOrchestrator::retry_backoff;
constexpr chrono::milliseconds FetchOrchestrator::page_close_delay_min;
constexpr chrono::milliseconds FetchOrchestrator::page_close_delay_max;

static bool is_timeout(const sys::error_code& ec)
{
    return ec == error::navigation_timeout || ec == asio::error::timed_out;
}

FetchOrchestrator::FetchOrchestrator( const util::AsioExecutor& exec
                                    , ConcurrencyGate& gate
                                    , RouteSelector routes
                                    , Defaults defaults
                                    , shared_ptr<Cancel> shutdown)
    : _exec(exec)
    , _gate(gate)
    , _routes(move(routes))
    , _defaults(defaults)
    , _shutdown(move(shutdown))
{}

string FetchOrchestrator::attempt( Environment& env
                                 , const FetchRequest& rq
                                 , chrono::milliseconds timeout
                                 , WaitUntil wait_until
                                 , shared_ptr<Page>& page
                                 , asio::yield_context yield)
{
    sys::error_code ec;

    page = env.new_page(yield[ec]);
    if (ec) return or_throw(yield, ec, string());

    if (!rq.abort.empty()) {
        page->route([abort = rq.abort] (const InterceptedRequest& r) {
                return abort.count(r.resource_type) ? RouteDecision::abort
                                                    : RouteDecision::proceed;
            }, yield[ec]);
        if (ec) return or_throw(yield, ec, string());
    }

    page->navigate(rq.url, timeout, wait_until, yield[ec]);
    if (ec) return or_throw(yield, ec, string());

    if (rq.selector) {
        page->wait_for_selector(*rq.selector, timeout, yield[ec]);
        if (ec) return or_throw(yield, ec, string());
    }

    auto html = page->content(yield[ec]);
    return or_throw(yield, ec, move(html));
}

boost::optional<string>
FetchOrchestrator::fetch(const FetchRequest& rq, asio::yield_context yield)
{
    const unsigned retries = rq.retries ? *rq.retries : _defaults.retries;
    const auto timeout = rq.timeout ? *rq.timeout : _defaults.timeout;
    const auto wait_until = rq.wait_until ? *rq.wait_until : WaitUntil::load;

    sys::error_code ec;

    // Released on every way out of this function.
    auto slot = _gate.wait_for_slot(yield[ec]);
    if (ec) return or_throw(yield, ec, boost::optional<string>());

    Environment& env = _routes.select(rq.url);

    LOG_DEBUG("Fetching ", rq.url, " through the ", env.route(), " environment");

    // Wide enough that `retries + 1` cannot wrap.
    const uint64_t attempts = uint64_t(retries) + 1;

    for (uint64_t attempt_n = 1; attempt_n <= attempts; ++attempt_n) {
        const bool is_last = attempt_n == attempts;
        const auto start = Clock::now();

        shared_ptr<Page> page;
        string content;
        string failure;

        ec = {};

        try {
            content = attempt(env, rq, timeout, wait_until, page, yield[ec]);
        }
        catch (const std::exception& e) {
            ec = error::transient_fetch_error;
            failure = e.what();
        }

        if (page) schedule_close(move(page));

        if (!ec) {
            chrono::duration<double> elapsed = Clock::now() - start;
            LOG_INFO("Success [", rq.url, "] in "
                    , boost::format("%.2f") % elapsed.count(), "s");
            return content;
        }

        if (is_timeout(ec)) {
            LOG_WARN("Timeout on attempt ", attempt_n, " for ", rq.url);
            if (is_last) return boost::none;
            continue;
        }

        LOG_ERROR("Error on attempt ", attempt_n, " for ", rq.url, ": "
                 , failure.empty() ? ec.message() : failure);

        if (is_last) return boost::none;

        if (!async_sleep(_exec, retry_backoff, *_shutdown, yield)) {
            LOG_DEBUG("Session closing, giving up on ", rq.url);
            return boost::none;
        }
    }

    return boost::none;
}

void FetchOrchestrator::schedule_close(shared_ptr<Page> page)
{
    auto delay = util::random::duration_between( page_close_delay_min
                                               , page_close_delay_max);

    task::spawn_detached(_exec,
        [ exec = _exec
        , page = move(page)
        , shutdown = _shutdown
        , delay
        ] (asio::yield_context yield) {
            // Pages still waiting when the session closes are left to
            // go away with their browser.
            if (!async_sleep(exec, delay, *shutdown, yield)) return;

            sys::error_code ec;
            page->close(yield[ec]);

            if (ec) {
                LOG_ERROR("Error closing page: ", ec.message());
            }
        });
}

} // rendergate namespace
