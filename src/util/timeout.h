#pragma once

#include <memory>

#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>

#include "executor.h"
#include "signal.h"

namespace rendergate { namespace util {

/*
 * Fires `abort_signal()` once `duration` elapses or the outer signal
 * fires, whichever comes first. Destroying the object disarms it.
 */
class Timeout {
    struct State {
        asio::steady_timer timer;
        Cancel local_abort_signal;
        bool finished = false;
        bool timed_out = false;

        State(const AsioExecutor& ex)
            : timer(ex)
        {}
    };

public:
    template<class Duration>
    Timeout( const AsioExecutor& ex
           , Cancel& outer
           , Duration duration)
        : _state(std::make_shared<State>(ex))
    {
        _outer_connection = outer.connect([s = _state] {
                if (!s->local_abort_signal) s->local_abort_signal();
            });

        _state->timer.expires_after(duration);
        _state->timer.async_wait([s = _state] (const sys::error_code&) {
                if (s->finished) return;
                s->timed_out = true;
                if (!s->local_abort_signal) s->local_abort_signal();
            });
    }

    Timeout(const Timeout&) = delete;
    Timeout& operator=(const Timeout&) = delete;

    Cancel& abort_signal()
    {
        return _state->local_abort_signal;
    }

    bool timed_out() const
    {
        return _state->timed_out;
    }

    ~Timeout()
    {
        _state->finished = true;
        _state->timer.cancel();
    }

private:
    std::shared_ptr<State> _state;
    Cancel::Connection _outer_connection;
};

/*
 * Runs `f(abort_signal, yield)` so that it gets aborted after
 * `duration`. An abort caused by the deadline (rather than by `cancel`)
 * is reported as `asio::error::timed_out`.
 */
template<class Duration, class F>
auto with_timeout( const AsioExecutor& ex
                 , Cancel& cancel
                 , Duration duration
                 , const F& f
                 , asio::yield_context yield)
{
    Timeout timeout(ex, cancel, duration);

    sys::error_code ec;

    auto ret = f(timeout.abort_signal(), yield[ec]);

    if (timeout.timed_out() && !cancel) {
        ec = asio::error::timed_out;
    }

    return or_throw(yield, ec, std::move(ret));
}

}} // namespaces
