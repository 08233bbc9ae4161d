#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include "namespaces.h"

#include "util/executor.h"
#include "util/signal.h"

namespace rendergate {

// Suspends the coroutine for `duration`. Returns false if `cancel`
// fired before or during the sleep.
bool async_sleep( const util::AsioExecutor& exec
                , asio::steady_timer::duration duration
                , Cancel& cancel
                , asio::yield_context yield);

inline
bool async_sleep( const util::AsioExecutor& exec
                , asio::steady_timer::duration duration
                , asio::yield_context yield)
{
    Cancel never;
    return async_sleep(exec, duration, never, yield);
}

} // rendergate namespace
