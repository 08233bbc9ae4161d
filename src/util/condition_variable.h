#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/intrusive/list.hpp>

#include "executor.h"
#include "signal.h"

namespace rendergate {

/*
 * Coroutine condition variable.
 *
 * `wait` suspends the calling coroutine until `notify` is called (from
 * the same executor), the passed `Cancel` fires or the variable is
 * destroyed. The two latter cases complete the wait with
 * `operation_aborted`. A notification wakes every waiter present at
 * the time of the call; there is no stored state, so callers re-check
 * their predicate in a loop.
 */
class ConditionVariable {
    using Sig = void(sys::error_code);

    using IntrusiveHook = boost::intrusive::list_base_hook
        <boost::intrusive::link_mode
            <boost::intrusive::auto_unlink>>;

    struct WaitEntry : IntrusiveHook {
        bool canceled = false;
        std::function<Sig> handler;

        void operator()(const sys::error_code& ec) {
            // Moved out so the entry may be destroyed by the handler.
            auto h = std::move(handler);
            if (canceled) h(asio::error::operation_aborted);
            else h(ec);
        }
    };

    using IntrusiveList = boost::intrusive::list
        <WaitEntry, boost::intrusive::constant_time_size<false>>;

public:
    explicit ConditionVariable(const util::AsioExecutor&);

    ConditionVariable(const ConditionVariable&) = delete;
    ConditionVariable& operator=(const ConditionVariable&) = delete;

    ~ConditionVariable();

    util::AsioExecutor get_executor() const { return _exec; }

    void notify(const sys::error_code& ec = sys::error_code());

    void wait(Cancel&, asio::yield_context yield);
    void wait(asio::yield_context yield);

    bool has_waiters() const { return !_on_notify.empty(); }

private:
    util::AsioExecutor _exec;
    IntrusiveList _on_notify;
};

inline
ConditionVariable::ConditionVariable(const util::AsioExecutor& exec)
    : _exec(exec)
{
}

inline
ConditionVariable::~ConditionVariable()
{
    notify(asio::error::operation_aborted);
}

inline
void ConditionVariable::notify(const sys::error_code& ec)
{
    while (!_on_notify.empty()) {
        auto& e = _on_notify.front();
        asio::post(_exec, [&e, ec] () mutable { e(ec); });
        _on_notify.pop_front();
    }
}

inline
void ConditionVariable::wait(Cancel& cancel, asio::yield_context yield)
{
    auto work = asio::make_work_guard(_exec);

    WaitEntry entry;

    asio::async_completion<asio::yield_context, Sig> init(yield);
    entry.handler = std::move(init.completion_handler);
    _on_notify.push_back(entry);

    auto slot = cancel.connect([&] {
        entry.canceled = true;

        // Already notified: the posted completion will see `canceled`.
        if (!entry.is_linked()) return;

        entry.unlink();

        asio::post(_exec, [&entry] () mutable {
            entry(asio::error::operation_aborted);
        });
    });

    return init.result.get();
}

inline
void ConditionVariable::wait(asio::yield_context yield)
{
    Cancel dummy_cancel;
    wait(dummy_cancel, yield);
}

} // rendergate namespace
