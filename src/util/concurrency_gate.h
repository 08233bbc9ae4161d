#pragma once

#include <boost/intrusive/list.hpp>

#include "condition_variable.h"
#include "executor.h"
#include "signal.h"
#include "../or_throw.h"

namespace rendergate {

/*
 * Counting semaphore for coroutines.
 *
 * At most `capacity` `Slot`s exist at any time. `wait_for_slot`
 * suspends the caller until one is free; the returned slot is given
 * back when it is destroyed (or moved over), so holding it in a local
 * variable keeps the slot for exactly the lifetime of that scope:
 *
 *     ConcurrencyGate gate(exec, 5);
 *
 *     spawn(exec, [&] (asio::yield_context yield) {
 *         sys::error_code ec;
 *         auto slot = gate.wait_for_slot(yield[ec]);
 *         if (ec) return;
 *         // at most 5 coroutines run this part at once
 *     });
 *
 * Waiters are woken in arrival order, but callers should not rely on
 * it. Destroying the gate aborts every pending wait with
 * `operation_aborted` and detaches outstanding slots.
 */
class ConcurrencyGate {
private:
    using ListHook = boost::intrusive::list_base_hook<>;

    template<class T>
    using List = boost::intrusive::list<T>;

    struct Waiter : public ListHook {
        Waiter(const util::AsioExecutor& exec) : cv(exec) {}
        ConditionVariable cv;
    };

public:
    class Slot : public ListHook {
    public:
        Slot() : _gate(nullptr) {}

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        Slot(Slot&& o) : _gate(o._gate) {
            swap_nodes(o);
            o._gate = nullptr;
        }

        Slot& operator=(Slot&& o) {
            if (_gate) _gate->release(*this);

            swap_nodes(o);
            _gate = o._gate;
            o._gate = nullptr;
            return *this;
        }

        bool is_held() const { return _gate != nullptr; }

        ~Slot();

    private:
        friend class ConcurrencyGate;
        explicit Slot(ConcurrencyGate* g) : _gate(g) {}

    private:
        ConcurrencyGate* _gate = nullptr;
    };

public:
    ConcurrencyGate(const util::AsioExecutor&, size_t capacity);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    Slot wait_for_slot(asio::yield_context yield);
    Slot wait_for_slot(Cancel&, asio::yield_context yield);

    size_t capacity() const { return _capacity; }

    size_t in_use() const { return _slots.size(); }
    size_t waiting() const { return _waiters.size(); }

    ~ConcurrencyGate();

private:
    void release(Slot&);

private:
    util::AsioExecutor _exec;
    size_t _capacity;
    List<Slot> _slots;
    List<Waiter> _waiters;
};

inline
ConcurrencyGate::ConcurrencyGate(const util::AsioExecutor& exec, size_t capacity)
    : _exec(exec)
    , _capacity(capacity)
{}

inline
ConcurrencyGate::Slot ConcurrencyGate::wait_for_slot(asio::yield_context yield)
{
    Cancel unused_cancel;
    return wait_for_slot(unused_cancel, yield);
}

inline
ConcurrencyGate::Slot ConcurrencyGate::wait_for_slot( Cancel& cancel
                                                    , asio::yield_context yield)
{
    while (_slots.size() >= _capacity) {
        Waiter waiter(_exec);

        _waiters.push_back(waiter);

        sys::error_code ec;
        bool cancelled = false;

        {
            auto con = cancel.connect([&] {
                // Out of the queue at once, so `release` never picks it.
                if (waiter.is_linked()) {
                    _waiters.erase(_waiters.iterator_to(waiter));
                    cancelled = true;
                }
                waiter.cv.notify(asio::error::operation_aborted);
            });

            waiter.cv.wait(yield[ec]);
        }

        if (cancel) ec = asio::error::operation_aborted;

        if (!waiter.is_linked() && !cancelled) {
            // The gate went away while we were waiting.
            if (!ec) ec = asio::error::operation_aborted;
            return or_throw(yield, ec, Slot());
        }

        if (waiter.is_linked()) {
            _waiters.erase(_waiters.iterator_to(waiter));
        }

        if (ec) {
            // A `release` may have woken us just before the cancel,
            // hand its wakeup over.
            if (_slots.size() < _capacity && !_waiters.empty()) {
                _waiters.front().cv.notify();
            }
            return or_throw(yield, ec, Slot());
        }
    }

    Slot slot(this);
    _slots.push_back(slot);
    return slot;
}

inline
ConcurrencyGate::Slot::~Slot() {
    if (_gate) _gate->release(*this);
}

inline
void ConcurrencyGate::release(Slot& slot)
{
    _slots.erase(_slots.iterator_to(slot));
    slot._gate = nullptr;
    if (_waiters.empty()) return;
    _waiters.front().cv.notify();
}

inline
ConcurrencyGate::~ConcurrencyGate()
{
    for (auto& slot : _slots) {
        slot._gate = nullptr;
    }
    _slots.clear();

    auto waiters = std::move(_waiters);
    for (auto& waiter : waiters) {
        waiter.cv.notify(asio::error::operation_aborted);
    }
}

} // rendergate namespace
