#pragma once

#include <cassert>
#include <functional>

#include <boost/asio/error.hpp>
#include <boost/intrusive/list.hpp>
#include <boost/system/error_code.hpp>

#include "../namespaces.h"
#include "../or_throw.h"

namespace rendergate {

/*
 * One-shot notification with scoped subscribers.
 *
 * Firing the signal calls every connected slot once and disconnects
 * them all; the signal then stays "fired" (`operator bool` is true).
 * A `Connection` unlinks itself when destroyed, so slots capturing
 * stack variables are safe as long as the connection lives on the
 * same stack frame.
 */
template<typename T>
class Signal {
private:
    template<class K>
    using List = boost::intrusive::list<K, boost::intrusive::constant_time_size<false>>;
    using Hook = boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>;

public:
    class Connection : public Hook
    {
    public:
        Connection() = default;

        Connection(Connection&& other)
            : _slot(std::move(other._slot))
            , _call_count(other._call_count)
        {
            other._call_count = 0;
            other.swap_nodes(*this);
        }

        Connection& operator=(Connection&& other) {
            _slot = std::move(other._slot);
            _call_count = other._call_count;
            other._call_count = 0;
            other.swap_nodes(*this);
            return *this;
        }

        size_t call_count() const { return _call_count; }

        operator bool() const { return call_count() != 0; }

    private:
        friend class Signal;
        std::function<T> _slot;
        size_t _call_count = 0;
    };

public:
    Signal() = default;

    Signal(const Signal&)            = delete;
    Signal& operator=(const Signal&) = delete;

    // A child signal fires whenever its parent does, but may also be
    // fired on its own without affecting the parent.
    explicit Signal(Signal& parent)
        : _parent_connection(parent.connect([this] { (*this)(); }))
    {}

    template<typename... Args>
    void operator()(Args&&... args)
    {
        ++_call_count;

        auto connections = std::move(_connections);
        for (auto& connection : connections) {
            ++connection._call_count;
            connection._slot(std::forward<Args>(args)...);
        }
    }

    size_t call_count() const { return _call_count; }

    operator bool() const { return call_count() != 0; }

    Connection connect(std::function<T> slot)
    {
        Connection connection;
        connection._slot = std::move(slot);
        _connections.push_back(connection);
        return connection;
    }

    size_t size() const { return _connections.size(); }

private:
    List<Connection> _connections;
    size_t _call_count = 0;
    Connection _parent_connection;
};

using Cancel = Signal<void()>;

// Normalizes the error of an async call made under `cancel`:
// a fired `cancel` always wins over whatever the call reported.
inline
sys::error_code
compute_error_code( const sys::error_code& ec
                  , const Cancel& cancel)
{
    if (cancel) return asio::error::operation_aborted;
    return ec;
}

#define return_or_throw_on_error(yield, cancel, ec, ...) { \
    sys::error_code ec_ = compute_error_code(ec, cancel); \
    if (ec_) return or_throw(yield, ec_, ##__VA_ARGS__); \
}

} // rendergate namespace
