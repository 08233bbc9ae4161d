#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/system/system_error.hpp>
#include "namespaces.h"

namespace rendergate {

/*
 * Reports `ec` the way the caller of a coroutine function asked for it.
 *
 * A function taking `asio::yield_context yield` may be called either as
 * `f(yield)`, in which case errors are expected as exceptions, or as
 * `f(yield[ec])`, in which case they are expected in `ec`. Always use it
 * right after `return`:
 *
 *     return or_throw(yield, ec, value);
 */
template<class Ret>
inline
Ret or_throw( asio::yield_context yield
            , const sys::error_code& ec
            , Ret&& ret = {})
{
    if (!ec) return std::forward<Ret>(ret);
    if (yield.ec_) { *yield.ec_ = ec; }
    else { throw sys::system_error(ec); }
    return std::forward<Ret>(ret);
}

inline
void or_throw(asio::yield_context yield, const sys::error_code& ec)
{
    if (!ec) return;
    if (yield.ec_) { *yield.ec_ = ec; }
    else { throw sys::system_error(ec); }
}

} // rendergate namespace
