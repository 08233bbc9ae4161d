#pragma once

#include <boost/utility/string_view.hpp>

#include "context_pool.h"
#include "logger.h"
#include "whitelist.h"

namespace rendergate {

// Whitelisted URLs go through the proxied environment, the rest
// through the direct one.
class RouteSelector {
public:
    RouteSelector(const WhitelistStore& whitelist, ContextPool& pool)
        : _whitelist(whitelist)
        , _pool(pool)
    {}

    Route route_for(boost::string_view url) const {
        return _whitelist.matches(url) ? Route::proxied : Route::direct;
    }

    Environment& select(boost::string_view url) const {
        return _pool.get(route_for(url));
    }

private:
    const WhitelistStore& _whitelist;
    ContextPool& _pool;
};

} // rendergate namespace
