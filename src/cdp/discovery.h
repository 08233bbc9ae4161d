#pragma once

#include <cstdint>
#include <string>

#include <boost/asio/spawn.hpp>

#include "../namespaces.h"
#include "../util/executor.h"
#include "../util/signal.h"

namespace rendergate { namespace cdp {

// Asks the browser's debugging HTTP endpoint (`/json/version`) for the
// websocket URL of its browser target.
std::string browser_ws_url( const util::AsioExecutor&
                          , const std::string& address
                          , uint16_t port
                          , Cancel&
                          , asio::yield_context);

}} // rendergate::cdp namespace
