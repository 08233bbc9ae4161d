#pragma once

#include <boost/asio/any_io_executor.hpp>

#include "../namespaces.h"

namespace rendergate { namespace util {

// The type-erased executor every asynchronous component is built on.
using AsioExecutor = asio::any_io_executor;

}} // rendergate::util namespace
