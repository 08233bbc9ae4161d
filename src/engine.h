#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

#include <boost/asio/spawn.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>

#include "namespaces.h"

namespace rendergate {

// Navigation-completion condition, see `Page::navigate`.
enum class WaitUntil { commit, domcontentloaded, load, networkidle };

// Category of a network request issued by a page.
enum class ResourceType {
    document, stylesheet, image, media, font, script, texttrack,
    xhr, fetch, eventsource, websocket, manifest, other
};

boost::optional<WaitUntil> parse_wait_until(boost::string_view);
boost::optional<ResourceType> parse_resource_type(boost::string_view);

std::ostream& operator<<(std::ostream&, WaitUntil);
std::ostream& operator<<(std::ostream&, ResourceType);

struct ProxyDescriptor {
    std::string server;  // e.g. "socks5://127.0.0.1:1080"
    boost::optional<std::string> username;
    boost::optional<std::string> password;
    boost::optional<std::string> bypass;
};

struct InterceptedRequest {
    std::string url;
    ResourceType resource_type;
};

enum class RouteDecision { proceed, abort };

using RouteHandler = std::function<RouteDecision(const InterceptedRequest&)>;

/*
 * A single render surface (a browser tab).
 *
 * All operations suspend the calling coroutine and report failures
 * through `yield` (see `or_throw`). Timeouts are reported as
 * `error::navigation_timeout`.
 */
class Page {
public:
    using Duration = std::chrono::milliseconds;

    virtual ~Page() = default;

    // Every request issued by the page from now on is passed to
    // `handler`, which decides whether it goes through.
    virtual void route(RouteHandler handler, asio::yield_context) = 0;

    virtual void navigate( const std::string& url
                         , Duration timeout
                         , WaitUntil
                         , asio::yield_context) = 0;

    virtual void wait_for_selector( const std::string& selector
                                  , Duration timeout
                                  , asio::yield_context) = 0;

    // The serialized DOM of the current document.
    virtual std::string content(asio::yield_context) = 0;

    virtual void set_content(const std::string& html, asio::yield_context) = 0;

    virtual void close(asio::yield_context) = 0;

    virtual bool is_closed() const = 0;
};

using HeaderMap = std::map<std::string, std::string>;

/*
 * An isolated browser profile with its own network route.
 * Closing the last page of a context may terminate it.
 */
class BrowserContext {
public:
    virtual ~BrowserContext() = default;

    virtual std::shared_ptr<Page> new_page(asio::yield_context) = 0;

    // Sent with every request of pages created afterwards.
    virtual void set_extra_http_headers(HeaderMap, asio::yield_context) = 0;

    virtual void close(asio::yield_context) = 0;

    virtual bool is_closed() const = 0;
};

struct ContextOptions {
    // Used in log messages only.
    std::string name;
    fs::path executable;
    fs::path user_data_dir;
    bool headless = true;
    std::string user_agent;
    uint16_t debug_port = 9222;
    std::string debug_address = "127.0.0.1";
    boost::optional<ProxyDescriptor> proxy;
};

class Engine {
public:
    virtual ~Engine() = default;

    virtual void start(asio::yield_context) = 0;

    // Launches a browser bound to a persistent profile directory.
    virtual std::shared_ptr<BrowserContext>
    launch_persistent_context(const ContextOptions&, asio::yield_context) = 0;

    virtual void stop(asio::yield_context) = 0;
};

/*
 * Makes sure the browser binary and its system dependencies exist
 * before the first launch. Returns the path to the browser executable.
 * Failure is reported as `error::provisioning_failure`.
 */
class Provisioner {
public:
    virtual ~Provisioner() = default;

    virtual fs::path ensure_browser(asio::yield_context) = 0;
};

} // rendergate namespace
