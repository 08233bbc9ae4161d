#pragma once

// In-process stand-in for the browser backend. Pages "load" by sleeping
// on the executor according to a per URL script, and everything they
// do ends up in a shared `Journal` the tests inspect afterwards.

#include <algorithm>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/asio/spawn.hpp>

#include <async_sleep.h>
#include <engine.h>
#include <error.h>
#include <namespaces.h>
#include <or_throw.h>
#include <util/executor.h>

namespace rendergate { namespace mock {

using Clock = std::chrono::steady_clock;

struct Outcome {
    enum Kind { ok, timeout, fail };

    Kind kind = ok;
    std::chrono::milliseconds delay{0};
    std::string html = "<html><body>ok</body></html>";

    static Outcome success(std::string html, std::chrono::milliseconds delay = {}) {
        Outcome o;
        o.html = std::move(html);
        o.delay = delay;
        return o;
    }

    static Outcome timed_out() {
        Outcome o;
        o.kind = timeout;
        return o;
    }

    static Outcome failure(std::chrono::milliseconds delay = {}) {
        Outcome o;
        o.kind = fail;
        o.delay = delay;
        return o;
    }
};

struct Journal {
    struct Navigation {
        std::string url;
        std::string context;
        Clock::time_point at;
    };

    // Consumed front first, the last entry is reused once alone.
    std::map<std::string, std::deque<Outcome>> script;
    // Requests a page issues while loading a given URL.
    std::map<std::string, std::vector<InterceptedRequest>> subresources;
    // Context name whose launch fails.
    std::string failing_launch;
    // How long each context launch takes.
    std::chrono::milliseconds launch_delay{0};

    unsigned engine_starts = 0;
    unsigned engine_stops = 0;
    std::vector<std::string> launched;
    std::vector<std::string> closed_contexts;

    std::vector<Navigation> navigations;
    std::vector<InterceptedRequest> aborted;
    std::vector<InterceptedRequest> proceeded;

    size_t active_pages = 0;
    size_t max_active_pages = 0;
    size_t pages_closed = 0;
    bool sentinel_closed = false;

    Outcome next_outcome(const std::string& url) {
        auto i = script.find(url);
        if (i == script.end() || i->second.empty()) return Outcome();
        auto o = i->second.front();
        if (i->second.size() > 1) i->second.pop_front();
        return o;
    }

    size_t attempts(const std::string& url) const {
        return std::count_if(navigations.begin(), navigations.end(),
                [&] (const Navigation& n) { return n.url == url; });
    }
};

class MockPage : public Page {
public:
    MockPage( const util::AsioExecutor& exec
            , std::shared_ptr<Journal> journal
            , std::string context_name)
        : _exec(exec)
        , _journal(std::move(journal))
        , _context_name(std::move(context_name))
    {
        begin();
    }

    ~MockPage() { end(); }

    void route(RouteHandler handler, asio::yield_context) override {
        _handler = std::move(handler);
    }

    void navigate( const std::string& url
                 , Duration timeout
                 , WaitUntil
                 , asio::yield_context yield) override
    {
        if (_closed) return or_throw(yield, error::browser_exited);

        _journal->navigations.push_back({url, _context_name, Clock::now()});

        for (auto& rq : _journal->subresources[url]) {
            auto d = _handler ? _handler(rq) : RouteDecision::proceed;
            if (d == RouteDecision::abort) _journal->aborted.push_back(rq);
            else _journal->proceeded.push_back(rq);
        }

        auto outcome = _journal->next_outcome(url);

        if (outcome.kind == Outcome::timeout || outcome.delay > timeout) {
            async_sleep(_exec, timeout, yield);
            end();
            return or_throw(yield, error::navigation_timeout);
        }

        async_sleep(_exec, outcome.delay, yield);

        if (outcome.kind == Outcome::fail) {
            end();
            return or_throw(yield, error::transient_fetch_error);
        }

        _html = outcome.html;
    }

    void wait_for_selector( const std::string& selector
                          , Duration timeout
                          , asio::yield_context yield) override
    {
        if (_html.find(selector) != std::string::npos) return;
        async_sleep(_exec, timeout, yield);
        end();
        return or_throw(yield, error::navigation_timeout);
    }

    std::string content(asio::yield_context) override {
        end();
        return _html;
    }

    void set_content(const std::string& html, asio::yield_context) override {
        // Only sentinels get their content set.
        _sentinel = true;
        _html = html;
        end();
    }

    void close(asio::yield_context) override {
        if (_closed) return;
        _closed = true;
        end();
        ++_journal->pages_closed;
        if (_sentinel) _journal->sentinel_closed = true;
    }

    bool is_closed() const override { return _closed; }

    bool is_sentinel() const { return _sentinel; }

private:
    void begin() {
        _active = true;
        auto n = ++_journal->active_pages;
        _journal->max_active_pages = std::max(_journal->max_active_pages, n);
    }

    void end() {
        if (!_active) return;
        _active = false;
        --_journal->active_pages;
    }

private:
    util::AsioExecutor _exec;
    std::shared_ptr<Journal> _journal;
    std::string _context_name;
    RouteHandler _handler;
    std::string _html;
    bool _active = false;
    bool _sentinel = false;
    bool _closed = false;
};

class MockContext : public BrowserContext {
public:
    MockContext( const util::AsioExecutor& exec
               , std::shared_ptr<Journal> journal
               , ContextOptions options)
        : _exec(exec)
        , _journal(std::move(journal))
        , _options(std::move(options))
    {}

    std::shared_ptr<Page> new_page(asio::yield_context yield) override {
        if (_closed) {
            return or_throw(yield, error::browser_exited, std::shared_ptr<Page>());
        }
        return std::make_shared<MockPage>(_exec, _journal, _options.name);
    }

    void set_extra_http_headers(HeaderMap h, asio::yield_context) override {
        _headers = std::move(h);
    }

    void close(asio::yield_context) override {
        if (_closed) return;
        _closed = true;
        _journal->closed_contexts.push_back(_options.name);
    }

    bool is_closed() const override { return _closed; }

    const ContextOptions& options() const { return _options; }
    const HeaderMap& headers() const { return _headers; }

private:
    util::AsioExecutor _exec;
    std::shared_ptr<Journal> _journal;
    ContextOptions _options;
    HeaderMap _headers;
    bool _closed = false;
};

class MockEngine : public Engine {
public:
    MockEngine(const util::AsioExecutor& exec, std::shared_ptr<Journal> journal)
        : _exec(exec)
        , _journal(std::move(journal))
    {}

    void start(asio::yield_context) override {
        ++_journal->engine_starts;
    }

    std::shared_ptr<BrowserContext>
    launch_persistent_context( const ContextOptions& options
                             , asio::yield_context yield) override
    {
        if (_journal->launch_delay.count()) {
            async_sleep(_exec, _journal->launch_delay, yield);
        }

        if (options.name == _journal->failing_launch) {
            return or_throw( yield, error::browser_exited
                           , std::shared_ptr<BrowserContext>());
        }

        _journal->launched.push_back(options.name);
        auto c = std::make_shared<MockContext>(_exec, _journal, options);
        contexts.push_back(c);
        return c;
    }

    void stop(asio::yield_context) override {
        ++_journal->engine_stops;
    }

    std::vector<std::shared_ptr<MockContext>> contexts;

private:
    util::AsioExecutor _exec;
    std::shared_ptr<Journal> _journal;
};

class MockProvisioner : public Provisioner {
public:
    explicit MockProvisioner(bool fail = false) : _fail(fail) {}

    fs::path ensure_browser(asio::yield_context yield) override {
        if (_fail) {
            return or_throw(yield, asio::error::not_found, fs::path());
        }
        return "/usr/bin/chromium";
    }

private:
    bool _fail;
};

}} // rendergate::mock namespace
