#include "session.h"

#include <ostream>

#include <boost/asio/error.hpp>

#include "cdp/chromium_engine.h"
#include "cdp/chromium_provisioner.h"
#include "error.h"
#include "logger.h"
#include "or_throw.h"

namespace rendergate {

using namespace std;

ostream& operator<<(ostream& os, Session::State s)
{
    switch (s) {
        case Session::State::uninitialized: return os << "uninitialized";
        case Session::State::initializing:  return os << "initializing";
        case Session::State::ready:         return os << "ready";
        case Session::State::closed:        return os << "closed";
    }
    return os << "???";
}

Session::Session( const util::AsioExecutor& exec
                , SessionConfig config
                , unique_ptr<Engine> engine
                , unique_ptr<Provisioner> provisioner)
    : _exec(exec)
    , _config(move(config))
    , _engine(move(engine))
    , _provisioner(move(provisioner))
    , _whitelist(_config.whitelist())
    , _gate(_exec, _config.max_concurrent_pages())
    , _pool(*_engine, _config)
    , _shutdown(make_shared<Cancel>())
    , _orchestrator( _exec
                   , _gate
                   , RouteSelector(_whitelist, _pool)
                   , FetchOrchestrator::Defaults{ _config.default_retries()
                                                , _config.default_timeout() }
                   , _shutdown)
{
    logger.set_threshold(_config.log_level());

    if (_config.log_file()) {
        logger.log_to_file(_config.log_file()->string());
    }
}

Session::~Session()
{
    // Lets detached page closes and retry pauses wind down.
    if (!*_shutdown) (*_shutdown)();
}

unique_ptr<Session> Session::create( const util::AsioExecutor& exec
                                   , SessionConfig config
                                   , asio::yield_context yield)
{
    auto provisioner = std::make_unique<cdp::ChromiumProvisioner>
        (exec, config.browser_path(), config.provision_command());

    auto engine = std::make_unique<cdp::ChromiumEngine>(exec);

    auto session = std::make_unique<Session>( exec
                                       , move(config)
                                       , move(engine)
                                       , move(provisioner));

    sys::error_code ec;
    session->start(yield[ec]);

    return or_throw(yield, ec, move(session));
}

void Session::start(asio::yield_context yield)
{
    if (_state != State::uninitialized) {
        return or_throw(yield, error::not_ready);
    }

    _state = State::initializing;

    sys::error_code ec;

    auto executable = _provisioner->ensure_browser(yield[ec]);

    if (_state == State::closed) {
        return or_throw(yield, asio::error::operation_aborted);
    }

    if (ec) {
        LOG_ERROR("Browser provisioning failed: ", ec.message());
        _state = State::uninitialized;
        // Whatever went wrong, the session cannot be used.
        return or_throw(yield, error::provisioning_failure);
    }

    _engine->start(yield[ec]);

    if (!ec) _engine_started = true;

    if (_state == State::closed) {
        stop_engine(yield);
        return or_throw(yield, asio::error::operation_aborted);
    }

    if (ec) {
        LOG_ERROR("Failed to start the browser engine: ", ec.message());
        _state = State::uninitialized;
        return or_throw(yield, ec);
    }

    _pool.launch(executable, *_shutdown, yield[ec]);

    if (_state == State::closed) {
        // The pool has closed whatever it launched after `close` ran.
        stop_engine(yield);
        return or_throw(yield, asio::error::operation_aborted);
    }

    if (ec) {
        stop_engine(yield);
        _state = State::uninitialized;
        return or_throw(yield, ec);
    }

    _state = State::ready;
    LOG_INFO("Session ready, direct port ", _config.debug_port()
            , ", proxied port ", _config.debug_port() + 1);
}

boost::optional<string>
Session::fetch(const FetchRequest& rq, asio::yield_context yield)
{
    if (_state != State::ready) {
        LOG_ERROR("Fetch of ", rq.url, " on a session which is ", _state);
        return or_throw(yield, error::not_ready, boost::optional<string>());
    }

    return _orchestrator.fetch(rq, yield);
}

void Session::whitelist_update(const set<string>& patterns)
{
    _whitelist.update(patterns);
}

void Session::close(asio::yield_context yield)
{
    if (_state == State::closed) return;

    _state = State::closed;

    if (!*_shutdown) (*_shutdown)();

    _pool.close(yield);

    stop_engine(yield);
}

void Session::stop_engine(asio::yield_context yield)
{
    if (!_engine_started) return;

    // Cleared first so that `start` and `close` never both stop it.
    _engine_started = false;

    sys::error_code ec;
    _engine->stop(yield[ec]);

    if (ec) {
        LOG_ERROR("Error stopping the browser engine: ", ec.message());
    }
}

} // rendergate namespace
