#include "chromium_provisioner.h"

#include <unistd.h>
#include <iterator>
#include <system_error>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/process.hpp>

#include "../async_sleep.h"
#include "../defer.h"
#include "../error.h"
#include "../logger.h"
#include "../or_throw.h"

namespace rendergate { namespace cdp {

using namespace std;
namespace bp = boost::process;

static const chrono::milliseconds exit_poll_interval(100);

static string read_file(const fs::path& p)
{
    fs::ifstream f(p, ios::binary);
    return string(istreambuf_iterator<char>(f), istreambuf_iterator<char>());
}

static bool is_executable(const fs::path& p)
{
    sys::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

ChromiumProvisioner::ChromiumProvisioner( const util::AsioExecutor& exec
                                        , boost::optional<fs::path> browser_path
                                        , boost::optional<string> provision_command
                                        , fs::path error_log)
    : _exec(exec)
    , _browser_path(std::move(browser_path))
    , _provision_command(std::move(provision_command))
    , _error_log(move(error_log))
{}

const vector<string>& ChromiumProvisioner::executable_names()
{
    static const vector<string> names = {
        "chromium",
        "chromium-browser",
        "google-chrome",
        "google-chrome-stable",
    };
    return names;
}

fs::path ChromiumProvisioner::ensure_browser(asio::yield_context yield)
{
    sys::error_code ec;

    if (_provision_command) {
        run_provision_command(*_provision_command, yield[ec]);
        if (ec) return or_throw(yield, ec, fs::path());
    }

    return find_executable(yield);
}

void ChromiumProvisioner::write_error_log( int exit_code
                                         , const fs::path& out
                                         , const fs::path& err)
{
    fs::ofstream log(_error_log, ios::trunc);

    log << "Browser provisioning failed!\n"
        << "Exit code: " << exit_code << "\n"
        << "Standard output:\n" << read_file(out) << "\n"
        << "Standard error:\n" << read_file(err) << "\n";

    if (!log) {
        LOG_ERROR("Failed to write ", _error_log);
    }
}

void ChromiumProvisioner::run_provision_command( const string& command
                                               , asio::yield_context yield)
{
    LOG_INFO("Provisioning browser: ", command);

    sys::error_code ec;

    auto dir = fs::temp_directory_path(ec)
             / fs::unique_path("rendergate-provision-%%%%-%%%%");
    if (!ec) fs::create_directories(dir, ec);

    if (ec) {
        LOG_ERROR("Failed to create a temporary directory: ", ec.message());
        return or_throw(yield, error::provisioning_failure);
    }

    auto remove_dir = defer([&] {
        sys::error_code ignored;
        fs::remove_all(dir, ignored);
    });

    const auto out = dir / "stdout";
    const auto err = dir / "stderr";

    std::error_code process_ec;

    bp::child child(
        bp::search_path("sh"),
        bp::args({ string("-c"), command }),
        bp::std_in < bp::null,
        bp::std_out > out,
        bp::std_err > err,
        bp::error(process_ec));

    if (process_ec) {
        LOG_ERROR("Failed to run the provision command: ", process_ec.message());
        write_error_log(-1, out, err);
        return or_throw(yield, error::provisioning_failure);
    }

    // Polled so other coroutines keep running meanwhile.
    while (child.running(process_ec)) {
        async_sleep(_exec, exit_poll_interval, yield);
    }

    if (process_ec) {
        LOG_ERROR("Lost track of the provision command: ", process_ec.message());
        write_error_log(-1, out, err);
        return or_throw(yield, error::provisioning_failure);
    }

    const int exit_code = child.exit_code();

    if (exit_code != 0) {
        LOG_ERROR("Browser provisioning failed with exit code ", exit_code
                 , ", see ", _error_log);
        write_error_log(exit_code, out, err);
        return or_throw(yield, error::provisioning_failure);
    }
}

fs::path ChromiumProvisioner::find_executable(asio::yield_context yield)
{
    if (_browser_path) {
        if (is_executable(*_browser_path)) return *_browser_path;

        LOG_ERROR("Browser executable not found: ", *_browser_path);
        return or_throw(yield, error::provisioning_failure, fs::path());
    }

    for (const auto& name : executable_names()) {
        auto p = bp::search_path(name);
        if (!p.empty()) {
            LOG_DEBUG("Using browser executable ", p);
            return p;
        }
    }

    LOG_ERROR("No Chromium executable found in PATH");
    return or_throw(yield, error::provisioning_failure, fs::path());
}

}} // rendergate::cdp namespace
