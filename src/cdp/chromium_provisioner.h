#pragma once

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "../engine.h"
#include "../util/executor.h"

namespace rendergate { namespace cdp {

/*
 * Finds the Chromium executable, running the configured provision
 * command first if there is one.
 *
 * A failing provision command leaves its exit code and output in
 * `error_log` and is reported as `error::provisioning_failure`, as is
 * a missing browser.
 */
class ChromiumProvisioner : public Provisioner {
public:
    ChromiumProvisioner( const util::AsioExecutor&
                       , boost::optional<fs::path> browser_path
                       , boost::optional<std::string> provision_command
                       , fs::path error_log = "provision_error.log");

    fs::path ensure_browser(asio::yield_context) override;

    // Names looked up in `PATH` when no browser path is configured.
    static const std::vector<std::string>& executable_names();

private:
    void run_provision_command(const std::string&, asio::yield_context);
    fs::path find_executable(asio::yield_context);
    void write_error_log(int exit_code, const fs::path& out, const fs::path& err);

private:
    util::AsioExecutor _exec;
    boost::optional<fs::path> _browser_path;
    boost::optional<std::string> _provision_command;
    fs::path _error_log;
};

}} // rendergate::cdp namespace
