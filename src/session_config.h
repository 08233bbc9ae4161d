#pragma once

#include <chrono>
#include <cstdint>
#include <set>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "engine.h"
#include "logger.h"
#include "namespaces.h"

namespace rendergate {

class SessionConfig {
public:
    // All options at their defaults.
    SessionConfig() = default;

    // Parses command line style arguments (`argv[0]` is skipped) and
    // the file given with `--config-file`, if any. Throws on error.
    SessionConfig(int argc, const char* argv[]);

    SessionConfig(SessionConfig&&) = default;
    SessionConfig& operator=(SessionConfig&&) = default;

    SessionConfig(const SessionConfig&) = default;
    SessionConfig& operator=(const SessionConfig&) = default;

    // Throws unless `n` is at least 1.
    size_t max_concurrent_pages() const { return _max_concurrent_pages; }
    void max_concurrent_pages(size_t n);

    const ProxyDescriptor& proxy() const { return _proxy; }
    void proxy(ProxyDescriptor p) { _proxy = std::move(p); }

    const std::set<std::string>& whitelist() const { return _whitelist; }
    void whitelist(std::set<std::string> w) { _whitelist = std::move(w); }

    bool headless() const { return _headless; }
    void headless(bool v) { _headless = v; }

    // Use this browser executable instead of looking it up in PATH.
    const boost::optional<fs::path>& browser_path() const { return _browser_path; }
    void browser_path(fs::path p) { _browser_path = std::move(p); }

    // Each environment keeps its profile in a subdirectory of this one.
    const fs::path& profile_dir() const { return _profile_dir; }
    void profile_dir(fs::path p) { _profile_dir = std::move(p); }

    // The direct environment listens on this port, the proxied one
    // on the next.
    uint16_t debug_port() const { return _debug_port; }
    void debug_port(uint16_t p) { _debug_port = p; }

    const std::string& debug_address() const { return _debug_address; }
    void debug_address(std::string a) { _debug_address = std::move(a); }

    unsigned default_retries() const { return _default_retries; }
    void default_retries(unsigned n) { _default_retries = n; }

    // Throws unless `t` is positive.
    std::chrono::milliseconds default_timeout() const { return _default_timeout; }
    void default_timeout(std::chrono::milliseconds t);

    // Shell command run before the browser is looked up.
    const boost::optional<std::string>& provision_command() const { return _provision_command; }
    void provision_command(std::string c) { _provision_command = std::move(c); }

    log_level_t log_level() const { return _log_level; }
    void log_level(log_level_t l) { _log_level = l; }

    const boost::optional<fs::path>& log_file() const { return _log_file; }
    void log_file(fs::path p) { _log_file = std::move(p); }

    bool is_help() const { return _is_help; }

    static boost::program_options::options_description description();

private:
    bool _is_help = false;
    size_t _max_concurrent_pages = 5;
    ProxyDescriptor _proxy{"socks5://127.0.0.1:1080", {}, {}, {}};
    std::set<std::string> _whitelist;
    bool _headless = true;
    boost::optional<fs::path> _browser_path;
    fs::path _profile_dir = "./user_data";
    uint16_t _debug_port = 9222;
    std::string _debug_address = "127.0.0.1";
    unsigned _default_retries = 2;
    std::chrono::milliseconds _default_timeout{10000};
    boost::optional<std::string> _provision_command;
    log_level_t _log_level = ERROR;
    boost::optional<fs::path> _log_file;
};

} // rendergate namespace
