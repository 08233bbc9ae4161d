#include "session_config.h"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <vector>

#include "util/str.h"

namespace rendergate {

template<class... Args>
inline
std::runtime_error config_error(Args&&... args) {
    return std::runtime_error(util::str(std::forward<Args>(args)...));
}

// Helper to avoid writing the name of the option twice.
template<typename T>
static boost::optional<T> as_optional(const boost::program_options::variables_map& vm, const char* name) {
    if (vm.count(name) == 0) {
        return boost::none;
    }
    return vm[name].as<T>();
}

void SessionConfig::max_concurrent_pages(size_t n)
{
    if (n == 0) {
        throw config_error("The page concurrency limit must be at least 1");
    }
    _max_concurrent_pages = n;
}

void SessionConfig::default_timeout(std::chrono::milliseconds t)
{
    if (t.count() <= 0) {
        throw config_error("The default timeout must be positive, got "
                          , t.count(), " ms");
    }
    _default_timeout = t;
}

boost::program_options::options_description SessionConfig::description()
{
    using namespace std;
    namespace po = boost::program_options;

    po::options_description general("General options");
    general.add_options()
       ("help", "Produce this help message")
       ("config-file", po::value<string>()
        , "Read further options from this file (INI syntax, "
          "command line options take precedence)")
       ("log-level", po::value<string>()->default_value("error")
        , "Set log level: silly, debug, verbose, info, warn, error, abort")
       ("log-file", po::value<string>()
        , "Also write log messages to this file")
       ;

    po::options_description browser("Browser options");
    browser.add_options()
       ("browser-path", po::value<string>()
        , "Path to the Chromium executable (default: look it up in PATH)")
       ("provision-command", po::value<string>()
        , "Shell command installing the browser and its dependencies, "
          "run before the first launch; its failure aborts start up")
       ("profile-dir", po::value<string>()->default_value("./user_data")
        , "Root of the persistent browser profiles; the direct and proxied "
          "environments use its \"direct\" and \"proxy\" subdirectories")
       ("headless", po::value<bool>()->default_value(true)
        , "Run the browsers without a window")
       ("debug-port", po::value<unsigned>()->default_value(9222)
        , "Remote debugging port of the direct environment; the proxied "
          "environment uses the next one")
       ("debug-address", po::value<string>()->default_value("127.0.0.1")
        , "Address the remote debugging ports listen on")
       ;

    po::options_description routing("Routing options");
    routing.add_options()
       ("proxy", po::value<string>()->default_value("socks5://127.0.0.1:1080")
        , "Proxy server of the proxied environment")
       ("proxy-username", po::value<string>()
        , "User name sent when the proxy asks for authentication")
       ("proxy-password", po::value<string>()
        , "Password sent when the proxy asks for authentication")
       ("proxy-bypass", po::value<string>()
        , "Comma separated hosts the proxied environment reaches directly")
       ("whitelist", po::value<vector<string>>()->composing()
        , "Glob pattern of host names (or host name and path) fetched "
          "through the proxy (can be used several times)")
       ;

    po::options_description fetching("Fetch options");
    fetching.add_options()
       ("max-concurrent-pages", po::value<size_t>()->default_value(5)
        , "Maximum number of fetches holding a page at the same time")
       ("default-retries", po::value<unsigned>()->default_value(2)
        , "Retries after a failed attempt when the fetch does not say")
       ("default-timeout", po::value<unsigned>()->default_value(10000)
        , "Navigation timeout in milliseconds when the fetch does not say")
       ;

    po::options_description desc;
    desc
        .add(general)
        .add(browser)
        .add(routing)
        .add(fetching);
    return desc;
}

SessionConfig::SessionConfig(int argc, const char* argv[])
{
    using namespace std;
    namespace po = boost::program_options;

    auto desc = description();

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);

    if (vm.count("help")) {
        _is_help = true;
        return;
    }

    if (auto path = as_optional<string>(vm, "config-file")) {
        if (!fs::is_regular_file(*path)) {
            throw config_error("No such configuration file: ", *path);
        }
        ifstream conf(*path);
        po::store(po::parse_config_file(conf, desc), vm);
    }

    po::notify(vm);

    {
        auto level_s = vm["log-level"].as<string>();
        auto level = parse_log_level(level_s);
        if (!level) {
            throw config_error("Invalid log level: ", level_s);
        }
        _log_level = *level;
    }

    if (auto path = as_optional<string>(vm, "log-file")) {
        _log_file = fs::path(*path);
    }

    if (auto path = as_optional<string>(vm, "browser-path")) {
        _browser_path = fs::path(*path);
    }

    _provision_command = as_optional<string>(vm, "provision-command");
    _profile_dir = vm["profile-dir"].as<string>();
    _headless = vm["headless"].as<bool>();

    {
        auto port = vm["debug-port"].as<unsigned>();
        // The proxied environment needs `port + 1` as well.
        if (port == 0 || port >= numeric_limits<uint16_t>::max()) {
            throw config_error("Invalid debug port: ", port);
        }
        _debug_port = uint16_t(port);
    }

    _debug_address = vm["debug-address"].as<string>();

    _proxy.server = vm["proxy"].as<string>();
    _proxy.username = as_optional<string>(vm, "proxy-username");
    _proxy.password = as_optional<string>(vm, "proxy-password");
    _proxy.bypass = as_optional<string>(vm, "proxy-bypass");

    if (_proxy.server.empty()) {
        throw config_error("The proxy server must not be empty");
    }

    if (bool(_proxy.username) != bool(_proxy.password)) {
        throw config_error("'--proxy-username' and '--proxy-password' go together");
    }

    if (auto patterns = as_optional<vector<string>>(vm, "whitelist")) {
        _whitelist.insert(patterns->begin(), patterns->end());
    }

    _max_concurrent_pages = vm["max-concurrent-pages"].as<size_t>();
    if (_max_concurrent_pages == 0) {
        throw config_error("'--max-concurrent-pages' must be at least 1");
    }

    _default_retries = vm["default-retries"].as<unsigned>();

    {
        auto ms = vm["default-timeout"].as<unsigned>();
        if (ms == 0) {
            throw config_error("'--default-timeout' must be at least 1 ms");
        }
        _default_timeout = chrono::milliseconds(ms);
    }
}

} // rendergate namespace
