#define BOOST_TEST_MODULE session_config
#include <boost/test/included/unit_test.hpp>

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <boost/filesystem.hpp>

#include <namespaces.h>
#include <session_config.h>

BOOST_AUTO_TEST_SUITE(rendergate_session_config)

using namespace std;
using namespace rendergate;

static SessionConfig parse(vector<const char*> args)
{
    args.insert(args.begin(), "rendergate");
    return SessionConfig(int(args.size()), args.data());
}

BOOST_AUTO_TEST_CASE(test_defaults) {
    auto c = parse({});

    BOOST_REQUIRE(!c.is_help());
    BOOST_REQUIRE_EQUAL(c.max_concurrent_pages(), 5u);
    BOOST_REQUIRE_EQUAL(c.proxy().server, "socks5://127.0.0.1:1080");
    BOOST_REQUIRE(!c.proxy().username);
    BOOST_REQUIRE(c.whitelist().empty());
    BOOST_REQUIRE(c.headless());
    BOOST_REQUIRE(!c.browser_path());
    BOOST_REQUIRE_EQUAL(c.profile_dir().string(), "./user_data");
    BOOST_REQUIRE_EQUAL(c.debug_port(), 9222);
    BOOST_REQUIRE_EQUAL(c.debug_address(), "127.0.0.1");
    BOOST_REQUIRE_EQUAL(c.default_retries(), 2u);
    BOOST_REQUIRE_EQUAL(c.default_timeout().count(), 10000);
    BOOST_REQUIRE(!c.provision_command());
    BOOST_REQUIRE_EQUAL(c.log_level(), ERROR);
    BOOST_REQUIRE(!c.log_file());

    // Programmatic defaults agree with the parsed ones.
    SessionConfig d;
    BOOST_REQUIRE_EQUAL(d.max_concurrent_pages(), c.max_concurrent_pages());
    BOOST_REQUIRE_EQUAL(d.proxy().server, c.proxy().server);
    BOOST_REQUIRE_EQUAL(d.debug_port(), c.debug_port());
    BOOST_REQUIRE_EQUAL(d.default_timeout().count(), c.default_timeout().count());
    BOOST_REQUIRE_EQUAL(d.log_level(), c.log_level());
}

BOOST_AUTO_TEST_CASE(test_options) {
    auto c = parse({ "--max-concurrent-pages", "3"
                   , "--proxy", "http://10.0.0.1:3128"
                   , "--proxy-username", "user"
                   , "--proxy-password", "secret"
                   , "--whitelist", "*.dmm.co.jp"
                   , "--whitelist", "example.com/path*"
                   , "--headless", "false"
                   , "--debug-port", "9300"
                   , "--default-retries", "0"
                   , "--default-timeout", "2500"
                   , "--log-level", "debug"
                   });

    BOOST_REQUIRE_EQUAL(c.max_concurrent_pages(), 3u);
    BOOST_REQUIRE_EQUAL(c.proxy().server, "http://10.0.0.1:3128");
    BOOST_REQUIRE_EQUAL(*c.proxy().username, "user");
    BOOST_REQUIRE_EQUAL(*c.proxy().password, "secret");
    BOOST_REQUIRE_EQUAL(c.whitelist().size(), 2u);
    BOOST_REQUIRE(c.whitelist().count("*.dmm.co.jp"));
    BOOST_REQUIRE(!c.headless());
    BOOST_REQUIRE_EQUAL(c.debug_port(), 9300);
    BOOST_REQUIRE_EQUAL(c.default_retries(), 0u);
    BOOST_REQUIRE_EQUAL(c.default_timeout().count(), 2500);
    BOOST_REQUIRE_EQUAL(c.log_level(), DEBUG);
}

BOOST_AUTO_TEST_CASE(test_help) {
    BOOST_REQUIRE(parse({"--help"}).is_help());
}

BOOST_AUTO_TEST_CASE(test_invalid) {
    BOOST_REQUIRE_THROW(parse({"--log-level", "loud"}), std::runtime_error);
    BOOST_REQUIRE_THROW(parse({"--debug-port", "0"}), std::runtime_error);
    BOOST_REQUIRE_THROW(parse({"--debug-port", "65535"}), std::runtime_error);
    BOOST_REQUIRE_THROW(parse({"--proxy", ""}), std::runtime_error);
    BOOST_REQUIRE_THROW(parse({"--proxy-username", "user"}), std::runtime_error);
    BOOST_REQUIRE_THROW(parse({"--max-concurrent-pages", "0"}), std::runtime_error);
    BOOST_REQUIRE_THROW(parse({"--default-timeout", "0"}), std::runtime_error);
    BOOST_REQUIRE_THROW(parse({"--config-file", "/nonexistent/rendergate.conf"}), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_invalid_setters) {
    SessionConfig c;

    BOOST_REQUIRE_THROW(c.max_concurrent_pages(0), std::runtime_error);
    BOOST_REQUIRE_THROW(c.default_timeout(chrono::milliseconds(0)), std::runtime_error);
    BOOST_REQUIRE_THROW(c.default_timeout(chrono::milliseconds(-5)), std::runtime_error);

    // Rejected values leave the previous ones in place.
    BOOST_REQUIRE_EQUAL(c.max_concurrent_pages(), 5u);
    BOOST_REQUIRE_EQUAL(c.default_timeout().count(), 10000);

    c.max_concurrent_pages(1);
    BOOST_REQUIRE_EQUAL(c.max_concurrent_pages(), 1u);
}

BOOST_AUTO_TEST_CASE(test_config_file) {
    auto path = fs::temp_directory_path()
              / fs::unique_path("rendergate-test-%%%%-%%%%.conf");

    {
        ofstream f(path.string());
        f << "max-concurrent-pages = 7\n"
          << "whitelist = a.test\n"
          << "whitelist = b.test\n"
          << "default-retries = 4\n";
    }

    auto c = parse({ "--config-file", path.c_str()
                   , "--default-retries", "1" });

    fs::remove(path);

    BOOST_REQUIRE_EQUAL(c.max_concurrent_pages(), 7u);
    BOOST_REQUIRE_EQUAL(c.whitelist().size(), 2u);
    // The command line wins.
    BOOST_REQUIRE_EQUAL(c.default_retries(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
