#define BOOST_TEST_MODULE cdp
#include <boost/test/included/unit_test.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/filesystem.hpp>

#include <cdp/chromium_engine.h>
#include <cdp/chromium_provisioner.h>
#include <cdp/protocol.h>
#include <error.h>
#include <namespaces.h>

BOOST_AUTO_TEST_SUITE(rendergate_cdp)

using namespace std;
using namespace rendergate;
using namespace rendergate::cdp;

static bool has(const vector<string>& v, const string& s) {
    return find(v.begin(), v.end(), s) != v.end();
}

static string slurp(const fs::path& p) {
    ifstream f(p.string());
    stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

BOOST_AUTO_TEST_CASE(test_resource_types) {
    BOOST_REQUIRE_EQUAL(resource_type_from_protocol("Document"), ResourceType::document);
    BOOST_REQUIRE_EQUAL(resource_type_from_protocol("Image"), ResourceType::image);
    BOOST_REQUIRE_EQUAL(resource_type_from_protocol("XHR"), ResourceType::xhr);
    BOOST_REQUIRE_EQUAL(resource_type_from_protocol("EventSource"), ResourceType::eventsource);
    BOOST_REQUIRE_EQUAL(resource_type_from_protocol("WebSocket"), ResourceType::websocket);
    BOOST_REQUIRE_EQUAL(resource_type_from_protocol("Ping"), ResourceType::other);
    BOOST_REQUIRE_EQUAL(resource_type_from_protocol(""), ResourceType::other);
}

BOOST_AUTO_TEST_CASE(test_lifecycle_events) {
    BOOST_REQUIRE(!lifecycle_event_name(WaitUntil::commit));
    BOOST_REQUIRE_EQUAL(*lifecycle_event_name(WaitUntil::domcontentloaded), "DOMContentLoaded");
    BOOST_REQUIRE_EQUAL(*lifecycle_event_name(WaitUntil::load), "load");
    BOOST_REQUIRE_EQUAL(*lifecycle_event_name(WaitUntil::networkidle), "networkIdle");
}

BOOST_AUTO_TEST_CASE(test_selector_expression_quoting) {
    auto e = selector_visible_expression("a[href=\"x\"]");
    BOOST_REQUIRE(e.find("querySelector(\"a[href=\\\"x\\\"]\")") != string::npos);
}

BOOST_AUTO_TEST_CASE(test_json_members) {
    auto j = Json::parse(R"({"result": {"value": "<html></html>"}, "n": 3})");

    BOOST_REQUIRE(member(j, "result"));
    BOOST_REQUIRE(!member(j, "missing"));
    BOOST_REQUIRE(!member(Json::array(), "result"));
    BOOST_REQUIRE_EQUAL(*string_member(*member(j, "result"), "value"), "<html></html>");
    BOOST_REQUIRE(!string_member(j, "n"));
}

BOOST_AUTO_TEST_CASE(test_command_line) {
    ContextOptions o;
    o.name = "proxied";
    o.user_data_dir = "/tmp/profiles/proxy";
    o.debug_port = 9223;
    o.user_agent = "Mozilla/5.0 Test";
    o.proxy = ProxyDescriptor{"socks5://127.0.0.1:1080", {}, {}, string("localhost")};

    auto args = ChromiumContext::command_line(o);

    BOOST_REQUIRE(has(args, "--remote-debugging-port=9223"));
    BOOST_REQUIRE(has(args, "--remote-debugging-address=127.0.0.1"));
    BOOST_REQUIRE(has(args, "--user-data-dir=/tmp/profiles/proxy"));
    BOOST_REQUIRE(has(args, "--proxy-server=socks5://127.0.0.1:1080"));
    BOOST_REQUIRE(has(args, "--proxy-bypass-list=localhost"));
    BOOST_REQUIRE(has(args, "--user-agent=Mozilla/5.0 Test"));
    BOOST_REQUIRE(has(args, "--headless=new"));
    BOOST_REQUIRE(has(args, "--disable-blink-features=AutomationControlled"));
    BOOST_REQUIRE_EQUAL(args.back(), "about:blank");

    o.proxy = boost::none;
    o.headless = false;
    args = ChromiumContext::command_line(o);

    BOOST_REQUIRE(!has(args, "--headless=new"));
    BOOST_REQUIRE(none_of(args.begin(), args.end(), [] (const string& a) {
            return a.find("--proxy-server") == 0;
        }));
}

BOOST_AUTO_TEST_CASE(test_provision_command_failure) {
    asio::io_context ctx;

    auto log = fs::temp_directory_path()
             / fs::unique_path("rendergate-provision-%%%%.log");

    ChromiumProvisioner p( ctx.get_executor()
                         , fs::path("/bin/sh")
                         , string("echo installing; echo broken >&2; exit 3")
                         , log);

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        sys::error_code ec;
        p.ensure_browser(yield[ec]);
        BOOST_REQUIRE_EQUAL(ec, sys::error_code(error::provisioning_failure));
    });

    ctx.run();

    auto text = slurp(log);
    fs::remove(log);

    BOOST_REQUIRE(text.find("Exit code: 3") != string::npos);
    BOOST_REQUIRE(text.find("installing") != string::npos);
    BOOST_REQUIRE(text.find("broken") != string::npos);
}

BOOST_AUTO_TEST_CASE(test_provision_command_success) {
    asio::io_context ctx;

    ChromiumProvisioner p( ctx.get_executor()
                         , fs::path("/bin/sh")
                         , string("true"));

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        auto path = p.ensure_browser(yield);
        BOOST_REQUIRE_EQUAL(path.string(), "/bin/sh");
    });

    ctx.run();
}

BOOST_AUTO_TEST_CASE(test_missing_browser) {
    asio::io_context ctx;

    ChromiumProvisioner p( ctx.get_executor()
                         , fs::path("/nonexistent/chromium")
                         , boost::none);

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        sys::error_code ec;
        p.ensure_browser(yield[ec]);
        BOOST_REQUIRE_EQUAL(ec, sys::error_code(error::provisioning_failure));
    });

    ctx.run();
}

BOOST_AUTO_TEST_CASE(test_launch_before_start) {
    asio::io_context ctx;
    ChromiumEngine engine(ctx.get_executor());

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        sys::error_code ec;
        engine.launch_persistent_context(ContextOptions(), yield[ec]);
        BOOST_REQUIRE_EQUAL(ec, sys::error_code(error::not_ready));
    });

    ctx.run();
}

BOOST_AUTO_TEST_SUITE_END()
