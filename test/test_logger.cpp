#define BOOST_TEST_MODULE logger_tester
#include <boost/test/included/unit_test.hpp>

#include <fstream>
#include <sstream>
#include <string>

#include <boost/filesystem.hpp>

#include "namespaces.h"
#include "logger.h"

BOOST_AUTO_TEST_SUITE(logger_tester)

using namespace std;
using namespace rendergate;

BOOST_AUTO_TEST_CASE(test_levels)
{
    Logger log(SILLY);

    BOOST_REQUIRE(log.would_log(SILLY));

    log.log(INFO, "This is the first info log");
    log.warn("This is the first warning");

    log.set_threshold(VERBOSE);
    BOOST_REQUIRE(log.would_log(VERBOSE));
    BOOST_REQUIRE(log.would_log(ERROR));
    BOOST_REQUIRE(!log.would_log(DEBUG));
    BOOST_REQUIRE(!log.would_log(SILLY));

    auto previous = logger.get_threshold();
    logger.set_threshold(WARN);
    LOG_WARN("This should make it out from the default logger with the macro");
    LOG_DEBUG("This should not make it out from the default logger with the macro");
    logger.set_threshold(previous);
}

BOOST_AUTO_TEST_CASE(test_parse_log_level)
{
    BOOST_REQUIRE_EQUAL(*parse_log_level("debug"), DEBUG);
    BOOST_REQUIRE_EQUAL(*parse_log_level("ERROR"), ERROR);
    BOOST_REQUIRE_EQUAL(*parse_log_level("Warn"), WARN);
    BOOST_REQUIRE(!parse_log_level("loud"));
    BOOST_REQUIRE(!parse_log_level(""));
}

BOOST_AUTO_TEST_CASE(test_log_to_file)
{
    auto path = fs::temp_directory_path()
              / fs::unique_path("rendergate-log-%%%%-%%%%.txt");

    {
        Logger log(INFO);
        log.log_to_file(path.string());
        BOOST_REQUIRE_EQUAL(log.current_log_file(), path.string());

        log.info("Success [https://www.example.com/] in 1.25s");
        log.debug("Below the threshold");

        log.log_to_file("");
        BOOST_REQUIRE(!log.get_log_file());
    }

    ifstream f(path.string());
    stringstream ss;
    ss << f.rdbuf();
    auto text = ss.str();

    fs::remove(path);

    BOOST_REQUIRE(text.find("RENDERGATE START") != string::npos);
    BOOST_REQUIRE(text.find("Success [https://www.example.com/] in 1.25s") != string::npos);
    BOOST_REQUIRE(text.find("Below the threshold") == string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
