#define BOOST_TEST_MODULE concurrency_gate
#include <boost/test/included/unit_test.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <namespaces.h>
#include <util/concurrency_gate.h>
#include <util/random.h>
#include <defer.h>

BOOST_AUTO_TEST_SUITE(rendergate_concurrency_gate)

using namespace std;
using namespace rendergate;
using namespace chrono;
using Timer = asio::steady_timer;

BOOST_AUTO_TEST_CASE(test_gate_limits_holders) {
    asio::io_context ctx;

    const size_t capacity = util::random::number<unsigned>() % 8 + 2;
    ConcurrencyGate gate(ctx.get_executor(), capacity);

    unsigned run_count = 0;
    unsigned max_run_count = 0;
    unsigned finished = 0;

    for (unsigned i = 0; i < 20; ++i) {
        asio::spawn(ctx, [&] (asio::yield_context yield) {
            asio::post(ctx, yield);

            sys::error_code ec;
            auto slot = gate.wait_for_slot(yield[ec]);
            BOOST_REQUIRE(!ec);
            BOOST_REQUIRE(slot.is_held());

            ++run_count;
            max_run_count = max(max_run_count, run_count);
            auto on_exit = defer([&] { --run_count; ++finished; });

            BOOST_REQUIRE(run_count <= gate.capacity());
            BOOST_REQUIRE_EQUAL(gate.in_use(), run_count);

            Timer timer(ctx);
            timer.expires_after(milliseconds(util::random::number<unsigned>() % 200));
            timer.async_wait(yield[ec]);

            BOOST_REQUIRE(!ec);
        });
    }

    ctx.run();

    BOOST_REQUIRE_EQUAL(finished, 20u);
    BOOST_REQUIRE_EQUAL(max_run_count, capacity);
    BOOST_REQUIRE_EQUAL(gate.in_use(), 0u);
    BOOST_REQUIRE_EQUAL(gate.waiting(), 0u);
}

BOOST_AUTO_TEST_CASE(test_gate_moved_slot) {
    asio::io_context ctx;

    ConcurrencyGate gate(ctx.get_executor(), 1);

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        auto slot = gate.wait_for_slot(yield);
        BOOST_REQUIRE_EQUAL(gate.in_use(), 1u);

        ConcurrencyGate::Slot other = move(slot);
        BOOST_REQUIRE(!slot.is_held());
        BOOST_REQUIRE(other.is_held());
        BOOST_REQUIRE_EQUAL(gate.in_use(), 1u);

        other = ConcurrencyGate::Slot();
        BOOST_REQUIRE_EQUAL(gate.in_use(), 0u);

        // Free again.
        auto again = gate.wait_for_slot(yield);
        BOOST_REQUIRE(again.is_held());
    });

    ctx.run();
}

BOOST_AUTO_TEST_CASE(test_gate_cancel) {
    asio::io_context ctx;

    ConcurrencyGate gate(ctx.get_executor(), 0);

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        Cancel cancel;
        asio::spawn(ctx, [&] (asio::yield_context yield) {
            asio::post(ctx, yield);
            BOOST_REQUIRE_EQUAL(gate.waiting(), 1u);
            cancel();
        });
        sys::error_code ec;
        auto slot = gate.wait_for_slot(cancel, yield[ec]);
        BOOST_REQUIRE_EQUAL(ec, asio::error::operation_aborted);
        BOOST_REQUIRE(!slot.is_held());
        BOOST_REQUIRE_EQUAL(gate.waiting(), 0u);
    });

    ctx.run();
}

BOOST_AUTO_TEST_CASE(test_gate_cancel_after_release) {
    asio::io_context ctx;

    ConcurrencyGate gate(ctx.get_executor(), 1);

    bool first_aborted = false;
    bool second_got_slot = false;

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        auto held = gate.wait_for_slot(yield);

        Cancel first_cancel;
        Cancel second_cancel;

        asio::spawn(ctx, [&] (asio::yield_context yield) {
            sys::error_code ec;
            auto slot = gate.wait_for_slot(first_cancel, yield[ec]);
            first_aborted = (ec == asio::error::operation_aborted);
        });

        asio::spawn(ctx, [&] (asio::yield_context yield) {
            sys::error_code ec;
            auto slot = gate.wait_for_slot(second_cancel, yield[ec]);
            second_got_slot = !ec && slot.is_held();
        });

        asio::post(ctx, yield);
        BOOST_REQUIRE_EQUAL(gate.waiting(), 2u);

        // The release wakes the first waiter, which is cancelled
        // before it gets to run.
        held = ConcurrencyGate::Slot();
        first_cancel();

        Timer timer(ctx);
        timer.expires_after(milliseconds(50));
        timer.async_wait(yield);

        BOOST_REQUIRE(first_aborted);
        BOOST_REQUIRE(second_got_slot);
        BOOST_REQUIRE_EQUAL(gate.waiting(), 0u);

        // Don't leave a stuck waiter behind if the above failed.
        second_cancel();
    });

    ctx.run();
}

BOOST_AUTO_TEST_CASE(test_gate_destroy_while_waiting) {
    asio::io_context ctx;

    auto gate = make_unique<ConcurrencyGate>(ctx.get_executor(), 0);

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        asio::spawn(ctx, [&] (asio::yield_context yield) {
            asio::post(ctx, yield);
            gate.reset();
        });

        sys::error_code ec;
        auto slot = gate->wait_for_slot(yield[ec]);
        BOOST_REQUIRE_EQUAL(ec, asio::error::operation_aborted);
    });

    ctx.run();
}

BOOST_AUTO_TEST_SUITE_END()
