#define BOOST_TEST_MODULE Memory Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "lbridge/base.hpp"
#include "lbridge/engine.hpp"
#include "lbridge/memory.hpp"

using namespace lbridge;

BOOST_AUTO_TEST_CASE( tracker_basics_test ) {
    memory_tracker t;
    BOOST_TEST(t.current_total() == 0);
    BOOST_TEST(t.get_limit() == 0);

    // no limit
    t.track_allocation(1 << 30);
    t.track_allocation(1 << 30);
    BOOST_TEST(t.current_total() == (size_t{1} << 31));

    t.track_deallocation(1 << 30);
    BOOST_TEST(t.current_total() == (size_t{1} << 30));
    t.reset();
    BOOST_TEST(t.current_total() == 0);
}

BOOST_AUTO_TEST_CASE( tracker_limit_boundary_test ) {
    memory_tracker t{1000};
    t.track_allocation(1000);
    BOOST_TEST(t.current_total() == 1000);

    bool threw = false;
    try {
        t.track_allocation(1);
    } catch (const error& e) {
        threw = true;
        BOOST_TEST(e.kind == ek_memory);
        BOOST_TEST(e.message.find("Memory limit exceeded") != string::npos);
    }
    BOOST_TEST(threw);
    // unchanged by the failed call
    BOOST_TEST(t.current_total() == 1000);

    BOOST_TEST(!t.try_allocation(1));
    t.track_deallocation(1);
    BOOST_TEST(t.try_allocation(1));
    BOOST_TEST(t.current_total() == 1000);
}

BOOST_AUTO_TEST_CASE( tracker_overflow_test ) {
    memory_tracker t{100};
    t.track_allocation(50);
    BOOST_TEST(!t.try_allocation(static_cast<size_t>(-1)));
    BOOST_TEST(t.current_total() == 50);
}

BOOST_AUTO_TEST_CASE( tracker_deallocation_saturates_test ) {
    memory_tracker t{100};
    t.track_allocation(10);
    t.track_deallocation(50);
    BOOST_TEST(t.current_total() == 0);
}

BOOST_AUTO_TEST_CASE( engine_memory_hook_test ) {
    engine_config config;
    config.memory_limit = 1024;
    // a small accounting limit must not get in the way of construction
    engine eng{config};
    BOOST_TEST(eng.allocated_bytes() == 0);

    eng.track_allocation(1024);
    BOOST_CHECK_THROW(eng.track_allocation(1), error);
    BOOST_TEST(eng.allocated_bytes() == 1024);

    eng.track_deallocation(24);
    BOOST_TEST(eng.allocated_bytes() == 1000);
    eng.reset_memory_tracker();
    BOOST_TEST(eng.allocated_bytes() == 0);

    // scripts still run
    BOOST_TEST((eng.evaluate("1 + 1") == value{2}));
}

BOOST_AUTO_TEST_CASE( interpreter_heap_limit_test ) {
    engine_config config;
    config.interpreter_memory_limit = 512 * 1024;
    engine eng{config};
    BOOST_TEST(eng.interpreter_bytes() > 0);
    BOOST_TEST(eng.interpreter_bytes() < config.interpreter_memory_limit);

    try {
        eng.run("local t = {} for i = 1, 10000000 do t[i] = i end");
        BOOST_FAIL("expected a memory error");
    } catch (const error& e) {
        BOOST_TEST(e.kind == ek_memory);
    }

    try {
        eng.evaluate("string.rep('x', 8 * 1024 * 1024)");
        BOOST_FAIL("expected a memory error");
    } catch (const error& e) {
        BOOST_TEST(e.kind == ek_memory);
    }

    // the engine stays usable
    BOOST_TEST((eng.evaluate("'still' .. ' alive'") == value{"still alive"}));
}

BOOST_AUTO_TEST_CASE( interpreter_unlimited_by_default_test ) {
    engine eng;
    auto v = eng.evaluate("#string.rep('x', 4 * 1024 * 1024)");
    BOOST_TEST((v == value{4 * 1024 * 1024}));
}
