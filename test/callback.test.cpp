#define BOOST_TEST_MODULE Callback Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "lbridge/base.hpp"
#include "lbridge/callback.hpp"
#include "lbridge/engine.hpp"

#include <stdexcept>

using namespace lbridge;

template<typename F>
static error expect_error(F fn) {
    try {
        fn();
    } catch (const error& e) {
        return e;
    }
    BOOST_FAIL("expected an lbridge::error");
    return error{ek_unknown, "unreachable"};
}

static value add(call_handle& h, const std::vector<value>& args) {
    if (!h.check_arity(args, 2) || !h.check_kind(args, 0, vk_number)
            || !h.check_kind(args, 1, vk_number)) {
        return value{};
    }
    return value{*args[0].as_number() + *args[1].as_number()};
}

BOOST_AUTO_TEST_CASE( basic_call_test ) {
    engine eng;
    eng.register_function("add", add);
    eng.register_function("greet", [](call_handle&, const std::vector<value>& args) {
        return value{"Hello, " + *args.at(0).as_string() + "!"};
    });
    eng.register_function("concat", [](call_handle&, const std::vector<value>& args) {
        string res;
        for (auto& a : args) {
            res += v_to_string(a);
        }
        return value{res};
    });

    BOOST_TEST(eng.has_function("add"));
    BOOST_TEST((eng.evaluate("add(2, 3)") == value{5}));
    BOOST_TEST((eng.evaluate("greet('World')") == value{"Hello, World!"}));
    BOOST_TEST((eng.evaluate("concat('a', 1, true, nil, 'z')") == value{"a1truenilz"}));
}

BOOST_AUTO_TEST_CASE( table_arguments_test ) {
    engine eng;
    eng.register_function("sum", [](call_handle& h, const std::vector<value>& args) {
        if (!h.check_kind(args, 0, vk_array)) {
            return value{};
        }
        f64 total = 0;
        for (auto& x : *args[0].as_array()) {
            total += x.as_number().value_or(0);
        }
        return value{total};
    });
    eng.register_function("person", [](call_handle&, const std::vector<value>& args) {
        return value{value_map{
            {"name", args.at(0)},
            {"tags", value_array{"a", "b"}}
        }};
    });

    BOOST_TEST((eng.evaluate("sum({1, 2, 3, 4})") == value{10}));
    BOOST_TEST((eng.evaluate("person('Ann').name") == value{"Ann"}));
    BOOST_TEST((eng.evaluate("person('Ann').tags[2]") == value{"b"}));
}

BOOST_AUTO_TEST_CASE( reported_error_test ) {
    engine eng;
    eng.register_function("add", add);

    auto e = expect_error([&] { eng.evaluate("add(1)"); });
    BOOST_TEST(e.kind == ek_callback);
    BOOST_TEST(e.message.find("add") != string::npos);
    BOOST_TEST(e.message.find("expected 2 argument(s), got 1") != string::npos);

    e = expect_error([&] { eng.evaluate("add(1, 'x')"); });
    BOOST_TEST(e.kind == ek_callback);
    BOOST_TEST(e.message.find("argument 2 must be number, got string") != string::npos);
}

BOOST_AUTO_TEST_CASE( thrown_error_test ) {
    engine eng;
    eng.register_function("fail", [](call_handle&, const std::vector<value>&) -> value {
        throw std::runtime_error("test failure");
    });
    auto e = expect_error([&] { eng.run("fail()"); });
    BOOST_TEST(e.kind == ek_callback);
    BOOST_TEST(e.message.find("test failure") != string::npos);

    // scripts can catch the failure and carry on
    auto v = eng.evaluate(
        "local ok, err = pcall(fail)\n"
        "return {ok = ok, msg = tostring(err)}");
    BOOST_TEST((v.field("ok") == value{false}));
    BOOST_TEST(v.field("msg").as_string()->find("test failure") != string::npos);
}

BOOST_AUTO_TEST_CASE( active_call_cleared_test ) {
    engine eng;
    bool seen_inside = false;
    eng.register_function("inspect", [&](call_handle& h, const std::vector<value>&) {
        seen_inside = h.eng->in_callback();
        return value{};
    });
    eng.register_function("fail", [](call_handle& h, const std::vector<value>&) {
        h.error("always fails");
        return value{};
    });
    eng.register_function("throws", [](call_handle&, const std::vector<value>&) -> value {
        throw std::logic_error("thrown");
    });

    BOOST_TEST(!eng.in_callback());
    eng.run("inspect()");
    BOOST_TEST(seen_inside);
    BOOST_TEST(!eng.in_callback());

    BOOST_CHECK_THROW(eng.run("fail()"), error);
    BOOST_TEST(!eng.in_callback());
    BOOST_CHECK_THROW(eng.run("throws()"), error);
    BOOST_TEST(!eng.in_callback());

    // the guard also unwinds when the error is caught inside the script
    eng.run("pcall(fail)");
    BOOST_TEST(!eng.in_callback());
}

BOOST_AUTO_TEST_CASE( unregister_test ) {
    engine eng;
    eng.register_function("add", add);
    BOOST_TEST(eng.unregister_function("add"));
    BOOST_TEST(!eng.unregister_function("add"));
    BOOST_TEST(!eng.has_function("add"));
    BOOST_TEST(eng.evaluate("add").is_nil());

    // the interpreter's own error, not a host one
    auto e = expect_error([&] { eng.evaluate("add(1, 2)"); });
    BOOST_TEST(e.kind == ek_runtime);
    BOOST_TEST(e.message.find("nil value") != string::npos);
}

BOOST_AUTO_TEST_CASE( replace_test ) {
    engine eng;
    eng.register_function("f", [](call_handle&, const std::vector<value>&) {
        return value{1};
    });
    eng.register_function("f", [](call_handle&, const std::vector<value>&) {
        return value{2};
    });
    BOOST_TEST((eng.evaluate("f()") == value{2}));
}

BOOST_AUTO_TEST_CASE( nested_call_test ) {
    engine eng;
    eng.register_function("add", add);
    // a host function that evaluates script code on the same engine
    eng.register_function("twice", [](call_handle& h, const std::vector<value>& args) {
        auto n = args.at(0).as_number().value_or(0);
        return h.eng->evaluate("add(" + std::to_string(n) + ", " + std::to_string(n) + ")");
    });
    BOOST_TEST((eng.evaluate("twice(4) + 1") == value{9}));
    BOOST_TEST(!eng.in_callback());
}

BOOST_AUTO_TEST_CASE( state_preservation_test ) {
    engine eng;
    int counter = 0;
    eng.register_function("tick", [&counter](call_handle&, const std::vector<value>&) {
        return value{++counter};
    });
    eng.run("tick() tick()");
    BOOST_TEST((eng.evaluate("tick()") == value{3}));
    BOOST_TEST(counter == 3);
}

BOOST_AUTO_TEST_CASE( binary_string_test ) {
    engine eng;
    string seen;
    eng.register_function("echo", [&seen](call_handle&, const std::vector<value>& args) {
        seen = *args.at(0).as_string();
        return args.at(0);
    });
    auto v = eng.evaluate("echo('a\\0b\\0c')");
    BOOST_TEST(seen.size() == 5);
    BOOST_TEST((v == value{string{"a\0b\0c", 5}}));
    BOOST_TEST((eng.evaluate("#echo('x\\0y')") == value{3}));
}

BOOST_AUTO_TEST_CASE( memory_hook_from_callback_test ) {
    engine_config config;
    config.memory_limit = 100;
    engine eng{config};
    eng.register_function("reserve", [](call_handle& h, const std::vector<value>& args) {
        auto bytes = static_cast<size_t>(args.at(0).as_number().value_or(0));
        if (!h.track_allocation(bytes)) {
            return value{};
        }
        return value{true};
    });

    eng.run("reserve(60)");
    BOOST_TEST(eng.allocated_bytes() == 60);
    auto e = expect_error([&] { eng.run("reserve(60)"); });
    BOOST_TEST(e.kind == ek_memory);
    BOOST_TEST(eng.allocated_bytes() == 60);
}

BOOST_AUTO_TEST_CASE( function_arguments_test ) {
    engine eng;
    // a host function receiving a script function can call it back
    eng.register_function("apply", [](call_handle& h, const std::vector<value>& args) {
        return h.eng->call_and_release(args.at(0), {args.at(1)});
    });
    BOOST_TEST((eng.evaluate("apply(function(x) return x * 10 end, 4)") == value{40}));
    BOOST_TEST(eng.anchored_functions() == 0);
}

BOOST_AUTO_TEST_CASE( caught_error_is_string_test ) {
    engine eng;
    eng.register_function("add", add);
    auto v = eng.evaluate(
        "local ok, err = pcall(add, 1)\n"
        "return {msg = 'caught: ' .. err, at = err:find('[callback]', 1, true)}");
    auto msg_value = v.field("msg");
    auto msg = msg_value.as_string();
    BOOST_REQUIRE(msg != nullptr);
    BOOST_TEST(msg->find("caught: ") == 0);
    BOOST_TEST(msg->find("host function 'add' failed") != string::npos);
    BOOST_TEST(v.field("at").kind() == vk_number);
}

BOOST_AUTO_TEST_CASE( argument_functions_stay_anchored_test ) {
    engine eng;
    std::vector<function_ref> kept;
    eng.register_function("log", [&kept](call_handle&, const std::vector<value>& args) {
        if (auto f = args.at(0).field("cb").as_function()) {
            kept.push_back(*f);
        }
        return value{};
    });
    eng.run("for i = 1, 50 do log({cb = function() end}) end");
    // every function passed to the host is anchored until released
    BOOST_TEST(eng.anchored_functions() == 50);
    for (auto& f : kept) {
        BOOST_TEST(eng.release_function(f));
    }
    BOOST_TEST(eng.anchored_functions() == 0);
}
