#define BOOST_TEST_MODULE Config Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "config.h"
#include "lbridge/config.hpp"
#include "lbridge/lua_api.hpp"

using namespace lbridge;

BOOST_AUTO_TEST_CASE( presets_test ) {
    auto c = default_config();
    BOOST_TEST(c.sandboxed);
    BOOST_TEST(!c.sandbox_policy.empty());
    BOOST_TEST(c.memory_limit == 0);
    BOOST_TEST(c.interpreter_memory_limit == 0);
    BOOST_TEST(!c.package_path.has_value());

    auto u = unrestricted_config();
    BOOST_TEST(!u.sandboxed);
    BOOST_TEST(u.sandbox_policy.empty());
}

BOOST_AUTO_TEST_CASE( split_dotted_test ) {
    BOOST_TEST((split_dotted("package.loaded.io")
            == std::vector<string>{"package", "loaded", "io"}));
    BOOST_TEST((split_dotted("io") == std::vector<string>{"io"}));
}

BOOST_AUTO_TEST_CASE( parse_count_test ) {
    BOOST_TEST((parse_count("0") == optional<size_t>{0}));
    BOOST_TEST((parse_count("1") == optional<size_t>{1}));
    BOOST_TEST((parse_count("524288") == optional<size_t>{524288}));

    // a sign would otherwise wrap around to a huge limit
    BOOST_TEST(!parse_count("-5").has_value());
    BOOST_TEST(!parse_count("+5").has_value());
    BOOST_TEST(!parse_count(" 5").has_value());
    // trailing junk is not an index
    BOOST_TEST(!parse_count("1abc").has_value());
    BOOST_TEST(!parse_count("5 ").has_value());
    BOOST_TEST(!parse_count("0x10").has_value());
    BOOST_TEST(!parse_count("").has_value());
    BOOST_TEST(!parse_count("count").has_value());
    BOOST_TEST(!parse_count("99999999999999999999999").has_value());
}

BOOST_AUTO_TEST_CASE( lua_version_test ) {
    string version = LBRIDGE_LUA_VERSION;
    BOOST_TEST(version.find(LUA_VERSION_MAJOR "." LUA_VERSION_MINOR) == 0);
}
