// strata_config scope merge tests

#include <catch2/catch_test_macros.hpp>
#include <strata/config/scope_config.hpp>

using namespace strata_config;

TEST_CASE("ScopeConfig defaults", "[config][scope]") {
    ScopeConfig scope;
    REQUIRE(scope.empty());
    REQUIRE_FALSE(scope.enabled.has_value());

    EffectiveConfig effective;
    REQUIRE_FALSE(effective.enabled);
    REQUIRE(effective.layers.empty());
}

TEST_CASE("Scope merge", "[config][scope]") {
    EffectiveConfig parent{true, {"a", "b"}};

    SECTION("empty child inherits everything") {
        REQUIRE(merge(parent, ScopeConfig{}) == parent);
    }

    SECTION("child layers replace, never extend") {
        ScopeConfig child;
        child.layers = {"c"};
        auto merged = merge(parent, child);
        REQUIRE(merged.enabled);
        REQUIRE(merged.layers == std::vector<std::string>{"c"});
    }

    SECTION("child enabled overrides but keeps parent layers") {
        ScopeConfig child;
        child.enabled = false;
        auto merged = merge(parent, child);
        REQUIRE_FALSE(merged.enabled);
        REQUIRE(merged.layers == parent.layers);
    }

    SECTION("explicit On in child of disabled parent") {
        EffectiveConfig off{false, {"x"}};
        ScopeConfig child;
        child.enabled = true;
        auto merged = merge(off, child);
        REQUIRE(merged.enabled);
        REQUIRE(merged.layers == std::vector<std::string>{"x"});
    }

    SECTION("duplicates in a child list are kept") {
        ScopeConfig child;
        child.layers = {"a", "a"};
        REQUIRE(merge(parent, child).layers.size() == 2);
    }
}

TEST_CASE("Scope merge chain", "[config][scope]") {
    ScopeConfig server;
    server.enabled = true;
    server.layers = {"seasonal", "promo"};

    ScopeConfig vhost;
    vhost.enabled = false;

    ScopeConfig location;
    location.enabled = true;
    location.layers = {"images_v3", "images_v2"};

    SECTION("outermost first") {
        auto merged = merge_chain({&server, &vhost, &location});
        REQUIRE(merged.enabled);
        REQUIRE(merged.layers == std::vector<std::string>{"images_v3", "images_v2"});
    }

    SECTION("vhost only") {
        auto merged = merge_chain({&server, &vhost});
        REQUIRE_FALSE(merged.enabled);
        REQUIRE(merged.layers == server.layers);
    }

    SECTION("null entries are skipped") {
        REQUIRE(merge_chain({nullptr, &server, nullptr}) == merge_chain({&server}));
    }

    SECTION("no scopes gives the defaults") {
        REQUIRE(merge_chain({}) == EffectiveConfig{});
    }
}

TEST_CASE("EffectiveConfig JSON", "[config][scope]") {
    EffectiveConfig cfg{true, {"one", "two"}};
    auto j = cfg.to_json();
    REQUIRE(j["enabled"] == true);
    REQUIRE(j["layers"].size() == 2);
    REQUIRE(j["layers"][0] == "one");
}
