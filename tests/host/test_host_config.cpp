// strata_host configuration scope tests

#include <catch2/catch_test_macros.hpp>
#include <strata/host/host_config.hpp>
#include <strata/config/config_parser.hpp>

#include <string>

using namespace strata_host;
using strata_config::CommandRegistry;
using strata_config::ConfigParser;
using strata_core::ConfigError;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

/// Registry with one list directive standing in for a module
CommandRegistry test_commands() {
    CommandRegistry registry;
    auto added = registry.add(strata_config::CommandSpec{
        "TestLayers", strata_config::ArgsHow::Iterate, "TestLayers dir...",
        [](const strata_config::DirectiveOccurrence&, strata_config::ScopeConfig& scope,
           const std::string& arg) {
            scope.layers.push_back(arg);
            return strata_core::Ok();
        }});
    REQUIRE(added.is_ok());
    added = registry.add(strata_config::CommandSpec{
        "TestEnable", strata_config::ArgsHow::Take1, "TestEnable On|Off",
        [](const strata_config::DirectiveOccurrence&, strata_config::ScopeConfig& scope,
           const std::string& arg) {
            scope.enabled = (arg == "On");
            return strata_core::Ok();
        }});
    REQUIRE(added.is_ok());
    return registry;
}

strata_core::Result<HostConfig> build(const CommandRegistry& registry, const std::string& text) {
    ConfigParser parser;
    auto tree = parser.parse_string(text, "host.conf");
    if (!tree) {
        return strata_core::Err<HostConfig>(tree.error());
    }
    return HostConfigBuilder(registry).build(tree.value());
}

} // anonymous namespace

// =============================================================================
// Scope Matching
// =============================================================================

TEST_CASE("Location matching", "[host][config]") {
    SECTION("prefix on segment boundaries") {
        LocationScope loc;
        loc.pattern = "/images";
        REQUIRE(loc.matches("/images"));
        REQUIRE(loc.matches("/images/a.png"));
        REQUIRE_FALSE(loc.matches("/imagesets/a.png"));
        REQUIRE_FALSE(loc.matches("/img"));
    }

    SECTION("pattern ending in a slash") {
        LocationScope loc;
        loc.pattern = "/static/";
        REQUIRE(loc.matches("/static/app.js"));
        REQUIRE_FALSE(loc.matches("/static"));
    }

    SECTION("regular expression") {
        LocationScope loc;
        loc.is_regex = true;
        loc.pattern = "\\.png$";
        loc.regex = std::regex(loc.pattern);
        REQUIRE(loc.matches("/banner.png"));
        REQUIRE_FALSE(loc.matches("/banner.png.txt"));
    }
}

TEST_CASE("Virtual host name matching", "[host][config]") {
    VirtualHostScope vhost;
    vhost.server_name = "www.example.com:80";
    vhost.aliases = {"example.com"};

    REQUIRE(vhost.answers_to("www.example.com"));
    REQUIRE(vhost.answers_to("WWW.Example.COM:8080"));
    REQUIRE(vhost.answers_to("example.com"));
    REQUIRE_FALSE(vhost.answers_to("other.org"));
    REQUIRE_FALSE(vhost.answers_to(""));
}

// =============================================================================
// Building
// =============================================================================

TEST_CASE("Host configuration building", "[host][config]") {
    auto registry = test_commands();

    auto result = build(registry,
        "ServerName main.example.com\n"
        "DocumentRoot /srv/main/\n"
        "TestEnable On\n"
        "TestLayers seasonal promo\n"
        "<Location /img>\n"
        "    TestLayers img_main\n"
        "</Location>\n"
        "<VirtualHost *:80>\n"
        "    ServerName www.example.com\n"
        "    ServerAlias example.com\n"
        "    DocumentRoot /srv/vhost\n"
        "    TestEnable Off\n"
        "    <LocationMatch \"\\.png$\">\n"
        "        TestEnable On\n"
        "        TestLayers images_v3 images_v2\n"
        "    </LocationMatch>\n"
        "</VirtualHost>\n"
        "<VirtualHost *:80>\n"
        "    ServerName second.example.com\n"
        "</VirtualHost>\n");
    REQUIRE(result.is_ok());
    const auto& config = result.value();

    SECTION("main server") {
        REQUIRE(config.server_name == "main.example.com");
        REQUIRE(config.document_root == "/srv/main");
        REQUIRE(config.effective == strata_config::EffectiveConfig{true, {"seasonal", "promo"}});
        REQUIRE(config.locations.size() == 1);
    }

    SECTION("virtual hosts inherit what they do not set") {
        REQUIRE(config.virtual_hosts.size() == 2);

        const auto& first = config.virtual_hosts[0];
        REQUIRE(first.effective_document_root == "/srv/vhost");
        REQUIRE_FALSE(first.effective.enabled);
        REQUIRE(first.effective.layers == std::vector<std::string>{"seasonal", "promo"});

        const auto& second = config.virtual_hosts[1];
        REQUIRE(second.effective_document_root == "/srv/main");
        REQUIRE(second.effective == config.effective);
    }

    SECTION("selection by host name") {
        REQUIRE(config.select_virtual_host("example.com") == &config.virtual_hosts[0]);
        REQUIRE(config.select_virtual_host("second.example.com:80") == &config.virtual_hosts[1]);
        REQUIRE(config.select_virtual_host("unknown.org") == &config.virtual_hosts[0]);
    }

    SECTION("location scopes merge in order") {
        const auto* vhost = &config.virtual_hosts[0];

        auto png = config.effective_for(vhost, "/banner.png");
        REQUIRE(png.enabled);
        REQUIRE(png.layers == std::vector<std::string>{"images_v3", "images_v2"});

        auto css = config.effective_for(vhost, "/site.css");
        REQUIRE_FALSE(css.enabled);

        // Main server <Location /img> applies first, then the vhost regex
        auto img = config.effective_for(vhost, "/img/logo.png");
        REQUIRE(img.layers == std::vector<std::string>{"images_v3", "images_v2"});

        auto img_other = config.effective_for(vhost, "/img/logo.gif");
        REQUIRE(img_other.layers == std::vector<std::string>{"img_main"});
        REQUIRE_FALSE(img_other.enabled);
    }

    SECTION("document root lookup") {
        REQUIRE(config.document_root_for(nullptr) == "/srv/main");
        REQUIRE(config.document_root_for(&config.virtual_hosts[0]) == "/srv/vhost");
    }
}

TEST_CASE("Host configuration defaults", "[host][config]") {
    auto registry = test_commands();
    auto result = build(registry, "# nothing\n");
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.document_root == kDefaultDocumentRoot);
    REQUIRE(config.virtual_hosts.empty());
    REQUIRE(config.select_virtual_host("any") == nullptr);
    REQUIRE_FALSE(config.effective.enabled);
    REQUIRE(config.effective.layers.empty());
}

TEST_CASE("Host configuration tolerates foreign directives", "[host][config]") {
    auto registry = test_commands();
    auto result = build(registry,
        "LoadModule foo modules/foo.so\n"
        "<IfModule foo>\n"
        "    Foo bar\n"
        "</IfModule>\n"
        "<Directory /srv/main>\n"
        "    Options Indexes\n"
        "</Directory>\n");
    REQUIRE(result.is_ok());
}

TEST_CASE("Host configuration scope errors", "[host][config]") {
    auto registry = test_commands();

    auto expect_error = [&registry](const std::string& text, ConfigError::Kind kind, std::size_t line) {
        auto result = build(registry, text);
        REQUIRE(result.is_err());
        const auto* err = result.error().as<ConfigError>();
        REQUIRE(err != nullptr);
        REQUIRE(err->kind == kind);
        REQUIRE(err->line == line);
    };

    SECTION("nested VirtualHost") {
        expect_error("<VirtualHost *:80>\n<VirtualHost *:81>\n</VirtualHost>\n</VirtualHost>\n",
                     ConfigError::Kind::NotAllowedHere, 2);
    }

    SECTION("DocumentRoot inside Location") {
        expect_error("<Location /x>\nDocumentRoot /y\n</Location>\n",
                     ConfigError::Kind::NotAllowedHere, 2);
    }

    SECTION("ServerAlias outside VirtualHost") {
        expect_error("ServerAlias a.example.com\n", ConfigError::Kind::NotAllowedHere, 1);
    }

    SECTION("Location inside Location") {
        expect_error("<Location /a>\n<Location /a/b>\n</Location>\n</Location>\n",
                     ConfigError::Kind::NotAllowedHere, 2);
    }

    SECTION("DocumentRoot argument count") {
        expect_error("DocumentRoot /a /b\n", ConfigError::Kind::InvalidArguments, 1);
    }

    SECTION("VirtualHost without address") {
        expect_error("<VirtualHost>\n</VirtualHost>\n", ConfigError::Kind::InvalidArguments, 1);
    }

    SECTION("invalid location regex") {
        expect_error("<LocationMatch \"([\">\n</LocationMatch>\n", ConfigError::Kind::Syntax, 1);
    }

    SECTION("module command errors propagate") {
        expect_error("TestEnable On Off\n", ConfigError::Kind::InvalidArguments, 1);
    }
}
