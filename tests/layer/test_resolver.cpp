// strata_layer resolver tests

#include <catch2/catch_test_macros.hpp>
#include <strata/layer/resolver.hpp>

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

using namespace strata_layer;
using strata_config::EffectiveConfig;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

/// In-memory prober recording every path it is asked about
class FakeProber final : public FileProber {
public:
    void add_file(const std::string& path, std::uintmax_t size = 1) {
        FileMetadata meta;
        meta.type = std::filesystem::file_type::regular;
        meta.size = size;
        m_entries[path] = meta;
    }

    void add_directory(const std::string& path) {
        FileMetadata meta;
        meta.type = std::filesystem::file_type::directory;
        m_entries[path] = meta;
    }

    /// Entry exists but cannot be stat'ed, the way EACCES looks to a prober
    void deny(const std::string& path) { m_denied.insert(path); }

    [[nodiscard]] std::optional<FileMetadata> probe(const std::string& path) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_probed.push_back(path);
        if (m_denied.count(path)) {
            return std::nullopt;
        }
        auto it = m_entries.find(path);
        if (it == m_entries.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] const std::vector<std::string>& probed() const { return m_probed; }

private:
    std::map<std::string, FileMetadata> m_entries;
    std::set<std::string> m_denied;
    mutable std::mutex m_mutex;
    mutable std::vector<std::string> m_probed;
};

EffectiveConfig enabled_with(std::vector<std::string> layers) {
    return EffectiveConfig{true, std::move(layers)};
}

} // anonymous namespace

// =============================================================================
// Resolution
// =============================================================================

TEST_CASE("Resolver with layering disabled", "[layer][resolver]") {
    FakeProber prober;
    prober.add_file("/srv/www/promo/banner.png");
    LayerResolver resolver(prober);

    auto outcome = resolver.resolve(EffectiveConfig{false, {"promo"}}, "/srv/www", "/banner.png");
    REQUIRE_FALSE(outcome.is_override());
    REQUIRE(outcome.match() == nullptr);
    REQUIRE(prober.probed().empty());
}

TEST_CASE("Resolver with no layers", "[layer][resolver]") {
    FakeProber prober;
    LayerResolver resolver(prober);

    auto outcome = resolver.resolve(enabled_with({}), "/srv/www", "/banner.png");
    REQUIRE_FALSE(outcome);
    REQUIRE(prober.probed().empty());
}

TEST_CASE("Resolver picks the first layer holding the file", "[layer][resolver]") {
    FakeProber prober;
    LayerResolver resolver(prober);
    auto config = enabled_with({"layered/christmas", "layered/promotions"});

    SECTION("first layer wins over later ones") {
        prober.add_file("/usr/local/htdocs/layered/christmas/banner.png", 10);
        prober.add_file("/usr/local/htdocs/layered/promotions/banner.png", 20);

        auto outcome = resolver.resolve(config, "/usr/local/htdocs", "/banner.png");
        REQUIRE(outcome.is_override());
        REQUIRE(outcome.match()->path == "/usr/local/htdocs/layered/christmas/banner.png");
        REQUIRE(outcome.match()->metadata.size == 10);
        REQUIRE(outcome.match()->layer == "layered/christmas");
        REQUIRE(outcome.match()->layer_index == 0);
        REQUIRE(prober.probed().size() == 1);
    }

    SECTION("falls through to a later layer") {
        prober.add_file("/usr/local/htdocs/layered/promotions/banner.png", 20);

        auto outcome = resolver.resolve(config, "/usr/local/htdocs", "/banner.png");
        REQUIRE(outcome.is_override());
        REQUIRE(outcome.match()->layer == "layered/promotions");
        REQUIRE(outcome.match()->layer_index == 1);
        REQUIRE(prober.probed() == std::vector<std::string>{
            "/usr/local/htdocs/layered/christmas/banner.png",
            "/usr/local/htdocs/layered/promotions/banner.png"});
    }

    SECTION("no layer holds the file") {
        prober.add_file("/usr/local/htdocs/banner.png");

        auto outcome = resolver.resolve(config, "/usr/local/htdocs", "/banner.png");
        REQUIRE_FALSE(outcome.is_override());
        REQUIRE(prober.probed().size() == 2);
    }
}

TEST_CASE("Resolver treats unreadable candidates as absent", "[layer][resolver]") {
    FakeProber prober;
    prober.deny("/srv/www/secret/index.html");
    prober.add_file("/srv/www/public/index.html");
    LayerResolver resolver(prober);

    auto outcome = resolver.resolve(enabled_with({"secret", "public"}), "/srv/www", "/index.html");
    REQUIRE(outcome.is_override());
    REQUIRE(outcome.match()->path == "/srv/www/public/index.html");
}

TEST_CASE("Resolver layer kinds", "[layer][resolver]") {
    FakeProber prober;
    LayerResolver resolver(prober);

    SECTION("absolute layer") {
        prober.add_file("/opt/overlay/css/site.css");
        auto outcome = resolver.resolve(enabled_with({"/opt/overlay"}), "/srv/www", "/css/site.css");
        REQUIRE(outcome.is_override());
        REQUIRE(outcome.match()->path == "/opt/overlay/css/site.css");
    }

    SECTION("directories count as present") {
        prober.add_directory("/srv/www/promo/images");
        auto outcome = resolver.resolve(enabled_with({"promo"}), "/srv/www", "/images/");
        REQUIRE(outcome.is_override());
        REQUIRE(outcome.match()->path == "/srv/www/promo/images");
        REQUIRE(outcome.match()->metadata.is_directory());
    }

    SECTION("duplicate layers are probed again") {
        auto outcome = resolver.resolve(enabled_with({"a", "a"}), "/srv/www", "/x");
        REQUIRE_FALSE(outcome);
        REQUIRE(prober.probed().size() == 2);
    }
}

TEST_CASE("ResolutionOutcome JSON", "[layer][resolver]") {
    REQUIRE(ResolutionOutcome::no_override().to_json()["override"] == false);

    FileMetadata meta;
    meta.type = std::filesystem::file_type::regular;
    auto outcome = ResolutionOutcome::override_with(LayerMatch{"/srv/www/a/x", meta, "a", 0});
    auto j = outcome.to_json();
    REQUIRE(j["override"] == true);
    REQUIRE(j["path"] == "/srv/www/a/x");
    REQUIRE(j["layer"] == "a");
    REQUIRE(j["metadata"]["type"] == "regular");
}
