#include <doctest/doctest.h>
#include <scfw/config.hpp>

#include "../test_helpers.hpp"

#include <map>

using scfw::EnvLookup;
using scfw::FirewallConfig;
using scfw::WarningPolicy;
using scfw_test::TempDir;
using scfw_test::write_file;

namespace {

EnvLookup env_of(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

} // namespace

// ============================================================================
// Value Parsing
// ============================================================================

TEST_CASE("parse_timeout_seconds") {
    auto whole = scfw::parse_timeout_seconds("30");
    REQUIRE(whole);
    CHECK(whole->count() == 30000);

    auto fractional = scfw::parse_timeout_seconds(" 2.5 ");
    REQUIRE(fractional);
    CHECK(fractional->count() == 2500);

    CHECK_FALSE(scfw::parse_timeout_seconds(""));
    CHECK_FALSE(scfw::parse_timeout_seconds("0"));
    CHECK_FALSE(scfw::parse_timeout_seconds("-5"));
    CHECK_FALSE(scfw::parse_timeout_seconds("10s"));
    CHECK_FALSE(scfw::parse_timeout_seconds("inf"));
}

TEST_CASE("is_valid_log_level") {
    CHECK(scfw::is_valid_log_level("debug"));
    CHECK(scfw::is_valid_log_level("off"));
    CHECK_FALSE(scfw::is_valid_log_level("verbose"));
}

// ============================================================================
// Layering
// ============================================================================

TEST_CASE("load_config defaults under SCFW_HOME") {
    TempDir home;
    FirewallConfig config = scfw::load_config(env_of({{"SCFW_HOME", home.str()}}));

    CHECK(config.scfw_home == home.str());
    CHECK_FALSE(config.on_warning);
    CHECK(config.verifier_timeout == scfw::kDefaultVerifierTimeout);
    REQUIRE(config.verifiers_path.size() == 1);
    CHECK(config.verifiers_path[0] == home / "verifiers");
    CHECK(config.log_file == home / "scfw.log");
    CHECK(config.log_level == "warn");
    CHECK(config.warnings.empty());
}

TEST_CASE("load_config reads config.json") {
    TempDir home;
    write_file(home / "config.json", R"({
  "on_warning": "BLOCK",
  "verifier_timeout": 5,
  "verifiers_path": ["/opt/scfw/verifiers", "/usr/lib/scfw"],
  "log_file": "/var/log/scfw.log",
  "log_level": "INFO"
})");

    FirewallConfig config = scfw::load_config(env_of({{"SCFW_HOME", home.str()}}));
    CHECK(config.on_warning == WarningPolicy::Block);
    CHECK(config.verifier_timeout.count() == 5000);
    REQUIRE(config.verifiers_path.size() == 2);
    CHECK(config.verifiers_path[1] == "/usr/lib/scfw");
    CHECK(config.log_file == "/var/log/scfw.log");
    CHECK(config.log_level == "info");
    CHECK(config.warnings.empty());
}

TEST_CASE("environment overrides the config file") {
    TempDir home;
    write_file(home / "config.json", R"({"on_warning": "BLOCK", "verifier_timeout": 5})");

    FirewallConfig config = scfw::load_config(env_of({
        {"SCFW_HOME", home.str()},
        {"SCFW_ON_WARNING", "allow"},
        {"SCFW_VERIFIER_TIMEOUT", "0.5"},
        {"SCFW_VERIFIERS_PATH", "/a::/b"},
        {"SCFW_LOG_FILE", "/tmp/scfw-test.log"},
        {"SCFW_LOG_LEVEL", "debug"},
    }));

    CHECK(config.on_warning == WarningPolicy::Allow);
    CHECK(config.verifier_timeout.count() == 500);
    REQUIRE(config.verifiers_path.size() == 2);
    CHECK(config.verifiers_path[0] == "/a");
    CHECK(config.verifiers_path[1] == "/b");
    CHECK(config.log_file == "/tmp/scfw-test.log");
    CHECK(config.log_level == "debug");
}

TEST_CASE("invalid values are reported and the previous layer is kept") {
    TempDir home;
    write_file(home / "config.json", R"({"on_warning": "BLOCK"})");

    FirewallConfig config = scfw::load_config(env_of({
        {"SCFW_HOME", home.str()},
        {"SCFW_ON_WARNING", "sometimes"},
        {"SCFW_VERIFIER_TIMEOUT", "-1"},
        {"SCFW_LOG_LEVEL", "loud"},
    }));

    CHECK(config.on_warning == WarningPolicy::Block);
    CHECK(config.verifier_timeout == scfw::kDefaultVerifierTimeout);
    CHECK(config.log_level == "warn");
    CHECK(config.warnings.size() == 3);
}

TEST_CASE("a malformed config file is ignored with a warning") {
    TempDir home;
    write_file(home / "config.json", "{ not json");

    FirewallConfig config = scfw::load_config(env_of({{"SCFW_HOME", home.str()}}));
    CHECK_FALSE(config.on_warning);
    REQUIRE(config.warnings.size() == 1);
    CHECK(config.warnings[0].find("config.json") != std::string::npos);
}
