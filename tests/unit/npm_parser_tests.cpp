#include <doctest/doctest.h>
#include <scfw/dry_run_parsers.hpp>

using scfw::Ecosystem;
using scfw::ErrorCode;
using scfw::Version;

namespace {

// Trimmed `npm install react --dry-run --loglevel silly` stderr
const char* kReactLog =
    "npm verb cli /usr/bin/node /usr/bin/npm\n"
    "npm info using npm@10.2.4\n"
    "npm sill placeDep ROOT react@18.3.1 OK for: my-app@1.0.0 want: *\n"
    "npm sill placeDep ROOT loose-envify@1.4.0 OK for: react@18.3.1 want: ^1.1.0\n"
    "npm sill placeDep ROOT js-tokens@4.0.0 OK for: loose-envify@1.4.0 want: ^3.0.0 || ^4.0.0\n"
    "npm sill reify moves {}\n"
    "npm sill ADD node_modules/js-tokens\n"
    "npm sill ADD node_modules/loose-envify\n"
    "npm sill ADD node_modules/react\n"
    "npm http fetch GET 200 https://registry.npmjs.org/react 12ms\n";

} // namespace

// ============================================================================
// Dry-run Log
// ============================================================================

TEST_CASE("parse_npm_dry_run_log collects handles and placed dependencies") {
    auto log = scfw::parse_npm_dry_run_log(kReactLog);
    REQUIRE(log.isOk());
    REQUIRE(log.value().handles.size() == 3);
    CHECK(log.value().handles[0] == "node_modules/js-tokens");
    REQUIRE(log.value().placed.size() == 3);
    CHECK(log.value().placed[0].name == "react");
    CHECK(log.value().placed[0].version == "18.3.1");
}

TEST_CASE("parse_npm_dry_run_log splits scoped names at the last @") {
    auto log = scfw::parse_npm_dry_run_log(
        "npm sill placeDep ROOT @types/node@20.11.5 OK for: app@1.0.0 want: ^20\n"
        "npm sill ADD node_modules/@types/node\n");
    REQUIRE(log.isOk());
    REQUIRE(log.value().placed.size() == 1);
    CHECK(log.value().placed[0].name == "@types/node");
    CHECK(log.value().placed[0].version == "20.11.5");
}

TEST_CASE("parse_npm_dry_run_log rejects an unversioned placeDep") {
    auto log = scfw::parse_npm_dry_run_log("npm sill placeDep ROOT react OK for: app@1.0.0\n");
    REQUIRE(log.isErr());
    CHECK(log.error().code() == ErrorCode::PARSE_ERROR);
}

TEST_CASE("npm_handle_name") {
    CHECK(scfw::npm_handle_name("node_modules/react") == "react");
    CHECK(scfw::npm_handle_name("node_modules/a/node_modules/b") == "b");
    CHECK(scfw::npm_handle_name("node_modules/@scope/pkg") == "@scope/pkg");
}

// ============================================================================
// Target Matching
// ============================================================================

TEST_CASE("match_npm_targets resolves every handle to a placed dependency") {
    auto log = scfw::parse_npm_dry_run_log(kReactLog);
    REQUIRE(log.isOk());

    auto targets = scfw::match_npm_targets(log.value(), "");
    REQUIRE(targets.isOk());
    REQUIRE(targets.value().size() == 3);
    CHECK(targets.value().contains({Ecosystem::Npm, "react", "18.3.1", ""}));
    CHECK(targets.value().contains({Ecosystem::Npm, "loose-envify", "1.4.0", ""}));
    CHECK(targets.value().contains({Ecosystem::Npm, "js-tokens", "4.0.0", ""}));
}

TEST_CASE("match_npm_targets falls back to the lockfile") {
    scfw::NpmDryRunLog log;
    log.handles = {"node_modules/react"};

    const char* lockfile = R"({
  "name": "my-app",
  "lockfileVersion": 3,
  "packages": {
    "": {"name": "my-app"},
    "node_modules/react": {"version": "18.2.0"}
  }
})";

    auto targets = scfw::match_npm_targets(log, lockfile);
    REQUIRE(targets.isOk());
    REQUIRE(targets.value().size() == 1);
    CHECK(targets.value().contains({Ecosystem::Npm, "react", "18.2.0", ""}));
}

TEST_CASE("match_npm_targets fails for an unresolvable handle") {
    scfw::NpmDryRunLog log;
    log.handles = {"node_modules/react"};

    auto targets = scfw::match_npm_targets(log, R"({"packages": {}})");
    REQUIRE(targets.isErr());
    CHECK(targets.error().code() == ErrorCode::PARSE_ERROR);
}

TEST_CASE("match_npm_targets fails for leftover placed dependencies") {
    scfw::NpmDryRunLog log;
    log.handles = {"node_modules/react"};
    log.placed = {
        {Ecosystem::Npm, "react", "18.3.1", ""},
        {Ecosystem::Npm, "left-pad", "1.3.0", ""},
    };

    auto targets = scfw::match_npm_targets(log, "");
    REQUIRE(targets.isErr());
    CHECK(targets.error().code() == ErrorCode::PARSE_ERROR);
    CHECK(targets.error().message().find("left-pad@1.3.0") != std::string::npos);
}

TEST_CASE("match_npm_targets with no handles installs nothing") {
    scfw::NpmDryRunLog log;
    log.placed = {{Ecosystem::Npm, "react", "18.3.1", ""}};

    auto targets = scfw::match_npm_targets(log, "");
    REQUIRE(targets.isOk());
    CHECK(targets.value().empty());
}

// ============================================================================
// npm list / npm --version
// ============================================================================

TEST_CASE("parse_npm_list flattens nested dependencies") {
    const char* list = R"({
  "name": "my-app",
  "version": "1.0.0",
  "dependencies": {
    "react": {
      "version": "18.3.1",
      "dependencies": {
        "loose-envify": {
          "version": "1.4.0",
          "dependencies": {"js-tokens": {"version": "4.0.0"}}
        }
      }
    },
    "missing-peer": {"required": "^1.0.0", "missing": true}
  }
})";

    auto targets = scfw::parse_npm_list(list);
    REQUIRE(targets.isOk());
    CHECK(targets.value().size() == 3);
    CHECK(targets.value().contains({Ecosystem::Npm, "js-tokens", "4.0.0", ""}));
}

TEST_CASE("parse_npm_list of an empty project") {
    auto targets = scfw::parse_npm_list(R"({"name": "empty", "version": "1.0.0"})");
    REQUIRE(targets.isOk());
    CHECK(targets.value().empty());
}

TEST_CASE("parse_npm_version") {
    auto v = scfw::parse_npm_version("10.2.4\n");
    REQUIRE(v);
    CHECK(*v == Version(10, 2, 4));
    CHECK_FALSE(scfw::parse_npm_version(""));
}
