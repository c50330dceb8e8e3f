#include <doctest/doctest.h>
#include <scfw/target.hpp>
#include <scfw/text_utils.hpp>
#include <scfw/types.hpp>

using scfw::Ecosystem;
using scfw::InstallTarget;
using scfw::TargetSet;

// ============================================================================
// Enum Parsing
// ============================================================================

TEST_CASE("parse_ecosystem is case-insensitive") {
    CHECK(scfw::parse_ecosystem("npm") == Ecosystem::Npm);
    CHECK(scfw::parse_ecosystem("PyPI") == Ecosystem::PyPI);
    CHECK(scfw::parse_ecosystem(" pypi ") == Ecosystem::PyPI);
    CHECK_FALSE(scfw::parse_ecosystem("cargo"));
}

TEST_CASE("parse_manager_kind accepts exact names only") {
    CHECK(scfw::parse_manager_kind("pip") == scfw::ManagerKind::Pip);
    CHECK(scfw::parse_manager_kind("npm") == scfw::ManagerKind::Npm);
    CHECK(scfw::parse_manager_kind("poetry") == scfw::ManagerKind::Poetry);
    CHECK_FALSE(scfw::parse_manager_kind("pip3"));
    CHECK_FALSE(scfw::parse_manager_kind("NPM"));
}

TEST_CASE("manager ecosystems") {
    CHECK(scfw::manager_ecosystem(scfw::ManagerKind::Pip) == Ecosystem::PyPI);
    CHECK(scfw::manager_ecosystem(scfw::ManagerKind::Poetry) == Ecosystem::PyPI);
    CHECK(scfw::manager_ecosystem(scfw::ManagerKind::Npm) == Ecosystem::Npm);
}

TEST_CASE("parse_warning_policy accepts ALLOW and BLOCK") {
    CHECK(scfw::parse_warning_policy("ALLOW") == scfw::WarningPolicy::Allow);
    CHECK(scfw::parse_warning_policy("block") == scfw::WarningPolicy::Block);
    CHECK_FALSE(scfw::parse_warning_policy("sometimes"));
    CHECK_FALSE(scfw::parse_warning_policy(""));
}

TEST_CASE("parse_severity") {
    CHECK(scfw::parse_severity("CRITICAL") == scfw::FindingSeverity::Critical);
    CHECK(scfw::parse_severity("warning") == scfw::FindingSeverity::Warning);
    CHECK_FALSE(scfw::parse_severity("INFO"));
}

// ============================================================================
// InstallTarget / TargetSet
// ============================================================================

TEST_CASE("InstallTarget display") {
    InstallTarget t{Ecosystem::Npm, "react", "18.3.1", ""};
    CHECK(t.display() == "react@18.3.1");

    InstallTarget p{Ecosystem::PyPI, "requests", "2.32.3", ""};
    CHECK(p.display() == "requests==2.32.3");
}

TEST_CASE("InstallTarget equality ignores source hint") {
    InstallTarget a{Ecosystem::PyPI, "requests", "2.32.3", ""};
    InstallTarget b{Ecosystem::PyPI, "requests", "2.32.3", "git+https://example.com/requests"};
    InstallTarget c{Ecosystem::Npm, "requests", "2.32.3", ""};
    CHECK(a == b);
    CHECK(a != c);
}

TEST_CASE("TargetSet deduplicates and keeps insertion order") {
    TargetSet set;
    CHECK(set.insert({Ecosystem::Npm, "react", "18.3.1", ""}));
    CHECK(set.insert({Ecosystem::Npm, "js-tokens", "4.0.0", ""}));
    CHECK_FALSE(set.insert({Ecosystem::Npm, "react", "18.3.1", ""}));

    REQUIRE(set.size() == 2);
    CHECK(set.items()[0].name == "react");
    CHECK(set.items()[1].name == "js-tokens");
    CHECK(set.contains({Ecosystem::Npm, "js-tokens", "4.0.0", ""}));
    CHECK_FALSE(set.contains({Ecosystem::Npm, "js-tokens", "3.0.0", ""}));
}

TEST_CASE("TargetSet treats different versions as different targets") {
    TargetSet set{
        {Ecosystem::PyPI, "urllib3", "1.26.0", ""},
        {Ecosystem::PyPI, "urllib3", "2.2.0", ""},
    };
    CHECK(set.size() == 2);
}

// ============================================================================
// Text Utilities
// ============================================================================

TEST_CASE("tokenize splits on runs of whitespace") {
    auto tokens = scfw::text::tokenize("  npm sill \t ADD  node_modules/react ");
    REQUIRE(tokens.size() == 4);
    CHECK(tokens[0] == "npm");
    CHECK(tokens[3] == "node_modules/react");
}

TEST_CASE("split_lines handles CRLF and a missing final newline") {
    auto lines = scfw::text::split_lines("one\r\ntwo\nthree");
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] == "one");
    CHECK(lines[2] == "three");
}
