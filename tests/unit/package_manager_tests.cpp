#include <doctest/doctest.h>
#include <scfw/compatibility.hpp>
#include <scfw/managers.hpp>

#include "../test_helpers.hpp"

using scfw::Classification;
using scfw::Command;
using scfw::ErrorCode;
using scfw::ManagerKind;
using scfw::NpmManager;
using scfw::PipManager;
using scfw::PoetryManager;
using scfw_test::TempDir;
using scfw_test::write_script;

// ============================================================================
// Command Classification
// ============================================================================

TEST_CASE("pip installish commands") {
    PipManager pip("/usr/bin/python3");
    CHECK(pip.isInstallish({"pip", "install", "requests"}));
    CHECK(pip.isInstallish({"pip", "-q", "install", "requests"}));
    CHECK_FALSE(pip.isInstallish({"pip", "list"}));
    CHECK_FALSE(pip.isInstallish({"pip", "uninstall", "requests"}));
    CHECK_FALSE(pip.isInstallish({"pip"}));

    CHECK(pip.installsNothing({"pip", "install", "--dry-run", "requests"}));
    CHECK(pip.installsNothing({"pip", "install", "-h"}));
    CHECK_FALSE(pip.installsNothing({"pip", "install", "requests"}));
}

TEST_CASE("npm accepts every install alias") {
    NpmManager npm("/usr/bin/npm");
    for (const auto& alias : {"install", "add", "i", "in", "ins", "inst", "insta", "instal",
                              "isnt", "isnta", "isntal", "isntall"}) {
        CAPTURE(alias);
        CHECK(npm.isInstallish({"npm", alias, "react"}));
    }
    CHECK(npm.isInstallish({"npm", "--prefix", "app", "install"}));
    CHECK_FALSE(npm.isInstallish({"npm", "run", "build"}));
    CHECK_FALSE(npm.isInstallish({"npm", "uninstall", "react"}));
}

TEST_CASE("poetry installish commands") {
    PoetryManager poetry("/usr/bin/poetry");
    for (const auto& sub : {"add", "install", "sync", "update"}) {
        CAPTURE(sub);
        CHECK(poetry.isInstallish({"poetry", sub}));
    }
    CHECK_FALSE(poetry.isInstallish({"poetry", "show"}));
    CHECK_FALSE(poetry.isInstallish({"poetry", "remove", "requests"}));
    CHECK(poetry.installsNothing({"poetry", "install", "--version"}));
    CHECK(poetry.installsNothing({"poetry", "add", "-V"}));
}

TEST_CASE("normalizeCommand substitutes the invocation") {
    PipManager pip("/opt/venv/bin/python");
    auto argv = pip.normalizeCommand({"pip", "install", "requests"});
    REQUIRE(argv.isOk());
    CHECK(argv.value() == Command{"/opt/venv/bin/python", "-m", "pip", "install", "requests"});

    NpmManager npm("/usr/local/bin/npm");
    auto npm_argv = npm.normalizeCommand({"npm", "i", "react"});
    REQUIRE(npm_argv.isOk());
    CHECK(npm_argv.value() == Command{"/usr/local/bin/npm", "i", "react"});
}

TEST_CASE("normalizeCommand rejects commands for another manager") {
    PipManager pip("/usr/bin/python3");
    auto empty = pip.normalizeCommand({});
    REQUIRE(empty.isErr());
    CHECK(empty.error().code() == ErrorCode::INVALID_COMMAND);

    auto wrong = pip.normalizeCommand({"npm", "install", "react"});
    REQUIRE(wrong.isErr());
    CHECK(wrong.error().code() == ErrorCode::INVALID_COMMAND);
}

// ============================================================================
// Factory
// ============================================================================

TEST_CASE("make_package_manager resolves an explicit executable") {
    TempDir dir;
    write_script(dir / "npm", "echo 10.2.4\n");

    auto npm = scfw::make_package_manager(ManagerKind::Npm, dir / "npm");
    REQUIRE(npm.isOk());
    CHECK(npm.value()->kind() == ManagerKind::Npm);
    CHECK(npm.value()->executable() == dir / "npm");
    CHECK(npm.value()->name() == "npm");

    auto missing = scfw::make_package_manager(ManagerKind::Poetry, dir / "poetry");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::EXECUTABLE_NOT_FOUND);
}

// ============================================================================
// Compatibility Gate
// ============================================================================

TEST_CASE("classify checks the version only for installish commands") {
    TempDir dir;
    // Records each invocation so that version queries can be counted
    write_script(dir / "npm",
        "echo \"$@\" >> \"$(dirname \"$0\")/calls\"\n"
        "echo 6.14.18\n");
    NpmManager npm(dir / "npm");

    auto run = scfw::classify(npm, {"npm", "run", "build"}, false);
    REQUIRE(run.isOk());
    CHECK(run.value() == Classification::NotInstallish);
    CHECK_FALSE(scfw::path_exists(dir / "calls"));

    auto install = scfw::classify(npm, {"npm", "install", "react"}, false);
    REQUIRE(install.isOk());
    CHECK(install.value() == Classification::UnsupportedVersion);
    CHECK(scfw::path_exists(dir / "calls"));

    auto allowed = scfw::classify(npm, {"npm", "install", "react"}, true);
    REQUIRE(allowed.isOk());
    CHECK(allowed.value() == Classification::Installish);
}

TEST_CASE("classify accepts supported versions") {
    TempDir dir;
    write_script(dir / "poetry", "echo 'Poetry (version 2.1.1)'\n");
    PoetryManager poetry(dir / "poetry");

    auto result = scfw::classify(poetry, {"poetry", "add", "requests"}, false);
    REQUIRE(result.isOk());
    CHECK(result.value() == Classification::Installish);
}

TEST_CASE("classify treats unparseable version output as unsupported") {
    TempDir dir;
    write_script(dir / "python", "echo 'something unexpected'\n");
    PipManager pip(dir / "python");

    auto result = scfw::classify(pip, {"pip", "install", "requests"}, false);
    REQUIRE(result.isOk());
    CHECK(result.value() == Classification::UnsupportedVersion);
}

TEST_CASE("classify propagates a failing version query") {
    TempDir dir;
    write_script(dir / "python", "echo 'No module named pip' >&2\nexit 1\n");
    PipManager pip(dir / "python");

    auto result = scfw::classify(pip, {"pip", "install", "requests"}, false);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::PROCESS_FAILED);
}

TEST_CASE("classify rejects a mismatched command") {
    PipManager pip("/usr/bin/python3");
    auto result = scfw::classify(pip, {"poetry", "install"}, false);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INVALID_COMMAND);
}
