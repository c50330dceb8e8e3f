#include <doctest/doctest.h>
#include <scfw/dry_run_parsers.hpp>

using scfw::Ecosystem;
using scfw::ErrorCode;
using scfw::InstallTarget;
using scfw::Version;

// ============================================================================
// Installation Report
// ============================================================================

TEST_CASE("parse_pip_report extracts every install entry") {
    const char* report = R"({
  "version": "1",
  "pip_version": "24.0",
  "install": [
    {
      "download_info": {"url": "https://files.pythonhosted.org/requests-2.32.3-py3-none-any.whl"},
      "is_direct": false,
      "requested": true,
      "metadata": {"name": "requests", "version": "2.32.3"}
    },
    {
      "download_info": {"url": "https://files.pythonhosted.org/idna-3.7-py3-none-any.whl"},
      "is_direct": false,
      "requested": false,
      "metadata": {"name": "idna", "version": "3.7"}
    }
  ]
})";

    auto targets = scfw::parse_pip_report(report);
    REQUIRE(targets.isOk());
    REQUIRE(targets.value().size() == 2);
    CHECK(targets.value().contains({Ecosystem::PyPI, "requests", "2.32.3", ""}));
    CHECK(targets.value().contains({Ecosystem::PyPI, "idna", "3.7", ""}));
    CHECK(targets.value().items()[0].source_hint.empty());
}

TEST_CASE("parse_pip_report keeps the URL of direct installs") {
    const char* report = R"({
  "install": [
    {
      "download_info": {"url": "https://github.com/psf/requests.git", "vcs_info": {"vcs": "git"}},
      "is_direct": true,
      "metadata": {"name": "requests", "version": "2.33.0.dev0"}
    }
  ]
})";

    auto targets = scfw::parse_pip_report(report);
    REQUIRE(targets.isOk());
    REQUIRE(targets.value().size() == 1);
    CHECK(targets.value().items()[0].source_hint == "https://github.com/psf/requests.git");
}

TEST_CASE("parse_pip_report with nothing to install") {
    auto targets = scfw::parse_pip_report(R"({"install": []})");
    REQUIRE(targets.isOk());
    CHECK(targets.value().empty());
}

TEST_CASE("parse_pip_report rejects malformed reports") {
    auto garbage = scfw::parse_pip_report("Collecting requests");
    REQUIRE(garbage.isErr());
    CHECK(garbage.error().code() == ErrorCode::PARSE_ERROR);

    auto no_install = scfw::parse_pip_report(R"({"version": "1"})");
    REQUIRE(no_install.isErr());
    CHECK(no_install.error().code() == ErrorCode::PARSE_ERROR);

    auto no_metadata = scfw::parse_pip_report(R"({"install": [{"is_direct": false}]})");
    REQUIRE(no_metadata.isErr());
    CHECK(no_metadata.error().code() == ErrorCode::PARSE_ERROR);
}

// ============================================================================
// pip list / pip --version
// ============================================================================

TEST_CASE("parse_pip_list") {
    auto targets = scfw::parse_pip_list(
        R"([{"name": "pip", "version": "24.0"}, {"name": "setuptools", "version": "69.5.1"}])");
    REQUIRE(targets.isOk());
    CHECK(targets.value().size() == 2);
    CHECK(targets.value().contains({Ecosystem::PyPI, "setuptools", "69.5.1", ""}));
}

TEST_CASE("parse_pip_list rejects non-array output") {
    auto targets = scfw::parse_pip_list(R"({"name": "pip"})");
    REQUIRE(targets.isErr());
    CHECK(targets.error().code() == ErrorCode::PARSE_ERROR);
}

TEST_CASE("parse_pip_version") {
    auto v = scfw::parse_pip_version("pip 24.0 from /usr/lib/python3/site-packages/pip (python 3.12)\n");
    REQUIRE(v);
    CHECK(*v == Version(24, 0, 0));

    auto old = scfw::parse_pip_version("pip 22.1.2 from /opt/venv/lib/python3.9/site-packages/pip (python 3.9)");
    REQUIRE(old);
    CHECK(*old == Version(22, 1, 2));

    CHECK_FALSE(scfw::parse_pip_version("/usr/bin/python3: No module named pip"));
}
