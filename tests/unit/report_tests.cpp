#include <doctest/doctest.h>
#include <scfw/report.hpp>

using scfw::Ecosystem;
using scfw::Finding;
using scfw::FindingSeverity;
using scfw::InstallTarget;
using scfw::VerificationCoverage;
using scfw::VerificationReport;

namespace {

const InstallTarget kRequests{Ecosystem::PyPI, "requests", "2.32.3", ""};
const InstallTarget kIdna{Ecosystem::PyPI, "idna", "3.7", ""};

Finding make_finding(const InstallTarget& target, FindingSeverity severity,
                     const std::string& message, const std::string& verifier = "TestVerifier") {
    Finding f;
    f.target = target;
    f.severity = severity;
    f.message = message;
    f.verifier = verifier;
    return f;
}

} // namespace

TEST_CASE("empty report") {
    VerificationReport report;
    CHECK(report.empty());
    CHECK_FALSE(report.has_critical());
    CHECK_FALSE(report.has_warnings());
    CHECK(report.finding_count() == 0);
    CHECK(report.findings_for(kRequests).empty());
    CHECK(report.render().empty());
}

TEST_CASE("findings are grouped per target in insertion order") {
    VerificationReport report;
    report.add_finding(make_finding(kIdna, FindingSeverity::Warning, "first"));
    report.add_finding(make_finding(kRequests, FindingSeverity::Critical, "second"));
    report.add_finding(make_finding(kIdna, FindingSeverity::Warning, "third", "OtherVerifier"));

    REQUIRE(report.targets_with_findings().size() == 2);
    CHECK(report.targets_with_findings()[0] == kIdna);
    CHECK(report.targets_with_findings()[1] == kRequests);

    const auto& idna = report.findings_for(kIdna);
    REQUIRE(idna.size() == 2);
    CHECK(idna[0].message == "first");
    CHECK(idna[1].message == "third");
    CHECK(idna[1].verifier == "OtherVerifier");

    CHECK(report.finding_count() == 3);
    CHECK(report.has_critical());
    CHECK(report.has_warnings());
}

TEST_CASE("filtered keeps one severity and the failure list") {
    VerificationReport report;
    report.add_finding(make_finding(kIdna, FindingSeverity::Warning, "old"));
    report.add_finding(make_finding(kRequests, FindingSeverity::Critical, "malicious"));
    report.add_failure({"SlowVerifier", "timed out after 30000 ms"});
    report.add_verifier_run("TestVerifier");

    auto critical = report.filtered(FindingSeverity::Critical);
    CHECK(critical.has_critical());
    CHECK_FALSE(critical.has_warnings());
    REQUIRE(critical.targets_with_findings().size() == 1);
    CHECK(critical.targets_with_findings()[0] == kRequests);
    CHECK(critical.failures().size() == 1);
    CHECK(critical.verifiers_run().size() == 1);

    auto warnings = report.filtered(FindingSeverity::Warning);
    CHECK_FALSE(warnings.has_critical());
    CHECK(warnings.findings_for(kIdna).size() == 1);
}

TEST_CASE("all_verifiers_failed") {
    VerificationReport none;
    CHECK_FALSE(none.all_verifiers_failed());

    VerificationReport failed;
    failed.add_failure({"A", "boom"});
    CHECK(failed.all_verifiers_failed());

    VerificationReport partial;
    partial.add_failure({"A", "boom"});
    partial.add_verifier_run("B");
    CHECK_FALSE(partial.all_verifiers_failed());
}

TEST_CASE("render lists targets, indented messages and unavailable verifiers") {
    VerificationReport report;
    report.add_finding(make_finding(kRequests, FindingSeverity::Warning,
                                    "An advisory exists:\n  * https://osv.dev/vulnerability/GHSA-1"));
    report.add_failure({"SlowVerifier", "timed out after 30000 ms"});

    std::string text = report.render();
    CHECK(text.find("Installation target requests==2.32.3:\n") != std::string::npos);
    CHECK(text.find("  - An advisory exists:\n      * https://osv.dev/vulnerability/GHSA-1\n") !=
          std::string::npos);
    CHECK(text.find("1 verifier unavailable:\n  - SlowVerifier: timed out after 30000 ms\n") !=
          std::string::npos);
}

TEST_CASE("coverage distinguishes no verifiers from clean results") {
    VerificationReport report;
    CHECK(report.coverage() == VerificationCoverage::NotNeeded);
    CHECK_FALSE(report.unverified());

    report.set_target_count(2);
    CHECK(report.coverage() == VerificationCoverage::NoVerifiers);
    CHECK(report.unverified());
    CHECK_FALSE(report.all_verifiers_failed());
    CHECK(report.empty());

    SUBCASE("every verifier failed") {
        report.add_failure({"OsvVerifier", "timed out"});
        CHECK(report.coverage() == VerificationCoverage::AllFailed);
        CHECK(report.unverified());
        CHECK(report.all_verifiers_failed());
    }
    SUBCASE("one verifier failed") {
        report.add_verifier_run("DatadogMaliciousPackagesVerifier");
        report.add_failure({"OsvVerifier", "timed out"});
        CHECK(report.coverage() == VerificationCoverage::Partial);
        CHECK_FALSE(report.unverified());
    }
    SUBCASE("every verifier ran") {
        report.add_verifier_run("DatadogMaliciousPackagesVerifier");
        CHECK(report.coverage() == VerificationCoverage::Complete);
        CHECK_FALSE(report.unverified());
    }
}
