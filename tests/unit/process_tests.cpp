#include <doctest/doctest.h>
#include <scfw/process.hpp>

#include "../test_helpers.hpp"

#include <chrono>
#include <thread>

using scfw::CancellationToken;
using scfw::ErrorCode;
using scfw::ProcessOptions;
using scfw_test::TempDir;

TEST_CASE("run_process captures output and the exit code") {
    auto result = scfw::run_process({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(result.isOk());
    CHECK(result.value().exit_code == 3);
    CHECK(result.value().out == "out\n");
    CHECK(result.value().err == "err\n");
    CHECK_FALSE(result.value().succeeded());
}

TEST_CASE("run_process reports a missing executable") {
    auto result = scfw::run_process({"/nonexistent/scfw-test-binary"});
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::EXECUTABLE_NOT_FOUND);
}

TEST_CASE("run_process honours the working directory") {
    TempDir dir;
    ProcessOptions options;
    options.cwd = dir.str();

    auto result = scfw::run_process({"/bin/sh", "-c", "pwd -P"}, options);
    REQUIRE(result.isOk());
    CHECK(result.value().out.find(dir.path().filename().string()) != std::string::npos);
}

TEST_CASE("run_process kills a child that exceeds its timeout") {
    ProcessOptions options;
    options.timeout = std::chrono::milliseconds(200);

    auto start = std::chrono::steady_clock::now();
    auto result = scfw::run_process({"/bin/sh", "-c", "sleep 5"}, options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.isOk());
    CHECK(result.value().timed_out);
    CHECK(elapsed < std::chrono::seconds(3));
}

TEST_CASE("run_process stops when cancelled") {
    CancellationToken token;
    ProcessOptions options;
    options.cancel = &token;

    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });
    auto result = scfw::run_process({"/bin/sh", "-c", "sleep 5"}, options);
    canceller.join();

    REQUIRE(result.isOk());
    CHECK(result.value().cancelled);
}

TEST_CASE("format_command quotes arguments with spaces") {
    CHECK(scfw::format_command({"pip", "install", "requests"}) == "pip install requests");
    CHECK(scfw::format_command({"sh", "-c", "echo hi"}) == "sh -c 'echo hi'");
}
