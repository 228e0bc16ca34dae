#include "process/Subprocess.hpp"

#include "../HtmlFrameTestHelper.hpp"

#include <doctest/doctest.h>

#include <chrono>
#include <string>

using namespace HF;
using namespace HF::Process;
using namespace std::chrono_literals;
using HF::Test::EnvGuard;
using HF::Test::TempDir;
using HF::Test::writeFile;
using HF::Test::writeScript;

TEST_SUITE("process.subprocess") {

TEST_CASE("Captures stdout, stderr and exit code") {
    auto result = RunProcess({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"});
    REQUIRE(result);
    CHECK(result->exit_code == 3);
    CHECK(result->term_signal == 0);
    CHECK_FALSE(result->succeeded());
    CHECK(result->stdout_text == "out\n");
    CHECK(result->stderr_text == "err\n");
}

TEST_CASE("Successful command") {
    auto result = RunProcess({"/bin/sh", "-c", "printf hello"});
    REQUIRE(result);
    CHECK(result->succeeded());
    CHECK(result->stdout_text == "hello");
}

TEST_CASE("Large output does not block the child") {
    auto result = RunProcess({"/bin/sh", "-c", "i=0; while [ $i -lt 5000 ]; do echo 0123456789abcdef; i=$((i+1)); done"});
    REQUIRE(result);
    CHECK(result->succeeded());
    CHECK(result->stdout_text.size() == 5000 * 17);
}

TEST_CASE("Working directory is applied") {
    TempDir dir;
    ProcessOptions options{};
    options.working_directory = dir.path();
    auto result = RunProcess({"/bin/sh", "-c", "pwd -P"}, options);
    REQUIRE(result);
    auto reported = result->stdout_text;
    while (!reported.empty() && reported.back() == '\n') {
        reported.pop_back();
    }
    CHECK(std::filesystem::path{reported} == std::filesystem::canonical(dir.path()));
}

TEST_CASE("Missing executable is reported as not found") {
    auto result = RunProcess({"htmlframe-definitely-not-installed"});
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::NotFound);

    auto empty = RunProcess({});
    REQUIRE_FALSE(empty);
    CHECK(empty.error().code == Error::Code::MalformedInput);
}

TEST_CASE("Timeout kills the child") {
    ProcessOptions options{};
    options.timeout = 200ms;
    auto start  = std::chrono::steady_clock::now();
    auto result = RunProcess({"/bin/sh", "-c", "sleep 5"}, options);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::Timeout);
    CHECK(elapsed < 4s);
}

TEST_CASE("Signals are reported") {
    auto result = RunProcess({"/bin/sh", "-c", "kill -9 $$"});
    REQUIRE(result);
    CHECK(result->term_signal == 9);
    CHECK_FALSE(result->succeeded());
}

TEST_CASE("PATH lookup finds executable files only") {
    TempDir dir;
    writeScript(dir / "fake-browser", "exit 0\n");
    writeFile(dir / "not-executable", "data");
    EnvGuard path("PATH", dir.path().c_str());

    auto found = FindExecutableInPath("fake-browser");
    REQUIRE(found);
    CHECK(*found == dir / "fake-browser");
    CHECK_FALSE(FindExecutableInPath("not-executable"));
    CHECK_FALSE(FindExecutableInPath("missing"));
    CHECK(IsExecutableFile(dir / "fake-browser"));
    CHECK_FALSE(IsExecutableFile(dir.path()));
}

} // TEST_SUITE
