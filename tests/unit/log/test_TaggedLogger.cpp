#ifdef HF_LOG_DEBUG
#include <doctest/doctest.h>

#include "log/TaggedLogger.hpp"
#include "../HtmlFrameTestHelper.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using HF::Test::captureStderr;
using HF::Test::EnvBlock;
using HF::Test::EnvGuard;

namespace {

void waitForFlush() {
    std::this_thread::sleep_for(20ms);
}

auto makeBaselineEnvBlock() -> EnvBlock {
    return EnvBlock{
        {"HTMLFRAME_LOG_ENABLED", nullptr},
        {"HTMLFRAME_LOG", nullptr},
        {"HTMLFRAME_LOG_CLEAR_DEFAULT_SKIPS", nullptr},
        {"HTMLFRAME_LOG_ENABLE_TAGS", nullptr},
        {"HTMLFRAME_LOG_SKIP_TAGS", nullptr},
    };
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto env = makeBaselineEnvBlock();

    auto output = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "TestTag");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("environment_flag_enables_logging") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("hello log", std::source_location::current(), "TestTag");
        waitForFlush();
    });

    CHECK_FALSE(output.empty());
    CHECK(output.find("[TestTag]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("[tid ") != std::string::npos);
}

TEST_CASE("HTMLFRAME_LOG_env_enables_logging") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG", "on");

    auto output = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("env enabled", std::source_location::current(), "EnvTag");
        waitForFlush();
    });

    CHECK(output.find("env enabled") != std::string::npos);
    CHECK(output.find("EnvTag") != std::string::npos);
}

TEST_CASE("default_skip_list_filters_noisy_tags") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "1");

    for (char const* tag : {"INFO", "Subprocess", "ERROR", "Function Called"}) {
        auto skipped = captureStderr([tag] {
            HF::TaggedLogger logger;
            logger.log_impl("filtered", std::source_location::current(), tag);
            waitForFlush();
        });
        CHECK_MESSAGE(skipped.empty(), tag);
    }

    auto kept = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("session ready", std::source_location::current(), "Render");
        waitForFlush();
    });
    CHECK(kept.find("[Render]") != std::string::npos);
}

TEST_CASE("falsy_env_values_keep_logging_off") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "off");
    EnvGuard shortFlag("HTMLFRAME_LOG", "0");

    auto output = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("quiet", std::source_location::current(), "Render");
        waitForFlush();
    });
    CHECK(output.empty());
}

TEST_CASE("clear_default_skips_allows_info") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "1");
    EnvGuard clearSkips("HTMLFRAME_LOG_CLEAR_DEFAULT_SKIPS", "1");

    auto output = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("info allowed", std::source_location::current(), "INFO");
        waitForFlush();
    });

    CHECK(output.find("info allowed") != std::string::npos);
}

TEST_CASE("enabled_tags_gate_output") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "1");
    EnvGuard enableTags("HTMLFRAME_LOG_ENABLE_TAGS", "Focus");

    auto accepted = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("keep me", std::source_location::current(), "Focus");
        waitForFlush();
    });
    CHECK(accepted.find("keep me") != std::string::npos);

    auto rejected = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("drop me", std::source_location::current(), "Focus", "Other");
        waitForFlush();
    });
    CHECK(rejected.empty());
}

TEST_CASE("custom_skip_tags_extend_filter") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "1");
    EnvGuard extraSkip("HTMLFRAME_LOG_SKIP_TAGS", "Noisy");

    auto skipped = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("not expected", std::source_location::current(), "Noisy");
        waitForFlush();
    });
    CHECK(skipped.empty());

    auto passed = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("expected", std::source_location::current(), "Quiet");
        waitForFlush();
    });
    CHECK(passed.find("expected") != std::string::npos);
}

TEST_CASE("skip_tag_parsing_trims_tokens") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "1");
    EnvGuard clearSkips("HTMLFRAME_LOG_CLEAR_DEFAULT_SKIPS", "1");
    EnvGuard extraSkip("HTMLFRAME_LOG_SKIP_TAGS", " noisy , extra ");

    auto skipped = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("first", std::source_location::current(), "extra");
        waitForFlush();
    });
    CHECK(skipped.empty());

    auto kept = captureStderr([] {
        HF::TaggedLogger logger;
        logger.log_impl("second", std::source_location::current(), "clean");
        waitForFlush();
    });
    CHECK(kept.find("second") != std::string::npos);
}

TEST_CASE("worker_thread_id_is_recorded") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "1");

    std::ostringstream expected;
    auto output = captureStderr([&expected] {
        HF::TaggedLogger logger;
        std::thread worker([&] {
            expected << "[tid " << std::this_thread::get_id() << "]";
            logger.log_impl("from worker", std::source_location::current(), "Test");
        });
        worker.join();
        waitForFlush();
    });

    CHECK(output.find(expected.str()) != std::string::npos);
}

TEST_CASE("set_logging_enabled_overrides_env") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "1");

    auto suppressed = captureStderr([] {
        HF::TaggedLogger logger;
        logger.setLoggingEnabled(false);
        logger.log_impl("disabled", std::source_location::current(), "Test");
        waitForFlush();
    });
    CHECK(suppressed.empty());

    auto enabled = captureStderr([] {
        HF::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("enabled", std::source_location::current(), "Test");
        waitForFlush();
    });
    CHECK(enabled.find("enabled") != std::string::npos);
}

TEST_CASE("global_wrappers_and_macro_emit_joined_tags") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        HF::set_logging_enabled(true);
        hf_log("via macro", "Alpha", "Beta");
        waitForFlush();
    });

    CHECK(output.find("Alpha][Beta") != std::string::npos);
}

TEST_CASE("short_path_handles_file_without_parent_directory") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        HF::TaggedLogger logger;
#line 500 "TaggedLoggerNoParent.cpp"
        logger.log_impl("no parent path", std::source_location::current(), "Solo");
#line 1 "tests/unit/log/test_TaggedLogger.cpp"
        waitForFlush();
    });

    CHECK(output.find("TaggedLoggerNoParent.cpp:500") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    auto env = makeBaselineEnvBlock();
    EnvGuard enableLog("HTMLFRAME_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        HF::TaggedLogger logger;
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 1 "tests/unit/log/test_TaggedLogger.cpp"
        waitForFlush();
    });

    CHECK(output.find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

} // TEST_SUITE
#endif // HF_LOG_DEBUG
