#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#ifdef DS_LOG_DEBUG

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

using namespace std::chrono_literals;

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

// Flushes by destroying the logger before the buffer is restored.
auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

void waitForFlush() {
    std::this_thread::sleep_for(20ms);
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    EnvGuard env("DDRSYNC_LOG", nullptr);

    auto output = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "Sync");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("DDRSYNC_LOG_env_enables_logging") {
    EnvGuard env("DDRSYNC_LOG", "1");

    auto output = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("hello log", std::source_location::current(), "Sync");
        waitForFlush();
    });

    CHECK(output.find("[Sync]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("DDRSYNC_LOG_zero_keeps_logging_off") {
    EnvGuard env("DDRSYNC_LOG", "0");

    auto output = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("quiet", std::source_location::current(), "Sync");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("default_skip_list_filters_chatty_tags") {
    EnvGuard env("DDRSYNC_LOG", "1");

    auto skipped = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("cache hit", std::source_location::current(), "FieldCache");
        logger.log_impl("request", std::source_location::current(), "Transport", "ERROR");
        waitForFlush();
    });
    CHECK(skipped.empty());

    auto cleared = captureStderr([] {
        DS::TaggedLogger logger;
        logger.set_skip_tags({});
        logger.log_impl("cache miss", std::source_location::current(), "FieldCache");
        waitForFlush();
    });
    CHECK(cleared.find("cache miss") != std::string::npos);
}

TEST_CASE("thread_name_is_used_in_output") {
    EnvGuard env("DDRSYNC_LOG", "1");

    auto output = captureStderr([] {
        DS::TaggedLogger logger;
        logger.set_thread_name("AutoSync");
        logger.log_impl("with name", std::source_location::current(), "Test");
        waitForFlush();
    });

    CHECK(output.find("[AutoSync]") != std::string::npos);
}

TEST_CASE("set_logging_enabled_overrides_env") {
    EnvGuard env("DDRSYNC_LOG", "1");

    auto suppressed = captureStderr([] {
        DS::TaggedLogger logger;
        logger.set_enabled(false);
        logger.log_impl("disabled", std::source_location::current(), "Test");
        waitForFlush();
    });
    CHECK(suppressed.empty());

    EnvGuard off("DDRSYNC_LOG", nullptr);
    auto     enabled = captureStderr([] {
        DS::TaggedLogger logger;
        logger.set_enabled(true);
        logger.log_impl("enabled", std::source_location::current(), "Test");
        waitForFlush();
    });
    CHECK(enabled.find("enabled") != std::string::npos);
}

TEST_CASE("tags_are_joined_in_order") {
    EnvGuard env("DDRSYNC_LOG", "1");

    auto output = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("joined", std::source_location::current(), "Alpha", "Beta");
        waitForFlush();
    });

    CHECK(output.find("[Alpha][Beta]") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    EnvGuard env("DDRSYNC_LOG", "1");

    auto output = captureStderr([] {
        DS::TaggedLogger logger;
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 1 "tests/unit/log/test_TaggedLogger.cpp"
        waitForFlush();
    });

    CHECK(output.find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

} // TEST_SUITE

#endif // DS_LOG_DEBUG
