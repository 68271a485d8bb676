#include <catch2/catch_test_macros.hpp>
#include <acoustics/core/log.hpp>
#include <string>
#include <vector>

using namespace acoustics::core;

namespace {

struct CapturingSink : ILogSink {
    struct Entry {
        LogLevel level;
        std::string category;
        std::string message;
    };
    std::vector<Entry> entries;

    void log(LogLevel level, const std::string& category, const std::string& message) override {
        entries.push_back({level, category, message});
    }
};

class LogFixture {
protected:
    LogFixture() : m_previous(get_log_level()) {
        add_log_sink(&sink);
    }

    ~LogFixture() {
        remove_log_sink(&sink);
        set_log_level(m_previous);
    }

    CapturingSink sink;

private:
    LogLevel m_previous;
};

} // namespace

TEST_CASE("LogLevel names", "[core][log]") {
    REQUIRE(std::string(to_string(LogLevel::Trace)) == "trace");
    REQUIRE(std::string(to_string(LogLevel::Info)) == "info");
    REQUIRE(std::string(to_string(LogLevel::Warn)) == "warn");
    REQUIRE(std::string(to_string(LogLevel::Fatal)) == "fatal");
}

TEST_CASE_METHOD(LogFixture, "Log sinks receive messages", "[core][log]") {
    set_log_level(LogLevel::Trace);

    SECTION("Category comes from the bracketed prefix") {
        log(LogLevel::Error, "[Baker] Bake failed");
        REQUIRE(sink.entries.size() == 1);
        REQUIRE(sink.entries[0].level == LogLevel::Error);
        REQUIRE(sink.entries[0].category == "Baker");
        REQUIRE(sink.entries[0].message == "[Baker] Bake failed");
    }

    SECTION("Messages without a prefix have no category") {
        log(LogLevel::Info, std::string("plain message"));
        REQUIRE(sink.entries.size() == 1);
        REQUIRE(sink.entries[0].category.empty());
    }

    SECTION("Empty brackets are not a category") {
        log(LogLevel::Info, "[] nothing");
        REQUIRE(sink.entries.size() == 1);
        REQUIRE(sink.entries[0].category.empty());
    }

    SECTION("Null message is logged as empty") {
        log(LogLevel::Info, static_cast<const char*>(nullptr));
        REQUIRE(sink.entries.size() == 1);
        REQUIRE(sink.entries[0].message.empty());
    }
}

TEST_CASE_METHOD(LogFixture, "Log level filters messages", "[core][log]") {
    set_log_level(LogLevel::Warn);
    REQUIRE(get_log_level() == LogLevel::Warn);

    log(LogLevel::Debug, "[Test] dropped");
    log(LogLevel::Info, "[Test] dropped");
    log(LogLevel::Warn, "[Test] kept");
    log(LogLevel::Error, "[Test] kept");

    REQUIRE(sink.entries.size() == 2);
    REQUIRE(sink.entries[0].level == LogLevel::Warn);
    REQUIRE(sink.entries[1].level == LogLevel::Error);
}

TEST_CASE_METHOD(LogFixture, "Log sink registration", "[core][log]") {
    set_log_level(LogLevel::Info);

    SECTION("Adding a sink twice delivers once") {
        add_log_sink(&sink);
        log(LogLevel::Info, "[Test] once");
        REQUIRE(sink.entries.size() == 1);
    }

    SECTION("Removed sinks receive nothing") {
        remove_log_sink(&sink);
        log(LogLevel::Info, "[Test] nobody listens");
        REQUIRE(sink.entries.empty());
    }

    SECTION("Null sinks are ignored") {
        add_log_sink(nullptr);
        remove_log_sink(nullptr);
        log(LogLevel::Info, "[Test] still works");
        REQUIRE(sink.entries.size() == 1);
    }
}
