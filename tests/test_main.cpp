#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
#ifdef WS_LOG_DEBUG
        std::lock_guard<std::mutex> lock(WS::TaggedLogger::output_mutex);
#endif
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void report_query(const doctest::QueryData&) override {
    }
    void test_run_start() override {
    }
    void test_run_end(const doctest::TestRunStats&) override {
    }
    void test_case_reenter(const doctest::TestCaseData&) override {
    }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
    }
    void test_case_exception(const doctest::TestCaseException&) override {
    }
    void subcase_start(const doctest::SubcaseSignature& in) override {
#ifdef WS_LOG_DEBUG
        std::lock_guard<std::mutex> lock(WS::TaggedLogger::output_mutex);
#endif
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }
    void subcase_end() override {
    }
    void log_assert(const doctest::AssertData&) override {
    }
    void log_message(const doctest::MessageData&) override {
    }
    void test_case_skipped(const doctest::TestCaseData&) override {
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    if (context.shouldExit()) {
        return context.run();
    }

#ifdef WS_LOG_DEBUG
    // WIDGETSPACE_LOG set to anything but "0" turns the tagged logger on;
    // WIDGETSPACE_LOG_TAGS narrows it, e.g. "EventRouter,Style".
    auto const* log_env  = std::getenv("WIDGETSPACE_LOG");
    auto const  log_test = log_env != nullptr && std::strcmp(log_env, "0") != 0;
    WS::set_thread_name("TestMain");
    if (log_test) {
        if (auto const* tags = std::getenv("WIDGETSPACE_LOG_TAGS")) {
            WS::set_logging_tags(tags);
        }
        WS::set_logging_enabled(true);
        ws_log("Starting test execution", "TEST");
    }
#endif

    auto const result = context.run();

#ifdef WS_LOG_DEBUG
    if (log_test) {
        ws_log(result == 0 ? "All tests passed" : "Some tests failed", "TEST");
        WS::logger().flush();
    }
#endif
    return result;
}
