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
        std::lock_guard<std::mutex> lock(RP::TaggedLogger::coutMutex);
        std::cout << "Test: " << in.m_test_suite << " / " << in.m_name << std::endl;
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
        std::lock_guard<std::mutex> lock(RP::TaggedLogger::coutMutex);
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

    // Test discovery or --help: leave the shared logger untouched
    if (context.shouldExit()) {
        return context.run();
    }

#ifdef ROADPATH_LOG_DEBUG
    // Library logging during the run follows ROADPATH_LOG only.
    const char* logEnv    = std::getenv("ROADPATH_LOG");
    bool const  enableLog = logEnv != nullptr && std::strcmp(logEnv, "0") != 0;
    RP::set_thread_name("TestMain");
    RP::set_logging_enabled(enableLog);
    if (enableLog) {
        rp_log("Starting test execution", "TEST");
    }
#endif

    int res = context.run();

#ifdef ROADPATH_LOG_DEBUG
    if (enableLog) {
        if (res == 0) {
            rp_log("All tests passed successfully", "TEST", "SUCCESS");
        } else {
            rp_log("Some tests failed", "TEST", "FAILURE");
        }
    }
#endif

    return res;
}
