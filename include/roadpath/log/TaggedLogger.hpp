#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace RP {

/**
 * Asynchronous logger writing tagged lines to stderr from a worker thread.
 *
 * Configuration is read from the environment when the logger is constructed:
 *   ROADPATH_LOG_ENABLED / ROADPATH_LOG   enable output
 *   ROADPATH_LOG_ENABLE_TAGS             comma list, only these tags pass
 *   ROADPATH_LOG_SKIP_TAGS               comma list of extra tags to drop
 *   ROADPATH_LOG_CLEAR_DEFAULT_SKIPS     drop the built-in skip list
 *
 * The worker thread starts with the first enqueued line. Pending lines are
 * written before the destructor returns.
 */
class TaggedLogger {
public:
    struct Entry {
        std::chrono::system_clock::time_point when;
        std::set<std::string>                 tags;
        std::string                           text;
        std::string                           thread;
        std::source_location                  where;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto isLoggingEnabled() const -> bool;
    auto hasWorker() const -> bool;

    // Serializes console output between the logger and test reporters.
    static std::mutex coutMutex;

private:
    auto        enqueue(Entry entry) -> void;
    auto        drain() -> void;
    auto        accepts(std::set<std::string> const& tags) const -> bool;
    auto        nameOf(std::thread::id id) -> std::string;
    static auto format(Entry const& entry) -> std::string;
    static auto shortPath(const char* file) -> std::string;

    std::vector<Entry>      pending;
    mutable std::mutex      pendingMutex;
    std::condition_variable wake;
    bool                    stopping = false;
    std::atomic<bool>       enabled{false};
    std::set<std::string>   skipTags{"INFO", "Glob"};
    std::set<std::string>   onlyTags;

    std::unordered_map<std::thread::id, std::string> threadNames;
    std::mutex                                       threadNamesMutex;
    int                                              unnamedThreads = 0;

    std::thread worker;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->enabled.load(std::memory_order_relaxed))
        return;
    this->enqueue(Entry{.when   = std::chrono::system_clock::now(),
                        .tags   = {std::string(std::forward<Tags>(tags))...},
                        .text   = message,
                        .thread = this->nameOf(std::this_thread::get_id()),
                        .where  = location});
}

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace RP

#ifdef ROADPATH_LOG_DEBUG
#define rp_log(message, ...) ::RP::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)
#else
#define rp_log(message, ...) ((void)0)
#endif // ROADPATH_LOG_DEBUG
