#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <format>
#include <iostream>
#include <string_view>
#include <utility>

namespace RP {

namespace {

auto env_flag(const char* name) -> bool {
    const char* value = std::getenv(name);
    if (value == nullptr)
        return false;
    std::string_view const text{value};
    return !(text.empty() || text == "0" || text == "false" || text == "off");
}

auto trim(std::string_view text) -> std::string_view {
    auto const first = text.find_first_not_of(' ');
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(' ');
    return text.substr(first, last - first + 1);
}

auto env_tags(const char* name) -> std::set<std::string> {
    std::set<std::string> tags;
    const char*           value = std::getenv(name);
    if (value == nullptr)
        return tags;
    std::string_view rest{value};
    for (;;) {
        auto const comma = rest.find(',');
        if (auto const tag = trim(rest.substr(0, comma)); !tag.empty())
            tags.emplace(tag);
        if (comma == std::string_view::npos)
            break;
        rest.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    if (env_flag("ROADPATH_LOG_ENABLED") || env_flag("ROADPATH_LOG"))
        this->enabled = true;
    if (env_flag("ROADPATH_LOG_CLEAR_DEFAULT_SKIPS"))
        this->skipTags.clear();
    this->skipTags.merge(env_tags("ROADPATH_LOG_SKIP_TAGS"));
    this->onlyTags = env_tags("ROADPATH_LOG_ENABLE_TAGS");
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->pendingMutex);
        this->stopping = true;
    }
    this->wake.notify_one();
    if (this->worker.joinable())
        this->worker.join();
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    this->threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    this->enabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return this->enabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::hasWorker() const -> bool {
    std::lock_guard<std::mutex> lock(this->pendingMutex);
    return this->worker.joinable();
}

auto TaggedLogger::enqueue(Entry entry) -> void {
    {
        std::lock_guard<std::mutex> lock(this->pendingMutex);
        this->pending.push_back(std::move(entry));
        // The worker only exists once there is something to write.
        if (!this->worker.joinable())
            this->worker = std::thread([this] { this->drain(); });
    }
    this->wake.notify_one();
}

auto TaggedLogger::drain() -> void {
    std::vector<Entry> batch;
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(this->pendingMutex);
            this->wake.wait(lock, [this] { return this->stopping || !this->pending.empty(); });
            if (this->pending.empty())
                return;
            batch.swap(this->pending);
        }
        for (auto const& entry : batch) {
            if (!this->accepts(entry.tags))
                continue;
            auto const line = format(entry);
            std::lock_guard<std::mutex> lock(coutMutex);
            std::cerr << line << std::flush;
        }
        batch.clear();
    }
}

auto TaggedLogger::accepts(std::set<std::string> const& tags) const -> bool {
    for (auto const& tag : tags) {
        if (this->skipTags.contains(tag))
            return false;
        if (!this->onlyTags.empty() && !this->onlyTags.contains(tag))
            return false;
    }
    return true;
}

auto TaggedLogger::nameOf(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    auto [it, inserted] = this->threadNames.try_emplace(id);
    if (inserted)
        it->second = "Thread " + std::to_string(this->unnamedThreads++);
    return it->second;
}

auto TaggedLogger::format(Entry const& entry) -> std::string {
    auto const seconds = std::chrono::system_clock::to_time_t(entry.when);
    auto const millis  = std::chrono::duration_cast<std::chrono::milliseconds>(entry.when.time_since_epoch()) % 1000;
    std::tm    local{};
    localtime_r(&seconds, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::string tags;
    for (auto const& tag : entry.tags)
        tags += "[" + tag + "]";

    return std::format("{}.{:03} {} [{}] [{}:{}] {}\n",
                       stamp,
                       millis.count(),
                       tags,
                       entry.thread,
                       shortPath(entry.where.file_name()),
                       entry.where.line(),
                       entry.text);
}

auto TaggedLogger::shortPath(const char* file) -> std::string {
    std::filesystem::path const path{file};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace RP
