#pragma once
#ifdef WS_LOG_DEBUG
#include <parallel_hashmap/phmap.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace WS {

/*
 * Asynchronous stderr logger. Callers format nothing: ws_log() captures the
 * message, its tags and the call site, and a worker thread writes one line per
 * record as
 *
 *   2026-10-19 12:00:00.123 [EventRouter][UI] [Main] [ui/UserInterfaceInput.cpp:45] text
 *
 * A record is written when one of its tags is enabled (or nothing is enabled)
 * and none of its tags is skipped.
 */
class TaggedLogger {
public:
    struct Record {
        std::chrono::system_clock::time_point timestamp;
        std::vector<std::string>              tags;
        std::string                           message;
        std::string                           thread_name;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)            = delete;
    TaggedLogger& operator=(TaggedLogger const&) = delete;

    template <typename... Tags>
    auto log(std::string message, std::source_location const& location, Tags&&... tags) -> void;

    auto set_thread_name(std::string name) -> void;
    auto set_enabled(bool enabled) -> void;
    auto set_enabled_tags(std::vector<std::string> const& tags) -> void;
    auto set_skipped_tags(std::vector<std::string> const& tags) -> void;
    // Blocks until the worker has written every queued record.
    auto flush() -> void;

    // Held while a line is written; test reporters share it.
    static std::mutex output_mutex;

private:
    auto run() -> void;
    auto write(Record const& record) const -> void;
    [[nodiscard]] auto accepts(Record const& record) const -> bool;
    [[nodiscard]] auto current_thread_name() -> std::string;

    std::deque<Record>      queue_{};
    mutable std::mutex      queue_mutex_{};
    std::condition_variable queue_cv_{};
    std::condition_variable drained_cv_{};
    bool                    stopping_ = false;
    std::atomic<bool>       enabled_{false};

    mutable std::mutex                 tags_mutex_{};
    phmap::flat_hash_set<std::string> enabled_tags_{};
    phmap::flat_hash_set<std::string> skipped_tags_{};

    std::mutex                                        names_mutex_{};
    phmap::flat_hash_map<std::thread::id, std::string> thread_names_{};
    int                                               next_thread_number_ = 0;

    std::thread worker_{};
};

auto logger() -> TaggedLogger&;

template <typename... Tags>
auto TaggedLogger::log(std::string message, std::source_location const& location, Tags&&... tags) -> void {
    if (!enabled_.load(std::memory_order_relaxed)) {
        return;
    }

    Record record{.timestamp   = std::chrono::system_clock::now(),
                  .tags        = {std::string(std::forward<Tags>(tags))...},
                  .message     = std::move(message),
                  .thread_name = current_thread_name(),
                  .location    = location};

    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(record));
    queue_cv_.notify_one();
}

auto set_thread_name(std::string name) -> void;
auto set_logging_enabled(bool enabled) -> void;
// Comma separated, e.g. "EventRouter,Style".
auto set_logging_tags(std::string_view enabled, std::string_view skipped = {}) -> void;

} // namespace WS

#define ws_log(message, ...) ::WS::logger().log(message, std::source_location::current(), ##__VA_ARGS__)

#else
#define ws_log(message, ...) ((void)0)
#endif // WS_LOG_DEBUG
