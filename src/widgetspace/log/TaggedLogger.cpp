#ifdef WS_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace WS {

namespace {

// Last directory plus file name, e.g. "ui/Style.cpp".
auto short_path(char const* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path()) {
        return path.filename().string();
    }
    return (path.parent_path().filename() / path.filename()).string();
}

auto split_tags(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tags;
    while (!text.empty()) {
        auto const comma = text.find(',');
        auto       tag   = text.substr(0, comma);
        if (!tag.empty()) {
            tags.emplace_back(tag);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

std::mutex TaggedLogger::output_mutex;

auto logger() -> TaggedLogger& {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : worker_(&TaggedLogger::run, this) {}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto TaggedLogger::set_thread_name(std::string name) -> void {
    std::lock_guard<std::mutex> lock(names_mutex_);
    thread_names_[std::this_thread::get_id()] = std::move(name);
}

auto TaggedLogger::set_enabled(bool enabled) -> void {
    enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::set_enabled_tags(std::vector<std::string> const& tags) -> void {
    std::lock_guard<std::mutex> lock(tags_mutex_);
    enabled_tags_.clear();
    enabled_tags_.insert(tags.begin(), tags.end());
}

auto TaggedLogger::set_skipped_tags(std::vector<std::string> const& tags) -> void {
    std::lock_guard<std::mutex> lock(tags_mutex_);
    skipped_tags_.clear();
    skipped_tags_.insert(tags.begin(), tags.end());
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    drained_cv_.wait(lock, [this] { return queue_.empty(); });
}

auto TaggedLogger::run() -> void {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait(lock, [this] { return !queue_.empty() || stopping_; });
        while (!queue_.empty()) {
            auto record = std::move(queue_.front());
            queue_.pop_front();
            lock.unlock();
            write(record);
            lock.lock();
        }
        drained_cv_.notify_all();
        if (stopping_) {
            return;
        }
    }
}

auto TaggedLogger::accepts(Record const& record) const -> bool {
    std::lock_guard<std::mutex> lock(tags_mutex_);
    auto selected = enabled_tags_.empty();
    for (auto const& tag : record.tags) {
        if (skipped_tags_.contains(tag)) {
            return false;
        }
        selected = selected || enabled_tags_.contains(tag);
    }
    return selected;
}

auto TaggedLogger::write(Record const& record) const -> void {
    if (!accepts(record)) {
        return;
    }

    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp.time_since_epoch()) % 1000;
    auto const time   = std::chrono::system_clock::to_time_t(record.timestamp);
    std::tm    local{};
    localtime_r(&time, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : record.tags) {
        line << '[' << tag << ']';
    }
    line << " [" << record.thread_name << "] [" << short_path(record.location.file_name()) << ':'
         << record.location.line() << "] " << record.message << '\n';

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::current_thread_name() -> std::string {
    std::lock_guard<std::mutex> lock(names_mutex_);
    auto const id = std::this_thread::get_id();
    if (auto it = thread_names_.find(id); it != thread_names_.end()) {
        return it->second;
    }
    auto name          = "Thread " + std::to_string(next_thread_number_++);
    thread_names_[id] = name;
    return name;
}

auto set_thread_name(std::string name) -> void {
    logger().set_thread_name(std::move(name));
}

auto set_logging_enabled(bool enabled) -> void {
    logger().set_enabled(enabled);
}

auto set_logging_tags(std::string_view enabled, std::string_view skipped) -> void {
    logger().set_enabled_tags(split_tags(enabled));
    logger().set_skipped_tags(split_tags(skipped));
}

} // namespace WS
#endif // WS_LOG_DEBUG
