#ifdef LT_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace LT {

namespace {

auto env_truthy(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    std::string normalized;
    for (char ch : std::string_view{value}) {
        if (ch == ' ' || ch == '\t' || ch == '\n') {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

auto split_tags(char const* value) -> std::set<std::string> {
    std::set<std::string> tags;
    if (value == nullptr) {
        return tags;
    }
    std::string_view text{value};
    while (!text.empty()) {
        auto comma = text.find(',');
        auto token = text.substr(0, comma);
        while (!token.empty() && (token.front() == ' ' || token.front() == '\t')) {
            token.remove_prefix(1);
        }
        while (!token.empty() && (token.back() == ' ' || token.back() == '\t')) {
            token.remove_suffix(1);
        }
        if (!token.empty()) {
            tags.emplace(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    apply_environment();
    worker_ = std::thread(&TaggedLogger::run, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    wake_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto TaggedLogger::apply_environment() -> void {
    if (env_truthy(std::getenv("LIVETREE_LOG_ENABLED")) || env_truthy(std::getenv("LIVETREE_LOG"))) {
        enabled_.store(true, std::memory_order_relaxed);
    }
    if (env_truthy(std::getenv("LIVETREE_LOG_CLEAR_DEFAULT_SKIPS"))) {
        skip_tags_.clear();
    }
    skip_tags_.merge(split_tags(std::getenv("LIVETREE_LOG_SKIP_TAGS")));
    enable_tags_ = split_tags(std::getenv("LIVETREE_LOG_ENABLE_TAGS"));
}

auto TaggedLogger::set_thread_name(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(thread_names_mutex_);
    thread_names_[std::this_thread::get_id()] = name;
}

auto TaggedLogger::set_enabled(bool enabled) -> void {
    enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && !writing_; });
}

auto TaggedLogger::run() -> void {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wake_.wait(lock, [this] { return !queue_.empty() || !running_; });
        while (!queue_.empty()) {
            auto entry = std::move(queue_.front());
            queue_.pop();
            writing_ = true;
            lock.unlock();
            write(entry);
            lock.lock();
            writing_ = false;
        }
        idle_.notify_all();
        if (!running_) {
            return;
        }
    }
}

auto TaggedLogger::passes_filters(Entry const& entry) const -> bool {
    if (!enable_tags_.empty()) {
        for (auto const& tag : entry.tags) {
            if (!enable_tags_.contains(tag)) {
                return false;
            }
        }
    }
    for (auto const& tag : entry.tags) {
        if (skip_tags_.contains(tag)) {
            return false;
        }
    }
    return true;
}

auto TaggedLogger::write(Entry const& entry) const -> void {
    if (!passes_filters(entry)) {
        return;
    }
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(entry.timestamp.time_since_epoch()) % 1000;
    auto const time   = std::chrono::system_clock::to_time_t(entry.timestamp);

    std::ostringstream line;
    line << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
         << millis.count() << " [";
    bool first = true;
    for (auto const& tag : entry.tags) {
        if (!first)
            line << "][";
        line << tag;
        first = false;
    }
    // Source location as "dir/file.cpp:line".
    std::filesystem::path file{entry.location.file_name()};
    line << "] [" << entry.thread_name << "] [" << (file.parent_path().filename() / file.filename()).string() << ':'
         << entry.location.line() << "] " << entry.message << '\n';

    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::thread_name(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(thread_names_mutex_);
    auto [it, inserted] = thread_names_.try_emplace(id);
    if (inserted) {
        it->second = "Thread " + std::to_string(next_thread_number_++);
    }
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().set_thread_name(name);
}

void set_logging_enabled(bool enabled) {
    logger().set_enabled(enabled);
}

void flush_log() {
    logger().flush();
}

} // namespace LT
#endif // LT_LOG_DEBUG
