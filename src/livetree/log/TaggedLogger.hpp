#ifdef LT_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace LT {

// Tagged stderr logger. Entries are queued by the caller and written by a
// worker thread, which is the only writer to std::cerr.
class TaggedLogger {
public:
    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto set_thread_name(const std::string& name) -> void;
    auto set_enabled(bool enabled) -> void;

    // Blocks until every queued entry has been written.
    auto flush() -> void;

private:
    struct Entry {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           thread_name;
        std::source_location                  location;
    };

    auto apply_environment() -> void;
    auto run() -> void;
    [[nodiscard]] auto passes_filters(Entry const& entry) const -> bool;
    auto write(Entry const& entry) const -> void;
    auto thread_name(std::thread::id id) -> std::string;

    std::queue<Entry>       queue_;
    std::mutex              mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    bool                    writing_ = false;
    bool                    running_ = true;
    std::atomic<bool>       enabled_{false};
    std::set<std::string>   skip_tags_{"INFO"};
    std::set<std::string>   enable_tags_;

    std::unordered_map<std::thread::id, std::string> thread_names_;
    std::mutex                                       thread_names_mutex_;
    int                                              next_thread_number_ = 0;

    std::thread worker_;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!enabled_.load(std::memory_order_relaxed))
        return;

    Entry entry{.timestamp   = std::chrono::system_clock::now(),
                .tags        = {std::forward<Tags>(tags)...},
                .message     = message,
                .thread_name = thread_name(std::this_thread::get_id()),
                .location    = location};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(entry));
    }
    wake_.notify_one();
}

#define lt_log(message, ...) ::LT::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);
void flush_log();

} // namespace LT

#else
#define lt_log(message, ...) ((void)0)
#endif // LT_LOG_DEBUG
