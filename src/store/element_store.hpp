#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "store/element.hpp"
#include "store/sanitizer.hpp"

namespace elrelay::store {

struct StoreConfig {
    size_t max_elements = 50;
    std::chrono::milliseconds ttl{3600000};
    std::chrono::milliseconds sweep_interval{300000};  // 0 = no sweeper thread
    SanitizerLimits limits;
};

enum class AdmitStatus {
    ADMITTED,   // stored, nothing evicted
    EVICTED,    // stored, oldest entry evicted to make room
    INVALID     // rejected by the sanitizer, store untouched
};

const char* admit_status_to_string(AdmitStatus status);

struct AdmitResult {
    AdmitStatus status = AdmitStatus::INVALID;
    std::string id;
    std::string label;
    int64_t captured_at = 0;
    std::optional<std::string> evicted_id;
    std::string error;

    bool admitted() const { return status != AdmitStatus::INVALID; }
};

struct StoreStats {
    size_t count = 0;
    size_t capacity = 0;
    int64_t ttl_ms = 0;
    std::optional<int64_t> oldest_captured_at;
    std::optional<int64_t> newest_captured_at;

    nlohmann::json to_json() const;
};

// Bounded, expiring element store.
//
// Entries are evicted oldest-admitted first once max_elements is reached,
// and expire ttl after admission. Expired entries are never returned: every
// read path drops them on contact, and a background sweeper removes the rest
// every sweep_interval. All public operations are atomic under one mutex.
class ElementStore {
public:
    using Clock = std::chrono::steady_clock;

    explicit ElementStore(StoreConfig config = {});
    ~ElementStore();

    ElementStore(const ElementStore&) = delete;
    ElementStore& operator=(const ElementStore&) = delete;

    AdmitResult admit(const nlohmann::json& raw);

    std::optional<Element> get(const std::string& id);

    // Live elements, newest captured_at first
    std::vector<Element> list();

    // Live elements whose selector, text, html or url contains query
    // (ASCII case-insensitive), in list() order
    std::vector<Element> search(const std::string& query);

    bool remove(const std::string& id);
    size_t clear();
    StoreStats stats();

    // Drop every expired entry; returns how many were removed
    size_t sweep();

    // Stop the sweeper and drop all entries. Safe to call repeatedly.
    void teardown();

    bool sweeper_running() const;
    const StoreConfig& config() const { return config_; }

private:
    struct Entry {
        Element element;
        Clock::time_point expires_at;
        uint64_t sequence = 0;
        std::list<std::string>::iterator fifo_pos;

        bool is_expired(Clock::time_point now) const { return now >= expires_at; }
    };

    StoreConfig config_;

    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> fifo_;   // ids in admission order, oldest first
    uint64_t next_sequence_ = 1;
    mutable std::mutex mutex_;

    std::thread sweeper_;
    std::condition_variable sweeper_cv_;
    bool stopping_ = false;

    // Callers hold mutex_
    void erase_locked(std::unordered_map<std::string, Entry>::iterator it);
    size_t purge_expired_locked(Clock::time_point now);
    std::vector<Element> live_sorted_locked();

    void sweeper_loop();
};

} // namespace elrelay::store
