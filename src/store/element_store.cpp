#include "store/element_store.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace elrelay::store {

namespace {

std::string ascii_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_folded(const std::string& haystack, const std::string& folded_needle) {
    return ascii_lower(haystack).find(folded_needle) != std::string::npos;
}

} // namespace

const char* admit_status_to_string(AdmitStatus status) {
    switch (status) {
        case AdmitStatus::ADMITTED: return "ADMITTED";
        case AdmitStatus::EVICTED:  return "EVICTED";
        case AdmitStatus::INVALID:  return "INVALID";
        default: return "UNKNOWN";
    }
}

json StoreStats::to_json() const {
    json j;
    j["total"] = count;
    j["maxElements"] = capacity;
    j["ttl"] = ttl_ms;
    j["oldestTimestamp"] = oldest_captured_at ? json(*oldest_captured_at) : json(nullptr);
    j["newestTimestamp"] = newest_captured_at ? json(*newest_captured_at) : json(nullptr);
    return j;
}

ElementStore::ElementStore(StoreConfig config)
    : config_(std::move(config)) {
    if (config_.max_elements == 0) {
        spdlog::warn("Element store capacity of 0 is not usable, using 1");
        config_.max_elements = 1;
    }
    if (config_.sweep_interval.count() > 0) {
        sweeper_ = std::thread(&ElementStore::sweeper_loop, this);
    }
}

ElementStore::~ElementStore() {
    teardown();
}

AdmitResult ElementStore::admit(const json& raw) {
    AdmitResult result;

    auto sanitized = sanitize(raw, config_.limits);
    if (!sanitized.success) {
        result.status = AdmitStatus::INVALID;
        result.error = sanitized.error;
        return result;
    }

    Element& element = sanitized.element;
    result.id = element.id;
    result.label = element.label;
    result.captured_at = element.captured_at;
    result.status = AdmitStatus::ADMITTED;

    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    purge_expired_locked(now);

    // Re-admitting an id replaces the old entry with a new one at the FIFO tail
    auto existing = entries_.find(element.id);
    if (existing != entries_.end()) {
        erase_locked(existing);
    }

    if (entries_.size() >= config_.max_elements && !fifo_.empty()) {
        std::string oldest_id = fifo_.front();
        erase_locked(entries_.find(oldest_id));
        result.status = AdmitStatus::EVICTED;
        result.evicted_id = oldest_id;
        spdlog::info("Evicted oldest element {} to stay within {} elements",
                     oldest_id, config_.max_elements);
    }

    fifo_.push_back(element.id);

    Entry entry;
    entry.expires_at = now + config_.ttl;
    entry.sequence = next_sequence_++;
    entry.fifo_pos = std::prev(fifo_.end());
    entry.element = std::move(element);

    std::string id = entry.element.id;
    entries_.emplace(std::move(id), std::move(entry));

    spdlog::debug("Added element {} ({})", result.id, result.label);
    return result;
}

std::optional<Element> ElementStore::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    if (it->second.is_expired(Clock::now())) {
        erase_locked(it);
        return std::nullopt;
    }

    return it->second.element;
}

std::vector<Element> ElementStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(Clock::now());
    return live_sorted_locked();
}

std::vector<Element> ElementStore::search(const std::string& query) {
    std::string needle = ascii_lower(query);

    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(Clock::now());

    std::vector<Element> matches;
    for (auto& element : live_sorted_locked()) {
        if (contains_folded(element.label, needle) ||
            contains_folded(element.excerpt, needle) ||
            contains_folded(element.body, needle) ||
            contains_folded(element.source_ref, needle)) {
            matches.push_back(std::move(element));
        }
    }
    return matches;
}

bool ElementStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    erase_locked(it);
    spdlog::debug("Removed element {}", id);
    return true;
}

size_t ElementStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = entries_.size();
    entries_.clear();
    fifo_.clear();
    if (count > 0) {
        spdlog::info("Cleared {} elements from storage", count);
    }
    return count;
}

StoreStats ElementStore::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(Clock::now());

    StoreStats stats;
    stats.count = entries_.size();
    stats.capacity = config_.max_elements;
    stats.ttl_ms = config_.ttl.count();

    for (const auto& [id, entry] : entries_) {
        int64_t ts = entry.element.captured_at;
        if (!stats.oldest_captured_at || ts < *stats.oldest_captured_at) {
            stats.oldest_captured_at = ts;
        }
        if (!stats.newest_captured_at || ts > *stats.newest_captured_at) {
            stats.newest_captured_at = ts;
        }
    }
    return stats;
}

size_t ElementStore::sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    return purge_expired_locked(Clock::now());
}

void ElementStore::teardown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    sweeper_cv_.notify_all();

    if (sweeper_.joinable() && sweeper_.get_id() != std::this_thread::get_id()) {
        sweeper_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    fifo_.clear();
}

bool ElementStore::sweeper_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_ && sweeper_.joinable();
}

void ElementStore::erase_locked(std::unordered_map<std::string, Entry>::iterator it) {
    fifo_.erase(it->second.fifo_pos);
    entries_.erase(it);
}

size_t ElementStore::purge_expired_locked(Clock::time_point now) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->second.is_expired(now)) {
            fifo_.erase(it->second.fifo_pos);
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<Element> ElementStore::live_sorted_locked() {
    std::vector<const Entry*> live;
    live.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        live.push_back(&entry);
    }

    std::sort(live.begin(), live.end(), [](const Entry* a, const Entry* b) {
        if (a->element.captured_at != b->element.captured_at) {
            return a->element.captured_at > b->element.captured_at;
        }
        return a->sequence > b->sequence;
    });

    std::vector<Element> elements;
    elements.reserve(live.size());
    for (const Entry* entry : live) {
        elements.push_back(entry->element);
    }
    return elements;
}

void ElementStore::sweeper_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (sweeper_cv_.wait_for(lock, config_.sweep_interval, [this]() { return stopping_; })) {
            break;
        }
        size_t removed = purge_expired_locked(Clock::now());
        if (removed > 0) {
            spdlog::info("Cleanup: removed {} expired elements", removed);
        }
    }
}

} // namespace elrelay::store
