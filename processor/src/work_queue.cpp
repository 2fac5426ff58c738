#include "fleetrun/engine/work_queue.hpp"
#include <algorithm>
#include <iterator>

namespace fleetrun {
namespace engine {

const char* to_string(QueueMode mode) {
    switch (mode) {
        case QueueMode::fifo: return "fifo";
        case QueueMode::lifo: return "lifo";
        case QueueMode::random: return "random";
        case QueueMode::priority: return "priority";
    }
    return "fifo";
}

const char* to_string(Priority priority) {
    switch (priority) {
        case Priority::critical: return "critical";
        case Priority::high: return "high";
        case Priority::normal: return "normal";
        case Priority::low: return "low";
        case Priority::idle: return "idle";
    }
    return "normal";
}

caf::expected<QueueMode> parse_queue_mode(const std::string& name) {
    if (name == "fifo") return QueueMode::fifo;
    if (name == "lifo") return QueueMode::lifo;
    if (name == "random") return QueueMode::random;
    if (name == "priority") return QueueMode::priority;
    return caf::make_error(caf::sec::invalid_argument, "Unknown queue mode: " + name);
}

Priority parse_priority(const std::string& name) {
    if (name == "critical") return Priority::critical;
    if (name == "high") return Priority::high;
    if (name == "low") return Priority::low;
    if (name == "idle") return Priority::idle;
    return Priority::normal;
}

void to_json(json& j, const QueueItem& item) {
    j = json{
        {"id", item.id},
        {"payload", item.payload},
        {"priority", to_string(item.priority)},
        {"addedAt", item.added_at},
        {"retryCount", item.retry_count}
    };
}

void to_json(json& j, const QueueStats& stats) {
    j = json{
        {"total", stats.total},
        {"mode", to_string(stats.mode)},
        {"byPriority", stats.by_priority},
        {"oldestItemAgeMs", stats.oldest_item_age_ms}
    };
}

WorkQueue::WorkQueue(QueueMode mode)
    : mode_(mode), rng_(std::random_device{}()) {}

std::string WorkQueue::add(QueueItem item) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (item.id.empty()) {
        item.id = generate_id("item");
    }
    if (item.added_at == 0) {
        item.added_at = now_epoch_ms();
    }
    item.sequence = next_sequence_++;
    std::string id = item.id;

    switch (mode_) {
        case QueueMode::lifo:
            items_.push_front(std::move(item));
            break;
        case QueueMode::priority:
            insert_sorted(std::move(item));
            break;
        case QueueMode::fifo:
        case QueueMode::random:
            items_.push_back(std::move(item));
            break;
    }
    return id;
}

void WorkQueue::insert_sorted(QueueItem item) {
    // First position whose rank is strictly worse keeps equal ranks in arrival order
    auto pos = std::find_if(items_.begin(), items_.end(), [&](const QueueItem& existing) {
        return static_cast<int>(existing.priority) > static_cast<int>(item.priority);
    });
    items_.insert(pos, std::move(item));
}

std::optional<QueueItem> WorkQueue::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }

    size_t index = 0;
    if (mode_ == QueueMode::random) {
        std::uniform_int_distribution<size_t> dist(0, items_.size() - 1);
        index = dist(rng_);
    }

    QueueItem item = std::move(items_[index]);
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
    return item;
}

std::optional<QueueItem> WorkQueue::peek() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }
    return items_.front();
}

std::deque<QueueItem>::iterator WorkQueue::find_by_id(const std::string& id) {
    return std::find_if(items_.begin(), items_.end(),
                        [&](const QueueItem& item) { return item.id == id; });
}

bool WorkQueue::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(id);
    if (it == items_.end()) {
        return false;
    }
    items_.erase(it);
    return true;
}

size_t WorkQueue::remove_by_payload_key(const std::string& key, const json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t before = items_.size();
    items_.erase(std::remove_if(items_.begin(), items_.end(), [&](const QueueItem& item) {
        return item.payload.is_object() && item.payload.contains(key) && item.payload.at(key) == value;
    }), items_.end());
    return before - items_.size();
}

bool WorkQueue::move_to_front(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(id);
    if (it == items_.end()) {
        return false;
    }
    QueueItem item = std::move(*it);
    items_.erase(it);
    items_.push_front(std::move(item));
    return true;
}

bool WorkQueue::move_to_back(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(id);
    if (it == items_.end()) {
        return false;
    }
    QueueItem item = std::move(*it);
    items_.erase(it);
    items_.push_back(std::move(item));
    return true;
}

bool WorkQueue::update_priority(const std::string& id, Priority priority) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_by_id(id);
    if (it == items_.end()) {
        return false;
    }
    it->priority = priority;
    if (mode_ == QueueMode::priority) {
        reorder();
    }
    return true;
}

void WorkQueue::reorder() {
    switch (mode_) {
        case QueueMode::priority:
            std::stable_sort(items_.begin(), items_.end(), [](const QueueItem& a, const QueueItem& b) {
                if (a.priority != b.priority) {
                    return static_cast<int>(a.priority) < static_cast<int>(b.priority);
                }
                return a.sequence < b.sequence;
            });
            break;
        case QueueMode::fifo:
            std::sort(items_.begin(), items_.end(), [](const QueueItem& a, const QueueItem& b) {
                return a.sequence < b.sequence;
            });
            break;
        case QueueMode::lifo:
            std::sort(items_.begin(), items_.end(), [](const QueueItem& a, const QueueItem& b) {
                return a.sequence > b.sequence;
            });
            break;
        case QueueMode::random:
            break;
    }
}

void WorkQueue::set_mode(QueueMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = mode;
    reorder();
}

QueueMode WorkQueue::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

void WorkQueue::shuffle() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::shuffle(items_.begin(), items_.end(), rng_);
}

std::optional<QueueItem> WorkQueue::find(const std::function<bool(const QueueItem&)>& pred) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(items_.begin(), items_.end(), pred);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<QueueItem> WorkQueue::filter(const std::function<bool(const QueueItem&)>& pred) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<QueueItem> result;
    std::copy_if(items_.begin(), items_.end(), std::back_inserter(result), pred);
    return result;
}

std::vector<QueueItem> WorkQueue::items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<QueueItem>(items_.begin(), items_.end());
}

QueueStats WorkQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueStats stats;
    stats.total = items_.size();
    stats.mode = mode_;
    for (Priority p : {Priority::critical, Priority::high, Priority::normal, Priority::low, Priority::idle}) {
        stats.by_priority[to_string(p)] = 0;
    }

    int64_t oldest = 0;
    for (const auto& item : items_) {
        stats.by_priority[to_string(item.priority)]++;
        if (oldest == 0 || item.added_at < oldest) {
            oldest = item.added_at;
        }
    }
    if (oldest > 0) {
        stats.oldest_item_age_ms = now_epoch_ms() - oldest;
    }
    return stats;
}

void WorkQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
}

size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

bool WorkQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
}

} // namespace engine
} // namespace fleetrun
