#pragma once

#include "fleetrun/engine/core.hpp"
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace fleetrun {
namespace engine {

enum class QueueMode {
    fifo,
    lifo,
    random,
    priority
};

// Lower rank is dispatched first in priority mode
enum class Priority {
    critical = 1,
    high = 2,
    normal = 3,
    low = 4,
    idle = 5
};

const char* to_string(QueueMode mode);
const char* to_string(Priority priority);
caf::expected<QueueMode> parse_queue_mode(const std::string& name);
// Unknown names map to normal
Priority parse_priority(const std::string& name);

struct QueueItem {
    std::string id;
    json payload;
    Priority priority = Priority::normal;
    int64_t added_at = 0;      // epoch ms
    int32_t retry_count = 0;
    uint64_t sequence = 0;     // arrival order, assigned by add()
};

void to_json(json& j, const QueueItem& item);

struct QueueStats {
    size_t total = 0;
    QueueMode mode = QueueMode::fifo;
    std::map<std::string, size_t> by_priority;
    int64_t oldest_item_age_ms = 0;
};

void to_json(json& j, const QueueStats& stats);

/**
 * Pending work items under a pluggable ordering policy.
 *
 * - fifo: append, take from front
 * - lifo: prepend, take from front
 * - random: append, take a uniformly random item
 * - priority: insertion-sorted by rank, ties keep arrival order
 *
 * All operations are guarded by an internal mutex so a retry timer may
 * enqueue concurrently with the dispatcher.
 */
class WorkQueue {
public:
    explicit WorkQueue(QueueMode mode = QueueMode::fifo);

    // Returns the id of the added item; assigns an id when item.id is empty
    std::string add(QueueItem item);
    std::optional<QueueItem> next();
    std::optional<QueueItem> peek() const;

    bool remove(const std::string& id);
    // Removes every item whose payload[key] equals value; returns the count
    size_t remove_by_payload_key(const std::string& key, const json& value);

    bool move_to_front(const std::string& id);
    bool move_to_back(const std::string& id);
    bool update_priority(const std::string& id, Priority priority);

    // Re-orders existing items for the new policy
    void set_mode(QueueMode mode);
    QueueMode mode() const;

    void shuffle();

    std::optional<QueueItem> find(const std::function<bool(const QueueItem&)>& pred) const;
    std::vector<QueueItem> filter(const std::function<bool(const QueueItem&)>& pred) const;
    std::vector<QueueItem> items() const;

    QueueStats stats() const;
    void clear();
    size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::deque<QueueItem> items_;
    QueueMode mode_;
    uint64_t next_sequence_ = 0;
    std::mt19937 rng_;

    void insert_sorted(QueueItem item);
    void reorder();
    std::deque<QueueItem>::iterator find_by_id(const std::string& id);
};

} // namespace engine
} // namespace fleetrun
