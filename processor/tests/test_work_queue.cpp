#include <iostream>
#include <cassert>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "fleetrun/engine/work_queue.hpp"

using namespace fleetrun::engine;

namespace {

QueueItem item(const std::string& id, Priority priority = Priority::normal) {
    QueueItem queued;
    queued.id = id;
    queued.payload = json{{"profileId", id}};
    queued.priority = priority;
    return queued;
}

std::vector<std::string> drain(WorkQueue& queue) {
    std::vector<std::string> ids;
    while (auto next = queue.next()) {
        ids.push_back(next->id);
    }
    return ids;
}

std::vector<std::string> ids_of(const WorkQueue& queue) {
    std::vector<std::string> ids;
    for (const auto& queued : queue.items()) {
        ids.push_back(queued.id);
    }
    return ids;
}

} // namespace

void test_fifo_and_lifo() {
    std::cout << "Testing fifo/lifo order..." << std::endl;

    WorkQueue fifo(QueueMode::fifo);
    fifo.add(item("a"));
    fifo.add(item("b"));
    fifo.add(item("c"));
    assert(fifo.peek()->id == "a");
    assert((drain(fifo) == std::vector<std::string>{"a", "b", "c"}));
    assert(!fifo.next());

    WorkQueue lifo(QueueMode::lifo);
    lifo.add(item("a"));
    lifo.add(item("b"));
    lifo.add(item("c"));
    assert((drain(lifo) == std::vector<std::string>{"c", "b", "a"}));

    std::cout << "✓ fifo/lifo order test passed" << std::endl;
}

void test_priority_order_is_stable() {
    std::cout << "Testing priority order..." << std::endl;

    WorkQueue queue(QueueMode::priority);
    queue.add(item("n1"));
    queue.add(item("low", Priority::low));
    queue.add(item("crit", Priority::critical));
    queue.add(item("n2"));
    queue.add(item("high", Priority::high));
    assert((drain(queue) == std::vector<std::string>{"crit", "high", "n1", "n2", "low"}));

    std::cout << "✓ priority order test passed" << std::endl;
}

void test_random_mode_drains_everything() {
    std::cout << "Testing random mode..." << std::endl;

    WorkQueue queue(QueueMode::random);
    for (int i = 0; i < 20; ++i) {
        queue.add(item("r" + std::to_string(i)));
    }
    auto drained = drain(queue);
    std::set<std::string> unique(drained.begin(), drained.end());
    assert(drained.size() == 20);
    assert(unique.size() == 20);
    assert(queue.empty());

    // shuffle reorders in place without losing items
    WorkQueue fifo(QueueMode::fifo);
    for (int i = 0; i < 20; ++i) {
        fifo.add(item("s" + std::to_string(i)));
    }
    fifo.shuffle();
    auto shuffled = ids_of(fifo);
    assert(shuffled.size() == 20);
    assert(std::set<std::string>(shuffled.begin(), shuffled.end()).size() == 20);
    assert(fifo.peek()->id == shuffled.front());

    std::cout << "✓ random mode test passed" << std::endl;
}

void test_add_assigns_ids_and_timestamps() {
    std::cout << "Testing add defaults..." << std::endl;

    WorkQueue queue;
    QueueItem anonymous;
    anonymous.payload = json{{"profileId", "p"}};
    std::string id = queue.add(anonymous);
    assert(!id.empty());
    auto stored = queue.peek();
    assert(stored->id == id);
    assert(stored->added_at > 0);

    QueueItem dated = item("dated");
    dated.added_at = 12345;
    queue.add(dated);
    assert(queue.items().back().added_at == 12345);

    std::cout << "✓ add defaults test passed" << std::endl;
}

void test_mutations() {
    std::cout << "Testing queue mutations..." << std::endl;

    WorkQueue queue;
    for (const char* id : {"a", "b", "c", "d"}) {
        queue.add(item(id));
    }

    assert(queue.move_to_front("c"));
    assert((ids_of(queue) == std::vector<std::string>{"c", "a", "b", "d"}));
    assert(queue.move_to_back("a"));
    assert((ids_of(queue) == std::vector<std::string>{"c", "b", "d", "a"}));
    assert(!queue.move_to_front("zzz"));

    assert(queue.remove("b"));
    assert(!queue.remove("b"));
    assert(queue.remove_by_payload_key("profileId", "d") == 1);
    assert((ids_of(queue) == std::vector<std::string>{"c", "a"}));

    auto found = queue.find([](const QueueItem& q) { return q.id == "a"; });
    assert(found && found->payload["profileId"] == "a");
    assert(queue.filter([](const QueueItem&) { return true; }).size() == 2);

    queue.clear();
    assert(queue.size() == 0);

    std::cout << "✓ queue mutations test passed" << std::endl;
}

void test_mode_switch_reorders() {
    std::cout << "Testing mode switch..." << std::endl;

    WorkQueue queue(QueueMode::fifo);
    queue.add(item("a", Priority::low));
    queue.add(item("b", Priority::high));
    queue.add(item("c", Priority::high));

    queue.set_mode(QueueMode::priority);
    assert(queue.mode() == QueueMode::priority);
    assert((ids_of(queue) == std::vector<std::string>{"b", "c", "a"}));

    queue.set_mode(QueueMode::fifo);
    assert((ids_of(queue) == std::vector<std::string>{"a", "b", "c"}));

    queue.set_mode(QueueMode::lifo);
    assert((ids_of(queue) == std::vector<std::string>{"c", "b", "a"}));

    queue.set_mode(QueueMode::priority);
    assert(queue.update_priority("a", Priority::critical));
    assert(queue.peek()->id == "a");

    std::cout << "✓ mode switch test passed" << std::endl;
}

void test_stats() {
    std::cout << "Testing queue stats..." << std::endl;

    WorkQueue queue(QueueMode::priority);
    QueueItem old = item("old", Priority::idle);
    old.added_at = now_epoch_ms() - 5000;
    queue.add(old);
    queue.add(item("x", Priority::high));
    queue.add(item("y", Priority::high));

    QueueStats stats = queue.stats();
    assert(stats.total == 3);
    assert(stats.by_priority["high"] == 2);
    assert(stats.by_priority["idle"] == 1);
    assert(stats.by_priority["critical"] == 0);
    assert(stats.oldest_item_age_ms >= 5000);

    json j = stats;
    assert(j["mode"] == "priority");
    assert(j["byPriority"]["high"] == 2);

    std::cout << "✓ queue stats test passed" << std::endl;
}

void test_concurrent_producers() {
    std::cout << "Testing concurrent producers..." << std::endl;

    WorkQueue queue;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&queue, t]() {
            for (int i = 0; i < 50; ++i) {
                queue.add(item("t" + std::to_string(t) + "-" + std::to_string(i)));
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    assert(queue.size() == 200);
    assert(drain(queue).size() == 200);

    std::cout << "✓ concurrent producers test passed" << std::endl;
}

int main() {
    std::cout << "Running work queue tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        std::cout << "\n[Ordering]" << std::endl;
        test_fifo_and_lifo();
        test_priority_order_is_stable();
        test_random_mode_drains_everything();

        std::cout << "\n[Management]" << std::endl;
        test_add_assigns_ids_and_timestamps();
        test_mutations();
        test_mode_switch_reorders();
        test_stats();
        test_concurrent_producers();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All work queue tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "\n❌ Test failed with unknown exception" << std::endl;
        return 1;
    }
}
