// ============================================================================
// BENCHMARK: STATUS STORE READS UNDER CONCURRENT REPLACE
// ============================================================================
// Readers hammer get()/list() while one writer publishes a new table per
// "round", the way the reconciler does.
//
// Test scenarios:
// 1. get() latency, no writer
// 2. get() latency with a writer replacing continuously
// 3. list() throughput with a writer replacing continuously
// ============================================================================

#include <iostream>
#include <chrono>
#include <thread>
#include <vector>
#include <atomic>
#include <algorithm>
#include <iomanip>
#include <string>

#include <watchman/core/status/status_store.hpp>

using namespace Watchman;
using namespace std::chrono;

namespace {

// Keeps the reads from being optimized away
std::atomic<size_t> g_sink{0};

uint64_t now_ns() {
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

StatusTable makeTable(uint64_t round, size_t targets) {
    StatusTable table;
    for (size_t i = 0; i < targets; ++i) {
        StatusEntry e;
        e.name = "machine-" + std::to_string(i);
        e.endpoint = "http://models:5555/gordo/v0/bench/" + e.name;
        e.health = HealthState::HEALTHY;
        e.round = round;
        table.emplace(e.name, std::move(e));
    }
    return table;
}

struct Result {
    size_t operations = 0;
    double seconds = 0;
    std::vector<uint64_t> latencies;
};

void printResult(const std::string& name, Result& r) {
    std::sort(r.latencies.begin(), r.latencies.end());
    std::cout << "  " << std::left << std::setw(36) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << (r.operations / r.seconds / 1e6) << " M ops/sec";
    if (!r.latencies.empty()) {
        std::cout << "  p50=" << r.latencies[r.latencies.size() * 50 / 100] << "ns"
                  << "  p99=" << r.latencies[r.latencies.size() * 99 / 100] << "ns";
    }
    std::cout << "\n";
}

// Each reader runs `perReader` operations; the writer replaces until they finish
Result runReaders(StatusStore& store, size_t readers, size_t perReader, size_t targets,
                  bool withWriter, bool useList) {
    std::atomic<bool> done{false};
    std::atomic<uint64_t> nextRound{store.round() + 1};

    std::thread writer;
    if (withWriter) {
        writer = std::thread([&]() {
            while (!done.load(std::memory_order_acquire)) {
                uint64_t round = nextRound.fetch_add(1);
                store.replace(round, makeTable(round, targets));
            }
        });
    }

    std::vector<std::vector<uint64_t>> samples(readers);
    const uint64_t start = now_ns();

    std::vector<std::thread> threads;
    for (size_t t = 0; t < readers; ++t) {
        threads.emplace_back([&, t]() {
            auto& lat = samples[t];
            lat.reserve(perReader / 16 + 1);
            size_t sink = 0;
            for (size_t i = 0; i < perReader; ++i) {
                const uint64_t t0 = now_ns();
                if (useList) {
                    sink += store.list().size();
                } else {
                    auto entry = store.get("machine-" + std::to_string(i % targets));
                    sink += entry ? 1 : 0;
                }
                if ((i & 15) == 0) lat.push_back(now_ns() - t0);
            }
            g_sink.fetch_add(sink, std::memory_order_relaxed);
        });
    }
    for (auto& th : threads) th.join();

    Result r;
    r.seconds = (now_ns() - start) / 1e9;
    r.operations = readers * perReader;
    for (auto& s : samples) {
        r.latencies.insert(r.latencies.end(), s.begin(), s.end());
    }

    done.store(true, std::memory_order_release);
    if (writer.joinable()) writer.join();
    return r;
}

} // namespace

int main() {
    std::cout << "===============================================================\n";
    std::cout << "  STATUS STORE BENCHMARK (copy-on-write table)\n";
    std::cout << "===============================================================\n\n";

    const size_t TARGETS = 200;
    const size_t READERS = 4;
    const size_t GETS_PER_READER = 500'000;
    const size_t LISTS_PER_READER = 5'000;

    StatusStore store;
    store.replace(1, makeTable(1, TARGETS));

    std::cout << "Targets: " << TARGETS << ", readers: " << READERS << "\n\n";

    auto quiet = runReaders(store, READERS, GETS_PER_READER, TARGETS, false, false);
    printResult("get(), no writer", quiet);

    auto contended = runReaders(store, READERS, GETS_PER_READER, TARGETS, true, false);
    printResult("get(), writer replacing", contended);

    auto listing = runReaders(store, READERS, LISTS_PER_READER, TARGETS, true, true);
    printResult("list(), writer replacing", listing);

    std::cout << "\nFinal round published: " << store.round() << "\n";
    std::cout << "\n===============================================================\n";
    std::cout << "  Benchmark complete\n";
    std::cout << "===============================================================\n\n";
    return 0;
}
