/**
 * @file channel_bench.cpp
 * @brief Microbenchmark for chan::Sender/Receiver (P producers / 1 consumer).
 *
 * Measures send+recv throughput for two payload types:
 *   1) `int` (trivially copyable)
 *   2) `net::Packet` carrying a Fragment (the type a node inbox actually moves)
 *
 * Reports: items/sec, combined ops/sec (send+recv), and ns per item.
 */

#include <atomic>
#include <barrier>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "dronet/chan/channel.hpp"
#include "dronet/net/packet.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

struct Result {
  std::string name;          // e.g., "int@4P"
  std::size_t N = 0;         // items transferred (all producers)
  double      seconds = 0.0; // wall time
  double      items_per_s = 0.0;  // N / seconds
  double      ops_per_s   = 0.0;  // 2N / seconds  (send+recv)
  double      ns_per_item = 0.0;  // 1e9 * seconds / N
};

template <class T>
T make_item(std::size_t i) {
  if constexpr (std::is_same_v<T, int>) {
    return static_cast<int>(i);
  } else {
    dronet::net::Packet p;
    p.routing_header.hops = {1, 2, 3, 4};
    p.routing_header.hop_index = 1;
    p.session_id = i;
    p.payload = dronet::net::Fragment{.fragment_index = i, .total_n_fragments = 1};
    return p;
  }
}

// -----------------------------------------------------------------------------
// Core benchmark runner (template on payload type)
// -----------------------------------------------------------------------------

template <class T>
Result run_one(std::string name, std::size_t producers, std::size_t per_producer) {
  auto [tx, rx] = dronet::chan::make_channel<T>();

  std::barrier sync(static_cast<std::ptrdiff_t>(producers + 1));
  clock::time_point t_start, t_end;
  const std::size_t N = producers * per_producer;
  std::atomic<std::size_t> failed_sends{0};

  std::vector<std::thread> prods;
  prods.reserve(producers);
  for (std::size_t p = 0; p < producers; ++p) {
    // each producer owns its own clone, as each neighbor of a node does
    prods.emplace_back([&sync, per_producer, &failed_sends, link = tx] {
      sync.arrive_and_wait();
      std::size_t failed = 0;
      for (std::size_t i = 0; i < per_producer; ++i) {
        if (!link.send(make_item<T>(i))) ++failed;
      }
      failed_sends.fetch_add(failed, std::memory_order_relaxed);
    });
  }

  std::size_t consumed = 0;
  std::thread cons([&] {
    sync.arrive_and_wait();
    t_start = clock::now();
    while (consumed < N) {
      auto v = rx.recv();
      if (!v) break; // all producers gone
      ++consumed;
    }
    t_end = clock::now();
  });

  for (auto& t : prods) t.join();
  cons.join();

  if (failed_sends.load() != 0 || consumed != N) {
    std::cerr << name << ": " << failed_sends.load() << " failed sends, " << consumed << "/" << N
              << " received\n";
  }

  const double seconds = std::chrono::duration_cast<ns>(t_end - t_start).count() / 1e9;
  Result r;
  r.name         = std::move(name);
  r.N            = consumed;
  r.seconds      = seconds;
  r.items_per_s  = (seconds > 0.0) ? (static_cast<double>(consumed) / seconds) : 0.0;
  r.ops_per_s    = 2.0 * r.items_per_s;
  r.ns_per_item  = (r.items_per_s > 0.0) ? 1e9 / r.items_per_s : 0.0;
  return r;
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(2)
            << std::left << std::setw(14) << r.name
            << "  N=" << std::setw(9) << r.N
            << "  time=" << std::setw(8) << r.seconds << " s"
            << "  items/s=" << std::setw(12) << r.items_per_s
            << "  ops/s="   << std::setw(12) << r.ops_per_s
            << "  ns/item=" << std::setw(10) << r.ns_per_item
            << '\n';
}

} // namespace bench

int main() {
  using bench::print;
  using bench::run_one;

  constexpr std::size_t N = 400'000;   // items per run, split across producers
  const std::vector<std::size_t> producers = {1, 2, 4};

  std::cout << "MPSC channel microbenchmark (send+recv)\n";
  std::cout << "----------------------------------------------------------\n";

  for (auto p : producers) {
    print(run_one<int>("int@" + std::to_string(p) + "P", p, N / p));
    print(run_one<dronet::net::Packet>("packet@" + std::to_string(p) + "P", p, N / p));
  }

  std::cout << std::flush;
  return 0;
}
