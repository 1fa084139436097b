/**
 * @file channel_bench.cpp
 * @brief Microbenchmark for ipc::Channel (forked producer / parent consumer).
 *
 * Measures send+receive throughput through a shared-memory channel for:
 *   1) raw byte frames (no codec)
 *   2) encoded Message envelopes (protobuf encode + decode)
 *
 * Reports: items/sec and ns per pair. A full ring makes the producer back off.
 */

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "warden/ipc/channel.hpp"
#include "warden/ipc/message.hpp"
#include "warden/ipc/shared_arena.hpp"
#include "warden/obs/observability.hpp"
#include "warden/runtime/process.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

struct Result {
  std::string name;          // e.g., "raw64@1024"
  std::size_t N = 0;         // number of items transferred
  double      seconds = 0.0; // wall time
  double      items_per_s = 0.0;
  double      ns_per_pair = 0.0;
  std::uint64_t overflows = 0;
};

inline void backoff() noexcept {
  std::this_thread::yield();
}

enum class Mode { Raw, Envelope };

bool run_one(Result& out, std::string name, Mode mode, std::size_t capacity_pow2,
             std::size_t frame_bytes, std::size_t N) {
  auto arena = warden::ipc::SharedArena::create(capacity_pow2 * (frame_bytes + 512) + (1u << 16));
  if (!arena) {
    std::cerr << "arena: " << arena.error().detail << "\n";
    return false;
  }
  auto ch = warden::ipc::Channel::create(*arena, capacity_pow2, frame_bytes + 256);
  if (!ch) {
    std::cerr << "channel: " << ch.error().detail << "\n";
    return false;
  }
  warden::ipc::Channel channel = *ch;

  const std::string blob(frame_bytes, 'x');
  auto producer = warden::runtime::ProcessHandle::spawn([channel, mode, &blob, N]() mutable {
    const auto* bytes = reinterpret_cast<const std::byte*>(blob.data());
    const auto msg = warden::ipc::build_request("bench", "sink", "frame",
                                                warden::ipc::Payload{{"blob", blob}}, "bench");
    for (std::size_t i = 0; i < N;) {
      const auto r = (mode == Mode::Raw) ? channel.send_bytes({bytes, blob.size()})
                                         : channel.send(msg);
      if (r) {
        ++i;
      } else if (r.error().code == warden::ErrorCode::QueueOverflow) {
        backoff();
      } else {
        return 1;
      }
    }
    return 0;
  }, "bench-producer");
  if (!producer) {
    std::cerr << "fork: " << producer.error().detail << "\n";
    return false;
  }

  const auto t_start = clock::now();
  std::size_t consumed = 0;
  while (consumed < N) {
    const bool got = (mode == Mode::Raw)
        ? channel.receive_bytes(std::chrono::milliseconds(1000)).has_value()
        : channel.receive(std::chrono::milliseconds(1000)).has_value();
    if (got) {
      ++consumed;
    } else if (!(*producer)->is_alive()) {
      std::cerr << name << ": producer " << (*producer)->describe_exit() << " after "
                << consumed << " items\n";
      return false;
    }
  }
  const auto t_end = clock::now();
  (*producer)->wait_for_exit(std::chrono::milliseconds(1000));

  const double seconds = std::chrono::duration_cast<ns>(t_end - t_start).count() / 1e9;
  out.name        = std::move(name);
  out.N           = N;
  out.seconds     = seconds;
  out.items_per_s = (seconds > 0.0) ? (static_cast<double>(N) / seconds) : 0.0;
  out.ns_per_pair = (out.items_per_s > 0.0) ? 1e9 / out.items_per_s : 0.0;
  out.overflows   = channel.stats().overflows;
  return true;
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(2)
            << std::left << std::setw(18) << r.name
            << "  N=" << std::setw(9) << r.N
            << "  time=" << std::setw(8) << r.seconds << " s"
            << "  items/s=" << std::setw(12) << r.items_per_s
            << "  ns/pair=" << std::setw(10) << r.ns_per_pair
            << "  overflows=" << r.overflows
            << '\n';
}

} // namespace bench

int main() {
  using bench::Mode;

  constexpr std::size_t N = 200'000;   // items per run
  const std::vector<std::size_t> caps   = {64, 1024};
  const std::vector<std::size_t> frames = {64, 1024};

  warden::obs::set_log_level("warn");
  std::cout << "Channel 1P/1C cross-process microbenchmark (send+receive pairs)\n";
  std::cout << "----------------------------------------------------------\n";

  int rc = 0;
  for (auto cap : caps) {
    for (auto frame : frames) {
      bench::Result r;
      const std::string suffix = std::to_string(frame) + "@" + std::to_string(cap);
      if (bench::run_one(r, "raw" + suffix, Mode::Raw, cap, frame, N)) bench::print(r); else rc = 1;
      if (bench::run_one(r, "env" + suffix, Mode::Envelope, cap, frame, N)) bench::print(r); else rc = 1;
    }
  }

  std::cout << std::flush;
  return rc;
}
