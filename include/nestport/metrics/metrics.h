/***
 * Name: nestport::metrics::Metrics
 * Purpose: OO metrics interface with static registry. Pipeline stages inherit
 *   this class and use ScopedTimer plus helper methods to record metrics.
 * Inputs: Phase identifiers and payloads (AST geometry, file outcomes)
 * Outputs: A static registry accessible by the application for reporting.
 * Theory of Operation: All instances share a static Registry and enabled flag.
 *   Files may be transpiled on several worker threads, so every update and
 *   snapshot goes through one mutex.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <mutex>
#include <ostream>
#include <utility>
#include <vector>

#include "ast/GeometrySummary.h"

namespace nestport {

namespace metrics {

class Metrics {
 public:
  enum class Phase { ReadFile, Lex, Group, Parse, Emit, WriteFile };

  struct Registry {
    bool enabled{false};
    std::vector<std::pair<Phase, std::uint64_t>> durations_ns;
    ast::GeometrySummary ast_geom{};  // nodes summed over files, deepest file wins max_depth
    std::uint64_t tokens{0};
    std::uint64_t files_ok{0};
    std::uint64_t files_failed{0};
  };

  class ScopedTimer {
   public:
    explicit ScopedTimer(Phase phase)
        : phase_(phase), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer() noexcept {
      auto end = std::chrono::steady_clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
      try {
        RecordDuration(phase_, static_cast<std::uint64_t>(ns));
      } catch (const std::exception&) {
        // sample dropped
      }
    }
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

   private:
    Phase phase_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
  };

  static void Enable(bool on) {
    const std::lock_guard<std::mutex> lock(mu_);
    reg_.enabled = on;
  }
  /*** Reset: Drop everything collected so far; the enabled flag is kept. */
  static void Reset() {
    const std::lock_guard<std::mutex> lock(mu_);
    reg_ = Registry{reg_.enabled, {}, {}, 0, 0, 0};
  }
  static Registry GetRegistry() {
    const std::lock_guard<std::mutex> lock(mu_);
    return reg_;
  }
  static void RecordDuration(Phase phase, std::uint64_t ns) {
    const std::lock_guard<std::mutex> lock(mu_);
    if (reg_.enabled) reg_.durations_ns.emplace_back(phase, ns);
  }
  static void AddASTGeometry(const ast::GeometrySummary& g) {
    const std::lock_guard<std::mutex> lock(mu_);
    if (!reg_.enabled) return;
    reg_.ast_geom.nodes += g.nodes;
    if (g.maxDepth > reg_.ast_geom.maxDepth) reg_.ast_geom.maxDepth = g.maxDepth;
  }
  static void AddTokens(std::uint64_t count) {
    const std::lock_guard<std::mutex> lock(mu_);
    if (reg_.enabled) reg_.tokens += count;
  }
  static void CountFile(bool ok) {
    const std::lock_guard<std::mutex> lock(mu_);
    if (!reg_.enabled) return;
    if (ok) {
      ++reg_.files_ok;
    } else {
      ++reg_.files_failed;
    }
  }

  static const char* PhaseName(Phase phase);
  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 protected:
  Metrics() = default;

 private:
  static std::mutex mu_;
  static Registry reg_;
};

}  // namespace metrics
}  // namespace nestport
