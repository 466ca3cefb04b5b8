#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

#include "manifest.hpp"

// Single-line "\r" meter over the whole session, e.g.
//   Sending [######v_____] 52.3% 12.0 MiB/23.0 MiB  photos (chunk 3/5)
class ProgressMeter {
public:
  ProgressMeter(std::string label,
                uint64_t total_bytes,
                std::size_t width = 40,
                bool enabled = true,
                std::ostream& out = std::cout);
  ~ProgressMeter();

  ProgressMeter(const ProgressMeter&) = delete;
  ProgressMeter& operator=(const ProgressMeter&) = delete;

  void update(const ManifestEntry& entry, uint64_t delta_bytes, uint64_t chunk_index);
  // Draws the final state and ends the line. Safe to call twice.
  void finish();

  uint64_t completed_bytes() const { return completed_; }
  std::string render() const;

  static std::string format_bar(uint64_t done, uint64_t total, std::size_t slots);

private:
  void draw();

  std::string label_;
  uint64_t total_;
  std::size_t width_;
  bool enabled_;
  std::ostream& out_;
  uint64_t completed_ = 0;
  std::string entry_name_;
  uint64_t chunk_index_ = 0;
  uint64_t chunk_count_ = 0;
  std::size_t line_width_ = 0;
  bool drawn_ = false;
  bool finished_ = false;
  std::chrono::steady_clock::time_point last_draw_{};
};
