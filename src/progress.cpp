#include "progress.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "utils.hpp"

namespace {

constexpr auto kRedrawInterval = std::chrono::milliseconds(100);
constexpr char kMeterChars[] = {' ', '.', '_', 'v', 'Y', 'X', 'H', '#'};
constexpr std::size_t kMeterCharCount = sizeof(kMeterChars) / sizeof(kMeterChars[0]);

} // namespace

ProgressMeter::ProgressMeter(std::string label,
                             uint64_t total_bytes,
                             std::size_t width,
                             bool enabled,
                             std::ostream& out)
  : label_(std::move(label)),
    total_(total_bytes),
    width_(std::max<std::size_t>(1, width)),
    enabled_(enabled),
    out_(out) {}

ProgressMeter::~ProgressMeter() {
  // Leave the cursor on a fresh line if the session aborted mid-entry.
  if(enabled_ && drawn_ && !finished_) out_ << "\n" << std::flush;
}

void ProgressMeter::update(const ManifestEntry& entry, uint64_t delta_bytes, uint64_t chunk_index) {
  completed_ += delta_bytes;
  entry_name_ = entry.relative_path;
  chunk_index_ = chunk_index;
  chunk_count_ = entry.chunk_count();
  if(!enabled_) return;

  auto now = std::chrono::steady_clock::now();
  if(drawn_ && now - last_draw_ < kRedrawInterval && completed_ < total_) return;
  last_draw_ = now;
  draw();
}

void ProgressMeter::finish() {
  if(finished_) return;
  finished_ = true;
  if(!enabled_) return;
  draw();
  out_ << "\n" << std::flush;
}

std::string ProgressMeter::format_bar(uint64_t done, uint64_t total, std::size_t slots) {
  slots = std::max<std::size_t>(1, slots);
  if(total == 0) return std::string(slots, kMeterChars[kMeterCharCount - 1]);
  done = std::min(done, total);

  std::string bar;
  bar.reserve(slots);
  // Each slot covers an equal share of the byte range; a partly covered
  // slot picks an intermediate glyph.
  for(std::size_t slot = 0; slot < slots; ++slot) {
    const double slot_start = static_cast<double>(total) * slot / slots;
    const double slot_end = static_cast<double>(total) * (slot + 1) / slots;
    const double covered = std::clamp((static_cast<double>(done) - slot_start) / (slot_end - slot_start),
                                      0.0, 1.0);
    auto index = static_cast<std::size_t>(covered * kMeterCharCount);
    if(index >= kMeterCharCount) index = kMeterCharCount - 1;
    bar.push_back(kMeterChars[index]);
  }
  return bar;
}

std::string ProgressMeter::render() const {
  double percent = total_ == 0
    ? 100.0
    : static_cast<double>(std::min(completed_, total_)) / static_cast<double>(total_) * 100.0;
  std::ostringstream line;
  line << label_ << " [" << format_bar(completed_, total_, width_) << "] "
       << std::fixed << std::setprecision(1) << percent << "% "
       << format_size(completed_) << "/" << format_size(total_);
  if(!entry_name_.empty()) {
    const auto chunks = std::max<uint64_t>(1, chunk_count_);
    line << "  " << entry_name_ << " (chunk " << std::min(chunk_index_ + 1, chunks) << "/"
         << chunks << ")";
  }
  return line.str();
}

void ProgressMeter::draw() {
  auto rendered = render();
  out_ << "\r" << rendered;
  if(rendered.size() < line_width_) {
    out_ << std::string(line_width_ - rendered.size(), ' ');
  } else {
    line_width_ = rendered.size();
  }
  out_.flush();
  drawn_ = true;
}
