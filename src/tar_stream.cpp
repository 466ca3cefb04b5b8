#include "tar_stream.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include "conflict_guard.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

namespace {

constexpr char kTypeFile = '0';
constexpr char kTypeDirectory = '5';
constexpr char kTypeGnuLongName = 'L';
constexpr char kTypePaxHeader = 'x';
constexpr char kTypePaxGlobal = 'g';
constexpr uint64_t kMaxLongName = 64 * 1024;

struct Field {
  std::size_t offset;
  std::size_t width;
};

constexpr Field kName{0, 100};
constexpr Field kMode{100, 8};
constexpr Field kUid{108, 8};
constexpr Field kGid{116, 8};
constexpr Field kSize{124, 12};
constexpr Field kMtime{136, 12};
constexpr Field kChecksum{148, 8};
constexpr std::size_t kTypeOffset = 156;
constexpr Field kMagic{257, 6};
constexpr Field kVersion{263, 2};
constexpr Field kPrefix{345, 155};

uint64_t padding_for(uint64_t size) {
  return (kTarBlockSize - size % kTarBlockSize) % kTarBlockSize;
}

void put_string(char* block, Field field, const std::string& value) {
  std::memcpy(block + field.offset, value.data(), std::min(value.size(), field.width));
}

// Octal with a trailing NUL when it fits, GNU base-256 otherwise.
void put_number(char* block, Field field, uint64_t value) {
  const std::size_t digits = field.width - 1;
  if(digits >= 22 || value < (uint64_t{1} << (3 * digits))) {
    std::string text(digits, '0');
    for(std::size_t i = digits; i > 0 && value > 0; --i) {
      text[i - 1] = static_cast<char>('0' + (value & 7));
      value >>= 3;
    }
    std::memcpy(block + field.offset, text.data(), digits);
    block[field.offset + digits] = '\0';
    return;
  }
  auto* out = reinterpret_cast<unsigned char*>(block + field.offset);
  std::memset(out, 0, field.width);
  for(std::size_t i = field.width; i > 1; --i) {
    out[i - 1] = static_cast<unsigned char>(value & 0xff);
    value >>= 8;
  }
  out[0] = 0x80;
}

uint64_t get_number(const char* block, Field field) {
  const auto* in = reinterpret_cast<const unsigned char*>(block + field.offset);
  if(in[0] & 0x80) {
    uint64_t value = in[0] & 0x7f;
    for(std::size_t i = 1; i < field.width; ++i) {
      if(value >> 56) throw StreamCorruptError("tar numeric field overflows 64 bits");
      value = (value << 8) | in[i];
    }
    return value;
  }
  uint64_t value = 0;
  std::size_t i = 0;
  while(i < field.width && (in[i] == ' ' || in[i] == '\0')) ++i;
  for(; i < field.width; ++i) {
    if(in[i] == ' ' || in[i] == '\0') break;
    if(in[i] < '0' || in[i] > '7') throw StreamCorruptError("Invalid octal digit in tar header");
    value = (value << 3) | static_cast<uint64_t>(in[i] - '0');
  }
  return value;
}

std::string get_string(const char* block, Field field) {
  const char* begin = block + field.offset;
  const char* end = static_cast<const char*>(std::memchr(begin, '\0', field.width));
  return std::string(begin, end ? end : begin + field.width);
}

uint64_t header_checksum(const char* block) {
  uint64_t sum = 0;
  for(std::size_t i = 0; i < kTarBlockSize; ++i) {
    bool in_checksum = i >= kChecksum.offset && i < kChecksum.offset + kChecksum.width;
    sum += in_checksum ? static_cast<unsigned char>(' ') : static_cast<unsigned char>(block[i]);
  }
  return sum;
}

std::string header_block(const std::string& name, const std::string& prefix, char type,
                         uint64_t size, uint32_t mode, int64_t mtime) {
  std::string block(kTarBlockSize, '\0');
  char* raw = &block[0];
  put_string(raw, kName, name);
  put_number(raw, kMode, mode & 07777);
  put_number(raw, kUid, 0);
  put_number(raw, kGid, 0);
  put_number(raw, kSize, size);
  put_number(raw, kMtime, mtime > 0 ? static_cast<uint64_t>(mtime) : 0);
  raw[kTypeOffset] = type;
  std::memcpy(raw + kMagic.offset, "ustar", 6);
  std::memcpy(raw + kVersion.offset, "00", 2);
  put_string(raw, kPrefix, prefix);

  uint64_t sum = header_checksum(raw);
  char digits[8];
  std::snprintf(digits, sizeof(digits), "%06o", static_cast<unsigned>(sum & 0777777));
  std::memcpy(raw + kChecksum.offset, digits, 6);
  raw[kChecksum.offset + 6] = '\0';
  raw[kChecksum.offset + 7] = ' ';
  return block;
}

} // namespace

std::string tar_member_header(const std::string& name, char type, uint64_t size,
                              uint32_t mode, int64_t mtime) {
  if(name.size() <= kName.width) {
    return header_block(name, "", type, size, mode, mtime);
  }
  // ustar split: prefix and name joined by an implicit '/'.
  for(auto slash = name.find('/'); slash != std::string::npos; slash = name.find('/', slash + 1)) {
    auto prefix_len = slash;
    auto name_len = name.size() - slash - 1;
    if(prefix_len <= kPrefix.width && name_len <= kName.width && name_len > 0) {
      return header_block(name.substr(slash + 1), name.substr(0, slash), type, size, mode, mtime);
    }
  }
  std::string record = header_block("././@LongLink", "", kTypeGnuLongName, name.size() + 1, 0644, 0);
  record += name;
  record.push_back('\0');
  record.append(padding_for(name.size() + 1), '\0');
  record += header_block(name.substr(0, kName.width), "", type, size, mode, mtime);
  return record;
}

TarSource::TarSource(fs::path directory, Logger* logger)
  : directory_(std::move(directory)) {
  collect(logger);
}

void TarSource::collect(Logger* logger) {
  std::error_code ec;
  fs::recursive_directory_iterator it(directory_, fs::directory_options::none, ec);
  if(ec) {
    throw std::runtime_error("Cannot walk " + directory_.string() + ": " + ec.message());
  }
  for(const fs::recursive_directory_iterator end{}; it != end; ) {
    const auto path = it->path();
    struct stat st{};
    if(::lstat(path.c_str(), &st) != 0) {
      throw std::runtime_error("Cannot stat " + path.string());
    }
    Member member;
    member.full_path = path;
    member.name = path.lexically_relative(directory_).generic_string();
    member.mode = static_cast<uint32_t>(st.st_mode & 07777);
    member.mtime = static_cast<int64_t>(st.st_mtime);
    if(S_ISDIR(st.st_mode)) {
      member.is_directory = true;
      member.name += "/";
    } else if(S_ISREG(st.st_mode)) {
      member.size = static_cast<uint64_t>(st.st_size);
    } else {
      if(logger) logger->warn("Skipping {} (not a regular file or directory)", path.string());
    }
    if(member.is_directory || S_ISREG(st.st_mode)) {
      members_.push_back(std::move(member));
    }
    it.increment(ec);
    if(ec) {
      throw std::runtime_error("Cannot walk " + directory_.string() + ": " + ec.message());
    }
  }
  std::sort(members_.begin(), members_.end(),
            [](const Member& a, const Member& b){ return a.name < b.name; });
}

bool TarSource::start_next() {
  pending_.clear();
  pending_offset_ = 0;
  if(next_member_ < members_.size()) {
    const auto& member = members_[next_member_++];
    pending_ = tar_member_header(member.name,
                                 member.is_directory ? kTypeDirectory : kTypeFile,
                                 member.is_directory ? 0 : member.size,
                                 member.mode,
                                 member.mtime);
    if(!member.is_directory && member.size > 0) {
      file_.close();
      file_.clear();
      file_.open(member.full_path, std::ios::binary);
      if(!file_) {
        throw std::runtime_error("Cannot open " + member.full_path.string() + " for reading");
      }
      file_path_ = member.full_path;
      file_remaining_ = member.size;
      file_padding_ = padding_for(member.size);
    }
    return true;
  }
  if(!trailer_queued_) {
    trailer_queued_ = true;
    pending_.assign(2 * kTarBlockSize, '\0');
    return true;
  }
  return false;
}

std::size_t TarSource::read(char* out, std::size_t max) {
  std::size_t total = 0;
  while(total < max) {
    if(pending_offset_ < pending_.size()) {
      auto n = std::min(max - total, pending_.size() - pending_offset_);
      std::memcpy(out + total, pending_.data() + pending_offset_, n);
      pending_offset_ += n;
      total += n;
      continue;
    }
    if(file_remaining_ > 0) {
      auto want = static_cast<std::streamsize>(std::min<uint64_t>(max - total, file_remaining_));
      file_.read(out + total, want);
      auto got = static_cast<std::size_t>(file_.gcount());
      if(got == 0) {
        throw std::runtime_error(file_path_.string() + " shrank while it was being archived");
      }
      file_remaining_ -= got;
      total += got;
      if(file_remaining_ == 0) {
        file_.close();
        pending_.assign(file_padding_, '\0');
        pending_offset_ = 0;
      }
      continue;
    }
    if(!start_next()) break;
  }
  return total;
}

TarExtractor::TarExtractor(fs::path root, Logger* logger)
  : root_(std::move(root)), logger_(logger) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if(ec) {
    throw std::runtime_error("Cannot create " + root_.string() + ": " + ec.message());
  }
}

TarExtractor::~TarExtractor() {
  abandon();
}

void TarExtractor::abandon() noexcept {
  if(out_.is_open()) out_.close();
}

fs::path TarExtractor::member_path(std::string name) const {
  while(!name.empty() && name.back() == '/') name.pop_back();
  std::string reason;
  if(!ConflictGuard::is_safe_relative(name, &reason)) {
    throw PathTraversalError("Unsafe archive member '" + name + "': " + reason, name);
  }
  return root_ / fs::path(name);
}

void TarExtractor::begin_data(State state, uint64_t size) {
  remaining_ = size;
  padding_ = padding_for(size);
  state_ = state;
  if(remaining_ == 0) end_data();
}

void TarExtractor::end_data() {
  if(state_ == State::FileData) {
    out_.close();
    if(!out_) {
      throw std::runtime_error("Write failed on " + out_path_.string());
    }
    std::error_code ec;
    fs::permissions(out_path_, static_cast<fs::perms>(out_mode_ & 07777), ec);
    if(ec && logger_) logger_->debug("Unable to set mode on {}: {}", out_path_.string(), ec.message());
  } else if(state_ == State::LongName) {
    auto nul = long_name_buffer_.find('\0');
    long_name_ = long_name_buffer_.substr(0, nul);
    long_name_buffer_.clear();
  }
  state_ = padding_ > 0 ? State::Padding : State::Header;
}

void TarExtractor::on_header() {
  const char* raw = block_.data();
  if(std::all_of(block_.begin(), block_.end(), [](char c){ return c == '\0'; })) {
    if(++zero_blocks_ == 2) state_ = State::End;
    return;
  }
  zero_blocks_ = 0;

  if(std::memcmp(raw + kMagic.offset, "ustar", 5) != 0) {
    throw StreamCorruptError("tar header is not ustar");
  }
  if(get_number(raw, kChecksum) != header_checksum(raw)) {
    throw StreamCorruptError("tar header checksum mismatch");
  }

  std::string name;
  if(!long_name_.empty()) {
    name = std::move(long_name_);
    long_name_.clear();
  } else {
    auto prefix = get_string(raw, kPrefix);
    name = get_string(raw, kName);
    if(!prefix.empty()) name = prefix + "/" + name;
  }
  const uint64_t size = get_number(raw, kSize);
  const char type = raw[kTypeOffset];

  switch(type) {
    case kTypeFile:
    case '\0':
    case '7': {
      out_path_ = member_path(name);
      out_mode_ = static_cast<uint32_t>(get_number(raw, kMode));
      std::error_code ec;
      fs::create_directories(out_path_.parent_path(), ec);
      out_.clear();
      out_.open(out_path_, std::ios::binary | std::ios::out | std::ios::trunc);
      if(!out_) {
        throw std::runtime_error("Cannot create " + out_path_.string());
      }
      begin_data(State::FileData, size);
      break;
    }
    case kTypeDirectory: {
      auto dir = member_path(name);
      std::error_code ec;
      fs::create_directories(dir, ec);
      if(ec) {
        throw std::runtime_error("Cannot create " + dir.string() + ": " + ec.message());
      }
      auto mode = static_cast<uint32_t>(get_number(raw, kMode));
      fs::permissions(dir, static_cast<fs::perms>(mode & 07777) | fs::perms::owner_all, ec);
      begin_data(State::SkipData, size);
      break;
    }
    case kTypeGnuLongName:
      if(size == 0 || size > kMaxLongName) {
        throw StreamCorruptError("Unreasonable GNU long name length " + std::to_string(size));
      }
      long_name_buffer_.clear();
      begin_data(State::LongName, size);
      break;
    case kTypePaxHeader:
    case kTypePaxGlobal:
      if(logger_) logger_->debug("Ignoring pax header for '{}'", name);
      begin_data(State::SkipData, size);
      break;
    default:
      if(logger_) logger_->warn("Skipping archive member '{}' of type '{}'", name, type);
      begin_data(State::SkipData, size);
      break;
  }
}

void TarExtractor::write(const char* data, std::size_t size) {
  while(size > 0) {
    std::size_t used = 0;
    switch(state_) {
      case State::Header: {
        used = std::min(size, kTarBlockSize - block_fill_);
        std::memcpy(block_.data() + block_fill_, data, used);
        block_fill_ += used;
        if(block_fill_ == kTarBlockSize) {
          block_fill_ = 0;
          on_header();
        }
        break;
      }
      case State::FileData:
      case State::LongName:
      case State::SkipData: {
        used = static_cast<std::size_t>(std::min<uint64_t>(size, remaining_));
        if(state_ == State::FileData) {
          out_.write(data, static_cast<std::streamsize>(used));
          if(!out_) throw std::runtime_error("Write failed on " + out_path_.string());
        } else if(state_ == State::LongName) {
          long_name_buffer_.append(data, used);
        }
        remaining_ -= used;
        if(remaining_ == 0) end_data();
        break;
      }
      case State::Padding: {
        used = static_cast<std::size_t>(std::min<uint64_t>(size, padding_));
        padding_ -= used;
        if(padding_ == 0) state_ = State::Header;
        break;
      }
      case State::End: {
        if(std::any_of(data, data + size, [](char c){ return c != '\0'; })) {
          throw StreamCorruptError("Data after tar end-of-archive marker");
        }
        used = size;
        break;
      }
    }
    data += used;
    size -= used;
  }
}

void TarExtractor::finish() {
  if(state_ != State::End) {
    abandon();
    throw StreamCorruptError("tar stream ended before its end-of-archive marker");
  }
}
