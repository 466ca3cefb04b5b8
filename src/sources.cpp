#include "sources.hpp"

#include <unordered_set>

#include "entry_io.hpp"
#include "errors.hpp"
#include "integrity.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kDigestBufferSize = 1 << 20;

} // namespace

std::string entry_name_for(const fs::path& source) {
  auto name = source.lexically_normal().filename().string();
  if(name.empty() || name == "." || name == "..") {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(fs::absolute(source, ec), ec);
    name = ec ? std::string() : canonical.filename().string();
    // weakly_canonical("/tmp/dir/") keeps an empty trailing component.
    if(name.empty() && !ec) name = canonical.parent_path().filename().string();
  }
  if(name.empty() || name == "." || name == "..") return "root";
  return name;
}

ManifestEntry describe_entry(const fs::path& source,
                             const std::string& name,
                             uint32_t chunk_size,
                             Logger* logger) {
  ManifestEntry entry;
  entry.relative_path = name;
  entry.chunk_size = chunk_size;
  entry.is_directory = fs::is_directory(source);

  auto stream = open_entry_source(source, entry.is_directory, logger);
  IntegrityVerifier digest;
  std::vector<char> buffer(kDigestBufferSize);
  while(true) {
    auto got = stream->read(buffer.data(), buffer.size());
    if(got == 0) break;
    digest.update(buffer.data(), got);
  }
  entry.size_bytes = digest.bytes_seen();
  entry.content_digest = digest.finalize();
  return entry;
}

std::vector<SendItem> prepare_send_items(const std::vector<std::string>& paths,
                                         uint32_t chunk_size,
                                         Logger* logger) {
  if(paths.empty()) {
    throw ConfigError("No files or directories to send");
  }
  if(chunk_size == 0) {
    throw ConfigError("Chunk size must be at least one byte");
  }

  std::vector<SendItem> items;
  std::unordered_set<std::string> names;
  for(const auto& raw : paths) {
    fs::path source(raw);
    std::error_code ec;
    auto status = fs::status(source, ec);
    if(ec || !fs::exists(status)) {
      throw ConfigError("File/directory does not exist: " + raw);
    }
    if(!fs::is_regular_file(status) && !fs::is_directory(status)) {
      throw ConfigError("Not a regular file or directory: " + raw);
    }

    auto name = entry_name_for(source);
    if(!names.insert(name).second) {
      throw ConfigError("Two sources map to the same entry name '" + name + "'", name);
    }

    SendItem item;
    item.source = source;
    try {
      item.entry = describe_entry(source, name, chunk_size, logger);
    } catch(const std::runtime_error& e) {
      throw ConfigError(std::string("Unable to read source: ") + e.what(), name);
    }
    if(logger) {
      logger->info("Prepared {} '{}' ({})", item.entry.is_directory ? "directory" : "file",
                   name, format_size(item.entry.size_bytes));
    }
    items.push_back(std::move(item));
  }
  return items;
}
