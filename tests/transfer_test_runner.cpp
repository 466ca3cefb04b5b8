#include "app.hpp"
#include "errors.hpp"
#include "handshake.hpp"
#include "identity.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include "memory_transport.hpp"
#include "peer_connector.hpp"
#include "session.hpp"
#include "settings_manager.hpp"
#include "sources.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using peersend::test::MemoryNetwork;
using peersend::test::TestCase;
using peersend::test::TestContext;
using peersend::test::TempWorkspace;
using peersend::test::expect;
using peersend::test::expect_throws;
using peersend::test::make_connection_pair;
using peersend::test::random_bytes;
using peersend::test::read_file;
using peersend::test::text_bytes;
using peersend::test::write_file;

namespace {

const std::string kSecret = "blue-otter-42";

struct SessionRun {
  std::exception_ptr sender_error;
  std::exception_ptr receiver_error;
  Manifest received;
  std::vector<fs::path> committed;
};

ConnectOptions quick_connect() {
  ConnectOptions options;
  options.timeout_per_attempt = std::chrono::milliseconds(3000);
  options.max_attempts = 3;
  options.retry_interval = std::chrono::milliseconds(10);
  options.ready_poll_interval = std::chrono::milliseconds(1);
  return options;
}

// Runs a receiver on a background thread and a sender on this one, both
// going through PeerConnector over the in-memory network.
SessionRun run_session(TestContext& ctx,
                       const std::shared_ptr<MemoryNetwork>& network,
                       const std::vector<SendItem>& items,
                       const fs::path& destination,
                       SessionOptions options = {}) {
  auto sender_log = std::make_shared<Logger>("sender");
  auto receiver_log = std::make_shared<Logger>("receiver");
  ctx.logs.attach(sender_log, "sender");
  ctx.logs.attach(receiver_log, "receiver");
  auto ids = peer_identities(kSecret);

  SessionRun run;
  std::thread receiver([&]() {
    try {
      PeerConnector connector(*network, receiver_log);
      auto link = connector.connect(derive_seed(kSecret, Role::Receiver), ids.sender, quick_connect());
      ReceiverSession session(link.connection(), destination, receiver_log, options);
      try {
        run.received = session.run();
      } catch(const std::exception&) {
        run.committed = session.committed();
        throw;
      }
      run.committed = session.committed();
    } catch(const std::exception&) {
      run.receiver_error = std::current_exception();
    }
  });

  try {
    PeerConnector connector(*network, sender_log);
    auto link = connector.connect(derive_seed(kSecret, Role::Sender), ids.receiver, quick_connect());
    SenderSession session(link.connection(), sender_log, options);
    session.run(items);
  } catch(const std::exception&) {
    run.sender_error = std::current_exception();
  }
  receiver.join();
  return run;
}

template<typename Error>
bool failed_with(TestContext& ctx, const std::exception_ptr& error, const std::string& what,
                 const std::string& entry = std::string()) {
  if(!error) return expect(ctx, false, what + ": expected a failure");
  try {
    std::rethrow_exception(error);
  } catch(const Error& e) {
    if(!entry.empty()) return expect(ctx, e.entry() == entry, what + ": failing entry is " + entry + ", got '" + e.entry() + "'");
    return true;
  } catch(const std::exception& e) {
    return expect(ctx, false, what + ": unexpected error " + e.what());
  }
}

bool succeeded(TestContext& ctx, const std::exception_ptr& error, const std::string& what) {
  if(!error) return true;
  try {
    std::rethrow_exception(error);
  } catch(const std::exception& e) {
    return expect(ctx, false, what + " failed: " + e.what());
  }
}

bool no_staging_left(TestContext& ctx, const fs::path& destination) {
  for(const auto& entry : fs::directory_iterator(destination)) {
    if(entry.path().filename().string().rfind(".peersend-staging-", 0) == 0) {
      return expect(ctx, false, "staging directory left behind: " + entry.path().string());
    }
  }
  return true;
}

bool same_tree(TestContext& ctx, const fs::path& a, const fs::path& b) {
  std::vector<std::string> left;
  std::vector<std::string> right;
  for(const auto& entry : fs::recursive_directory_iterator(a)) {
    left.push_back(fs::relative(entry.path(), a).generic_string() + (entry.is_directory() ? "/" : ""));
  }
  for(const auto& entry : fs::recursive_directory_iterator(b)) {
    right.push_back(fs::relative(entry.path(), b).generic_string() + (entry.is_directory() ? "/" : ""));
  }
  std::sort(left.begin(), left.end());
  std::sort(right.begin(), right.end());
  if(!expect(ctx, left == right, "directory listings match")) return false;
  for(const auto& name : left) {
    if(name.back() == '/') continue;
    if(!expect(ctx, read_file(a / name) == read_file(b / name), "content of " + name)) return false;
  }
  return true;
}

bool test_single_file_three_chunks(TestContext& ctx) {
  TempWorkspace ws("peersend-single");
  auto payload = text_bytes(2 * 5120 + 100, 11);
  write_file(ws.root() / "src" / "report.txt", payload);
  auto dest = ws.dir("dest");

  auto items = prepare_send_items({(ws.root() / "src" / "report.txt").string()}, 5120);
  bool ok = expect(ctx, items[0].entry.chunk_count() == 3, "three windows");

  auto network = std::make_shared<MemoryNetwork>();
  auto run = run_session(ctx, network, items, dest);
  ok &= succeeded(ctx, run.sender_error, "sender");
  ok &= succeeded(ctx, run.receiver_error, "receiver");
  ok &= expect(ctx, read_file(dest / "report.txt") == payload, "file arrived intact");
  ok &= expect(ctx, run.received.entries.size() == 1, "one entry received");
  ok &= expect(ctx, run.committed.size() == 1, "one entry committed");
  ok &= no_staging_left(ctx, dest);
  return ok;
}

bool test_directory_tree(TestContext& ctx) {
  TempWorkspace ws("peersend-tree");
  auto tree = ws.dir("photos");
  write_file(tree / "2023" / "beach.jpg", random_bytes(40000, 12));
  write_file(tree / "2023" / "notes.md", text_bytes(9000, 13));
  write_file(tree / "2024" / "deep" / "er" / "x.raw", random_bytes(1, 14));
  write_file(tree / "empty.txt", "");
  fs::create_directories(tree / "empty_album");
  auto dest = ws.dir("dest");

  auto items = prepare_send_items({tree.string()}, 4096);
  auto network = std::make_shared<MemoryNetwork>();
  auto run = run_session(ctx, network, items, dest);
  bool ok = succeeded(ctx, run.sender_error, "sender");
  ok &= succeeded(ctx, run.receiver_error, "receiver");
  ok &= expect(ctx, fs::is_directory(dest / "photos"), "directory entry created");
  ok &= expect(ctx, !run.received.entries.empty() &&
               run.received.entries[0].content_digest == items[0].entry.content_digest,
               "directory digest is the sender's tar stream digest");
  ok &= same_tree(ctx, tree, dest / "photos");
  ok &= no_staging_left(ctx, dest);
  return ok;
}

bool test_mixed_entries_small_chunks(TestContext& ctx) {
  TempWorkspace ws("peersend-mixed");
  write_file(ws.root() / "src" / "tiny.txt", "seven b");
  write_file(ws.root() / "src" / "zero.bin", "");
  write_file(ws.root() / "src" / "docs" / "a.txt", text_bytes(3000, 15));
  auto dest = ws.dir("dest");

  auto items = prepare_send_items({(ws.root() / "src" / "tiny.txt").string(),
                                   (ws.root() / "src" / "zero.bin").string(),
                                   (ws.root() / "src" / "docs").string()}, 7);
  auto network = std::make_shared<MemoryNetwork>();
  auto run = run_session(ctx, network, items, dest);
  bool ok = succeeded(ctx, run.sender_error, "sender");
  ok &= succeeded(ctx, run.receiver_error, "receiver");
  ok &= expect(ctx, read_file(dest / "tiny.txt") == "seven b", "tiny file");
  ok &= expect(ctx, fs::exists(dest / "zero.bin") && fs::file_size(dest / "zero.bin") == 0, "zero-byte file");
  ok &= expect(ctx, run.received.entries[1].content_digest == sha256_hex(""), "zero-byte digest");
  ok &= same_tree(ctx, ws.root() / "src" / "docs", dest / "docs");
  return ok;
}

bool test_preflight_conflict(TestContext& ctx) {
  TempWorkspace ws("peersend-conflict");
  write_file(ws.root() / "src" / "fresh.txt", "new content");
  write_file(ws.root() / "src" / "notes.txt", "incoming");
  auto dest = ws.dir("dest");
  write_file(dest / "notes.txt", "already here");

  auto items = prepare_send_items({(ws.root() / "src" / "fresh.txt").string(),
                                   (ws.root() / "src" / "notes.txt").string()}, 1024);
  auto network = std::make_shared<MemoryNetwork>();
  auto run = run_session(ctx, network, items, dest);
  bool ok = failed_with<ConflictError>(ctx, run.receiver_error, "receiver", "notes.txt");
  ok &= failed_with<RemoteRejectedError>(ctx, run.sender_error, "sender");
  ok &= expect(ctx, !fs::exists(dest / "fresh.txt"), "nothing written before the rejection");
  ok &= expect(ctx, read_file(dest / "notes.txt") == "already here", "existing file untouched");
  ok &= no_staging_left(ctx, dest);
  return ok;
}

bool test_corrupted_block_fails_integrity(TestContext& ctx) {
  TempWorkspace ws("peersend-tamper");
  write_file(ws.root() / "src" / "blob.bin", random_bytes(3 * 16384, 16));
  auto dest = ws.dir("dest");
  auto items = prepare_send_items({(ws.root() / "src" / "blob.bin").string()}, 16384);

  auto network = std::make_shared<MemoryNetwork>();
  auto sender_id = peer_identities(kSecret).sender;
  // Message 0 is the manifest; message 2 is the second stored block.
  network->set_tamper([sender_id](const std::string& from, std::size_t index, Bytes& message) {
    if(from == sender_id && index == 2 && message.size() > 100) {
      message[message.size() / 2] ^= 0x5a;
    }
  });
  SessionOptions options;
  options.compression_level = 0;
  auto run = run_session(ctx, network, items, dest, options);
  bool ok = failed_with<IntegrityError>(ctx, run.receiver_error, "receiver", "blob.bin");
  ok &= expect(ctx, run.sender_error != nullptr, "sender sees the aborted session");
  ok &= expect(ctx, !fs::exists(dest / "blob.bin"), "no file at the final path");
  ok &= no_staging_left(ctx, dest);
  return ok;
}

bool test_garbled_stream_is_corrupt(TestContext& ctx) {
  TempWorkspace ws("peersend-garbled");
  write_file(ws.root() / "src" / "doc.txt", text_bytes(20000, 17));
  auto dest = ws.dir("dest");
  auto items = prepare_send_items({(ws.root() / "src" / "doc.txt").string()}, 8192);

  auto network = std::make_shared<MemoryNetwork>();
  auto sender_id = peer_identities(kSecret).sender;
  network->set_tamper([sender_id](const std::string& from, std::size_t index, Bytes& message) {
    if(from == sender_id && index == 1) message.assign(16, '\xff');
  });
  auto run = run_session(ctx, network, items, dest);
  bool ok = failed_with<StreamCorruptError>(ctx, run.receiver_error, "receiver", "doc.txt");
  ok &= expect(ctx, !fs::exists(dest / "doc.txt"), "nothing committed");
  ok &= no_staging_left(ctx, dest);
  return ok;
}

SessionRun run_with_late_conflict(TestContext& ctx, TempWorkspace& ws, bool rollback) {
  write_file(ws.root() / "src" / "first.txt", text_bytes(5000, 18));
  write_file(ws.root() / "src" / "second.txt", text_bytes(5000, 19));
  auto dest = ws.dir("dest");
  auto items = prepare_send_items({(ws.root() / "src" / "first.txt").string(),
                                   (ws.root() / "src" / "second.txt").string()}, 1024);

  auto network = std::make_shared<MemoryNetwork>();
  auto sender_id = peer_identities(kSecret).sender;
  // Once the first entry is under way, something else claims the second
  // entry's path.
  network->set_tamper([sender_id, dest](const std::string& from, std::size_t index, Bytes&) {
    if(from == sender_id && index == 1) write_file(dest / "second.txt", "squatter");
  });
  SessionOptions options;
  options.rollback_on_failure = rollback;
  return run_session(ctx, network, items, dest, options);
}

bool test_per_entry_conflict(TestContext& ctx) {
  TempWorkspace ws("peersend-late-conflict");
  auto run = run_with_late_conflict(ctx, ws, false);
  auto dest = ws.root() / "dest";
  bool ok = failed_with<ConflictError>(ctx, run.receiver_error, "receiver", "second.txt");
  ok &= expect(ctx, run.sender_error != nullptr, "sender fails too");
  ok &= expect(ctx, read_file(dest / "second.txt") == "squatter", "conflicting file not overwritten");
  ok &= expect(ctx, read_file(dest / "first.txt") == read_file(ws.root() / "src" / "first.txt"),
               "verified earlier entry stays");
  ok &= no_staging_left(ctx, dest);
  return ok;
}

bool test_rollback_on_failure(TestContext& ctx) {
  TempWorkspace ws("peersend-rollback");
  auto run = run_with_late_conflict(ctx, ws, true);
  auto dest = ws.root() / "dest";
  bool ok = failed_with<ConflictError>(ctx, run.receiver_error, "receiver", "second.txt");
  ok &= expect(ctx, !fs::exists(dest / "first.txt"), "committed entry rolled back");
  ok &= expect(ctx, run.committed.empty(), "nothing left committed");
  ok &= expect(ctx, read_file(dest / "second.txt") == "squatter", "foreign file untouched");
  ok &= expect(ctx, ctx.logs.contains("Rolled back"), "rollback logged");
  return ok;
}

bool test_source_changed_after_manifest(TestContext& ctx) {
  TempWorkspace ws("peersend-changed");
  auto source = ws.root() / "src" / "live.log";
  write_file(source, "version one of the file");
  auto dest = ws.dir("dest");
  auto items = prepare_send_items({source.string()}, 1024);
  write_file(source, "version two of the file");

  auto network = std::make_shared<MemoryNetwork>();
  auto run = run_session(ctx, network, items, dest);
  bool ok = failed_with<IntegrityError>(ctx, run.sender_error, "sender", "live.log");
  ok &= failed_with<IntegrityError>(ctx, run.receiver_error, "receiver", "live.log");
  ok &= expect(ctx, !fs::exists(dest / "live.log"), "mismatching entry not committed");
  return ok;
}

bool test_source_removed_after_manifest(TestContext& ctx) {
  TempWorkspace ws("peersend-removed");
  auto source = ws.root() / "src" / "notes.txt";
  write_file(source, "short lived");
  auto dest = ws.dir("dest");
  auto items = prepare_send_items({source.string()}, 1024);
  fs::remove(source);

  auto network = std::make_shared<MemoryNetwork>();
  auto run = run_session(ctx, network, items, dest);
  bool ok = failed_with<FileSystemError>(ctx, run.sender_error, "sender", "notes.txt");
  ok &= expect(ctx, run.receiver_error != nullptr, "receiver fails when the sender gives up");
  ok &= expect(ctx, !fs::exists(dest / "notes.txt"), "nothing committed");
  ok &= no_staging_left(ctx, dest);
  return ok;
}

bool test_version_mismatch(TestContext& ctx) {
  TempWorkspace ws("peersend-version");
  auto dest = ws.dir("dest");
  auto [sender, receiver] = make_connection_pair("sender", "receiver");
  auto logger = std::make_shared<Logger>("receiver");
  ctx.logs.attach(logger, "receiver");

  Manifest manifest;
  manifest.protocol_version = kProtocolVersion + 1;
  auto text = encode_manifest(manifest);
  send_message(*sender, Bytes(text.begin(), text.end()));

  ReceiverSession session(receiver, dest, logger);
  bool ok = expect_throws<ProtocolError>(ctx, [&]() { session.run(); }, "receiver with a newer manifest");
  auto verdict = receive_message(*sender);
  ok &= expect(ctx, verdict.size() == 1 && verdict[0] == kAckReject, "sender is told to stop");
  ok &= expect(ctx, fs::is_empty(dest), "nothing written");
  return ok;
}

bool test_connect_attempt_count(TestContext& ctx) {
  auto network = std::make_shared<MemoryNetwork>();
  auto logger = std::make_shared<Logger>("connector");
  ctx.logs.attach(logger, "connector");
  auto ids = peer_identities(kSecret);

  ConnectOptions options;
  options.timeout_per_attempt = std::chrono::milliseconds(20);
  options.max_attempts = 4;
  options.retry_interval = std::chrono::milliseconds(5);
  PeerConnector connector(*network, logger);
  bool ok = expect_throws<ConnectionError>(ctx, [&]() {
    connector.connect(derive_seed(kSecret, Role::Sender), ids.receiver, options);
  }, "unreachable peer");
  ok &= expect(ctx, network->dial_count(ids.sender) == 4, "exactly max_attempts dials, got " +
               std::to_string(network->dial_count(ids.sender)));

  options.max_attempts = 0;
  ok &= expect_throws<ConfigError>(ctx, [&]() {
    connector.connect(derive_seed(kSecret, Role::Sender), ids.receiver, options);
  }, "zero attempts");
  ok &= expect(ctx, network->dial_count(ids.sender) == 4, "no dial for a config error");
  return ok;
}

bool test_app_end_to_end(TestContext& ctx) {
  TempWorkspace ws("peersend-app");
  write_file(ws.root() / "src" / "hello.txt", "hello from the sender");
  write_file(ws.root() / "src" / "pics" / "cat.png", random_bytes(7000, 20));
  auto dest = ws.dir("dest");

  ::setenv("PEERSEND_TEST_SECRET", kSecret.c_str(), 1);
  SettingsManager settings;
  std::string error;
  bool ok = expect(ctx, settings.set_from_string("token_env", "PEERSEND_TEST_SECRET", error), "token_env");
  ok &= expect(ctx, settings.set_from_string("chunk_size", "2k", error), "chunk_size");
  ok &= expect(ctx, settings.set_from_string("dest_dir", dest.string(), error), "dest_dir");
  ok &= expect(ctx, settings.set_from_string("transfer_progress", "false", error), "progress off");
  auto options = AppOptions::from_settings(settings);
  ok &= expect(ctx, options.secret == kSecret && options.chunk_size == 2048, "options from settings");
  options.connect = quick_connect();

  auto network = std::make_shared<MemoryNetwork>();
  auto sender_log = std::make_shared<Logger>("sender");
  auto receiver_log = std::make_shared<Logger>("receiver");
  ctx.logs.attach(sender_log, "sender");
  ctx.logs.attach(receiver_log, "receiver");

  int receiver_code = -1;
  std::exception_ptr receiver_error;
  std::thread receiver([&]() {
    try {
      receiver_code = run_transfer(options, {}, *network, receiver_log);
    } catch(const std::exception&) {
      receiver_error = std::current_exception();
    }
  });
  int sender_code = run_transfer(options,
                                 {(ws.root() / "src" / "hello.txt").string(), (ws.root() / "src" / "pics").string()},
                                 *network, sender_log);
  receiver.join();
  ok &= succeeded(ctx, receiver_error, "receiver");
  ok &= expect(ctx, sender_code == 0 && receiver_code == 0, "both sides exit cleanly");
  ok &= expect(ctx, read_file(dest / "hello.txt") == "hello from the sender", "file delivered");
  ok &= same_tree(ctx, ws.root() / "src" / "pics", dest / "pics");
  ok &= expect(ctx, ctx.logs.contains("chunk_size is decided by the sender"), "receiver warns about chunk_size");

  ::unsetenv("PEERSEND_TEST_SECRET");
  ok &= expect_throws<ConfigError>(ctx, [&]() { AppOptions::from_settings(settings); }, "missing secret");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"single_file_three_chunks", test_single_file_three_chunks},
    {"directory_tree", test_directory_tree},
    {"mixed_entries_small_chunks", test_mixed_entries_small_chunks},
    {"preflight_conflict", test_preflight_conflict},
    {"corrupted_block_fails_integrity", test_corrupted_block_fails_integrity},
    {"garbled_stream_is_corrupt", test_garbled_stream_is_corrupt},
    {"per_entry_conflict", test_per_entry_conflict},
    {"rollback_on_failure", test_rollback_on_failure},
    {"source_changed_after_manifest", test_source_changed_after_manifest},
    {"source_removed_after_manifest", test_source_removed_after_manifest},
    {"version_mismatch", test_version_mismatch},
    {"connect_attempt_count", test_connect_attempt_count},
    {"app_end_to_end", test_app_end_to_end},
  };
  return peersend::test::run_test_cases("transfer", tests, argc, argv);
}
