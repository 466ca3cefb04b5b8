#include "errors.hpp"
#include "identity.hpp"
#include "log.hpp"
#include "peer_connector.hpp"
#include "session.hpp"
#include "sources.hpp"
#include "tcp_transport.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using peersend::test::TestCase;
using peersend::test::TestContext;
using peersend::test::TempWorkspace;
using peersend::test::expect;
using peersend::test::expect_throws;
using peersend::test::random_bytes;
using peersend::test::read_file;
using peersend::test::text_bytes;
using peersend::test::write_file;

namespace {

const std::string kSecret = "loopback-secret";

TcpOptions listening_options() {
  TcpOptions options;
  options.listen_ip = "127.0.0.1";
  options.listen_port = 0;
  return options;
}

TcpOptions dialing_options(uint16_t port) {
  TcpOptions options;
  options.listen_port = -1;
  options.peer_address = "127.0.0.1:" + std::to_string(port);
  return options;
}

std::shared_ptr<Logger> attached_logger(TestContext& ctx, const std::string& name) {
  auto logger = std::make_shared<Logger>(name);
  ctx.logs.attach(logger, name);
  return logger;
}

bool test_loopback_messages(TestContext& ctx) {
  auto ids = peer_identities(kSecret);
  TcpNode receiver(derive_seed(kSecret, Role::Receiver), listening_options(), attached_logger(ctx, "receiver"));
  bool ok = expect(ctx, receiver.listen_port() != 0, "ephemeral port bound");
  TcpNode sender(derive_seed(kSecret, Role::Sender), dialing_options(receiver.listen_port()),
                 attached_logger(ctx, "sender"));
  ok &= expect(ctx, sender.listen_port() == 0, "dialing node does not listen");

  auto inbound = std::async(std::launch::async, [&]() {
    return receiver.connect(ids.sender, std::chrono::milliseconds(5000));
  });
  auto outbound = sender.connect(ids.receiver, std::chrono::milliseconds(5000));
  auto accepted = inbound.get();
  ok &= expect(ctx, outbound->remote_identity() == ids.receiver, "dialer sees the receiver identity");
  ok &= expect(ctx, accepted->remote_identity() == ids.sender, "listener sees the sender identity");

  auto big = random_bytes(300 * 1024, 31);
  send_message(*outbound, Bytes{'h', 'i'});
  send_message(*outbound, Bytes{});
  send_message(*outbound, Bytes(big.begin(), big.end()));
  send_message(*accepted, Bytes{0x01});

  ok &= expect(ctx, receive_message(*accepted) == Bytes{'h', 'i'}, "first message");
  ok &= expect(ctx, receive_message(*accepted).empty(), "empty message keeps its boundary");
  ok &= expect(ctx, receive_message(*accepted) == Bytes(big.begin(), big.end()), "large message spans reads");
  ok &= expect(ctx, receive_message(*outbound) == Bytes{0x01}, "reply travels back");

  outbound->close();
  ok &= expect_throws<ConnectionError>(ctx, [&]() { receive_message(*accepted); }, "receive after peer close");
  ok &= expect_throws<ConnectionError>(ctx, [&]() { send_message(*outbound, Bytes{'x'}); }, "send after close");
  return ok;
}

bool test_wrong_identity_rejected(TestContext& ctx) {
  auto ids = peer_identities(kSecret);
  TcpNode receiver(derive_seed(kSecret, Role::Receiver), listening_options(), attached_logger(ctx, "receiver"));
  // Right role, wrong secret.
  TcpNode impostor(derive_seed("not-the-secret", Role::Sender), dialing_options(receiver.listen_port()),
                   attached_logger(ctx, "impostor"));

  auto inbound = std::async(std::launch::async, [&]() {
    return receiver.connect(ids.sender, std::chrono::milliseconds(800));
  });
  bool ok = expect_throws<ConnectionError>(ctx, [&]() {
    impostor.connect(ids.receiver, std::chrono::milliseconds(800));
  }, "impostor dial");
  ok &= expect_throws<ConnectionError>(ctx, [&]() { inbound.get(); }, "listener waiting for the real sender");
  ok &= expect(ctx, ctx.logs.contains("Dropped inbound connection"), "dropped connection logged");
  return ok;
}

bool test_connect_timeout(TestContext& ctx) {
  auto ids = peer_identities(kSecret);
  TcpNode receiver(derive_seed(kSecret, Role::Receiver), listening_options(), attached_logger(ctx, "receiver"));
  auto started = std::chrono::steady_clock::now();
  bool ok = expect_throws<ConnectionError>(ctx, [&]() {
    receiver.connect(ids.sender, std::chrono::milliseconds(150));
  }, "nobody dials in");
  ok &= expect(ctx, std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(140), "waited the timeout");

  TcpNode mute(derive_seed(kSecret, Role::Sender), TcpOptions{"127.0.0.1", -1, ""}, attached_logger(ctx, "mute"));
  ok &= expect_throws<ConfigError>(ctx, [&]() {
    mute.connect(ids.receiver, std::chrono::milliseconds(50));
  }, "node that neither listens nor dials");

  TcpNode bad_address(derive_seed(kSecret, Role::Sender), dialing_options(0), attached_logger(ctx, "bad"));
  ok &= expect_throws<ConnectionError>(ctx, [&]() {
    bad_address.connect(ids.receiver, std::chrono::milliseconds(500));
  }, "dial to a closed port");
  return ok;
}

// Speaks the handshake by hand, then sends a frame header larger than
// the limit.
bool test_oversized_frame(TestContext& ctx) {
  auto ids = peer_identities(kSecret);
  auto sender_seed = derive_seed(kSecret, Role::Sender);
  TcpNode receiver(derive_seed(kSecret, Role::Receiver), listening_options(), attached_logger(ctx, "receiver"));

  auto inbound = std::async(std::launch::async, [&]() {
    return receiver.connect(ids.sender, std::chrono::milliseconds(5000));
  });

  asio::io_context io;
  asio::ip::tcp::socket socket(io);
  socket.connect({asio::ip::make_address("127.0.0.1"), receiver.listen_port()});
  asio::streambuf buffer;
  auto read_json_line = [&]() {
    auto length = asio::read_until(socket, buffer, '\n');
    auto begin = asio::buffers_begin(buffer.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(length - 1));
    buffer.consume(length);
    return json::parse(line);
  };
  auto write_json_line = [&](const json& doc) {
    asio::write(socket, asio::buffer(doc.dump() + "\n"));
  };

  const std::string my_nonce(64, 'a');
  write_json_line({{"type", "hello"}, {"node_id", ids.sender}, {"nonce", my_nonce}});
  auto hello = read_json_line();
  auto signed_text = "peersend-hello-v1:" + hello["nonce"].get<std::string>() + ":" + ids.sender + ":" + ids.receiver;
  write_json_line({{"type", "proof"}, {"signature", hex_from_bytes(sign_with_seed(sender_seed, signed_text))}});
  auto proof = read_json_line();
  bool ok = expect(ctx, proof.value("type", "") == "proof", "listener answered with its proof");

  auto accepted = inbound.get();
  const unsigned char header[4] = {0xff, 0xff, 0xff, 0xf0};
  asio::write(socket, asio::buffer(header, sizeof(header)));
  ok &= expect_throws<ProtocolError>(ctx, [&]() { receive_message(*accepted); }, "oversized frame");
  ok &= expect(ctx, !accepted->is_ready(), "link dropped after the bad frame");
  return ok;
}

bool test_session_over_tcp(TestContext& ctx) {
  TempWorkspace ws("peersend-tcp-session");
  write_file(ws.root() / "src" / "album" / "one.jpg", random_bytes(200 * 1024, 32));
  write_file(ws.root() / "src" / "album" / "two.txt", text_bytes(50 * 1024, 33));
  write_file(ws.root() / "src" / "readme.md", "# hi\n");
  auto dest = ws.dir("dest");
  auto items = prepare_send_items({(ws.root() / "src" / "album").string(),
                                   (ws.root() / "src" / "readme.md").string()}, 32 * 1024);

  auto ids = peer_identities(kSecret);
  auto receiver_log = attached_logger(ctx, "receiver");
  auto sender_log = attached_logger(ctx, "sender");
  TcpNode receiver(derive_seed(kSecret, Role::Receiver), listening_options(), receiver_log);

  std::exception_ptr receiver_error;
  std::thread receiving([&]() {
    try {
      auto connection = receiver.connect(ids.sender, std::chrono::milliseconds(5000));
      ReceiverSession session(connection, dest, receiver_log);
      session.run();
    } catch(const std::exception&) {
      receiver_error = std::current_exception();
    }
  });

  bool ok = true;
  try {
    TcpTransport transport(dialing_options(receiver.listen_port()), sender_log);
    PeerConnector connector(transport, sender_log);
    ConnectOptions options;
    options.timeout_per_attempt = std::chrono::milliseconds(2000);
    options.max_attempts = 3;
    options.retry_interval = std::chrono::milliseconds(50);
    auto link = connector.connect(derive_seed(kSecret, Role::Sender), ids.receiver, options);
    SenderSession session(link.connection(), sender_log);
    session.run(items);
  } catch(const std::exception& e) {
    ok = expect(ctx, false, std::string("sender failed: ") + e.what());
  }
  receiving.join();
  if(receiver_error) {
    try {
      std::rethrow_exception(receiver_error);
    } catch(const std::exception& e) {
      ok = expect(ctx, false, std::string("receiver failed: ") + e.what());
    }
  }
  ok &= expect(ctx, read_file(dest / "album" / "one.jpg") == read_file(ws.root() / "src" / "album" / "one.jpg"), "binary file");
  ok &= expect(ctx, read_file(dest / "album" / "two.txt") == read_file(ws.root() / "src" / "album" / "two.txt"), "text file");
  ok &= expect(ctx, read_file(dest / "readme.md") == "# hi\n", "single file");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"loopback_messages", test_loopback_messages},
    {"wrong_identity_rejected", test_wrong_identity_rejected},
    {"connect_timeout", test_connect_timeout},
    {"oversized_frame", test_oversized_frame},
    {"session_over_tcp", test_session_over_tcp},
  };
  return peersend::test::run_test_cases("tcp", tests, argc, argv);
}
