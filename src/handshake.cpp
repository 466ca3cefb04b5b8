#include "handshake.hpp"

#include "errors.hpp"
#include "transport.hpp"

namespace {

char receive_ack(Connection& connection, const char* stage) {
  Bytes reply;
  try {
    reply = receive_message(connection);
  } catch(const ConnectionError& e) {
    throw RemoteRejectedError(std::string("Receiver closed the connection ") + stage + ": " + e.what());
  }
  if(reply.size() != 1) {
    throw ProtocolError(std::string("Expected a one-byte acknowledgement ") + stage + ", got " +
                        std::to_string(reply.size()) + " bytes");
  }
  return reply[0];
}

} // namespace

void send_manifest(Connection& connection, const Manifest& manifest) {
  auto text = encode_manifest(manifest);
  send_message(connection, Bytes(text.begin(), text.end()));

  auto verdict = receive_ack(connection, "before accepting the manifest");
  if(verdict == kAckReject) {
    throw RemoteRejectedError("Receiver rejected the manifest");
  }
  if(verdict != kAckAccept) {
    throw ProtocolError("Unknown manifest acknowledgement byte " +
                        std::to_string(static_cast<unsigned char>(verdict)));
  }
}

Manifest receive_manifest(Connection& connection, uint32_t supported_version) {
  auto message = receive_message(connection);
  if(message.empty()) {
    throw ProtocolError("Expected a manifest, got an empty message");
  }
  return decode_manifest(std::string(message.begin(), message.end()), supported_version);
}

void send_ack(Connection& connection, bool accept) {
  send_message(connection, Bytes{accept ? kAckAccept : kAckReject});
}

void await_completion(Connection& connection) {
  auto verdict = receive_ack(connection, "before confirming the transfer");
  if(verdict != kAckAccept) {
    throw RemoteRejectedError("Receiver did not confirm the transfer");
  }
}
