#pragma once

#include <cstdint>

#include "manifest.hpp"

class Connection;

inline constexpr char kAckAccept = 0x01;
inline constexpr char kAckReject = 0x00;

// Sends the manifest as one message and waits for the receiver's verdict.
// Throws RemoteRejectedError on a reject or when the link drops first.
void send_manifest(Connection& connection, const Manifest& manifest);

// Receives and decodes the manifest. Throws ProtocolError on a version
// mismatch or a malformed manifest. Sends no verdict.
Manifest receive_manifest(Connection& connection, uint32_t supported_version = kProtocolVersion);

void send_ack(Connection& connection, bool accept);

// Sender side of the final acknowledgement, after the last entry.
void await_completion(Connection& connection);
