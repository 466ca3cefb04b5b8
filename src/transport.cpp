#include "transport.hpp"

#include "errors.hpp"

void send_message(Connection& connection, Bytes message) {
  auto pending = connection.send(std::move(message));
  try {
    pending.get();
  } catch(const std::future_error& e) {
    throw ConnectionError(std::string("Send abandoned: ") + e.what());
  }
}

Bytes receive_message(Connection& connection) {
  auto pending = connection.recv();
  try {
    return pending.get();
  } catch(const std::future_error& e) {
    throw ConnectionError(std::string("Receive abandoned: ") + e.what());
  }
}
