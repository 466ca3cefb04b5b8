#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const unsigned char* data, std::size_t size);
std::string hex_from_bytes(const std::vector<unsigned char>&);
std::optional<std::vector<unsigned char>> bytes_from_hex(const std::string& hex);
bool is_lower_hex(const std::string& value, std::size_t expected_length);

std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// "1k", "1.5m", "3g", "1024" -> bytes (k/m/g are powers of 1024).
// Throws std::invalid_argument on malformed input.
uint64_t parse_size(const std::string& text);
std::string format_size(uint64_t bytes);
