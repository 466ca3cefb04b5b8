#include "utils.hpp"
#include <openssl/sha.h>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
    std::ostringstream oss;
    for(std::size_t i = 0; i < size; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    return hex_from_bytes(b.data(), b.size());
}

std::optional<std::vector<unsigned char>> bytes_from_hex(const std::string& hex){
    if(hex.size() % 2 != 0) return std::nullopt;
    auto nibble = [](char c) -> int {
        if(c >= '0' && c <= '9') return c - '0';
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        if(c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for(std::size_t i = 0; i < hex.size(); i += 2){
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if(hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
}

bool is_lower_hex(const std::string& value, std::size_t expected_length){
    if(value.size() != expected_length) return false;
    for(char c : value){
        if(!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

uint64_t parse_size(const std::string& text){
    std::string clean = text;
    clean.erase(0, clean.find_first_not_of(" \t\r\n"));
    auto last = clean.find_last_not_of(" \t\r\n");
    if(last != std::string::npos) clean.erase(last + 1);
    if(clean.empty()) throw std::invalid_argument("Invalid size format: '" + text + "'");

    double multiplier = 1.0;
    char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(clean.back())));
    if(suffix == 'k' || suffix == 'm' || suffix == 'g'){
        multiplier = suffix == 'k' ? 1024.0 : suffix == 'm' ? 1024.0 * 1024.0 : 1024.0 * 1024.0 * 1024.0;
        clean.pop_back();
    }

    std::size_t consumed = 0;
    double number = 0.0;
    try {
        number = std::stod(clean, &consumed);
    } catch(const std::exception&) {
        throw std::invalid_argument("Invalid size format: '" + text + "'");
    }
    if(consumed != clean.size() || number < 0 || !std::isfinite(number)){
        throw std::invalid_argument("Invalid size format: '" + text + "'");
    }
    double bytes = number * multiplier;
    // 2^64: the first value uint64_t cannot hold.
    if(bytes >= 18446744073709551616.0){
        throw std::invalid_argument("Size out of range: '" + text + "'");
    }
    return static_cast<uint64_t>(bytes);
}

std::string format_size(uint64_t bytes){
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])){
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if(unit == 0) oss << bytes << " " << units[unit];
    else oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return oss.str();
}
