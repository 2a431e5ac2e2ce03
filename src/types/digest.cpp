#include "types/digest.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace merkle_stream {
namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(const Bytes& bytes) {
    std::ostringstream oss;
    for (uint8_t byte_val : bytes) {
        oss << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(byte_val);
    }
    return oss.str();
}

Bytes from_hex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(hex.length()));
    }

    Bytes out;
    out.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character at offset " + std::to_string(i));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace merkle_stream
