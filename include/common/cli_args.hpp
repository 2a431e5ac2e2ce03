#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace merkle_stream {

/**
 * Parse a decimal command-line count. Only plain digits are accepted, so a
 * leading sign or whitespace is rejected instead of wrapping around.
 *
 * @throws std::invalid_argument if the text is not a number or exceeds uint64_t
 */
inline uint64_t parse_u64(const std::string& text, const std::string& what) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(what + " must be a non-negative integer, got '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + " " + text + " is out of range");
    }
}

} // namespace merkle_stream
