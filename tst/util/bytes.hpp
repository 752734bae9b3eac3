#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace testing {

namespace util {

/// Builds a byte string from the given octets.
inline
std::string
bytes(std::initializer_list<int> octets) {
    std::string result;
    for (auto it = octets.begin(); it != octets.end(); ++it) {
        result.push_back(static_cast<char>(static_cast<std::uint8_t>(*it)));
    }

    return result;
}

inline
std::string
hex(const char* data, std::size_t size) {
    static const char digits[] = "0123456789abcdef";

    std::string result;
    for (std::size_t i = 0; i < size; ++i) {
        const std::uint8_t octet = static_cast<std::uint8_t>(data[i]);
        result.push_back(digits[octet >> 4]);
        result.push_back(digits[octet & 0x0f]);
    }

    return result;
}

inline
std::string
hex(const std::string& data) {
    return hex(data.data(), data.size());
}

inline
std::string
hex(const std::vector<char>& data) {
    return hex(data.data(), data.size());
}

/// Splits the data into consecutive chunks, each of them except the last one of the given size.
inline
std::vector<std::string>
split(const std::string& data, std::size_t size) {
    std::vector<std::string> result;
    for (std::size_t offset = 0; offset < data.size(); offset += size) {
        result.push_back(data.substr(offset, size));
    }

    return result;
}

} // namespace util

} // namespace testing
