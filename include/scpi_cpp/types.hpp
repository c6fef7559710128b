#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace scpi {

using Bytes = std::vector<uint8_t>;
using Duration = std::chrono::milliseconds;

constexpr Duration DEFAULT_TIMEOUT = std::chrono::seconds(5);
// Longest accepted timeout. Deadlines are computed on steady_clock, whose
// nanosecond count overflows well before Duration's does.
constexpr Duration MAX_TIMEOUT = std::chrono::hours(24 * 365);

// One entry of the instrument error queue, e.g. 113,"Undefined header".
struct ErrorEntry {
    int64_t code = 0;
    std::string message;
};

// Fields of an IEEE 488.2 *IDN? reply.
struct Identity {
    std::string manufacturer;
    std::string model;
    std::string serial;
    std::string firmware;
};

inline bool operator==(const ErrorEntry& lhs, const ErrorEntry& rhs) {
    return lhs.code == rhs.code && lhs.message == rhs.message;
}

inline bool operator!=(const ErrorEntry& lhs, const ErrorEntry& rhs) { return !(lhs == rhs); }

std::ostream& operator<<(std::ostream& os, const ErrorEntry& entry);
std::ostream& operator<<(std::ostream& os, const Identity& identity);

}  // namespace scpi
