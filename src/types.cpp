#include "scpi_cpp/types.hpp"

#include <iostream>

namespace scpi {

std::ostream& operator<<(std::ostream& os, const ErrorEntry& entry) {
    return os << entry.code << ",\"" << entry.message << "\"";
}

std::ostream& operator<<(std::ostream& os, const Identity& identity) {
    return os << identity.manufacturer << " " << identity.model << " (serial " << identity.serial << ", firmware "
              << identity.firmware << ")";
}

}  // namespace scpi
