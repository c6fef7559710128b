#pragma once
#include <cstdint>
#include <string>

#include "scpi_cpp/types.hpp"

// Conversions from a raw reply line to typed values. Every parser throws
// scpi::ProtocolError holding the untouched reply when it does not match.
namespace scpi {

// Strips leading and trailing spaces, tabs, CR and LF.
std::string trim(const std::string& text);

// Accepts anything strtod accepts in full, e.g. "2.00E+00" or "-1.5".
double parse_double(const std::string& response);

// Decimal integer with optional sign.
int64_t parse_int(const std::string& response);

// "1"/"ON" and "0"/"OFF", case-insensitive.
bool parse_bool(const std::string& response);

// <code>,"<message>" as returned by the error queue query. Quotes around the
// message are optional.
ErrorEntry parse_error_entry(const std::string& response);

// <manufacturer>,<model>,<serial>,<firmware>. Commas past the third belong
// to the firmware field.
Identity parse_identity(const std::string& response);

}  // namespace scpi
