#include "scpi_cpp/response.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <vector>

#include "scpi_cpp/errors.hpp"

namespace scpi {

namespace {

constexpr const char* WHITESPACE = " \t\r\n";

std::string quote(const std::string& text) { return "'" + text + "'"; }

// from_chars takes '-' but not '+'. A '+' may only be followed by a digit or
// a decimal point, so "+-5" and "++5" are rejected.
const char* skip_plus(const char* first, const char* last) {
    if (first == last || *first != '+') return first;
    ++first;
    if (first == last || !(std::isdigit(static_cast<unsigned char>(*first)) || *first == '.')) return nullptr;
    return first;
}

}  // namespace

std::string trim(const std::string& text) {
    std::size_t first = text.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) return "";

    std::size_t last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

double parse_double(const std::string& response) {
    std::string text = trim(response);
    if (text.empty()) throw ProtocolError("Expected float, got empty response", response);

    // chars_format::general takes no hex and ignores the C locale.
    const char* last = text.data() + text.size();
    const char* first = skip_plus(text.data(), last);

    double value = 0.0;
    if (first == nullptr) throw ProtocolError("Expected float, got " + quote(response), response);
    auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);
    if (ec != std::errc() || ptr != last) throw ProtocolError("Expected float, got " + quote(response), response);

    return value;
}

int64_t parse_int(const std::string& response) {
    std::string text = trim(response);

    const char* last = text.data() + text.size();
    const char* first = skip_plus(text.data(), last);
    if (text.empty() || first == nullptr) throw ProtocolError("Expected int, got " + quote(response), response);

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        throw ProtocolError("Expected int, got " + quote(response), response);
    }

    return value;
}

bool parse_bool(const std::string& response) {
    std::string text = trim(response);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (text == "1" || text == "ON") return true;
    if (text == "0" || text == "OFF") return false;

    throw ProtocolError("Expected boolean, got " + quote(response), response);
}

ErrorEntry parse_error_entry(const std::string& response) {
    std::string text = trim(response);

    std::size_t comma = text.find(',');
    if (comma == std::string::npos) throw ProtocolError("Malformed error response " + quote(response), response);

    ErrorEntry entry;
    try {
        entry.code = parse_int(text.substr(0, comma));
    } catch (const ProtocolError&) {
        throw ProtocolError("Malformed error code in " + quote(response), response);
    }

    std::string message = trim(text.substr(comma + 1));
    if (message.size() >= 2 && message.front() == '"' && message.back() == '"') {
        message = message.substr(1, message.size() - 2);
    }
    entry.message = message;

    return entry;
}

Identity parse_identity(const std::string& response) {
    std::string text = trim(response);

    std::vector<std::string> fields;
    std::size_t start = 0;
    while (fields.size() < 3) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string::npos) break;

        fields.push_back(trim(text.substr(start, comma - start)));
        start = comma + 1;
    }
    fields.push_back(trim(text.substr(start)));

    if (fields.size() != 4) throw ProtocolError("Malformed identification " + quote(response), response);

    return Identity{fields[0], fields[1], fields[2], fields[3]};
}

}  // namespace scpi
