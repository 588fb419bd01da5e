#include "tftpclient/tftp_util.h"
#include <cctype>
#include <cstdio>
#include <limits>

namespace tftpclient {
namespace util {

std::string HexDump(const uint8_t* data, size_t size, size_t max_bytes) {
    std::string hex_dump;
    if (data == nullptr) {
        return hex_dump;
    }

    size_t count = size < max_bytes ? size : max_bytes;
    hex_dump.reserve(count * 3 + 3);
    for (size_t i = 0; i < count; ++i) {
        char buf[4];
        std::snprintf(buf, sizeof(buf), "%02x", data[i]);
        if (i > 0) {
            hex_dump += ' ';
        }
        hex_dump += buf;
    }
    if (size > count) {
        hex_dump += " ...";
    }
    return hex_dump;
}

bool IsAscii(const std::string& str) {
    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc == 0 || uc > 0x7F) {
            return false;
        }
    }
    return true;
}

bool ParseDecimal(const std::string& str, uint64_t& value) {
    if (str.empty()) {
        return false;
    }

    uint64_t result = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (result > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return false;  // overflow
        }
        result = result * 10 + digit;
    }

    value = result;
    return true;
}

bool EqualsIgnoreCase(const std::string& lhs, const std::string& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace util
} // namespace tftpclient
