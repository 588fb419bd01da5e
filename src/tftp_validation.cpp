#include "tftpclient/tftp_validation.h"
#include "tftpclient/tftp_logger.h"
#include "tftpclient/tftp_util.h"
#include <regex>
#include <sstream>

namespace tftpclient {
namespace validation {

bool ValidateBlockSize(long long block_size) {
    if (block_size < kMinBlockSize) {
        TFTPCLIENT_ERROR("Block size too small: %lld < %u", block_size, kMinBlockSize);
        return false;
    }

    if (block_size > kMaxBlockSize) {
        TFTPCLIENT_ERROR("Block size too large: %lld > %u", block_size, kMaxBlockSize);
        return false;
    }

    return true;
}

bool ValidateTransferSize(long long transfer_size) {
    if (transfer_size < 0) {
        TFTPCLIENT_ERROR("Transfer size cannot be negative: %lld", transfer_size);
        return false;
    }
    return true;
}

bool ValidatePort(uint16_t port) {
    if (port == 0) {
        TFTPCLIENT_ERROR("Port number cannot be 0");
        return false;
    }
    return true;
}

bool ValidateTimeout(int timeout_ms) {
    if (timeout_ms < kMinTimeoutMs) {
        TFTPCLIENT_ERROR("Timeout cannot be negative: %d ms", timeout_ms);
        return false;
    }

    if (timeout_ms > kMaxTimeoutMs) {
        TFTPCLIENT_ERROR("Timeout too large: %d > %d ms", timeout_ms, kMaxTimeoutMs);
        return false;
    }

    return true;
}

bool ValidateHost(const std::string& host) {
    if (host.empty()) {
        TFTPCLIENT_ERROR("Host cannot be empty");
        return false;
    }

    if (host.length() > kMaxHostLength) {
        TFTPCLIENT_ERROR("Host too long for an IPv4 address: %zu > %zu", host.length(), kMaxHostLength);
        return false;
    }

    try {
        std::regex ipv4_pattern(R"(^(\d{1,3}\.){3}\d{1,3}$)");
        if (!std::regex_match(host, ipv4_pattern)) {
            TFTPCLIENT_ERROR("Host is not a dotted IPv4 address: %s", host.c_str());
            return false;
        }

        std::istringstream iss(host);
        std::string octet;
        while (std::getline(iss, octet, '.')) {
            int val = std::stoi(octet);
            if (val < 0 || val > 255) {
                TFTPCLIENT_ERROR("Invalid IPv4 address: %s", host.c_str());
                return false;
            }
        }
        return true;

    } catch (const std::exception& e) {
        TFTPCLIENT_ERROR("Error validating host '%s': %s", host.c_str(), e.what());
        return false;
    }
}

bool ValidateFilename(const std::string& filename) {
    if (filename.empty()) {
        TFTPCLIENT_ERROR("Filename cannot be empty");
        return false;
    }

    if (filename.length() > kMaxFilenameLength) {
        TFTPCLIENT_ERROR("Filename too long: %zu > %zu", filename.length(), kMaxFilenameLength);
        return false;
    }

    // NUL would terminate the field early on the wire
    if (!util::IsAscii(filename)) {
        TFTPCLIENT_ERROR("Filename must be 7-bit ASCII without NUL bytes");
        return false;
    }

    return true;
}

} // namespace validation
} // namespace tftpclient
