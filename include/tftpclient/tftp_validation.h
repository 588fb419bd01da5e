/**
 * @file tftp_validation.h
 * @brief Input validation utilities for TFTP client API parameters
 */

#ifndef TFTPCLIENT_TFTP_VALIDATION_H_
#define TFTPCLIENT_TFTP_VALIDATION_H_

#include "tftpclient/tftp_common.h"
#include <string>
#include <cstdint>

namespace tftpclient {
namespace validation {

// Validation constants
constexpr int kMinTimeoutMs = 0;                // 0 means block indefinitely
constexpr int kMaxTimeoutMs = 3600 * 1000;      // 1 hour
constexpr size_t kMaxHostLength = 15;           // dotted IPv4 literal

/**
 * @brief Validates a requested block size (RFC 2348 range)
 * @param block_size Block size in bytes
 * @return true if within [kMinBlockSize, kMaxBlockSize]
 */
TFTPCLIENT_EXPORT bool ValidateBlockSize(long long block_size);

/**
 * @brief Validates a transfer size value (RFC 2349, must not be negative)
 */
TFTPCLIENT_EXPORT bool ValidateTransferSize(long long transfer_size);

/**
 * @brief Validates the server port
 * @param port Port number to validate
 * @return true if valid, false otherwise
 */
TFTPCLIENT_EXPORT bool ValidatePort(uint16_t port);

/**
 * @brief Validates receive deadline
 * @param timeout_ms Timeout in milliseconds, 0 blocks indefinitely
 * @return true if valid, false otherwise
 */
TFTPCLIENT_EXPORT bool ValidateTimeout(int timeout_ms);

/**
 * @brief Validates the server host
 *
 * Name resolution is the caller's job, only dotted IPv4 literals are accepted.
 *
 * @param host IPv4 address to validate
 * @return true if valid, false otherwise
 */
TFTPCLIENT_EXPORT bool ValidateHost(const std::string& host);

/**
 * @brief Validates a remote filename for a RRQ/WRQ
 * @param filename Filename to validate (7-bit ASCII, no NUL, bounded length)
 * @return true if valid, false otherwise
 */
TFTPCLIENT_EXPORT bool ValidateFilename(const std::string& filename);

} // namespace validation
} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_VALIDATION_H_
