/**
 * @file tftp_util.h
 * @brief TFTP utility functions
 */

#ifndef TFTPCLIENT_TFTP_UTIL_H_
#define TFTPCLIENT_TFTP_UTIL_H_

#include "tftpclient/tftp_common.h"
#include <string>
#include <vector>
#include <cstdint>

namespace tftpclient {
namespace util {

/**
 * @brief Format bytes as space separated hex for trace logging
 * @param data Bytes to dump
 * @param size Number of bytes
 * @param max_bytes Dump at most this many bytes, "..." marks the cut
 * @return Hex string, e.g. "00 03 00 01"
 */
TFTPCLIENT_EXPORT std::string HexDump(const uint8_t* data, size_t size, size_t max_bytes = 64);

/**
 * @brief Check that every character is 7-bit ASCII and not NUL
 */
TFTPCLIENT_EXPORT bool IsAscii(const std::string& str);

/**
 * @brief Parse an unsigned decimal string (digits only, no sign or spaces)
 * @param str Input string
 * @param value Parsed value (output parameter)
 * @return true if the whole string is a decimal number that fits in 64 bits
 */
TFTPCLIENT_EXPORT bool ParseDecimal(const std::string& str, uint64_t& value);

/**
 * @brief ASCII case-insensitive comparison, used for option names
 */
TFTPCLIENT_EXPORT bool EqualsIgnoreCase(const std::string& lhs, const std::string& rhs);

} // namespace util
} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_UTIL_H_
