/**
 * @file tftp_common.h
 * @brief Common definitions for the TFTP client protocol engine
 */

#ifndef TFTPCLIENT_TFTP_COMMON_H_
#define TFTPCLIENT_TFTP_COMMON_H_

#include <string>
#include <stdexcept>
#include <ostream>
#include <cstdint>
#include <cstddef>

// DLL export/import definitions (for Windows)
#if defined(_MSC_VER) && defined(TFTPCLIENT_SHARED_LIBRARY)
    #ifdef TFTPCLIENT_BUILDING_LIBRARY
        #define TFTPCLIENT_EXPORT __declspec(dllexport)
    #else
        #define TFTPCLIENT_EXPORT __declspec(dllimport)
    #endif
#else
    #define TFTPCLIENT_EXPORT
#endif

namespace tftpclient {

// TFTP protocol constants
constexpr uint16_t kDefaultTftpPort = 69;
constexpr uint16_t kDefaultBlockSize = 512;     // RFC 1350
constexpr uint16_t kMinBlockSize = 8;           // RFC 2348
constexpr uint16_t kMaxBlockSize = 65464;       // RFC 2348
constexpr uint64_t kDefaultTransferSize = 0;    // RFC 2349, unknown size
constexpr size_t kHeaderSize = 4;               // opcode + block / error code
constexpr size_t kMaxPacketSize = 516;          // 512 + 4 (header)
constexpr int kBlockForever = 0;                // receive deadline meaning "no timeout"

constexpr const char* kOctetMode = "octet";
constexpr const char* kBlockSizeOption = "blksize";
constexpr const char* kTransferSizeOption = "tsize";

// Limits applied when building requests
constexpr size_t kMaxFilenameLength = 255;

// Operation codes
enum class OpCode : uint16_t {
    kReadRequest = 1,
    kWriteRequest = 2,
    kData = 3,
    kAcknowledge = 4,
    kError = 5,
    kOACK = 6
};

// Error codes (RFC 1350 section 5, RFC 2347 adds 8)
enum class ErrorCode : uint16_t {
    kNotDefined = 0,
    kFileNotFound = 1,
    kAccessViolation = 2,
    kDiskFull = 3,
    kIllegalOperation = 4,
    kUnknownTransferId = 5,
    kFileExists = 6,
    kNoSuchUser = 7,
    kOptionNegotiation = 8
};

// Custom exception class, thrown for caller precondition violations
class TFTPCLIENT_EXPORT TftpException : public std::runtime_error {
public:
    explicit TftpException(const std::string& message) : std::runtime_error(message) {}
};

// Names used in log messages and test output
TFTPCLIENT_EXPORT const char* ToString(OpCode op_code);
TFTPCLIENT_EXPORT const char* ToString(ErrorCode error_code);

// Stream output operators for Google Test
inline std::ostream& operator<<(std::ostream& os, OpCode op_code) {
    return os << ToString(op_code) << "(" << static_cast<int>(op_code) << ")";
}

inline std::ostream& operator<<(std::ostream& os, ErrorCode error_code) {
    return os << ToString(error_code) << "(" << static_cast<int>(error_code) << ")";
}

} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_COMMON_H_
