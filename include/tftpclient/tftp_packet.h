/**
 * @file tftp_packet.h
 * @brief TFTP packet definitions and wire codec
 *
 * A packet is a closed variant over the six TFTP packet kinds. Every kind
 * has its own encoder and decoder; Serialize() and Deserialize() dispatch on
 * the variant index and on the opcode respectively.
 *
 * NOTE: TFTP packets use network byte order (big-endian) for all multi-byte fields
 */

#ifndef TFTPCLIENT_TFTP_PACKET_H_
#define TFTPCLIENT_TFTP_PACKET_H_

#include "tftpclient/tftp_common.h"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tftpclient {

// (option name, option value) as carried on the wire, in packet order
using Option = std::pair<std::string, std::string>;
using OptionList = std::vector<Option>;

struct ReadRequestPacket {
    std::string filename;
    std::string mode = kOctetMode;
    OptionList options;
};

struct WriteRequestPacket {
    std::string filename;
    std::string mode = kOctetMode;
    OptionList options;
};

struct DataPacket {
    uint16_t block = 0;
    std::vector<uint8_t> payload;  // shorter than blksize marks the last block
};

struct AckPacket {
    uint16_t block = 0;
};

struct ErrorPacket {
    uint16_t error_code = 0;  // raw value, peers may send codes outside ErrorCode
    std::string message;
};

struct OackPacket {
    OptionList options;
};

using Packet = std::variant<ReadRequestPacket, WriteRequestPacket, DataPacket,
                            AckPacket, ErrorPacket, OackPacket>;

enum class DecodeError {
    kNone,
    kTruncated,       // shorter than the fixed header of its opcode
    kUnknownOpcode,   // opcode outside 1..6
    kMalformed        // missing terminator or trailing bytes where none are allowed
};

inline bool operator==(const ReadRequestPacket& lhs, const ReadRequestPacket& rhs) {
    return lhs.filename == rhs.filename && lhs.mode == rhs.mode && lhs.options == rhs.options;
}

inline bool operator==(const WriteRequestPacket& lhs, const WriteRequestPacket& rhs) {
    return lhs.filename == rhs.filename && lhs.mode == rhs.mode && lhs.options == rhs.options;
}

inline bool operator==(const DataPacket& lhs, const DataPacket& rhs) {
    return lhs.block == rhs.block && lhs.payload == rhs.payload;
}

inline bool operator==(const AckPacket& lhs, const AckPacket& rhs) {
    return lhs.block == rhs.block;
}

inline bool operator==(const ErrorPacket& lhs, const ErrorPacket& rhs) {
    return lhs.error_code == rhs.error_code && lhs.message == rhs.message;
}

inline bool operator==(const OackPacket& lhs, const OackPacket& rhs) {
    return lhs.options == rhs.options;
}

// Packet creation
TFTPCLIENT_EXPORT Packet CreateReadRequest(const std::string& filename, const OptionList& options = {});
TFTPCLIENT_EXPORT Packet CreateWriteRequest(const std::string& filename, const OptionList& options = {});
TFTPCLIENT_EXPORT Packet CreateData(uint16_t block, std::vector<uint8_t> payload);
TFTPCLIENT_EXPORT Packet CreateAck(uint16_t block);
TFTPCLIENT_EXPORT Packet CreateError(ErrorCode code, const std::string& message);
TFTPCLIENT_EXPORT Packet CreateOack(const OptionList& options);

/**
 * @brief Opcode of the kind held by the packet
 */
TFTPCLIENT_EXPORT OpCode GetOpCode(const Packet& packet);

/**
 * @brief Encode a packet to its wire form
 * @param packet Packet to encode
 * @return Datagram bytes
 */
TFTPCLIENT_EXPORT std::vector<uint8_t> Serialize(const Packet& packet);

/**
 * @brief Decode one datagram
 * @param data Datagram bytes
 * @param size Datagram length
 * @param packet Decoded packet (output parameter, untouched on failure)
 * @param error Failure reason (optional output parameter)
 * @return true on success
 */
TFTPCLIENT_EXPORT bool Deserialize(const uint8_t* data, size_t size, Packet& packet,
                                   DecodeError* error = nullptr);

TFTPCLIENT_EXPORT bool Deserialize(const std::vector<uint8_t>& data, Packet& packet,
                                   DecodeError* error = nullptr);

TFTPCLIENT_EXPORT const char* ToString(DecodeError error);

inline std::ostream& operator<<(std::ostream& os, DecodeError error) {
    return os << ToString(error);
}

} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_PACKET_H_
