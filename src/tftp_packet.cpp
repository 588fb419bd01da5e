#include "tftpclient/tftp_packet.h"
#include "tftpclient/tftp_logger.h"
#include "tftpclient/tftp_util.h"
#include <cstring>
#include <arpa/inet.h>

namespace tftpclient {

namespace {
    // Append a 16-bit value in network byte order
    void put_u16(std::vector<uint8_t>& dest, uint16_t value) {
        uint16_t value_network = htons(value);
        uint8_t bytes[sizeof(uint16_t)];
        std::memcpy(bytes, &value_network, sizeof(uint16_t));
        dest.insert(dest.end(), bytes, bytes + sizeof(uint16_t));
    }

    // Read a 16-bit value in network byte order, caller checks bounds
    uint16_t get_u16(const uint8_t* data) {
        uint16_t value_network;
        std::memcpy(&value_network, data, sizeof(uint16_t));
        return ntohs(value_network);
    }

    // Append string with null terminator
    void put_string(std::vector<uint8_t>& dest, const std::string& src) {
        dest.insert(dest.end(), src.begin(), src.end());
        dest.push_back(0);
    }

    void put_options(std::vector<uint8_t>& dest, const OptionList& options) {
        for (const auto& option : options) {
            put_string(dest, option.first);   // option name
            put_string(dest, option.second);  // option value
        }
    }

    // Read bytes up to the next NUL (or the end of the datagram) and step past it.
    // Returns false if a terminator is required and the datagram ends first.
    bool read_string(const uint8_t* data, size_t size, size_t& offset,
                     std::string& out, bool require_terminator) {
        size_t start = offset;
        while (offset < size && data[offset] != 0) {
            ++offset;
        }
        bool terminated = offset < size;
        if (require_terminator && !terminated) {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(data + start), offset - start);
        if (terminated) {
            ++offset;  // skip null terminator
        }
        return true;
    }

    // Option suffix shared by RRQ/WRQ and OACK: (name 0 value 0)*.
    // A pair with an empty value carries nothing and is skipped, an empty
    // name ends the list.
    OptionList read_options(const uint8_t* data, size_t size, size_t offset) {
        OptionList options;
        while (offset < size) {
            std::string name;
            std::string value;
            read_string(data, size, offset, name, false);
            if (name.empty()) {
                break;
            }
            read_string(data, size, offset, value, false);
            if (value.empty()) {
                TFTPCLIENT_DEBUG("Option '%s' has no value, skipped", name.c_str());
                continue;
            }
            options.emplace_back(std::move(name), std::move(value));
        }
        return options;
    }

    bool fail(DecodeError* error, DecodeError reason) {
        if (error != nullptr) {
            *error = reason;
        }
        return false;
    }

    // Encoders, one per packet kind
    struct PacketEncoder {
        std::vector<uint8_t>& out;

        void operator()(const ReadRequestPacket& packet) const {
            put_u16(out, static_cast<uint16_t>(OpCode::kReadRequest));
            put_string(out, packet.filename);
            put_string(out, packet.mode);
            put_options(out, packet.options);
        }

        void operator()(const WriteRequestPacket& packet) const {
            put_u16(out, static_cast<uint16_t>(OpCode::kWriteRequest));
            put_string(out, packet.filename);
            put_string(out, packet.mode);
            put_options(out, packet.options);
        }

        void operator()(const DataPacket& packet) const {
            put_u16(out, static_cast<uint16_t>(OpCode::kData));
            put_u16(out, packet.block);
            out.insert(out.end(), packet.payload.begin(), packet.payload.end());
        }

        void operator()(const AckPacket& packet) const {
            put_u16(out, static_cast<uint16_t>(OpCode::kAcknowledge));
            put_u16(out, packet.block);
        }

        void operator()(const ErrorPacket& packet) const {
            put_u16(out, static_cast<uint16_t>(OpCode::kError));
            put_u16(out, packet.error_code);
            put_string(out, packet.message);
        }

        void operator()(const OackPacket& packet) const {
            put_u16(out, static_cast<uint16_t>(OpCode::kOACK));
            put_options(out, packet.options);
        }
    };

    // Decoders, one per packet kind. `data` starts at the opcode.
    template <typename Request>
    bool decode_request(const uint8_t* data, size_t size, Packet& packet, DecodeError* error) {
        Request request;
        size_t offset = 2;
        if (!read_string(data, size, offset, request.filename, true)) {
            TFTPCLIENT_DEBUG("Request filename is not terminated");
            return fail(error, DecodeError::kMalformed);
        }
        if (!read_string(data, size, offset, request.mode, true)) {
            TFTPCLIENT_DEBUG("Request mode is not terminated");
            return fail(error, DecodeError::kMalformed);
        }
        request.options = read_options(data, size, offset);
        packet = std::move(request);
        return true;
    }

    bool decode_data(const uint8_t* data, size_t size, Packet& packet, DecodeError* error) {
        if (size < kHeaderSize) {
            TFTPCLIENT_DEBUG("DATA packet too small: size=%zu", size);
            return fail(error, DecodeError::kTruncated);
        }
        DataPacket data_packet;
        data_packet.block = get_u16(data + 2);
        data_packet.payload.assign(data + kHeaderSize, data + size);
        packet = std::move(data_packet);
        return true;
    }

    bool decode_ack(const uint8_t* data, size_t size, Packet& packet, DecodeError* error) {
        if (size < kHeaderSize) {
            TFTPCLIENT_DEBUG("ACK packet too small: size=%zu", size);
            return fail(error, DecodeError::kTruncated);
        }
        if (size != kHeaderSize) {
            TFTPCLIENT_DEBUG("ACK packet has incorrect size: %zu (expected: 4)", size);
            return fail(error, DecodeError::kMalformed);
        }
        packet = AckPacket{get_u16(data + 2)};
        return true;
    }

    bool decode_error(const uint8_t* data, size_t size, Packet& packet, DecodeError* error) {
        if (size < kHeaderSize) {
            TFTPCLIENT_DEBUG("ERROR packet too small: size=%zu", size);
            return fail(error, DecodeError::kTruncated);
        }
        ErrorPacket error_packet;
        error_packet.error_code = get_u16(data + 2);
        size_t offset = kHeaderSize;
        read_string(data, size, offset, error_packet.message, false);  // NUL is optional
        packet = std::move(error_packet);
        return true;
    }

    bool decode_oack(const uint8_t* data, size_t size, Packet& packet) {
        packet = OackPacket{read_options(data, size, 2)};
        return true;
    }
}

Packet CreateReadRequest(const std::string& filename, const OptionList& options) {
    return ReadRequestPacket{filename, kOctetMode, options};
}

Packet CreateWriteRequest(const std::string& filename, const OptionList& options) {
    return WriteRequestPacket{filename, kOctetMode, options};
}

Packet CreateData(uint16_t block, std::vector<uint8_t> payload) {
    return DataPacket{block, std::move(payload)};
}

Packet CreateAck(uint16_t block) {
    return AckPacket{block};
}

Packet CreateError(ErrorCode code, const std::string& message) {
    return ErrorPacket{static_cast<uint16_t>(code), message};
}

Packet CreateOack(const OptionList& options) {
    return OackPacket{options};
}

OpCode GetOpCode(const Packet& packet) {
    // Variant alternatives are declared in opcode order
    return static_cast<OpCode>(packet.index() + 1);
}

std::vector<uint8_t> Serialize(const Packet& packet) {
    std::vector<uint8_t> result;
    std::visit(PacketEncoder{result}, packet);
    return result;
}

bool Deserialize(const uint8_t* data, size_t size, Packet& packet, DecodeError* error) {
    if (error != nullptr) {
        *error = DecodeError::kNone;
    }

    if (data == nullptr || size < sizeof(uint16_t)) {
        TFTPCLIENT_DEBUG("Packet too small for opcode: size=%zu", size);
        return fail(error, DecodeError::kTruncated);
    }

    TFTPCLIENT_TRACE("Decoding %zu bytes: %s", size, util::HexDump(data, size).c_str());

    uint16_t opcode_value = get_u16(data);
    switch (static_cast<OpCode>(opcode_value)) {
        case OpCode::kReadRequest:
            return decode_request<ReadRequestPacket>(data, size, packet, error);
        case OpCode::kWriteRequest:
            return decode_request<WriteRequestPacket>(data, size, packet, error);
        case OpCode::kData:
            return decode_data(data, size, packet, error);
        case OpCode::kAcknowledge:
            return decode_ack(data, size, packet, error);
        case OpCode::kError:
            return decode_error(data, size, packet, error);
        case OpCode::kOACK:
            return decode_oack(data, size, packet);
        default:
            TFTPCLIENT_DEBUG("Unknown opcode value: %u", opcode_value);
            return fail(error, DecodeError::kUnknownOpcode);
    }
}

bool Deserialize(const std::vector<uint8_t>& data, Packet& packet, DecodeError* error) {
    return Deserialize(data.data(), data.size(), packet, error);
}

const char* ToString(OpCode op_code) {
    switch (op_code) {
        case OpCode::kReadRequest: return "RRQ";
        case OpCode::kWriteRequest: return "WRQ";
        case OpCode::kData: return "DATA";
        case OpCode::kAcknowledge: return "ACK";
        case OpCode::kError: return "ERROR";
        case OpCode::kOACK: return "OACK";
        default: return "Unknown";
    }
}

const char* ToString(ErrorCode error_code) {
    switch (error_code) {
        case ErrorCode::kNotDefined: return "NotDefined";
        case ErrorCode::kFileNotFound: return "FileNotFound";
        case ErrorCode::kAccessViolation: return "AccessViolation";
        case ErrorCode::kDiskFull: return "DiskFull";
        case ErrorCode::kIllegalOperation: return "IllegalOperation";
        case ErrorCode::kUnknownTransferId: return "UnknownTransferId";
        case ErrorCode::kFileExists: return "FileExists";
        case ErrorCode::kNoSuchUser: return "NoSuchUser";
        case ErrorCode::kOptionNegotiation: return "OptionNegotiation";
        default: return "Unknown";
    }
}

const char* ToString(DecodeError error) {
    switch (error) {
        case DecodeError::kNone: return "None";
        case DecodeError::kTruncated: return "Truncated";
        case DecodeError::kUnknownOpcode: return "UnknownOpcode";
        case DecodeError::kMalformed: return "Malformed";
        default: return "Unknown";
    }
}

} // namespace tftpclient
