/**
 * @file tftp_transfer.h
 * @brief Download and upload state machines
 *
 * A transfer owns the socket for its whole data phase and performs exactly
 * one send-then-receive step at a time. Waiting for the next datagram is the
 * only point where it blocks; without a receive deadline it waits forever.
 * No packet is ever retransmitted.
 */

#ifndef TFTPCLIENT_TFTP_TRANSFER_H_
#define TFTPCLIENT_TFTP_TRANSFER_H_

#include "tftpclient/tftp_common.h"
#include "tftpclient/tftp_options.h"
#include "tftpclient/tftp_packet.h"
#include "tftpclient/tftp_socket.h"
#include "tftpclient/tftp_stream.h"
#include <functional>
#include <string>
#include <vector>

namespace tftpclient {

enum class TransferState {
    kAwaitingData,   // download in progress
    kSendingData,    // upload in progress
    kComplete,
    kAborted
};

enum class FailureKind {
    kNone,
    kProtocol,   // peer sent ERROR, or answered the request with the wrong kind
    kLocalIo,    // sink/source failure
    kNetwork,    // socket failure
    kTimeout     // receive deadline expired
};

/**
 * @brief Outcome of one transfer
 */
struct TransferResult {
    TransferState state = TransferState::kAborted;
    FailureKind failure = FailureKind::kNone;
    uint16_t error_code = 0;   // peer error code for kProtocol
    std::string message;
    uint64_t bytes_transferred = 0;
    uint32_t blocks = 0;       // DATA blocks consumed or acknowledged

    bool Succeeded() const { return state == TransferState::kComplete; }
};

/**
 * @brief Progress notification: bytes so far, negotiated tsize (0 if unknown)
 */
using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

/**
 * @brief Parameters of one transfer, fixed once the first reply is classified
 */
struct TransferContext {
    net::SocketAddress peer;          // server address, port becomes the TID
    bool tid_established = false;     // peer port is the server's transfer ID
    uint16_t blksize = kDefaultBlockSize;
    uint64_t tsize = kDefaultTransferSize;
    int receive_timeout_ms = kBlockForever;
    ProgressCallback progress;

    void Apply(const NegotiatedOptions& negotiated) {
        blksize = negotiated.blksize;
        tsize = negotiated.tsize;
    }
};

/**
 * @class Transfer
 * @brief Common receive loop of the two state machines
 */
class TFTPCLIENT_EXPORT Transfer {
public:
    Transfer(net::UdpSocket& socket, TransferContext& context, TransferState initial_state);
    virtual ~Transfer() = default;

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    /**
     * @brief Drive the transfer to a terminal state
     * @return Final result
     */
    TransferResult Run();

    /**
     * @brief Perform the initial send, if the state machine has one
     */
    virtual TransferState Start() = 0;

    /**
     * @brief Feed one received packet
     * @param packet Decoded packet
     * @param from Source address of the datagram
     * @return State after handling the packet
     */
    virtual TransferState OnPacket(const Packet& packet, const net::SocketAddress& from) = 0;

    TransferState GetState() const { return result_.state; }
    const TransferResult& GetResult() const { return result_; }
    bool IsFinished() const;

protected:
    bool Send(const Packet& packet, const net::SocketAddress& to);
    TransferState Abort(FailureKind failure, const std::string& message, uint16_t error_code = 0);
    TransferState Finish();

    // Tell the peer why we stop, best effort
    void SendErrorToPeer(ErrorCode code, const std::string& message);

    void ReportProgress();

    net::UdpSocket& socket_;
    TransferContext& context_;
    TransferResult result_;

private:
    size_t ReceiveBufferSize() const;
};

/**
 * @class ReadTransfer
 * @brief Download state machine: kAwaitingData -> kComplete | kAborted
 *
 * Every DATA packet is acknowledged with the block number it carries. Its
 * payload is written only when that block is the expected one, any other
 * block is acknowledged and dropped without ending the transfer. A payload
 * shorter than blksize completes the transfer once acknowledged.
 */
class TFTPCLIENT_EXPORT ReadTransfer : public Transfer {
public:
    ReadTransfer(net::UdpSocket& socket, TransferContext& context, ByteSink& sink);

    TransferState Start() override;
    TransferState OnPacket(const Packet& packet, const net::SocketAddress& from) override;

    uint16_t GetExpectedBlock() const { return expected_block_; }

private:
    TransferState OnData(const DataPacket& data, const net::SocketAddress& from);

    ByteSink& sink_;
    uint16_t expected_block_;
};

/**
 * @class WriteTransfer
 * @brief Upload state machine: kSendingData -> kComplete | kAborted
 *
 * Sends blksize chunks and waits for the matching ACK after each one. When
 * the source length is a multiple of blksize, an empty DATA packet follows
 * the last full chunk so the peer sees a short packet.
 */
class TFTPCLIENT_EXPORT WriteTransfer : public Transfer {
public:
    WriteTransfer(net::UdpSocket& socket, TransferContext& context, ByteSource& source);

    TransferState Start() override;
    TransferState OnPacket(const Packet& packet, const net::SocketAddress& from) override;

    uint16_t GetCurrentBlock() const { return data_block_; }

private:
    TransferState SendNextBlock();

    ByteSource& source_;
    uint16_t data_block_;
    size_t last_chunk_size_;
    std::vector<uint8_t> chunk_;
};

TFTPCLIENT_EXPORT const char* ToString(TransferState state);
TFTPCLIENT_EXPORT const char* ToString(FailureKind failure);

inline std::ostream& operator<<(std::ostream& os, TransferState state) {
    return os << ToString(state);
}

inline std::ostream& operator<<(std::ostream& os, FailureKind failure) {
    return os << ToString(failure);
}

} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_TRANSFER_H_
