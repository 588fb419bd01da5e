#include "tftpclient/tftp_transfer.h"
#include "tftpclient/tftp_logger.h"
#include "tftpclient/tftp_util.h"
#include <algorithm>

namespace tftpclient {

Transfer::Transfer(net::UdpSocket& socket, TransferContext& context, TransferState initial_state)
    : socket_(socket), context_(context) {
    result_.state = initial_state;
}

bool Transfer::IsFinished() const {
    return result_.state == TransferState::kComplete || result_.state == TransferState::kAborted;
}

size_t Transfer::ReceiveBufferSize() const {
    // Room for a full DATA packet, and never less than a classic 516-byte
    // datagram so ERROR messages are not cut short with tiny block sizes.
    // One extra byte lets oversized DATA payloads be detected.
    return std::max(kHeaderSize + context_.blksize, kMaxPacketSize) + 1;
}

TransferResult Transfer::Run() {
    Start();

    std::vector<uint8_t> buffer(ReceiveBufferSize());
    while (!IsFinished()) {
        net::SocketAddress from;
        int received = socket_.ReceiveFromTimeout(buffer.data(), buffer.size(), from,
                                                  context_.receive_timeout_ms);
        if (received == net::kSocketTimeout) {
            Abort(FailureKind::kTimeout, "No packet received within " +
                  std::to_string(context_.receive_timeout_ms) + " ms");
            break;
        }
        if (received < 0) {
            Abort(FailureKind::kNetwork, socket_.GetLastError());
            break;
        }

        Packet packet;
        DecodeError error = DecodeError::kNone;
        if (!Deserialize(buffer.data(), static_cast<size_t>(received), packet, &error)) {
            // Not recognized, keep waiting for the next datagram
            TFTPCLIENT_WARN("Ignoring undecodable datagram from %s (%s, %d bytes)",
                            from.ToString().c_str(), ToString(error), received);
            continue;
        }
        OnPacket(packet, from);
    }
    return result_;
}

bool Transfer::Send(const Packet& packet, const net::SocketAddress& to) {
    std::vector<uint8_t> data = Serialize(packet);
    TFTPCLIENT_TRACE("Sending %zu bytes to %s: %s", data.size(), to.ToString().c_str(),
                     util::HexDump(data.data(), data.size()).c_str());

    int sent = socket_.SendTo(data.data(), data.size(), to);
    if (sent != static_cast<int>(data.size())) {
        TFTPCLIENT_ERROR("Packet send failed: sent=%d, expected=%zu", sent, data.size());
        return false;
    }
    return true;
}

TransferState Transfer::Abort(FailureKind failure, const std::string& message, uint16_t error_code) {
    if (IsFinished()) {
        return result_.state;
    }
    result_.state = TransferState::kAborted;
    result_.failure = failure;
    result_.error_code = error_code;
    result_.message = message;
    TFTPCLIENT_ERROR("Transfer aborted (%s): %s", ToString(failure), message.c_str());
    return result_.state;
}

TransferState Transfer::Finish() {
    result_.state = TransferState::kComplete;
    result_.failure = FailureKind::kNone;
    TFTPCLIENT_INFO("Transfer complete: %llu bytes in %u blocks",
                    static_cast<unsigned long long>(result_.bytes_transferred), result_.blocks);
    return result_.state;
}

void Transfer::SendErrorToPeer(ErrorCode code, const std::string& message) {
    if (!Send(CreateError(code, message), context_.peer)) {
        TFTPCLIENT_WARN("Could not notify %s of the failure", context_.peer.ToString().c_str());
    }
}

void Transfer::ReportProgress() {
    if (context_.tsize > 0) {
        TFTPCLIENT_DEBUG("[Progress] %llu/%llu bytes",
                         static_cast<unsigned long long>(result_.bytes_transferred),
                         static_cast<unsigned long long>(context_.tsize));
    }
    if (context_.progress) {
        context_.progress(result_.bytes_transferred, context_.tsize);
    }
}

const char* ToString(TransferState state) {
    switch (state) {
        case TransferState::kAwaitingData: return "AwaitingData";
        case TransferState::kSendingData: return "SendingData";
        case TransferState::kComplete: return "Complete";
        case TransferState::kAborted: return "Aborted";
        default: return "Unknown";
    }
}

const char* ToString(FailureKind failure) {
    switch (failure) {
        case FailureKind::kNone: return "None";
        case FailureKind::kProtocol: return "Protocol";
        case FailureKind::kLocalIo: return "LocalIo";
        case FailureKind::kNetwork: return "Network";
        case FailureKind::kTimeout: return "Timeout";
        default: return "Unknown";
    }
}

} // namespace tftpclient
