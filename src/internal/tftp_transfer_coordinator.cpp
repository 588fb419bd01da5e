#include "internal/tftp_transfer_coordinator.h"
#include "tftpclient/tftp_logger.h"
#include "tftpclient/tftp_util.h"
#include <algorithm>
#include <sstream>

namespace tftpclient {
namespace internal {

TransferCoordinator::TransferCoordinator(const net::SocketAddress& server, const OptionSet& requested,
                                         int receive_timeout_ms)
    : server_(server),
      requested_(requested),
      used_(false) {
    context_.peer = server_;
    context_.receive_timeout_ms = receive_timeout_ms;
}

TransferCoordinator::~TransferCoordinator() = default;

void TransferCoordinator::SetProgressCallback(ProgressCallback callback) {
    context_.progress = std::move(callback);
}

void TransferCoordinator::BeginTransfer() {
    if (used_) {
        throw TftpException("TransferCoordinator runs a single transfer");
    }
    used_ = true;
    context_.peer = server_;
    context_.tid_established = false;
    context_.Apply(OptionSet::Defaults());
}

TransferResult TransferCoordinator::Download(const std::string& remote_filename, ByteSink& sink) {
    BeginTransfer();

    // The size is unknown before a download, tsize=0 asks the server for it
    sent_options_ = requested_;
    if (sent_options_.GetTransferSize()) {
        sent_options_.SetTransferSize(0);
    }

    TransferResult result;
    if (!OpenSocket(result)) {
        return result;
    }

    TFTPCLIENT_INFO("RRQ '%s' to %s (%zu options)", remote_filename.c_str(),
                    server_.ToString().c_str(), sent_options_.ToOptionList().size());
    if (!SendPacket(CreateReadRequest(remote_filename, sent_options_.ToOptionList()), server_, result)) {
        return result;
    }

    Packet reply;
    net::SocketAddress from;
    if (!ReceiveFirstReply(reply, from, result)) {
        return result;
    }

    ReadTransfer transfer(socket_, context_, sink);

    if (const auto* oack = std::get_if<OackPacket>(&reply)) {
        ApplyOack(*oack, from);
        // Block 0 acknowledges the OACK and starts the data phase
        if (!SendPacket(CreateAck(0), context_.peer, result)) {
            return result;
        }
        return transfer.Run();
    }

    if (std::get_if<DataPacket>(&reply) != nullptr) {
        // Plain RRQ, or the server ignored every option: defaults apply
        TFTPCLIENT_INFO("Server answered with DATA, using default options");
        transfer.OnPacket(reply, from);
        return transfer.Run();
    }

    if (const auto* error = std::get_if<ErrorPacket>(&reply)) {
        Fail(result, FailureKind::kProtocol, error->message, error->error_code);
        return result;
    }

    std::ostringstream message;
    message << "Unexpected " << ToString(GetOpCode(reply)) << " packet in reply to RRQ";
    Fail(result, FailureKind::kProtocol, message.str());
    return result;
}

TransferResult TransferCoordinator::Upload(const std::string& remote_filename, ByteSource& source) {
    BeginTransfer();

    // tsize on a write announces the exact length being sent
    sent_options_ = requested_;
    if (sent_options_.GetTransferSize()) {
        sent_options_.SetTransferSize(static_cast<int64_t>(source.Size()));
    }

    TransferResult result;
    if (!OpenSocket(result)) {
        return result;
    }

    TFTPCLIENT_INFO("WRQ '%s' to %s (%llu bytes, %zu options)", remote_filename.c_str(),
                    server_.ToString().c_str(), static_cast<unsigned long long>(source.Size()),
                    sent_options_.ToOptionList().size());
    if (!SendPacket(CreateWriteRequest(remote_filename, sent_options_.ToOptionList()), server_, result)) {
        return result;
    }

    Packet reply;
    net::SocketAddress from;
    if (!ReceiveFirstReply(reply, from, result)) {
        return result;
    }

    if (const auto* oack = std::get_if<OackPacket>(&reply)) {
        ApplyOack(*oack, from);
    } else if (const auto* ack = std::get_if<AckPacket>(&reply)) {
        if (ack->block != 0) {
            Fail(result, FailureKind::kProtocol,
                 "Expected ACK 0 in reply to WRQ, got ACK " + std::to_string(ack->block));
            return result;
        }
        // No OACK means no option was granted
        TFTPCLIENT_INFO("Server answered with ACK 0, using default options");
        context_.Apply(OptionSet::Defaults());
        context_.peer = from;
        context_.tid_established = true;
    } else if (const auto* error = std::get_if<ErrorPacket>(&reply)) {
        Fail(result, FailureKind::kProtocol, error->message, error->error_code);
        return result;
    } else {
        std::ostringstream message;
        message << "Unexpected " << ToString(GetOpCode(reply)) << " packet in reply to WRQ";
        Fail(result, FailureKind::kProtocol, message.str());
        return result;
    }

    WriteTransfer transfer(socket_, context_, source);
    return transfer.Run();
}

bool TransferCoordinator::OpenSocket(TransferResult& result) {
    if (!socket_.Create()) {
        Fail(result, FailureKind::kNetwork, socket_.GetLastError());
        return false;
    }

    // Ephemeral local port, our side of the transfer ID
    net::SocketAddress local;
    if (!socket_.Bind(local)) {
        Fail(result, FailureKind::kNetwork, socket_.GetLastError());
        socket_.Close();
        return false;
    }
    return true;
}

bool TransferCoordinator::SendPacket(const Packet& packet, const net::SocketAddress& to,
                                     TransferResult& result) {
    std::vector<uint8_t> data = Serialize(packet);
    TFTPCLIENT_TRACE("Sending %zu bytes to %s: %s", data.size(), to.ToString().c_str(),
                     util::HexDump(data.data(), data.size()).c_str());

    int sent = socket_.SendTo(data.data(), data.size(), to);
    if (sent != static_cast<int>(data.size())) {
        Fail(result, FailureKind::kNetwork, "Send to " + to.ToString() + " failed: " +
             socket_.GetLastError());
        return false;
    }
    return true;
}

bool TransferCoordinator::ReceiveFirstReply(Packet& reply, net::SocketAddress& from,
                                            TransferResult& result) {
    // A granted blksize may already apply to a DATA reply
    size_t buffer_size = kMaxPacketSize;
    if (sent_options_.GetBlockSize()) {
        buffer_size = std::max(buffer_size, kHeaderSize + *sent_options_.GetBlockSize());
    }
    std::vector<uint8_t> buffer(buffer_size + 1);

    while (true) {
        int received = socket_.ReceiveFromTimeout(buffer.data(), buffer.size(), from,
                                                  context_.receive_timeout_ms);
        if (received == net::kSocketTimeout) {
            Fail(result, FailureKind::kTimeout, "No reply from " + server_.ToString() + " within " +
                 std::to_string(context_.receive_timeout_ms) + " ms");
            return false;
        }
        if (received < 0) {
            Fail(result, FailureKind::kNetwork, socket_.GetLastError());
            return false;
        }
        if (!from.IsSameHost(server_)) {
            TFTPCLIENT_WARN("Ignoring reply from %s, request went to %s",
                            from.ToString().c_str(), server_.ToString().c_str());
            continue;
        }

        DecodeError error = DecodeError::kNone;
        if (Deserialize(buffer.data(), static_cast<size_t>(received), reply, &error)) {
            TFTPCLIENT_DEBUG("First reply from %s: %s", from.ToString().c_str(),
                             ToString(GetOpCode(reply)));
            return true;
        }
        TFTPCLIENT_WARN("Ignoring undecodable reply from %s (%s)",
                        from.ToString().c_str(), ToString(error));
    }
}

void TransferCoordinator::ApplyOack(const OackPacket& oack, const net::SocketAddress& from) {
    OptionSet granted = OptionSet::FromOptionList(oack.options);
    context_.Apply(granted.Negotiate());
    context_.peer = from;
    context_.tid_established = true;
    TFTPCLIENT_INFO("OACK from %s: blksize=%u, tsize=%llu", from.ToString().c_str(),
                    context_.blksize, static_cast<unsigned long long>(context_.tsize));
}

void TransferCoordinator::Fail(TransferResult& result, FailureKind failure, const std::string& message,
                               uint16_t error_code) {
    result.state = TransferState::kAborted;
    result.failure = failure;
    result.error_code = error_code;
    result.message = message;
    if (failure == FailureKind::kProtocol && error_code != 0) {
        TFTPCLIENT_ERROR("Transfer refused: [Error Code = %u] [Error Message = %s]",
                         error_code, message.c_str());
    } else {
        TFTPCLIENT_ERROR("Transfer failed (%s): %s", ToString(failure), message.c_str());
    }
}

} // namespace internal
} // namespace tftpclient
