#include "tftpclient/tftp_transfer.h"
#include "tftpclient/tftp_logger.h"

namespace tftpclient {

ReadTransfer::ReadTransfer(net::UdpSocket& socket, TransferContext& context, ByteSink& sink)
    : Transfer(socket, context, TransferState::kAwaitingData),
      sink_(sink),
      expected_block_(1) {
}

TransferState ReadTransfer::Start() {
    // The server speaks first on a download
    TFTPCLIENT_DEBUG("Download started: blksize=%u, tsize=%llu", context_.blksize,
                     static_cast<unsigned long long>(context_.tsize));
    return result_.state;
}

TransferState ReadTransfer::OnPacket(const Packet& packet, const net::SocketAddress& from) {
    if (IsFinished()) {
        return result_.state;
    }

    if (context_.tid_established && from != context_.peer) {
        TFTPCLIENT_WARN("Ignoring packet from unknown transfer ID %s (expected %s)",
                        from.ToString().c_str(), context_.peer.ToString().c_str());
        return result_.state;
    }

    if (const auto* data = std::get_if<DataPacket>(&packet)) {
        return OnData(*data, from);
    }

    if (const auto* error = std::get_if<ErrorPacket>(&packet)) {
        TFTPCLIENT_ERROR("ERROR packet received: code=%u, message='%s'",
                         error->error_code, error->message.c_str());
        return Abort(FailureKind::kProtocol, error->message, error->error_code);
    }

    TFTPCLIENT_DEBUG("Ignoring %s packet while awaiting data", ToString(GetOpCode(packet)));
    return result_.state;
}

TransferState ReadTransfer::OnData(const DataPacket& data, const net::SocketAddress& from) {
    const size_t payload_size = data.payload.size();
    if (payload_size > context_.blksize) {
        TFTPCLIENT_WARN("Ignoring DATA block %u with %zu bytes, larger than blksize %u",
                        data.block, payload_size, context_.blksize);
        return result_.state;
    }

    if (!context_.tid_established) {
        context_.peer = from;
        context_.tid_established = true;
        TFTPCLIENT_DEBUG("Transfer ID established: %s", from.ToString().c_str());
    }

    // Acknowledge the block actually received, expected or not
    if (!Send(CreateAck(data.block), context_.peer)) {
        return Abort(FailureKind::kNetwork, "Failed to send ACK for block " +
                     std::to_string(data.block) + ": " + socket_.GetLastError());
    }

    if (data.block == expected_block_) {
        if (payload_size > 0 && !sink_.Write(data.payload.data(), payload_size)) {
            SendErrorToPeer(ErrorCode::kDiskFull, "Disk full or allocation exceeded");
            return Abort(FailureKind::kLocalIo, sink_.GetLastError());
        }
        ++expected_block_;
        ++result_.blocks;
        result_.bytes_transferred += payload_size;
        ReportProgress();
    } else {
        TFTPCLIENT_WARN("Received unexpected block %u, expected %u", data.block, expected_block_);
    }

    if (payload_size < context_.blksize) {
        return Finish();
    }
    return result_.state;
}

} // namespace tftpclient
