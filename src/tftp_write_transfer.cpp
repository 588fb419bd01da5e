#include "tftpclient/tftp_transfer.h"
#include "tftpclient/tftp_logger.h"

namespace tftpclient {

WriteTransfer::WriteTransfer(net::UdpSocket& socket, TransferContext& context, ByteSource& source)
    : Transfer(socket, context, TransferState::kSendingData),
      source_(source),
      data_block_(1),
      last_chunk_size_(0) {
}

TransferState WriteTransfer::Start() {
    TFTPCLIENT_DEBUG("Upload started: blksize=%u, tsize=%llu, source=%llu bytes",
                     context_.blksize, static_cast<unsigned long long>(context_.tsize),
                     static_cast<unsigned long long>(source_.Size()));
    return SendNextBlock();
}

TransferState WriteTransfer::SendNextBlock() {
    chunk_.clear();
    if (!source_.Read(context_.blksize, chunk_)) {
        SendErrorToPeer(ErrorCode::kNotDefined, "Local read error");
        return Abort(FailureKind::kLocalIo, source_.GetLastError());
    }
    if (chunk_.size() > context_.blksize) {
        return Abort(FailureKind::kLocalIo, "Source returned more than blksize bytes");
    }
    last_chunk_size_ = chunk_.size();

    // A chunk shorter than blksize (possibly empty) is the terminal packet
    if (!Send(CreateData(data_block_, chunk_), context_.peer)) {
        return Abort(FailureKind::kNetwork, "Failed to send DATA block " +
                     std::to_string(data_block_) + ": " + socket_.GetLastError());
    }
    TFTPCLIENT_DEBUG("Sent DATA block %u (%zu bytes)", data_block_, last_chunk_size_);
    return result_.state;
}

TransferState WriteTransfer::OnPacket(const Packet& packet, const net::SocketAddress& from) {
    if (IsFinished()) {
        return result_.state;
    }

    // The data port may move, the server host may not
    if (!from.IsSameHost(context_.peer)) {
        TFTPCLIENT_WARN("Ignoring packet from foreign host %s (server %s)",
                        from.ToString().c_str(), context_.peer.ToString().c_str());
        return result_.state;
    }

    if (const auto* error = std::get_if<ErrorPacket>(&packet)) {
        TFTPCLIENT_ERROR("ERROR packet received: code=%u, message='%s'",
                         error->error_code, error->message.c_str());
        return Abort(FailureKind::kProtocol, error->message, error->error_code);
    }

    const auto* ack = std::get_if<AckPacket>(&packet);
    if (ack == nullptr) {
        TFTPCLIENT_DEBUG("Ignoring %s packet while sending data", ToString(GetOpCode(packet)));
        return result_.state;
    }

    if (ack->block != data_block_) {
        TFTPCLIENT_DEBUG("Ignoring ACK %u while waiting for ACK %u", ack->block, data_block_);
        return result_.state;
    }

    // The server may rebind its transfer ID, follow the ACK source
    if (from != context_.peer) {
        TFTPCLIENT_DEBUG("Data port moved from %s to %s",
                         context_.peer.ToString().c_str(), from.ToString().c_str());
        context_.peer = from;
    }
    context_.tid_established = true;

    ++result_.blocks;
    result_.bytes_transferred += last_chunk_size_;
    ReportProgress();

    if (last_chunk_size_ < context_.blksize) {
        return Finish();
    }

    ++data_block_;
    return SendNextBlock();
}

} // namespace tftpclient
