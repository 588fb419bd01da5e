/**
 * @file tftp_transfer_coordinator.h
 * @brief Request phase of a transfer and dispatch to the state machines
 */

#ifndef TFTPCLIENT_TFTP_TRANSFER_COORDINATOR_H_
#define TFTPCLIENT_TFTP_TRANSFER_COORDINATOR_H_

#include "tftpclient/tftp_common.h"
#include "tftpclient/tftp_options.h"
#include "tftpclient/tftp_packet.h"
#include "tftpclient/tftp_socket.h"
#include "tftpclient/tftp_stream.h"
#include "tftpclient/tftp_transfer.h"
#include <string>

namespace tftpclient {
namespace internal {

/**
 * @class TransferCoordinator
 * @brief Owns the socket of one transfer from request to last packet
 *
 * Sends the RRQ/WRQ to the server's well-known port, classifies the first
 * reply and hands the socket to ReadTransfer or WriteTransfer. An instance
 * runs a single transfer; parallel transfers need one instance each.
 */
class TransferCoordinator {
public:
    /**
     * @param server Server address, port is the request port (normally 69)
     * @param requested Options to request, an empty set sends a plain request
     * @param receive_timeout_ms Receive deadline, kBlockForever to wait indefinitely
     */
    TransferCoordinator(const net::SocketAddress& server, const OptionSet& requested,
                        int receive_timeout_ms = kBlockForever);
    ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    void SetProgressCallback(ProgressCallback callback);

    /**
     * @brief Download a file into the sink
     * @throws TftpException if this coordinator already ran a transfer
     */
    TransferResult Download(const std::string& remote_filename, ByteSink& sink);

    /**
     * @brief Upload the source to a file on the server
     * @throws TftpException if this coordinator already ran a transfer
     */
    TransferResult Upload(const std::string& remote_filename, ByteSource& source);

    /**
     * @brief Context of the transfer, negotiated values once the first reply is in
     */
    const TransferContext& GetContext() const { return context_; }

    /**
     * @brief Options as they went out in the request
     */
    const OptionSet& GetSentOptions() const { return sent_options_; }

private:
    void BeginTransfer();
    bool OpenSocket(TransferResult& result);
    bool SendPacket(const Packet& packet, const net::SocketAddress& to, TransferResult& result);
    bool ReceiveFirstReply(Packet& reply, net::SocketAddress& from, TransferResult& result);
    void ApplyOack(const OackPacket& oack, const net::SocketAddress& from);

    static void Fail(TransferResult& result, FailureKind failure, const std::string& message,
                     uint16_t error_code = 0);

    net::SocketAddress server_;
    OptionSet requested_;
    OptionSet sent_options_;
    net::UdpSocket socket_;
    TransferContext context_;
    bool used_;
};

} // namespace internal
} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_TRANSFER_COORDINATOR_H_
