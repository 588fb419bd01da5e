/**
 * @file tftp_socket_impl.h
 * @brief Internal implementation of the UDP socket wrapper
 */

#ifndef TFTPCLIENT_TFTP_SOCKET_IMPL_H_
#define TFTPCLIENT_TFTP_SOCKET_IMPL_H_

#include "tftpclient/tftp_socket.h"
#include "tftpclient/tftp_logger.h"
#include <string>

namespace tftpclient {
namespace net {
namespace internal {

/**
 * @brief POSIX socket implementation
 */
class SocketImpl {
public:
    SocketImpl();
    ~SocketImpl();

    SocketImpl(const SocketImpl&) = delete;
    SocketImpl& operator=(const SocketImpl&) = delete;

    bool Create();
    bool Bind(const SocketAddress& addr);
    bool GetLocalAddress(SocketAddress& addr) const;
    int SendTo(const void* data, size_t size, const SocketAddress& addr);
    int ReceiveFrom(void* buffer, size_t buffer_size, SocketAddress& sender_addr);
    int ReceiveFromTimeout(void* buffer, size_t buffer_size, SocketAddress& sender_addr, int timeout_ms);
    void Close();
    bool IsValid() const;
    std::string GetLastError() const;

private:
    socket_t socket_;
    mutable std::string last_error_;

    void SetLastError(const std::string& error) const;
    std::string GetSystemErrorMessage() const;
};

} // namespace internal
} // namespace net
} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_SOCKET_IMPL_H_
