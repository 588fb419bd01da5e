/**
 * @file tftp_socket_impl.cpp
 * @brief POSIX socket implementation
 */

#include "internal/tftp_socket_impl.h"
#include <sys/select.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>

namespace tftpclient {
namespace net {
namespace internal {

SocketImpl::SocketImpl() : socket_(kInvalidSocket) {
}

SocketImpl::~SocketImpl() {
    Close();
}

bool SocketImpl::Create() {
    Close();

    socket_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_ == kInvalidSocket) {
        SetLastError("Failed to create UDP socket: " + GetSystemErrorMessage());
        TFTPCLIENT_ERROR("%s", last_error_.c_str());
        return false;
    }

    TFTPCLIENT_DEBUG("UDP socket created (fd: %d)", socket_);
    return true;
}

bool SocketImpl::Bind(const SocketAddress& addr) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot bind invalid socket");
        return false;
    }

    const sockaddr_in& sock_addr = addr.GetSockAddr();
    int result = bind(socket_, reinterpret_cast<const sockaddr*>(&sock_addr), sizeof(sock_addr));

    if (result != 0) {
        SetLastError("Failed to bind socket: " + GetSystemErrorMessage());
        TFTPCLIENT_ERROR("Failed to bind socket to %s - %s",
                         addr.ToString().c_str(), last_error_.c_str());
        return false;
    }

    TFTPCLIENT_DEBUG("Socket bound to %s", addr.ToString().c_str());
    return true;
}

bool SocketImpl::GetLocalAddress(SocketAddress& addr) const {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot query invalid socket");
        return false;
    }

    sockaddr_in& sock_addr = addr.GetSockAddr();
    socklen_t addr_len = sizeof(sock_addr);
    if (getsockname(socket_, reinterpret_cast<sockaddr*>(&sock_addr), &addr_len) != 0) {
        SetLastError("Failed to get local address: " + GetSystemErrorMessage());
        TFTPCLIENT_ERROR("%s", last_error_.c_str());
        return false;
    }
    return true;
}

int SocketImpl::SendTo(const void* data, size_t size, const SocketAddress& addr) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot send on invalid socket");
        return kSocketError;
    }

    if (data == nullptr && size != 0) {
        SetLastError("Invalid send parameters");
        return kSocketError;
    }

    const sockaddr_in& sock_addr = addr.GetSockAddr();
    ssize_t sent = sendto(socket_, data, size, 0,
                          reinterpret_cast<const sockaddr*>(&sock_addr), sizeof(sock_addr));

    if (sent < 0) {
        SetLastError("Failed to send data: " + GetSystemErrorMessage());
        TFTPCLIENT_ERROR("Failed to send %zu bytes to %s - %s",
                         size, addr.ToString().c_str(), last_error_.c_str());
        return kSocketError;
    }

    if (static_cast<size_t>(sent) != size) {
        TFTPCLIENT_WARN("Partial send: %zd bytes sent out of %zu", sent, size);
    }

    return static_cast<int>(sent);
}

int SocketImpl::ReceiveFrom(void* buffer, size_t buffer_size, SocketAddress& sender_addr) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot receive on invalid socket");
        return kSocketError;
    }

    if (buffer == nullptr || buffer_size == 0) {
        SetLastError("Invalid receive parameters");
        return kSocketError;
    }

    sockaddr_in& sock_addr = sender_addr.GetSockAddr();
    socklen_t addr_len = sizeof(sock_addr);

    ssize_t received;
    do {
        received = recvfrom(socket_, buffer, buffer_size, 0,
                            reinterpret_cast<sockaddr*>(&sock_addr), &addr_len);
    } while (received < 0 && errno == EINTR);

    if (received < 0) {
        SetLastError("Failed to receive data: " + GetSystemErrorMessage());
        TFTPCLIENT_ERROR("%s", last_error_.c_str());
        return kSocketError;
    }

    return static_cast<int>(received);
}

int SocketImpl::ReceiveFromTimeout(void* buffer, size_t buffer_size, SocketAddress& sender_addr, int timeout_ms) {
    if (socket_ == kInvalidSocket) {
        SetLastError("Cannot receive on invalid socket");
        return kSocketError;
    }

    if (timeout_ms == kBlockForever) {
        return ReceiveFrom(buffer, buffer_size, sender_addr);
    }

    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(socket_, &readfds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(socket_ + 1, &readfds, nullptr, nullptr, &timeout);

    if (result < 0) {
        SetLastError("Select failed: " + GetSystemErrorMessage());
        TFTPCLIENT_ERROR("%s", last_error_.c_str());
        return kSocketError;
    }

    if (result == 0) {
        SetLastError("Receive timeout");
        TFTPCLIENT_DEBUG("Receive timeout after %d ms", timeout_ms);
        return kSocketTimeout;
    }

    return ReceiveFrom(buffer, buffer_size, sender_addr);
}

void SocketImpl::Close() {
    if (socket_ != kInvalidSocket) {
        TFTPCLIENT_DEBUG("Closing socket (fd: %d)", socket_);
        close(socket_);
        socket_ = kInvalidSocket;
    }
}

bool SocketImpl::IsValid() const {
    return socket_ != kInvalidSocket;
}

std::string SocketImpl::GetLastError() const {
    return last_error_;
}

void SocketImpl::SetLastError(const std::string& error) const {
    last_error_ = error;
}

std::string SocketImpl::GetSystemErrorMessage() const {
    return std::strerror(errno);
}

} // namespace internal
} // namespace net
} // namespace tftpclient
