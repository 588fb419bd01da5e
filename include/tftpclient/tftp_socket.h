/**
 * @file tftp_socket.h
 * @brief UDP socket RAII wrapper for the TFTP client
 */

#ifndef TFTPCLIENT_TFTP_SOCKET_H_
#define TFTPCLIENT_TFTP_SOCKET_H_

#include "tftpclient/tftp_common.h"
#include <memory>
#include <string>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

using socket_t = int;
constexpr socket_t kInvalidSocket = -1;

namespace tftpclient {
namespace net {

// Return values of UdpSocket send/receive calls besides a byte count
constexpr int kSocketError = -1;
constexpr int kSocketTimeout = -2;

// Forward declaration for pimpl
namespace internal {
class SocketImpl;
}

/**
 * @brief IPv4 socket address wrapper
 */
class TFTPCLIENT_EXPORT SocketAddress {
public:
    /**
     * @brief Default constructor, INADDR_ANY port 0
     */
    SocketAddress();

    /**
     * @brief Constructor with IPv4 address and port
     * @param ip IPv4 address (e.g., "127.0.0.1"), INADDR_ANY if it does not parse
     * @param port Port number
     */
    SocketAddress(const std::string& ip, uint16_t port);

    explicit SocketAddress(const sockaddr_in& addr);

    SocketAddress(const SocketAddress& other);
    SocketAddress(SocketAddress&& other) noexcept;
    SocketAddress& operator=(const SocketAddress& other);
    SocketAddress& operator=(SocketAddress&& other) noexcept;
    ~SocketAddress();

    const sockaddr_in& GetSockAddr() const;
    sockaddr_in& GetSockAddr();

    /**
     * @brief Get IP address as string
     */
    std::string GetIP() const;

    /**
     * @brief Get port number (host byte order)
     */
    uint16_t GetPort() const;

    /**
     * @brief Replace the port, keeping the IP address
     */
    void SetPort(uint16_t port);

    /**
     * @brief Set IP address and port
     * @param ip Dotted IPv4 address, empty or "0.0.0.0" for INADDR_ANY
     * @param port Port number
     * @return false if the address does not parse (the address is then INADDR_ANY)
     */
    bool Set(const std::string& ip, uint16_t port);

    /**
     * @brief "ip:port" form for log messages
     */
    std::string ToString() const;

    bool operator==(const SocketAddress& other) const;
    bool operator!=(const SocketAddress& other) const { return !(*this == other); }

    /**
     * @brief Same IPv4 address, any port
     */
    bool IsSameHost(const SocketAddress& other) const;

private:
    std::unique_ptr<sockaddr_in> addr_;
};

/**
 * @brief UDP socket RAII wrapper
 *
 * This class provides automatic resource management for a UDP socket. It uses
 * the pimpl idiom to keep the system headers of the implementation private.
 * A socket belongs to one transfer at a time and is not thread-safe.
 */
class TFTPCLIENT_EXPORT UdpSocket {
public:
    /**
     * @brief Default constructor - creates an invalid socket
     */
    UdpSocket();

    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    /**
     * @brief Destructor - automatically closes socket
     */
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /**
     * @brief Create a UDP socket
     * @return true if successful, false on error
     */
    bool Create();

    /**
     * @brief Bind socket to an address
     * @param addr Address to bind to, port 0 picks an ephemeral port
     * @return true if successful, false on error
     */
    bool Bind(const SocketAddress& addr);

    /**
     * @brief Get the address the socket is bound to
     * @param addr Local address (output parameter)
     * @return true if successful, false on error
     */
    bool GetLocalAddress(SocketAddress& addr) const;

    /**
     * @brief Send data to a specific address
     * @param data Data buffer to send (may be empty)
     * @param size Size of data to send
     * @param addr Destination address
     * @return Number of bytes sent, or kSocketError
     */
    int SendTo(const void* data, size_t size, const SocketAddress& addr);

    /**
     * @brief Receive one datagram, blocking indefinitely
     * @param buffer Buffer to receive data
     * @param buffer_size Size of receive buffer, longer datagrams are truncated
     * @param sender_addr Address of sender (output parameter)
     * @return Number of bytes received, or kSocketError
     */
    int ReceiveFrom(void* buffer, size_t buffer_size, SocketAddress& sender_addr);

    /**
     * @brief Receive one datagram with timeout
     * @param buffer Buffer to receive data
     * @param buffer_size Size of receive buffer
     * @param sender_addr Address of sender (output parameter)
     * @param timeout_ms Timeout in milliseconds, kBlockForever to wait indefinitely
     * @return Number of bytes received, kSocketTimeout on timeout, or kSocketError
     */
    int ReceiveFromTimeout(void* buffer, size_t buffer_size, SocketAddress& sender_addr, int timeout_ms);

    /**
     * @brief Close the socket
     */
    void Close();

    bool IsValid() const;

    /**
     * @brief Get the last error message
     */
    std::string GetLastError() const;

private:
    std::unique_ptr<internal::SocketImpl> impl_;
};

} // namespace net
} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_SOCKET_H_
