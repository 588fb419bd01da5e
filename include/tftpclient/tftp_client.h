/**
 * @file tftp_client.h
 * @brief Public TFTP client API
 */

#ifndef TFTPCLIENT_TFTP_CLIENT_H_
#define TFTPCLIENT_TFTP_CLIENT_H_

#include "tftpclient/tftp_common.h"
#include "tftpclient/tftp_options.h"
#include "tftpclient/tftp_stream.h"
#include "tftpclient/tftp_transfer.h"
#include <memory>
#include <string>
#include <vector>

namespace tftpclient {

/**
 * @class TftpClient
 * @brief Downloads and uploads files over TFTP in octet mode
 *
 * Each call runs one complete transfer on its own socket and blocks until it
 * completes or aborts. Calls return false on failure; GetLastError() and
 * GetLastResult() describe the failure. Setters that receive values the
 * protocol cannot carry throw TftpException.
 */
class TFTPCLIENT_EXPORT TftpClient {
public:
    TftpClient();
    ~TftpClient();

    TftpClient(const TftpClient&) = delete;
    TftpClient& operator=(const TftpClient&) = delete;

    /**
     * @brief Download a file into a sink
     * @param host Server IPv4 address
     * @param filename Remote filename
     * @param sink Destination of the file contents
     * @param port Server request port (default 69)
     * @return true on success, false otherwise
     */
    bool DownloadFile(const std::string& host, const std::string& filename,
                      ByteSink& sink, uint16_t port = kDefaultTftpPort);

    /**
     * @brief Download a file into a buffer, cleared first
     */
    bool DownloadFile(const std::string& host, const std::string& filename,
                      std::vector<uint8_t>& output_buffer, uint16_t port = kDefaultTftpPort);

    /**
     * @brief Download a file into a local file, created or truncated
     */
    bool DownloadToFile(const std::string& host, const std::string& filename,
                        const std::string& local_path, uint16_t port = kDefaultTftpPort);

    /**
     * @brief Upload the contents of a source
     * @param host Server IPv4 address
     * @param filename Remote filename
     * @param source Origin of the file contents
     * @param port Server request port (default 69)
     * @return true on success, false otherwise
     */
    bool UploadFile(const std::string& host, const std::string& filename,
                    ByteSource& source, uint16_t port = kDefaultTftpPort);

    bool UploadFile(const std::string& host, const std::string& filename,
                    const std::vector<uint8_t>& data, uint16_t port = kDefaultTftpPort);

    /**
     * @brief Upload a local file
     */
    bool UploadFromFile(const std::string& host, const std::string& local_path,
                        const std::string& filename, uint16_t port = kDefaultTftpPort);

    /**
     * @brief Request the blksize option on following transfers
     * @throws TftpException if outside [8, 65464]
     */
    void SetBlockSize(int block_size);
    void ClearBlockSize();

    /**
     * @brief Request the tsize option on following transfers
     *
     * Sent as 0 on a download and as the source length on an upload.
     */
    void SetRequestTransferSize(bool enable);

    /**
     * @brief Receive deadline in milliseconds, 0 waits indefinitely
     * @throws TftpException if outside [0, 3600000]
     */
    void SetReceiveTimeout(int timeout_ms);

    void SetProgressCallback(ProgressCallback callback);

    const OptionSet& GetRequestedOptions() const;

    std::string GetLastError() const;
    TransferResult GetLastResult() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_CLIENT_H_
