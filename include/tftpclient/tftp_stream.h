/**
 * @file tftp_stream.h
 * @brief Byte sink and source collaborators of the transfer engine
 *
 * The engine never opens files itself. A download writes into a ByteSink,
 * an upload reads from a ByteSource.
 */

#ifndef TFTPCLIENT_TFTP_STREAM_H_
#define TFTPCLIENT_TFTP_STREAM_H_

#include "tftpclient/tftp_common.h"
#include <fstream>
#include <string>
#include <vector>

namespace tftpclient {

/**
 * @brief Destination of downloaded bytes
 */
class TFTPCLIENT_EXPORT ByteSink {
public:
    virtual ~ByteSink() = default;

    /**
     * @brief Append bytes
     * @return false on a local I/O failure, the transfer is then aborted
     */
    virtual bool Write(const uint8_t* data, size_t size) = 0;

    /**
     * @brief Description of the last failure
     */
    virtual std::string GetLastError() const { return "write failed"; }
};

/**
 * @brief Origin of uploaded bytes
 */
class TFTPCLIENT_EXPORT ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read the next chunk
     * @param max_bytes Upper bound, fewer bytes are returned only at the end
     * @param out Chunk read (output parameter), empty once exhausted
     * @return false on a local I/O failure
     */
    virtual bool Read(size_t max_bytes, std::vector<uint8_t>& out) = 0;

    /**
     * @brief Total length in bytes, used for the tsize option
     */
    virtual uint64_t Size() const = 0;

    virtual std::string GetLastError() const { return "read failed"; }
};

/**
 * @brief Sink appending to a caller-owned buffer
 */
class TFTPCLIENT_EXPORT MemoryByteSink : public ByteSink {
public:
    explicit MemoryByteSink(std::vector<uint8_t>& buffer) : buffer_(buffer) {}

    bool Write(const uint8_t* data, size_t size) override;

private:
    std::vector<uint8_t>& buffer_;
};

/**
 * @brief Source reading from a caller-owned buffer
 */
class TFTPCLIENT_EXPORT MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(const std::vector<uint8_t>& buffer) : buffer_(buffer), offset_(0) {}

    bool Read(size_t max_bytes, std::vector<uint8_t>& out) override;
    uint64_t Size() const override { return buffer_.size(); }

private:
    const std::vector<uint8_t>& buffer_;
    size_t offset_;
};

/**
 * @brief Sink writing a local file in binary mode
 */
class TFTPCLIENT_EXPORT FileByteSink : public ByteSink {
public:
    FileByteSink() = default;

    /**
     * @brief Create or truncate the file
     * @return false if the file cannot be opened
     */
    bool Open(const std::string& path);

    bool Write(const uint8_t* data, size_t size) override;
    std::string GetLastError() const override { return last_error_; }

    /**
     * @brief Flush and close, reports a failed flush
     */
    bool Close();

private:
    std::ofstream file_;
    std::string path_;
    std::string last_error_;
};

/**
 * @brief Source reading a local file in binary mode
 */
class TFTPCLIENT_EXPORT FileByteSource : public ByteSource {
public:
    FileByteSource() : size_(0) {}

    /**
     * @brief Open the file and record its length
     * @return false if the file does not exist or cannot be read
     */
    bool Open(const std::string& path);

    bool Read(size_t max_bytes, std::vector<uint8_t>& out) override;
    uint64_t Size() const override { return size_; }
    std::string GetLastError() const override { return last_error_; }

private:
    std::ifstream file_;
    std::string path_;
    uint64_t size_;
    std::string last_error_;
};

} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_STREAM_H_
