/**
 * @file tftp_options.h
 * @brief Requested and negotiated TFTP options (RFC 2347, 2348, 2349)
 */

#ifndef TFTPCLIENT_TFTP_OPTIONS_H_
#define TFTPCLIENT_TFTP_OPTIONS_H_

#include "tftpclient/tftp_common.h"
#include "tftpclient/tftp_packet.h"
#include <optional>

namespace tftpclient {

/**
 * @brief Values in effect for one transfer once the first reply is classified
 */
struct NegotiatedOptions {
    uint16_t blksize = kDefaultBlockSize;
    uint64_t tsize = kDefaultTransferSize;
};

/**
 * @class OptionSet
 * @brief The two options this client knows, each either absent or set
 *
 * Setters enforce the RFC ranges and throw TftpException for values the
 * caller has to supply again; nothing is clamped.
 */
class TFTPCLIENT_EXPORT OptionSet {
public:
    OptionSet() = default;

    /**
     * @brief Request a block size
     * @param block_size Bytes per DATA packet, must be within [8, 65464]
     * @throws TftpException if out of range
     */
    void SetBlockSize(int block_size);

    /**
     * @brief Request a transfer size
     * @param transfer_size Total bytes, 0 asks the server on a read
     * @throws TftpException if negative
     */
    void SetTransferSize(int64_t transfer_size);

    void ClearBlockSize() { blksize_.reset(); }
    void ClearTransferSize() { tsize_.reset(); }

    const std::optional<uint16_t>& GetBlockSize() const { return blksize_; }
    const std::optional<uint64_t>& GetTransferSize() const { return tsize_; }

    bool Empty() const { return !blksize_ && !tsize_; }

    /**
     * @brief Option suffix for a request, blksize first then tsize
     */
    OptionList ToOptionList() const;

    /**
     * @brief Extract the known options from a received option list
     *
     * Names compare case-insensitively. Values that are not decimal or
     * outside the valid range are dropped with a warning, unknown names
     * are ignored.
     */
    static OptionSet FromOptionList(const OptionList& options);

    /**
     * @brief Values in effect after an OACK granting these options
     *
     * Granted options override the defaults. An option that was requested
     * but is missing from the OACK falls back to its default.
     */
    NegotiatedOptions Negotiate() const;

    /**
     * @brief Values in effect when the server answered without an OACK
     */
    static NegotiatedOptions Defaults() { return NegotiatedOptions(); }

    bool operator==(const OptionSet& other) const {
        return blksize_ == other.blksize_ && tsize_ == other.tsize_;
    }

private:
    std::optional<uint16_t> blksize_;
    std::optional<uint64_t> tsize_;
};

} // namespace tftpclient

#endif // TFTPCLIENT_TFTP_OPTIONS_H_
