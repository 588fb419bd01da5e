#include "tftpclient/tftp_options.h"
#include "tftpclient/tftp_logger.h"
#include "tftpclient/tftp_util.h"
#include "tftpclient/tftp_validation.h"
#include <string>

namespace tftpclient {

void OptionSet::SetBlockSize(int block_size) {
    if (!validation::ValidateBlockSize(block_size)) {
        throw TftpException("Invalid block size: " + std::to_string(block_size) +
                            " (valid range " + std::to_string(kMinBlockSize) + "-" +
                            std::to_string(kMaxBlockSize) + ")");
    }
    blksize_ = static_cast<uint16_t>(block_size);
}

void OptionSet::SetTransferSize(int64_t transfer_size) {
    if (!validation::ValidateTransferSize(transfer_size)) {
        throw TftpException("Invalid transfer size: " + std::to_string(transfer_size));
    }
    tsize_ = static_cast<uint64_t>(transfer_size);
}

OptionList OptionSet::ToOptionList() const {
    OptionList options;
    if (blksize_) {
        options.emplace_back(kBlockSizeOption, std::to_string(*blksize_));
    }
    if (tsize_) {
        options.emplace_back(kTransferSizeOption, std::to_string(*tsize_));
    }
    return options;
}

OptionSet OptionSet::FromOptionList(const OptionList& options) {
    OptionSet result;
    for (const auto& option : options) {
        uint64_t value = 0;
        if (util::EqualsIgnoreCase(option.first, kBlockSizeOption)) {
            if (!util::ParseDecimal(option.second, value) ||
                value < kMinBlockSize || value > kMaxBlockSize) {
                TFTPCLIENT_WARN("Ignoring invalid blksize value: '%s'", option.second.c_str());
                continue;
            }
            result.blksize_ = static_cast<uint16_t>(value);
        } else if (util::EqualsIgnoreCase(option.first, kTransferSizeOption)) {
            if (!util::ParseDecimal(option.second, value)) {
                TFTPCLIENT_WARN("Ignoring invalid tsize value: '%s'", option.second.c_str());
                continue;
            }
            result.tsize_ = value;
        } else {
            TFTPCLIENT_DEBUG("Ignoring unknown option: %s=%s",
                             option.first.c_str(), option.second.c_str());
        }
    }
    return result;
}

NegotiatedOptions OptionSet::Negotiate() const {
    NegotiatedOptions negotiated;
    if (blksize_) {
        negotiated.blksize = *blksize_;
    }
    if (tsize_) {
        negotiated.tsize = *tsize_;
    }
    return negotiated;
}

} // namespace tftpclient
