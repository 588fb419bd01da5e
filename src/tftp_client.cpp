#include "tftpclient/tftp_client.h"
#include "tftpclient/tftp_logger.h"
#include "tftpclient/tftp_socket.h"
#include "tftpclient/tftp_validation.h"
#include "internal/tftp_transfer_coordinator.h"

namespace tftpclient {

class TftpClient::Impl {
public:
    Impl() : timeout_ms_(kBlockForever), last_error_("No error") {}

    bool Download(const std::string& host, const std::string& filename, ByteSink& sink, uint16_t port) {
        net::SocketAddress server;
        if (!PrepareTransfer(host, filename, port, server)) {
            return false;
        }

        internal::TransferCoordinator coordinator(server, options_, timeout_ms_);
        coordinator.SetProgressCallback(progress_);
        return Complete(coordinator.Download(filename, sink));
    }

    bool DownloadToFile(const std::string& host, const std::string& filename,
                        const std::string& local_path, uint16_t port) {
        FileByteSink sink;
        if (!sink.Open(local_path)) {
            return LocalFailure(sink.GetLastError());
        }

        bool success = Download(host, filename, sink, port);
        if (!sink.Close() && success) {
            return LocalFailure(sink.GetLastError());
        }
        return success;
    }

    bool Upload(const std::string& host, const std::string& filename, ByteSource& source, uint16_t port) {
        net::SocketAddress server;
        if (!PrepareTransfer(host, filename, port, server)) {
            return false;
        }

        internal::TransferCoordinator coordinator(server, options_, timeout_ms_);
        coordinator.SetProgressCallback(progress_);
        return Complete(coordinator.Upload(filename, source));
    }

    bool UploadFromFile(const std::string& host, const std::string& local_path,
                        const std::string& filename, uint16_t port) {
        FileByteSource source;
        if (!source.Open(local_path)) {
            return LocalFailure(source.GetLastError());
        }
        return Upload(host, filename, source, port);
    }

    void SetBlockSize(int block_size) {
        if (!validation::ValidateBlockSize(block_size)) {
            TFTPCLIENT_ERROR("SetBlockSize: invalid block size: %d", block_size);
            throw TftpException("Invalid block size: " + std::to_string(block_size));
        }
        options_.SetBlockSize(block_size);
    }

    void SetReceiveTimeout(int timeout_ms) {
        if (!validation::ValidateTimeout(timeout_ms)) {
            TFTPCLIENT_ERROR("SetReceiveTimeout: invalid timeout value: %d", timeout_ms);
            throw TftpException("Invalid timeout: " + std::to_string(timeout_ms));
        }
        timeout_ms_ = timeout_ms;
    }

    void SetRequestTransferSize(bool enable) {
        if (enable) {
            options_.SetTransferSize(0);
        } else {
            options_.ClearTransferSize();
        }
    }

    OptionSet& Options() { return options_; }
    void SetProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }
    std::string GetLastError() const { return last_error_; }
    TransferResult GetLastResult() const { return last_result_; }

private:
    bool PrepareTransfer(const std::string& host, const std::string& filename, uint16_t port,
                         net::SocketAddress& server) {
        last_result_ = TransferResult();

        if (!validation::ValidateHost(host)) {
            return Reject("Invalid host: " + host);
        }
        if (!validation::ValidateFilename(filename)) {
            return Reject("Invalid filename: " + filename);
        }
        if (!validation::ValidatePort(port)) {
            return Reject("Invalid port: " + std::to_string(port));
        }
        if (!server.Set(host, port)) {
            return Reject("Invalid host: " + host);
        }
        return true;
    }

    bool Reject(const std::string& message) {
        TFTPCLIENT_ERROR("%s", message.c_str());
        last_result_.message = message;
        last_error_ = message;
        return false;
    }

    bool LocalFailure(const std::string& message) {
        last_result_ = TransferResult();
        last_result_.failure = FailureKind::kLocalIo;
        last_result_.message = message;
        last_error_ = message;
        TFTPCLIENT_ERROR("%s", message.c_str());
        return false;
    }

    bool Complete(const TransferResult& result) {
        last_result_ = result;
        if (result.Succeeded()) {
            last_error_ = "No error";
            return true;
        }

        if (result.failure == FailureKind::kProtocol && result.error_code != 0) {
            last_error_ = "Server error " + std::to_string(result.error_code) + ": " + result.message;
        } else {
            last_error_ = std::string(ToString(result.failure)) + " error: " + result.message;
        }
        return false;
    }

    OptionSet options_;
    int timeout_ms_;
    ProgressCallback progress_;
    std::string last_error_;
    TransferResult last_result_;
};

TftpClient::TftpClient() : impl_(std::make_unique<Impl>()) {}

TftpClient::~TftpClient() = default;

bool TftpClient::DownloadFile(const std::string& host, const std::string& filename,
                              ByteSink& sink, uint16_t port) {
    return impl_->Download(host, filename, sink, port);
}

bool TftpClient::DownloadFile(const std::string& host, const std::string& filename,
                              std::vector<uint8_t>& output_buffer, uint16_t port) {
    output_buffer.clear();
    MemoryByteSink sink(output_buffer);
    return impl_->Download(host, filename, sink, port);
}

bool TftpClient::DownloadToFile(const std::string& host, const std::string& filename,
                                const std::string& local_path, uint16_t port) {
    return impl_->DownloadToFile(host, filename, local_path, port);
}

bool TftpClient::UploadFile(const std::string& host, const std::string& filename,
                            ByteSource& source, uint16_t port) {
    return impl_->Upload(host, filename, source, port);
}

bool TftpClient::UploadFile(const std::string& host, const std::string& filename,
                            const std::vector<uint8_t>& data, uint16_t port) {
    MemoryByteSource source(data);
    return impl_->Upload(host, filename, source, port);
}

bool TftpClient::UploadFromFile(const std::string& host, const std::string& local_path,
                                const std::string& filename, uint16_t port) {
    return impl_->UploadFromFile(host, local_path, filename, port);
}

void TftpClient::SetBlockSize(int block_size) {
    impl_->SetBlockSize(block_size);
}

void TftpClient::ClearBlockSize() {
    impl_->Options().ClearBlockSize();
}

void TftpClient::SetRequestTransferSize(bool enable) {
    impl_->SetRequestTransferSize(enable);
}

void TftpClient::SetReceiveTimeout(int timeout_ms) {
    impl_->SetReceiveTimeout(timeout_ms);
}

void TftpClient::SetProgressCallback(ProgressCallback callback) {
    impl_->SetProgressCallback(std::move(callback));
}

const OptionSet& TftpClient::GetRequestedOptions() const {
    return impl_->Options();
}

std::string TftpClient::GetLastError() const {
    return impl_->GetLastError();
}

TransferResult TftpClient::GetLastResult() const {
    return impl_->GetLastResult();
}

} // namespace tftpclient
