#include "tftpclient/tftp_client.h"
#include "tftpclient/tftp_logger.h"
#include "tftpclient/tftp_util.h"
#include <iostream>
#include <limits>
#include <string>

namespace {

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <server-ip> get|put <local-file> <remote-file>"
                 " [--blksize N] [--tsize] [--port P] [--timeout MS] [--verbose]" << std::endl
              << "  --verbose prints debug output only in Debug builds"
                 " (or with TFTPCLIENT_LOG_LEVEL set to 1)" << std::endl;
}

bool ParseNumber(const std::string& text, uint64_t max_value, uint64_t& value) {
    return tftpclient::util::ParseDecimal(text, value) && value <= max_value;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 5) {
        PrintUsage(argv[0]);
        return 1;
    }

    const std::string host = argv[1];
    const std::string command = argv[2];
    const std::string local_file = argv[3];
    const std::string remote_file = argv[4];

    if (command != "get" && command != "put") {
        std::cerr << "Unknown command: " << command << std::endl;
        PrintUsage(argv[0]);
        return 1;
    }

    tftpclient::TftpClient client;
    uint16_t port = tftpclient::kDefaultTftpPort;

    try {
        for (int i = 5; i < argc; ++i) {
            const std::string arg = argv[i];
            uint64_t value = 0;
            if (arg == "--tsize") {
                client.SetRequestTransferSize(true);
            } else if (arg == "--verbose") {
                tftpclient::TftpLogger::GetInstance().SetLogLevel(tftpclient::kLogDebug);
            } else if ((arg == "--blksize" || arg == "--port" || arg == "--timeout") && i + 1 < argc) {
                const std::string text = argv[++i];
                if (!ParseNumber(text, std::numeric_limits<int>::max(), value)) {
                    std::cerr << "Invalid value for " << arg << ": " << text << std::endl;
                    return 1;
                }
                if (arg == "--blksize") {
                    client.SetBlockSize(static_cast<int>(value));
                } else if (arg == "--timeout") {
                    client.SetReceiveTimeout(static_cast<int>(value));
                } else {
                    if (value == 0 || value > std::numeric_limits<uint16_t>::max()) {
                        std::cerr << "Port number out of range: " << value << std::endl;
                        return 1;
                    }
                    port = static_cast<uint16_t>(value);
                }
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << std::endl;
                PrintUsage(argv[0]);
                return 1;
            }
        }
    } catch (const tftpclient::TftpException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    client.SetProgressCallback([](uint64_t bytes, uint64_t total) {
        if (total > 0) {
            std::cout << "\r" << bytes << "/" << total << " bytes" << std::flush;
        }
    });

    bool success = false;
    if (command == "get") {
        success = client.DownloadToFile(host, remote_file, local_file, port);
    } else {
        success = client.UploadFromFile(host, local_file, remote_file, port);
    }

    const tftpclient::TransferResult result = client.GetLastResult();
    if (!success) {
        std::cerr << std::endl << "Transfer failed: " << client.GetLastError() << std::endl;
        return 1;
    }

    std::cout << std::endl << (command == "get" ? "Downloaded " : "Uploaded ")
              << result.bytes_transferred << " bytes in " << result.blocks << " blocks" << std::endl;
    return 0;
}
