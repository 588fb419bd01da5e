#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <tftpclient/tftp_client.h>
#include <tftpclient/tftp_packet.h>
#include <tftpclient/tftp_socket.h>
#include "internal/tftp_transfer_coordinator.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

using namespace tftpclient;
using namespace tftpclient::net;
using tftpclient::internal::TransferCoordinator;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

namespace {

constexpr int kWaitMs = 2000;

std::vector<uint8_t> Pattern(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(i * 7 + 3);
    }
    return data;
}

/**
 * @class FakeServer
 * @brief Scripted TFTP server on loopback
 *
 * Requests arrive on the request socket; replies go out from a separate data
 * socket, so the client has to switch to the server's transfer ID port.
 */
class FakeServer {
public:
    using Script = std::function<void(FakeServer&)>;

    ~FakeServer() { Join(); }

    bool Open() {
        return OpenLoopback(request_socket_, request_addr_) && OpenLoopback(data_socket_, data_addr_);
    }

    void Run(Script script) {
        thread_ = std::thread([this, script]() { script(*this); });
    }

    void Join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool ReceiveRequest(Packet& packet) { return Receive(request_socket_, packet); }
    bool Receive(Packet& packet) { return Receive(data_socket_, packet); }

    void Reply(const Packet& packet) {
        std::vector<uint8_t> data = Serialize(packet);
        data_socket_.SendTo(data.data(), data.size(), client_addr_);
    }

    /**
     * Send DATA blocks for `contents` and expect the matching ACKs
     */
    bool ServeFile(const std::vector<uint8_t>& contents, size_t blksize, uint16_t first_block = 1) {
        size_t offset = 0;
        uint16_t block = first_block;
        while (true) {
            size_t chunk = std::min(blksize, contents.size() - offset);
            Reply(CreateData(block, std::vector<uint8_t>(contents.begin() + offset,
                                                         contents.begin() + offset + chunk)));
            Packet ack;
            if (!Receive(ack) || !(ack == CreateAck(block))) {
                return false;
            }
            offset += chunk;
            ++block;
            if (chunk < blksize) {
                return true;
            }
        }
    }

    /**
     * Collect DATA blocks, acknowledging each, until a short one arrives
     */
    bool CollectFile(size_t blksize, std::vector<uint8_t>& contents) {
        uint16_t expected = 1;
        while (true) {
            Packet packet;
            if (!Receive(packet)) {
                return false;
            }
            const auto* data = std::get_if<DataPacket>(&packet);
            if (data == nullptr || data->block != expected) {
                return false;
            }
            contents.insert(contents.end(), data->payload.begin(), data->payload.end());
            Reply(CreateAck(expected));
            ++expected;
            if (data->payload.size() < blksize) {
                return true;
            }
        }
    }

    const SocketAddress& GetRequestAddress() const { return request_addr_; }
    const SocketAddress& GetDataAddress() const { return data_addr_; }
    const SocketAddress& GetClientAddress() const { return client_addr_; }
    uint16_t GetPort() const { return request_addr_.GetPort(); }

private:
    static bool OpenLoopback(UdpSocket& socket, SocketAddress& bound) {
        return socket.Create() && socket.Bind(SocketAddress("127.0.0.1", 0)) && socket.GetLocalAddress(bound);
    }

    bool Receive(UdpSocket& socket, Packet& packet) {
        std::vector<uint8_t> buffer(kMaxBlockSize + kHeaderSize + 1);
        SocketAddress from;
        int received = socket.ReceiveFromTimeout(buffer.data(), buffer.size(), from, kWaitMs);
        if (received < 0) {
            return false;
        }
        client_addr_ = from;
        return Deserialize(buffer.data(), static_cast<size_t>(received), packet);
    }

    UdpSocket request_socket_;
    UdpSocket data_socket_;
    SocketAddress request_addr_;
    SocketAddress data_addr_;
    SocketAddress client_addr_;
    std::thread thread_;
};

} // namespace

/**
 * @class TransferCoordinatorTest
 * @brief Request phase and first-reply classification
 */
class TransferCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(server_.Open());
    }

    FakeServer server_;
    OptionSet options_;
};

TEST_F(TransferCoordinatorTest, DownloadWithOackGrantingOnlyBlockSize) {
    options_.SetBlockSize(1024);
    options_.SetTransferSize(12345);  // replaced by 0 on a read
    std::vector<uint8_t> contents = Pattern(1024 + 10);

    server_.Run([&contents](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        const auto* rrq = std::get_if<ReadRequestPacket>(&request);
        ASSERT_NE(rrq, nullptr);
        EXPECT_EQ(rrq->filename, "firmware.bin");
        EXPECT_EQ(rrq->mode, "octet");
        EXPECT_THAT(rrq->options, ElementsAre(Option("blksize", "1024"), Option("tsize", "0")));

        server.Reply(CreateOack({{"blksize", "1024"}}));
        Packet ack;
        ASSERT_TRUE(server.Receive(ack));
        EXPECT_EQ(ack, CreateAck(0));
        EXPECT_TRUE(server.ServeFile(contents, 1024));
    });

    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, kWaitMs);
    std::vector<uint8_t> output;
    MemoryByteSink sink(output);
    TransferResult result = coordinator.Download("firmware.bin", sink);
    server_.Join();

    EXPECT_TRUE(result.Succeeded()) << result.message;
    EXPECT_EQ(output, contents);
    EXPECT_EQ(coordinator.GetContext().blksize, 1024);
    EXPECT_EQ(coordinator.GetContext().tsize, 0u);
    EXPECT_EQ(coordinator.GetContext().peer, server_.GetDataAddress());
    EXPECT_EQ(*coordinator.GetSentOptions().GetTransferSize(), 0u);
}

TEST_F(TransferCoordinatorTest, DownloadWithOackGrantingTransferSize) {
    options_.SetTransferSize(0);
    std::vector<uint8_t> contents = Pattern(700);

    server_.Run([&contents](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        server.Reply(CreateOack({{"tsize", "700"}}));
        Packet ack;
        ASSERT_TRUE(server.Receive(ack));
        EXPECT_TRUE(server.ServeFile(contents, kDefaultBlockSize));
    });

    std::vector<uint64_t> progress;
    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, kWaitMs);
    coordinator.SetProgressCallback([&progress](uint64_t bytes, uint64_t total) {
        EXPECT_EQ(total, 700u);
        progress.push_back(bytes);
    });
    std::vector<uint8_t> output;
    MemoryByteSink sink(output);
    TransferResult result = coordinator.Download("image", sink);
    server_.Join();

    EXPECT_TRUE(result.Succeeded()) << result.message;
    EXPECT_EQ(coordinator.GetContext().blksize, kDefaultBlockSize);
    EXPECT_EQ(coordinator.GetContext().tsize, 700u);
    EXPECT_THAT(progress, ElementsAre(512u, 700u));
}

TEST_F(TransferCoordinatorTest, PlainReadRequestKeepsFirstDataBlock) {
    std::vector<uint8_t> contents = Pattern(100);

    server_.Run([&contents](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        EXPECT_THAT(std::get<ReadRequestPacket>(request).options, IsEmpty());
        EXPECT_TRUE(server.ServeFile(contents, kDefaultBlockSize));
    });

    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, kWaitMs);
    std::vector<uint8_t> output;
    MemoryByteSink sink(output);
    TransferResult result = coordinator.Download("small.txt", sink);
    server_.Join();

    EXPECT_TRUE(result.Succeeded()) << result.message;
    EXPECT_EQ(output, contents);
    EXPECT_EQ(coordinator.GetContext().peer, server_.GetDataAddress());
}

TEST_F(TransferCoordinatorTest, ServerIgnoringOptionsMeansDefaults) {
    options_.SetBlockSize(4096);
    std::vector<uint8_t> contents = Pattern(512 + 1);

    server_.Run([&contents](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        EXPECT_TRUE(server.ServeFile(contents, kDefaultBlockSize));
    });

    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, kWaitMs);
    std::vector<uint8_t> output;
    MemoryByteSink sink(output);
    TransferResult result = coordinator.Download("legacy", sink);
    server_.Join();

    EXPECT_TRUE(result.Succeeded()) << result.message;
    EXPECT_EQ(coordinator.GetContext().blksize, kDefaultBlockSize);
    EXPECT_EQ(output, contents);
}

TEST_F(TransferCoordinatorTest, UploadAfterPlainAck) {
    std::vector<uint8_t> contents = Pattern(300);

    server_.Run([](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        const auto* wrq = std::get_if<WriteRequestPacket>(&request);
        ASSERT_NE(wrq, nullptr);
        EXPECT_EQ(wrq->filename, "upload.txt");
        EXPECT_THAT(wrq->options, IsEmpty());

        server.Reply(CreateAck(0));
        std::vector<uint8_t> received;
        EXPECT_TRUE(server.CollectFile(kDefaultBlockSize, received));
        EXPECT_EQ(received, Pattern(300));
    });

    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, kWaitMs);
    MemoryByteSource source(contents);
    TransferResult result = coordinator.Upload("upload.txt", source);
    server_.Join();

    EXPECT_TRUE(result.Succeeded()) << result.message;
    EXPECT_EQ(result.bytes_transferred, 300u);
    EXPECT_EQ(coordinator.GetContext().peer, server_.GetDataAddress());
}

TEST_F(TransferCoordinatorTest, UploadAfterOackSendsSourceLength) {
    options_.SetBlockSize(8);
    options_.SetTransferSize(0);
    std::vector<uint8_t> contents = Pattern(20);

    server_.Run([](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        EXPECT_THAT(std::get<WriteRequestPacket>(request).options,
                    ElementsAre(Option("blksize", "8"), Option("tsize", "20")));

        server.Reply(CreateOack({{"blksize", "8"}, {"tsize", "20"}}));
        std::vector<uint8_t> received;
        EXPECT_TRUE(server.CollectFile(8, received));
        EXPECT_EQ(received, Pattern(20));
    });

    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, kWaitMs);
    MemoryByteSource source(contents);
    TransferResult result = coordinator.Upload("config.cfg", source);
    server_.Join();

    EXPECT_TRUE(result.Succeeded()) << result.message;
    EXPECT_EQ(result.blocks, 3u);
    EXPECT_EQ(coordinator.GetContext().blksize, 8);
    EXPECT_EQ(coordinator.GetContext().tsize, 20u);
}

TEST_F(TransferCoordinatorTest, ErrorOnFirstReplyStartsNoTransfer) {
    server_.Run([](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        server.Reply(CreateError(ErrorCode::kFileNotFound, "File not found"));

        Packet unexpected;
        EXPECT_FALSE(server.Receive(unexpected)) << "client answered an ERROR packet";
    });

    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, kWaitMs);
    std::vector<uint8_t> output;
    MemoryByteSink sink(output);
    TransferResult result = coordinator.Download("missing", sink);
    server_.Join();

    EXPECT_EQ(result.state, TransferState::kAborted);
    EXPECT_EQ(result.failure, FailureKind::kProtocol);
    EXPECT_EQ(result.error_code, 1);
    EXPECT_EQ(result.message, "File not found");
    EXPECT_TRUE(output.empty());
}

TEST_F(TransferCoordinatorTest, AckOnReadPathIsProtocolFailure) {
    server_.Run([](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        server.Reply(CreateAck(0));
    });

    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, kWaitMs);
    std::vector<uint8_t> output;
    MemoryByteSink sink(output);
    TransferResult result = coordinator.Download("file", sink);
    server_.Join();

    EXPECT_EQ(result.failure, FailureKind::kProtocol);
    EXPECT_EQ(result.error_code, 0);
    EXPECT_EQ(result.message, "Unexpected ACK packet in reply to RRQ");
}

TEST_F(TransferCoordinatorTest, NonZeroAckOnWritePathIsProtocolFailure) {
    server_.Run([](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        server.Reply(CreateAck(1));
    });

    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, kWaitMs);
    std::vector<uint8_t> contents = Pattern(10);
    MemoryByteSource source(contents);
    TransferResult result = coordinator.Upload("file", source);
    server_.Join();

    EXPECT_EQ(result.failure, FailureKind::kProtocol);
    EXPECT_THAT(result.message, HasSubstr("ACK 1"));
}

TEST_F(TransferCoordinatorTest, ReplyFromAnotherHostIsIgnored) {
    UdpSocket stranger;
    if (!stranger.Create() || !stranger.Bind(SocketAddress("127.0.0.2", 0))) {
        GTEST_SKIP() << "127.0.0.2 is not routed to loopback";
    }
    std::vector<uint8_t> contents = Pattern(30);

    server_.Run([&stranger, &contents](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        std::vector<uint8_t> error = Serialize(CreateError(ErrorCode::kAccessViolation, "Go away"));
        stranger.SendTo(error.data(), error.size(), server.GetClientAddress());
        EXPECT_TRUE(server.ServeFile(contents, kDefaultBlockSize));
    });

    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, kWaitMs);
    std::vector<uint8_t> output;
    MemoryByteSink sink(output);
    TransferResult result = coordinator.Download("file", sink);
    server_.Join();

    EXPECT_TRUE(result.Succeeded()) << result.message;
    EXPECT_EQ(output, contents);
}

TEST_F(TransferCoordinatorTest, SilentServerTimesOut) {
    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, 100);
    std::vector<uint8_t> output;
    MemoryByteSink sink(output);
    TransferResult result = coordinator.Download("file", sink);

    EXPECT_EQ(result.state, TransferState::kAborted);
    EXPECT_EQ(result.failure, FailureKind::kTimeout);
}

TEST_F(TransferCoordinatorTest, RunsOnlyOneTransfer) {
    TransferCoordinator coordinator(server_.GetRequestAddress(), options_, 50);
    std::vector<uint8_t> output;
    MemoryByteSink sink(output);
    coordinator.Download("file", sink);

    std::vector<uint8_t> contents;
    MemoryByteSource source(contents);
    EXPECT_THROW(coordinator.Upload("file", source), TftpException);
}

/**
 * @class TftpClientTest
 * @brief Facade: parameter validation, buffers and files, last error
 */
class TftpClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(server_.Open());
        client_.SetReceiveTimeout(kWaitMs);
        temp_dir_ = std::filesystem::temp_directory_path() /
                    ("tftpclient_test_" + std::to_string(server_.GetPort()));
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        server_.Join();
        std::error_code ec;
        std::filesystem::remove_all(temp_dir_, ec);
    }

    std::string TempPath(const std::string& name) const {
        return (temp_dir_ / name).string();
    }

    FakeServer server_;
    TftpClient client_;
    std::filesystem::path temp_dir_;
};

TEST_F(TftpClientTest, RejectsInvalidParameters) {
    std::vector<uint8_t> output;
    EXPECT_FALSE(client_.DownloadFile("tftp.example.com", "file", output, server_.GetPort()));
    EXPECT_THAT(client_.GetLastError(), HasSubstr("Invalid host"));

    EXPECT_FALSE(client_.DownloadFile("127.0.0.1", "", output, server_.GetPort()));
    EXPECT_THAT(client_.GetLastError(), HasSubstr("Invalid filename"));

    EXPECT_FALSE(client_.UploadFile("127.0.0.1", "file", std::vector<uint8_t>{1, 2}, 0));
    EXPECT_THAT(client_.GetLastError(), HasSubstr("Invalid port"));
}

TEST_F(TftpClientTest, SettersEnforceRanges) {
    EXPECT_THROW(client_.SetBlockSize(7), TftpException);
    EXPECT_THROW(client_.SetBlockSize(65465), TftpException);
    EXPECT_THROW(client_.SetReceiveTimeout(-1), TftpException);
    EXPECT_THROW(client_.SetReceiveTimeout(3600001), TftpException);

    client_.SetBlockSize(1428);
    client_.SetRequestTransferSize(true);
    EXPECT_EQ(*client_.GetRequestedOptions().GetBlockSize(), 1428);
    EXPECT_TRUE(client_.GetRequestedOptions().GetTransferSize());

    client_.ClearBlockSize();
    client_.SetRequestTransferSize(false);
    EXPECT_TRUE(client_.GetRequestedOptions().Empty());
}

TEST_F(TftpClientTest, DownloadIntoBuffer) {
    client_.SetBlockSize(1024);
    std::vector<uint8_t> contents = Pattern(2048);

    server_.Run([&contents](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        server.Reply(CreateOack({{"blksize", "1024"}}));
        Packet ack;
        ASSERT_TRUE(server.Receive(ack));
        EXPECT_TRUE(server.ServeFile(contents, 1024));
    });

    std::vector<uint8_t> output = {0xFF};  // cleared before the transfer
    ASSERT_TRUE(client_.DownloadFile("127.0.0.1", "blob", output, server_.GetPort()))
        << client_.GetLastError();
    server_.Join();

    EXPECT_EQ(output, contents);
    EXPECT_EQ(client_.GetLastResult().blocks, 3u);
    EXPECT_EQ(client_.GetLastError(), "No error");
}

TEST_F(TftpClientTest, ServerErrorIsReported) {
    server_.Run([](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        server.Reply(CreateError(ErrorCode::kAccessViolation, "Permission denied"));
    });

    std::vector<uint8_t> output;
    EXPECT_FALSE(client_.DownloadFile("127.0.0.1", "secret", output, server_.GetPort()));
    server_.Join();

    EXPECT_THAT(client_.GetLastError(), HasSubstr("Permission denied"));
    EXPECT_EQ(client_.GetLastResult().failure, FailureKind::kProtocol);
    EXPECT_EQ(client_.GetLastResult().error_code, 2);
}

TEST_F(TftpClientTest, DownloadToFileAndUploadFromFile) {
    std::vector<uint8_t> contents = Pattern(1500);

    server_.Run([&contents](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        EXPECT_TRUE(server.ServeFile(contents, kDefaultBlockSize));
    });

    const std::string local = TempPath("downloaded.bin");
    ASSERT_TRUE(client_.DownloadToFile("127.0.0.1", "remote.bin", local, server_.GetPort()))
        << client_.GetLastError();
    server_.Join();

    std::ifstream file(local, std::ios::binary);
    std::vector<uint8_t> written((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(written, contents);

    // Send the same file back
    server_.Run([&contents](FakeServer& server) {
        Packet request;
        ASSERT_TRUE(server.ReceiveRequest(request));
        server.Reply(CreateAck(0));
        std::vector<uint8_t> received;
        EXPECT_TRUE(server.CollectFile(kDefaultBlockSize, received));
        EXPECT_EQ(received, contents);
    });

    ASSERT_TRUE(client_.UploadFromFile("127.0.0.1", local, "copy.bin", server_.GetPort()))
        << client_.GetLastError();
    server_.Join();
    EXPECT_EQ(client_.GetLastResult().bytes_transferred, contents.size());
}

TEST_F(TftpClientTest, MissingLocalFileIsLocalFailure) {
    EXPECT_FALSE(client_.UploadFromFile("127.0.0.1", TempPath("does_not_exist"), "x", server_.GetPort()));
    EXPECT_EQ(client_.GetLastResult().failure, FailureKind::kLocalIo);
    EXPECT_FALSE(client_.GetLastError().empty());
}
