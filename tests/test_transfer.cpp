#include <gtest/gtest.h>
#include <thread>
#include "transfer.hpp"
#include "security.hpp"
#include "protocol/request.hpp"
#include "test_util.hpp"

using boost::asio::ip::tcp;

namespace {

// A connected loopback pair: `client` talks to `server`
struct SocketPair {
    boost::asio::io_context io;
    tcp::socket client{io};
    tcp::socket server{io};

    SocketPair() {
        tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        client.connect(acceptor.local_endpoint());
        acceptor.accept(server);
    }
};

protocol::FileInfo info_for(const std::string& name, const std::string& body) {
    return protocol::FileInfo{name, body.size(), security::sha256_hex(body)};
}

std::string read_to_close(tcp::socket& socket) {
    return transfer::MessageReceiver::receive_until_close(socket, 1024, std::chrono::seconds(5));
}

} // namespace

TEST(Transfer, HeaderStopsAtNewline) {
    SocketPair pair;
    transfer::MessageSender::send(pair.client, "{\"a\":1}\nrest");
    auto header = transfer::MessageReceiver::receive_header(pair.server, 1024);
    EXPECT_EQ(header.text, "{\"a\":1}\n");
    EXPECT_TRUE(header.delimited);
    EXPECT_FALSE(header.overflow);
    EXPECT_EQ(transfer::MessageReceiver::receive_exact(pair.server, 4), "rest");
}

TEST(Transfer, HeaderOverflowAndClose) {
    SocketPair pair;
    transfer::MessageSender::send(pair.client, std::string(32, 'x'));
    auto header = transfer::MessageReceiver::receive_header(pair.server, 16);
    EXPECT_TRUE(header.overflow);
    EXPECT_EQ(header.text.size(), 16u);

    SocketPair closed;
    closed.client.close();
    auto empty = transfer::MessageReceiver::receive_header(closed.server, 16);
    EXPECT_TRUE(empty.text.empty());
    EXPECT_FALSE(empty.delimited);
}

TEST(Transfer, HeaderReadTimesOut) {
    SocketPair pair;
    transfer::MessageSender::send(pair.client, "{\"partial\"");
    auto start = std::chrono::steady_clock::now();
    auto header = transfer::MessageReceiver::receive_header(pair.server, 1024, std::chrono::milliseconds(100));
    EXPECT_EQ(header.text, "{\"partial\"");
    EXPECT_FALSE(header.delimited);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(Transfer, ReceivesAndVerifiesFile) {
    testutil::TempDir dir;
    SocketPair pair;
    const std::string body = "col1,col2\n1,2\n3,4\n";

    std::vector<uint64_t> progress;
    transfer::TransferResult result;
    std::thread server([&]() {
        transfer::ReceiveOptions options;
        options.chunk_size = 4;
        result = transfer::MessageReceiver::receive_file(pair.server, dir.path(), info_for("run.csv", body), options,
            [&](const std::string&, uint64_t done, uint64_t, double) { progress.push_back(done); });
        pair.server.close();
    });

    EXPECT_EQ(transfer::MessageReceiver::receive_exact(pair.client, 3), "ACK");
    transfer::MessageSender::send(pair.client, body);
    EXPECT_EQ(read_to_close(pair.client), "EOF_OK");
    server.join();

    EXPECT_EQ(result.state, transfer::TransferState::COMPLETED);
    EXPECT_TRUE(result.checksum_ok);
    EXPECT_EQ(result.session.bytes_received, body.size());
    EXPECT_EQ(testutil::read_file(dir.file("run.csv")), body);
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.back(), body.size());
}

TEST(Transfer, ChecksumMismatchKeepsFile) {
    testutil::TempDir dir;
    SocketPair pair;
    protocol::FileInfo info{"bad.bin", 4, std::string(64, '0')};

    transfer::TransferResult result;
    std::thread server([&]() {
        result = transfer::MessageReceiver::receive_file(pair.server, dir.path(), info);
        pair.server.close();
    });
    EXPECT_EQ(transfer::MessageReceiver::receive_exact(pair.client, 3), "ACK");
    transfer::MessageSender::send(pair.client, "abcd");
    EXPECT_EQ(read_to_close(pair.client), "ERR_CHECKSUM\n");
    server.join();

    EXPECT_EQ(result.state, transfer::TransferState::COMPLETED);
    EXPECT_FALSE(result.checksum_ok);
    EXPECT_EQ(testutil::read_file(dir.file("bad.bin")), "abcd");
}

TEST(Transfer, ShortTransferIsReported) {
    testutil::TempDir dir;
    SocketPair pair;
    const std::string body = "0123456789";

    transfer::TransferResult result;
    std::thread server([&]() {
        result = transfer::MessageReceiver::receive_file(pair.server, dir.path(), info_for("short.bin", body));
        pair.server.close();
    });
    EXPECT_EQ(transfer::MessageReceiver::receive_exact(pair.client, 3), "ACK");
    transfer::MessageSender::send(pair.client, body.substr(0, 4));
    pair.client.shutdown(tcp::socket::shutdown_send);
    EXPECT_EQ(read_to_close(pair.client), "ERR_CHECKSUM\n");
    server.join();

    EXPECT_EQ(result.state, transfer::TransferState::SHORT);
    EXPECT_EQ(result.session.bytes_received, 4u);
    EXPECT_EQ(testutil::read_file(dir.file("short.bin")), "0123");
}

TEST(Transfer, SameNameUploadsDoNotInterleave) {
    testutil::TempDir dir;
    const std::string first(4000, 'a');
    const std::string second(4000, 'b');
    SocketPair a;
    SocketPair b;

    transfer::TransferResult result_a, result_b;
    transfer::ReceiveOptions options;
    options.chunk_size = 512;
    std::thread server_a([&]() {
        result_a = transfer::MessageReceiver::receive_file(a.server, dir.path(), info_for("same.bin", first), options);
        a.server.close();
    });
    std::thread server_b([&]() {
        result_b = transfer::MessageReceiver::receive_file(b.server, dir.path(), info_for("same.bin", second), options);
        b.server.close();
    });

    EXPECT_EQ(transfer::MessageReceiver::receive_exact(a.client, 3), "ACK");
    EXPECT_EQ(transfer::MessageReceiver::receive_exact(b.client, 3), "ACK");
    transfer::MessageSender::send(a.client, first.substr(0, 2000));
    transfer::MessageSender::send(b.client, second.substr(0, 2000));
    transfer::MessageSender::send(b.client, second.substr(2000));
    EXPECT_EQ(read_to_close(b.client), "EOF_OK");
    server_b.join();
    EXPECT_EQ(testutil::read_file(dir.file("same.bin")), second);

    transfer::MessageSender::send(a.client, first.substr(2000));
    EXPECT_EQ(read_to_close(a.client), "EOF_OK");
    server_a.join();

    EXPECT_EQ(result_a.state, transfer::TransferState::COMPLETED);
    EXPECT_EQ(result_b.state, transfer::TransferState::COMPLETED);
    EXPECT_EQ(testutil::read_file(dir.file("same.bin")), first);

    // Nothing but the finished upload is left behind
    std::size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST(Transfer, ZeroByteFile) {
    testutil::TempDir dir;
    SocketPair pair;
    transfer::TransferResult result;
    std::thread server([&]() {
        result = transfer::MessageReceiver::receive_file(pair.server, dir.path(), info_for("empty.txt", ""));
        pair.server.close();
    });
    EXPECT_EQ(read_to_close(pair.client), "ACKEOF_OK");
    server.join();
    EXPECT_TRUE(result.checksum_ok);
    EXPECT_TRUE(std::filesystem::exists(dir.file("empty.txt")));
}

TEST(Transfer, TraversalNameStaysInDestination) {
    testutil::TempDir dir;
    std::filesystem::create_directories(dir.path() / "dest");
    SocketPair pair;
    transfer::TransferResult result;
    std::thread server([&]() {
        result = transfer::MessageReceiver::receive_file(pair.server, dir.path() / "dest",
                                                         info_for("../../escape.txt", "hi"));
        pair.server.close();
    });
    EXPECT_EQ(transfer::MessageReceiver::receive_exact(pair.client, 3), "ACK");
    transfer::MessageSender::send(pair.client, "hi");
    EXPECT_EQ(read_to_close(pair.client), "EOF_OK");
    server.join();

    EXPECT_EQ(result.session.filename, "escape.txt");
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "dest" / "escape.txt"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "escape.txt"));
}

TEST(Transfer, UnusableNameIsRejectedBeforeAck) {
    testutil::TempDir dir;
    SocketPair pair;
    transfer::TransferResult result;
    std::thread server([&]() {
        result = transfer::MessageReceiver::receive_file(pair.server, dir.path(), info_for("..", "x"));
        pair.server.close();
    });
    EXPECT_EQ(read_to_close(pair.client), "ERR_INCOMPLETE_HEADER\n");
    server.join();
    EXPECT_EQ(result.state, transfer::TransferState::REJECTED);
}

TEST(Transfer, SenderStreamsFile) {
    testutil::TempDir dir;
    const std::string body(10000, 'z');
    testutil::write_file(dir.file("src.bin"), body);

    SocketPair pair;
    uint64_t last = 0;
    EXPECT_TRUE(transfer::MessageSender::send_file(pair.client, dir.file("src.bin"), 1024,
        [&](const std::string&, uint64_t done, uint64_t, double) { last = done; }));
    pair.client.shutdown(tcp::socket::shutdown_send);
    EXPECT_EQ(transfer::MessageReceiver::receive_until_close(pair.server, 20000), body);
    EXPECT_EQ(last, body.size());

    EXPECT_FALSE(transfer::MessageSender::send_file(pair.client, dir.file("missing.bin")));
}
