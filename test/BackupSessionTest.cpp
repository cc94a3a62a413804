#include <gtest/gtest.h>

#include <memory>

#include "BackupServerFixture.hpp"
#include "BackupSession.hpp"

namespace {

class BackupSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("session-%%%%-%%%%");
        boost::filesystem::create_directories(dir_);
        server_ = std::make_unique<BackupServerFixture>(dir_);
    }

    void TearDown() override {
        session_.close();
        server_.reset();
        boost::system::error_code ec;
        boost::filesystem::remove_all(dir_, ec);
    }

    boost::filesystem::path dir_;
    std::unique_ptr<BackupServerFixture> server_;
    BackupSession session_;
    ClientIdentity identity_{ 42, kClientVersion };
};

}

TEST_F(BackupSessionTest, StartsDisconnected) {
    EXPECT_EQ(session_.state(), BackupSession::State::Disconnected);
    EXPECT_FALSE(session_.isConnected());
}

TEST_F(BackupSessionTest, SendWhileDisconnectedIsAStateError) {
    EXPECT_THROW(session_.sendRequest(identity_, ListRequest{}), SessionStateError);
    EXPECT_THROW(session_.receiveResponse(), SessionStateError);
}

TEST_F(BackupSessionTest, ConnectAndClose) {
    session_.connect("127.0.0.1", server_->port());
    EXPECT_EQ(session_.state(), BackupSession::State::Connected);

    session_.close();
    EXPECT_EQ(session_.state(), BackupSession::State::Disconnected);
    EXPECT_THROW(session_.sendRequest(identity_, ListRequest{}), SessionStateError);

    session_.close();
    EXPECT_FALSE(session_.isConnected());
}

TEST_F(BackupSessionTest, ConnectTwiceIsAStateError) {
    session_.connect("127.0.0.1", server_->port());
    EXPECT_THROW(session_.connect("127.0.0.1", server_->port()), SessionStateError);
    EXPECT_TRUE(session_.isConnected());
}

TEST_F(BackupSessionTest, ConnectionRefusedIsATransportError) {
    unsigned short port = 0;
    {
        // grab a port nobody listens on
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor probe(io, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
        port = probe.local_endpoint().port();
    }
    EXPECT_THROW(session_.connect("127.0.0.1", port), TransportError);
    EXPECT_FALSE(session_.isConnected());
}

TEST_F(BackupSessionTest, OneExchangeOverLoopback) {
    session_.connect("127.0.0.1", server_->port());

    session_.sendRequest(identity_, ListRequest{});
    Response resp = session_.receiveResponse();

    EXPECT_TRUE(resp.hasStatus(Status::ErrNoFiles));
    EXPECT_EQ(resp.version, kClientVersion);
    ASSERT_EQ(server_->requests().size(), 1u);
    EXPECT_EQ(server_->requests()[0].userId, 42u);
    EXPECT_EQ(server_->requests()[0].op, static_cast<uint8_t>(OpCode::List));
    EXPECT_EQ(server_->requests()[0].nameLen, 0);
}

TEST_F(BackupSessionTest, PeerClosingMidResponseIsEndOfStream) {
    server_->setResponder([](const ReceivedRequest&) {
        std::vector<char> partial = BackupServerFixture::response(1, 210, "f", std::string("hello"));
        partial.resize(partial.size() - 2);
        return ScriptedReply{ partial, true };
    });
    session_.connect("127.0.0.1", server_->port());

    session_.sendRequest(identity_, RestoreRequest{ "f" });
    EXPECT_THROW(session_.receiveResponse(), EndOfStream);
}
