#include <gtest/gtest.h>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <thread>

#include "sockd/Connection.hpp"
#include "sockd/ControlProtocol.hpp"
#include "sockd/ServiceError.hpp"
#include "sockd/SocketTransport.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// Оставляет на диске файл сокета без владельца, как после аварийного завершения
void leaveStaleSocket(const std::string& path) {
  int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  ASSERT_GE(fd, 0);
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
  ASSERT_EQ(::listen(fd, 1), 0);
  ::close(fd);
}

std::pair<sockd::Connection, sockd::Connection> connectedPair() {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
    throw std::system_error(errno, std::system_category(), "socketpair");
  }
  return {sockd::Connection(fds[0]), sockd::Connection(fds[1])};
}

}  // namespace

TEST(ControlProtocolTest, FrameAppendsCrLf) {
  EXPECT_EQ(sockd::protocol::frame("ping"), "ping\r\n");
  EXPECT_EQ(sockd::protocol::frame(""), "\r\n");
}

TEST(ControlProtocolTest, TrimRemovesOneTerminator) {
  using sockd::protocol::trimFrame;
  EXPECT_EQ(trimFrame("pong\r\n"), "pong");
  EXPECT_EQ(trimFrame("pong\n"), "pong");
  EXPECT_EQ(trimFrame("pong\r"), "pong");
  EXPECT_EQ(trimFrame("pong"), "pong");
  EXPECT_EQ(trimFrame("a\r\nb"), "a\r\nb");
  EXPECT_EQ(trimFrame("line\n\n"), "line\n");
  EXPECT_EQ(trimFrame(""), "");
}

TEST(ControlProtocolTest, PingIsRecognizedWithAnyTerminator) {
  EXPECT_TRUE(sockd::protocol::isPing("ping\r\n"));
  EXPECT_TRUE(sockd::protocol::isPing("ping\n"));
  EXPECT_TRUE(sockd::protocol::isPing("ping"));
  EXPECT_FALSE(sockd::protocol::isPing("ping me\r\n"));
  EXPECT_FALSE(sockd::protocol::isPing("PING\r\n"));
}

TEST(ConnectionTest, PeekDoesNotConsume) {
  auto [client, server] = connectedPair();
  client.writeFrame("hello");

  ASSERT_TRUE(server.waitReadable(1s));
  EXPECT_EQ(server.peek(sockd::protocol::kPeekSize), "hello\r\n");
  EXPECT_EQ(server.peek(3), "hel");

  auto line = server.readLine(1s);
  ASSERT_TRUE(line.has_value());
  EXPECT_EQ(*line, "hello\r\n");
}

TEST(ConnectionTest, ReadLineTimesOutWithoutTerminator) {
  auto [client, server] = connectedPair();
  client.write("partial");
  EXPECT_FALSE(server.readLine(200ms).has_value());
}

TEST(ConnectionTest, ReadLineReturnsRestOnPeerClose) {
  auto [client, server] = connectedPair();
  client.write("tail");
  client.close();

  auto line = server.readLine(1s);
  ASSERT_TRUE(line.has_value());
  EXPECT_EQ(*line, "tail");
}

TEST(ConnectionTest, WriteToClosedPeerThrowsInsteadOfSigpipe) {
  auto [client, server] = connectedPair();
  server.close();
  EXPECT_THROW(
      {
        for (int i = 0; i < 100; ++i) client.write(std::string(4096, 'x'));
      },
      std::system_error);
}

TEST(ConnectionTest, DiscardPendingEmptiesBuffer) {
  auto [client, server] = connectedPair();
  client.write("unread data\r\n");
  ASSERT_TRUE(server.waitReadable(1s));

  server.discardPending();
  EXPECT_FALSE(server.waitReadable(50ms));
}

TEST(ConnectionTest, MoveTransfersOwnership) {
  auto [client, server] = connectedPair();
  const int fd = client.fd();

  sockd::Connection moved(std::move(client));
  EXPECT_FALSE(client.isOpen());
  EXPECT_EQ(moved.fd(), fd);
}

class UnixTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("sockd_transport_" + std::to_string(getpid()));
    fs::create_directories(dir_);
    path_ = (dir_ / (std::string(::testing::UnitTest::GetInstance()
                                     ->current_test_info()
                                     ->name()) +
                     ".sock"))
                .string();
    fs::remove(path_);
    config_.useUnixSocket(path_);
    config_.reclaimTimeout = 1s;
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
  std::string path_;
  sockd::ServiceConfig config_;
};

TEST_F(UnixTransportTest, OpensSocketWithConfiguredMode) {
  config_.socketMode = 0600;
  sockd::ServerSocket server = sockd::SocketTransport::openServer(config_);

  EXPECT_TRUE(server.isOpen());
  EXPECT_EQ(server.address(), path_);
  EXPECT_EQ(server.port(), 0);

  struct stat st {};
  ASSERT_EQ(::stat(path_.c_str(), &st), 0);
  EXPECT_TRUE(S_ISSOCK(st.st_mode));
  EXPECT_EQ(st.st_mode & 07777, 0600u);
}

TEST_F(UnixTransportTest, ZeroModeLeavesPermissionsAlone) {
  config_.socketMode = 0;
  const mode_t previous = ::umask(022);
  sockd::ServerSocket server = sockd::SocketTransport::openServer(config_);
  ::umask(previous);

  struct stat st {};
  ASSERT_EQ(::stat(path_.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0755u);
}

TEST_F(UnixTransportTest, ClientExchangesOneFrame) {
  sockd::ServerSocket server = sockd::SocketTransport::openServer(config_);

  std::thread peer([&server] {
    sockd::Connection conn = server.accept();
    auto request = conn.readLine(2s);
    conn.writeFrame("echo " + sockd::protocol::trimFrame(request.value_or("")));
  });

  sockd::Connection client = sockd::SocketTransport::openClient(config_, 1s);
  client.writeFrame("hello");
  auto reply = client.readLine(2s);
  peer.join();

  ASSERT_TRUE(reply.has_value());
  EXPECT_EQ(*reply, "echo hello\r\n");
}

TEST_F(UnixTransportTest, ReclaimsStaleSocketPath) {
  leaveStaleSocket(path_);
  ASSERT_TRUE(fs::exists(path_));

  sockd::ServerSocket server;
  EXPECT_NO_THROW(server = sockd::SocketTransport::openServer(config_));
  EXPECT_TRUE(server.isOpen());

  // Новый сокет принимает соединения
  EXPECT_NO_THROW(sockd::SocketTransport::openClient(config_, 1s));
}

TEST_F(UnixTransportTest, LivePeerKeepsItsSocket) {
  sockd::ServerSocket owner = sockd::SocketTransport::openServer(config_);
  std::thread peer([&owner] {
    sockd::Connection conn = owner.accept();
    if (sockd::protocol::isPing(conn.peek(sockd::protocol::kPeekSize))) {
      conn.writeFrame(sockd::protocol::kPongResponse);
    }
  });

  try {
    sockd::SocketTransport::openServer(config_);
    ADD_FAILURE() << "expected SocketInUse";
  } catch (const sockd::ServiceError& e) {
    EXPECT_EQ(e.kind(), sockd::ErrorKind::SocketInUse);
    EXPECT_NE(std::string(e.what()).find(path_), std::string::npos);
  }
  peer.join();

  EXPECT_TRUE(fs::exists(path_));
}

TEST_F(UnixTransportTest, UnresponsivePeerIsTreatedAsStale) {
  // Слушает, но никогда не отвечает
  sockd::ServerSocket silent = sockd::SocketTransport::openServer(config_);
  config_.reclaimTimeout = 300ms;

  sockd::ServerSocket server;
  EXPECT_NO_THROW(server = sockd::SocketTransport::openServer(config_));
  EXPECT_TRUE(server.isOpen());
}

TEST_F(UnixTransportTest, RegularFileIsNotRemoved) {
  std::ofstream(path_) << "data";

  EXPECT_THROW(sockd::SocketTransport::openServer(config_), std::system_error);
  EXPECT_TRUE(fs::is_regular_file(path_));
}

TEST_F(UnixTransportTest, ClientOnMissingPathFailsWithSystemError) {
  try {
    sockd::SocketTransport::openClient(config_, 1s);
    ADD_FAILURE() << "expected std::system_error";
  } catch (const std::system_error& e) {
    EXPECT_EQ(e.code().value(), ENOENT);
  }
  EXPECT_FALSE(sockd::SocketTransport::probe(config_, 200ms));
}

TEST_F(UnixTransportTest, ProbeSeesPongFromLivePeer) {
  sockd::ServerSocket owner = sockd::SocketTransport::openServer(config_);
  std::thread peer([&owner] {
    sockd::Connection conn = owner.accept();
    conn.readLine(1s);
    conn.writeFrame(sockd::protocol::kPongResponse);
  });

  EXPECT_TRUE(sockd::SocketTransport::probe(config_, 1s));
  peer.join();
}

TEST_F(UnixTransportTest, UnwritableDirectoryReportsPermissionError) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "root bypasses directory permissions";
  }
  const fs::path locked = dir_ / "locked";
  fs::create_directories(locked);
  fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_exec);
  config_.useUnixSocket((locked / "control.sock").string());

  try {
    sockd::SocketTransport::openServer(config_);
    ADD_FAILURE() << "expected TransportPermissionError";
  } catch (const sockd::ServiceError& e) {
    EXPECT_EQ(e.kind(), sockd::ErrorKind::TransportPermissionError);
    EXPECT_NE(std::string(e.what()).find("check permissions"), std::string::npos);
  }
  fs::permissions(locked, fs::perms::owner_all);
}

TEST(TcpTransportTest, BindsEphemeralPortAndAcceptsClient) {
  sockd::ServiceConfig config;
  config.useTcp("127.0.0.1", 0);

  sockd::ServerSocket server = sockd::SocketTransport::openServer(config);
  const std::uint16_t port = server.port();
  ASSERT_GT(port, 0);
  EXPECT_EQ(server.address(), "127.0.0.1:" + std::to_string(port));

  config.port = port;
  std::thread peer([&server] {
    sockd::Connection conn = server.accept();
    conn.readLine(1s);
    conn.writeFrame(sockd::protocol::kPongResponse);
  });

  EXPECT_TRUE(sockd::SocketTransport::probe(config, 1s));
  peer.join();
}

TEST(TcpTransportTest, BusyPortIsReportedAsSocketInUse) {
  sockd::ServiceConfig config;
  config.useTcp("127.0.0.1", 0);
  sockd::ServerSocket first = sockd::SocketTransport::openServer(config);
  config.port = first.port();

  try {
    sockd::SocketTransport::openServer(config);
    ADD_FAILURE() << "expected SocketInUse";
  } catch (const sockd::ServiceError& e) {
    EXPECT_EQ(e.kind(), sockd::ErrorKind::SocketInUse);
  }
}

TEST(TcpTransportTest, RefusedConnectionIsSystemError) {
  sockd::ServiceConfig config;
  config.useTcp("127.0.0.1", 0);
  std::uint16_t port;
  {
    sockd::ServerSocket probe = sockd::SocketTransport::openServer(config);
    port = probe.port();
  }
  config.port = port;

  EXPECT_THROW(sockd::SocketTransport::openClient(config, 500ms), std::system_error);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
