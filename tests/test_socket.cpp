/**
 * @file test_socket.cpp
 * @brief Tests for socket.hpp: SocketAddress, TcpSocket, TcpListener.
 */

#include <catch2/catch_test_macros.hpp>
#include "hostlink/socket.hpp"

#include <cstring>
#include <thread>

namespace {

/** Listening loopback socket on an OS-assigned port. */
hostlink::TcpListener MakeListener(uint16_t& port) {
  auto listener_r = hostlink::TcpListener::Create();
  REQUIRE(listener_r.has_value());
  hostlink::TcpListener listener =
      static_cast<hostlink::TcpListener&&>(listener_r.value());
  auto addr_r = hostlink::SocketAddress::FromIpv4("127.0.0.1", 0);
  REQUIRE(addr_r.has_value());
  REQUIRE(listener.Bind(addr_r.value()).has_value());
  REQUIRE(listener.Listen(4).has_value());
  auto port_r = listener.LocalPort();
  REQUIRE(port_r.has_value());
  port = port_r.value();
  REQUIRE(port > 0);
  return listener;
}

}  // namespace

// ============================================================================
// Create
// ============================================================================

TEST_CASE("socket - TcpSocket::Create succeeds", "[socket][tcp]") {
  auto result = hostlink::TcpSocket::Create();
  REQUIRE(result.has_value());
  REQUIRE(result.value().IsValid());
  REQUIRE(result.value().Fd() >= 0);
}

TEST_CASE("socket - TcpListener::Create succeeds", "[socket][tcp]") {
  auto result = hostlink::TcpListener::Create();
  REQUIRE(result.has_value());
  REQUIRE(result.value().IsValid());
}

// ============================================================================
// SocketAddress
// ============================================================================

TEST_CASE("socket - SocketAddress::FromIpv4 valid", "[socket][address]") {
  auto result = hostlink::SocketAddress::FromIpv4("127.0.0.1", 8080);
  REQUIRE(result.has_value());
  REQUIRE(result.value().Raw() != nullptr);
  REQUIRE(result.value().Size() == sizeof(sockaddr_in));
  REQUIRE(result.value().Port() == 8080);
}

TEST_CASE("socket - SocketAddress::FromIpv4 invalid returns error",
          "[socket][address]") {
  auto result = hostlink::SocketAddress::FromIpv4("not.an.ip.address", 80);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == hostlink::SocketError::kInvalidAddress);
}

TEST_CASE("socket - SocketAddress::Resolve literal and name",
          "[socket][address]") {
  auto literal = hostlink::SocketAddress::Resolve("10.0.2.2", 42699);
  REQUIRE(literal.has_value());
  REQUIRE(literal.value().Port() == 42699);

  auto local = hostlink::SocketAddress::Resolve("localhost", 42699);
  REQUIRE(local.has_value());
  REQUIRE(local.value().Port() == 42699);

  auto empty = hostlink::SocketAddress::Resolve("", 80);
  REQUIRE(!empty.has_value());
}

TEST_CASE("socket - SocketErrorToString", "[socket]") {
  REQUIRE(std::strlen(hostlink::SocketErrorToString(
              hostlink::SocketError::kConnectFailed)) > 0U);
  REQUIRE(std::strcmp(hostlink::SocketErrorToString(
                          hostlink::SocketError::kTimeout),
                      hostlink::SocketErrorToString(
                          hostlink::SocketError::kResolveFailed)) != 0);
}

// ============================================================================
// TcpSocket ownership
// ============================================================================

TEST_CASE("socket - TcpSocket move semantics", "[socket][tcp]") {
  auto result = hostlink::TcpSocket::Create();
  REQUIRE(result.has_value());

  hostlink::TcpSocket a = static_cast<hostlink::TcpSocket&&>(result.value());
  int original_fd = a.Fd();

  hostlink::TcpSocket b(static_cast<hostlink::TcpSocket&&>(a));
  REQUIRE(!a.IsValid());
  REQUIRE(b.Fd() == original_fd);

  hostlink::TcpSocket c;
  c = static_cast<hostlink::TcpSocket&&>(b);
  REQUIRE(!b.IsValid());
  REQUIRE(c.Fd() == original_fd);
}

TEST_CASE("socket - TcpSocket Close is idempotent", "[socket][tcp]") {
  auto result = hostlink::TcpSocket::Create();
  REQUIRE(result.has_value());
  hostlink::TcpSocket sock = static_cast<hostlink::TcpSocket&&>(result.value());

  sock.Close();
  REQUIRE(!sock.IsValid());
  sock.Close();
  REQUIRE(!sock.IsValid());

  char buf[4];
  auto r = sock.Recv(buf, sizeof(buf));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == hostlink::SocketError::kInvalidFd);
}

// ============================================================================
// Loopback
// ============================================================================

TEST_CASE("socket - ConnectTo, SendAll and Recv over loopback",
          "[socket][tcp][integration]") {
  uint16_t port = 0;
  hostlink::TcpListener listener = MakeListener(port);

  const char* msg = "hello agent";
  std::thread client_thread([port, msg]() {
    auto addr = hostlink::SocketAddress::FromIpv4("127.0.0.1", port);
    if (!addr.has_value()) return;
    auto client = hostlink::TcpSocket::ConnectTo(addr.value(), 1000);
    if (!client.has_value()) return;
    (void)client.value().SetNoDelay(true);
    (void)client.value().SendAll(msg, std::strlen(msg));
  });

  auto accept_r = listener.Accept();
  REQUIRE(accept_r.has_value());
  hostlink::TcpSocket accepted =
      static_cast<hostlink::TcpSocket&&>(accept_r.value());
  REQUIRE(accepted.SetRecvTimeout(2000).has_value());

  std::string got;
  char buf[64];
  for (;;) {
    auto recv_r = accepted.Recv(buf, sizeof(buf));
    REQUIRE(recv_r.has_value());
    if (recv_r.value() == 0) break;
    got.append(buf, static_cast<size_t>(recv_r.value()));
  }
  REQUIRE(got == msg);
  client_thread.join();
}

TEST_CASE("socket - ConnectTo a closed port fails", "[socket][tcp]") {
  uint16_t port = 0;
  {
    hostlink::TcpListener listener = MakeListener(port);
  }
  auto addr = hostlink::SocketAddress::FromIpv4("127.0.0.1", port);
  REQUIRE(addr.has_value());
  auto client = hostlink::TcpSocket::ConnectTo(addr.value(), 1000);
  REQUIRE(!client.has_value());
  REQUIRE(client.get_error() == hostlink::SocketError::kConnectFailed);
}

TEST_CASE("socket - Recv timeout reports kWouldBlock", "[socket][tcp]") {
  uint16_t port = 0;
  hostlink::TcpListener listener = MakeListener(port);
  auto addr = hostlink::SocketAddress::FromIpv4("127.0.0.1", port);
  REQUIRE(addr.has_value());
  auto client = hostlink::TcpSocket::ConnectTo(addr.value(), 1000);
  REQUIRE(client.has_value());
  REQUIRE(client.value().SetRecvTimeout(50).has_value());

  char buf[8];
  auto r = client.value().Recv(buf, sizeof(buf));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == hostlink::SocketError::kWouldBlock);
}
