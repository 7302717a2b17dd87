#ifndef RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_SOCKET_TRANSPORT_H
#define RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_SOCKET_TRANSPORT_H

#include <glog/logging.h>
#include <rdsync/common/errors.h>
#include <rdsync/transport/transport.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace rdsync {

/**
 * Transport over a connected Boost.Asio stream socket, used synchronously.
 */
template <typename Socket>
class SocketTransport final : public Transport {
  Socket socket_;

public:
  explicit SocketTransport(Socket socket) : socket_(std::move(socket)) {}

  std::streamsize ReadSome(void *buffer, std::streamsize size) override {
    boost::system::error_code error;
    auto count = socket_.read_some(boost::asio::buffer(buffer, size), error);
    if (error == boost::asio::error::eof) {
      return 0;
    }
    if (error) {
      throw TransportError("read failed: " + error.message());
    }
    return static_cast<std::streamsize>(count);
  }

  void WriteAll(const void *buffer, std::streamsize size) override {
    boost::system::error_code error;
    boost::asio::write(socket_, boost::asio::buffer(buffer, size), error);
    if (error) {
      throw TransportError("write failed: " + error.message());
    }
  }

  void ShutdownSend() override {
    boost::system::error_code error;
    socket_.shutdown(Socket::shutdown_send, error);
    LOG_IF(WARNING, error) << "shutdown failed: " << error.message();
  }

  void Close() override {
    boost::system::error_code error;
    socket_.close(error);
    LOG_IF(WARNING, error) << "close failed: " << error.message();
  }
};

using TcpTransport = SocketTransport<boost::asio::ip::tcp::socket>;

using LocalTransport =
    SocketTransport<boost::asio::local::stream_protocol::socket>;

/**
 * @throws TransportError if no endpoint of `host` accepts the connection
 */
std::unique_ptr<TcpTransport> ConnectTcp(
    boost::asio::io_context &io_context,
    const std::string &host,
    uint16_t port);

/**
 * waits for a single connection on `port`
 * @throws TransportError if the port cannot be bound
 */
std::unique_ptr<TcpTransport>
AcceptTcp(boost::asio::io_context &io_context, uint16_t port);

// two connected in-process transports
std::pair<std::unique_ptr<LocalTransport>, std::unique_ptr<LocalTransport>>
CreateLocalPair(boost::asio::io_context &io_context);

}  // namespace rdsync

#endif  // RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_SOCKET_TRANSPORT_H
