#include <glog/logging.h>
#include <rdsync/transport/socket_transport.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/local/connect_pair.hpp>

namespace rdsync {

using boost::asio::ip::tcp;

std::unique_ptr<TcpTransport> ConnectTcp(
    boost::asio::io_context &io_context,
    const std::string &host,
    uint16_t port) {
  boost::system::error_code error;

  tcp::resolver resolver(io_context);
  auto endpoints = resolver.resolve(host, std::to_string(port), error);
  if (error) {
    throw TransportError("cannot resolve " + host + ": " + error.message());
  }

  tcp::socket socket(io_context);
  boost::asio::connect(socket, endpoints, error);
  if (error) {
    throw TransportError(
        "cannot connect to " + host + ":" + std::to_string(port) + ": " +
        error.message());
  }

  LOG(INFO) << "connected to " << host << ":" << port;
  return std::make_unique<TcpTransport>(std::move(socket));
}

std::unique_ptr<TcpTransport>
AcceptTcp(boost::asio::io_context &io_context, uint16_t port) {
  boost::system::error_code error;

  tcp::acceptor acceptor(io_context);
  tcp::endpoint endpoint(tcp::v4(), port);
  acceptor.open(endpoint.protocol(), error);
  if (!error) {
    acceptor.set_option(tcp::acceptor::reuse_address(true), error);
  }
  if (!error) {
    acceptor.bind(endpoint, error);
  }
  if (!error) {
    acceptor.listen(1, error);
  }
  if (error) {
    throw TransportError(
        "cannot listen on port " + std::to_string(port) + ": " +
        error.message());
  }

  LOG(INFO) << "waiting for a connection on port " << port;

  tcp::socket socket(io_context);
  acceptor.accept(socket, error);
  if (error) {
    throw TransportError("accept failed: " + error.message());
  }

  LOG(INFO) << "accepted connection from " << socket.remote_endpoint(error);
  return std::make_unique<TcpTransport>(std::move(socket));
}

std::pair<std::unique_ptr<LocalTransport>, std::unique_ptr<LocalTransport>>
CreateLocalPair(boost::asio::io_context &io_context) {
  boost::asio::local::stream_protocol::socket first(io_context);
  boost::asio::local::stream_protocol::socket second(io_context);

  boost::system::error_code error;
  boost::asio::local::connect_pair(first, second, error);
  if (error) {
    throw TransportError("cannot create socket pair: " + error.message());
  }

  return {
      std::make_unique<LocalTransport>(std::move(first)),
      std::make_unique<LocalTransport>(std::move(second))};
}

}  // namespace rdsync
