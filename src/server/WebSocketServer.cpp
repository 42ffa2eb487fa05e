#include "WebSocketServer.hpp"

#include "BridgeErrors.hpp"
#include "LogHandler.hpp"
#include "ProtocolMessages.hpp"

namespace tcode {
WebSocketConnection::WebSocketConnection(tcp::socket&& socket,
                                         shared_ptr<ProtocolRouter> _router)
    : ws(std::move(socket)),
      id(ProtocolRouter::newConnectionId()),
      router(_router),
      writing(false),
      open(false),
      registered(false) {}

WebSocketConnection::~WebSocketConnection() {
  VLOG(1) << "Connection object destroyed: " << id;
}

void WebSocketConnection::run() {
  // Stay on the connection's strand for every handler below
  net::dispatch(ws.get_executor(), [self = shared_from_this()]() {
    self->ws.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::server));
    self->ws.set_option(
        websocket::stream_base::decorator([](websocket::response_type& res) {
          res.set(beast::http::field::server,
                  string("tcode-server/") + TCODE_VERSION);
        }));
    self->ws.async_accept(beast::bind_front_handler(
        &WebSocketConnection::onAccept, self));
  });
}

void WebSocketConnection::send(const string& payload) {
  net::post(ws.get_executor(),
            [self = shared_from_this(), payload]() { self->enqueue(payload); });
}

void WebSocketConnection::onAccept(beast::error_code ec) {
  if (ec) {
    LOG(WARNING) << "WebSocket handshake failed: " << ec.message();
    return;
  }
  open = true;
  registered = true;
  router->onConnectionOpened(id, shared_from_this());
  doRead();
}

void WebSocketConnection::doRead() {
  ws.async_read(buffer, beast::bind_front_handler(&WebSocketConnection::onRead,
                                                  shared_from_this()));
}

void WebSocketConnection::onRead(beast::error_code ec,
                                 std::size_t bytesTransferred) {
  if (ec) {
    handleClosed(ec == websocket::error::closed ? "closed by client"
                                                : ec.message());
    return;
  }
  string payload = beast::buffers_to_string(buffer.data());
  buffer.consume(bytesTransferred);

  try {
    router->handleMessage(id, payload);
  } catch (const ProtocolError& pe) {
    LOG(WARNING) << "[" << id << "] rejected message: " << pe.what();
    enqueue(ProtocolMessages::error(pe.what())
                .dump(-1, ' ', false, json::error_handler_t::replace));
  }
  doRead();
}

void WebSocketConnection::enqueue(string payload) {
  if (!open) {
    return;
  }
  sendQueue.push_back(std::move(payload));
  if (!writing) {
    writeNext();
  }
}

void WebSocketConnection::writeNext() {
  if (sendQueue.empty() || !open) {
    writing = false;
    return;
  }
  writing = true;
  ws.text(true);
  ws.async_write(net::buffer(sendQueue.front()),
                 beast::bind_front_handler(&WebSocketConnection::onWrite,
                                           shared_from_this()));
}

void WebSocketConnection::onWrite(beast::error_code ec,
                                  std::size_t bytesTransferred) {
  if (ec) {
    handleClosed("write failed: " + ec.message());
    return;
  }
  VLOG(2) << "[" << id << "] wrote " << bytesTransferred << " bytes";
  sendQueue.pop_front();
  writeNext();
}

void WebSocketConnection::handleClosed(const string& reason) {
  open = false;
  sendQueue.clear();
  writing = false;
  if (!registered) {
    return;
  }
  registered = false;
  LOG(INFO) << "[" << id << "] connection closed: " << reason;
  router->onConnectionClosed(id);
}

WebSocketServer::WebSocketServer(net::io_context& _ioContext,
                                 const string& bindIp, int port,
                                 shared_ptr<ProtocolRouter> _router)
    : ioContext(_ioContext), acceptor(net::make_strand(_ioContext)),
      router(_router) {
  beast::error_code ec;
  tcp::endpoint endpoint(net::ip::make_address(bindIp, ec), uint16_t(port));
  if (ec) {
    throw std::runtime_error("Invalid bind address " + bindIp + ": " +
                             ec.message());
  }
  acceptor.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor.set_option(net::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor.listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    throw std::runtime_error("Cannot listen on " + bindIp + ":" +
                             to_string(port) + ": " + ec.message());
  }
}

void WebSocketServer::start() {
  LOG(INFO) << "Listening on " << acceptor.local_endpoint();
  doAccept();
}

void WebSocketServer::stop() {
  beast::error_code ec;
  acceptor.close(ec);
  if (ec) {
    LOG(WARNING) << "Error closing listener: " << ec.message();
  }
}

uint16_t WebSocketServer::getPort() const {
  return acceptor.local_endpoint().port();
}

void WebSocketServer::doAccept() {
  acceptor.async_accept(
      net::make_strand(ioContext),
      beast::bind_front_handler(&WebSocketServer::onAccept, this));
}

void WebSocketServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    return;
  }
  if (ec) {
    LOG(WARNING) << "Accept failed: " << ec.message();
  } else {
    make_shared<WebSocketConnection>(std::move(socket), router)->run();
  }
  doAccept();
}
}  // namespace tcode
