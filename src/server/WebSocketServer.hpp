#ifndef __TCODE_WEB_SOCKET_SERVER__
#define __TCODE_WEB_SOCKET_SERVER__

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "ClientChannel.hpp"
#include "Headers.hpp"
#include "ProtocolRouter.hpp"

namespace tcode {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

/**
 * @brief One browser WebSocket. Reads text frames into the router and
 * writes queued messages one at a time, all on the connection's strand.
 */
class WebSocketConnection
    : public ClientChannel,
      public std::enable_shared_from_this<WebSocketConnection> {
 public:
  WebSocketConnection(tcp::socket&& socket,
                      shared_ptr<ProtocolRouter> _router);
  virtual ~WebSocketConnection();

  /** @brief Performs the WebSocket handshake and starts reading. */
  void run();

  virtual void send(const string& payload);
  virtual bool isOpen() { return open; }

  const string& getId() const { return id; }

 protected:
  void onAccept(beast::error_code ec);
  void doRead();
  void onRead(beast::error_code ec, std::size_t bytesTransferred);
  void enqueue(string payload);
  void writeNext();
  void onWrite(beast::error_code ec, std::size_t bytesTransferred);
  void handleClosed(const string& reason);

  websocket::stream<beast::tcp_stream> ws;
  beast::flat_buffer buffer;
  string id;
  shared_ptr<ProtocolRouter> router;

  deque<string> sendQueue;
  bool writing;
  atomic<bool> open;
  bool registered;
};

/**
 * @brief Accepts WebSocket clients and hands each one to the router.
 */
class WebSocketServer {
 public:
  WebSocketServer(net::io_context& _ioContext, const string& bindIp, int port,
                  shared_ptr<ProtocolRouter> _router);

  void start();
  void stop();
  uint16_t getPort() const;

 protected:
  void doAccept();
  void onAccept(beast::error_code ec, tcp::socket socket);

  net::io_context& ioContext;
  tcp::acceptor acceptor;
  shared_ptr<ProtocolRouter> router;
};
}  // namespace tcode

#endif  // __TCODE_WEB_SOCKET_SERVER__
