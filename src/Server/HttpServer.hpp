#ifndef HTTP_SERVER_HPP_
#define HTTP_SERVER_HPP_

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <memory>
#include <string>

#include "HttpRouter.hpp"

// Asynchronous HTTP/1.1 listener running on a small io_context thread
// group. run() returns after SIGINT/SIGTERM or stop().
class HttpServer {
 public:
  HttpServer(const HttpRouter& router, const std::string& address,
             unsigned short port, int threads);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  void run();
  void stop();

 private:
  void doAccept();

  const HttpRouter& router_;
  int threads_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::signal_set signals_;
};

#endif  // HTTP_SERVER_HPP_
