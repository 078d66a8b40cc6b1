#include "HttpServer.hpp"

#include <algorithm>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <chrono>
#include <csignal>
#include <exception>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "logger.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(30);

// 单个 HTTP 连接：读请求 -> 路由 -> 写响应，支持 keep-alive
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
 public:
  HttpConnection(tcp::socket&& socket, const HttpRouter& router)
      : stream_(std::move(socket)), router_(router) {}

  void start() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpConnection::doRead,
                                            shared_from_this()));
  }

 private:
  void doRead() {
    req_ = {};
    stream_.expires_after(kReadTimeout);
    http::async_read(stream_, buffer_, req_,
                     beast::bind_front_handler(&HttpConnection::onRead,
                                               shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) return doClose();
    if (ec) {
      if (ec != beast::error::timeout) {
        LOG(DEBUG) << "read: " << ec.message();
      }
      return;
    }

    HttpResponse response;
    try {
      response = router_.handle(req_);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Handler for " << req_.target() << " threw: " << e.what();
      StringResponse res{http::status::internal_server_error, req_.version()};
      res.set(http::field::content_type, "text/plain");
      res.keep_alive(false);
      res.body() = "internal error\n";
      res.prepare_payload();
      response = std::move(res);
    }
    std::visit([this](auto& res) { this->send(std::move(res)); }, response);
  }

  template <class Response>
  void send(Response&& res) {
    auto sp = std::make_shared<std::decay_t<Response>>(std::move(res));
    bool close = sp->need_eof();
    response_ = sp;
    http::async_write(stream_, *sp,
                      beast::bind_front_handler(&HttpConnection::onWrite,
                                                shared_from_this(), close));
  }

  void onWrite(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
      LOG(DEBUG) << "write: " << ec.message();
      return;
    }
    if (close) return doClose();
    response_.reset();
    doRead();
  }

  void doClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  HttpRequest req_;
  std::shared_ptr<void> response_;
  const HttpRouter& router_;
};

}  // namespace

HttpServer::HttpServer(const HttpRouter& router, const std::string& address,
                       unsigned short port, int threads)
    : router_(router),
      threads_(std::max(1, threads)),
      ioc_(threads_),
      acceptor_(net::make_strand(ioc_)),
      signals_(ioc_, SIGINT, SIGTERM) {
  tcp::endpoint endpoint(net::ip::make_address(address), port);
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);
  LOG(INFO) << "Listening on http://" << address << ":" << port;
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::run() {
  signals_.async_wait([this](const beast::error_code& ec, int signal) {
    if (ec) return;
    LOG(INFO) << "Received signal " << signal << ", shutting down";
    stop();
  });
  doAccept();

  std::vector<std::thread> pool;
  pool.reserve(threads_ - 1);
  for (int i = 1; i < threads_; ++i) {
    pool.emplace_back([this]() { ioc_.run(); });
  }
  ioc_.run();
  for (auto& t : pool) t.join();
}

void HttpServer::stop() { ioc_.stop(); }

void HttpServer::doAccept() {
  acceptor_.async_accept(
      net::make_strand(ioc_),
      [this](beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (ec) {
          LOG(WARN) << "accept: " << ec.message();
        } else {
          std::make_shared<HttpConnection>(std::move(socket), router_)->start();
        }
        doAccept();
      });
}
