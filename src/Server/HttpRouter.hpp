#ifndef HTTP_ROUTER_HPP_
#define HTTP_ROUTER_HPP_

#include <boost/beast/http.hpp>
#include <string>
#include <variant>

#include "Credentials.hpp"
#include "HttpUtils.hpp"
#include "Service/TransferService.hpp"

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using StringResponse = http::response<http::string_body>;
using FileResponse = http::response<http::file_body>;
using HttpResponse = std::variant<StringResponse, FileResponse>;

/**
 * @brief Maps HTTP requests onto TransferService calls.
 *
 *   GET  /                          index page
 *   POST /download?sessionID=ID     form body locator=...
 *   GET  /progress?sessionID=ID
 *   POST /cancel?sessionID=ID
 *   GET  /sessions
 *   GET  /completed
 *   GET  /download/<sessionID|path> completed file as attachment
 *   GET  /files
 *
 * Socket free, so it can be driven directly from tests.
 */
class HttpRouter {
 public:
  HttpRouter(TransferService& service, Credentials credentials);

  HttpResponse handle(const HttpRequest& req) const;

 private:
  StringResponse index(const HttpRequest& req) const;
  StringResponse startDownload(const HttpRequest& req,
                               const RequestTarget& target) const;
  StringResponse progress(const HttpRequest& req,
                          const RequestTarget& target) const;
  StringResponse cancel(const HttpRequest& req,
                        const RequestTarget& target) const;
  StringResponse sessions(const HttpRequest& req) const;
  StringResponse completed(const HttpRequest& req) const;
  StringResponse files(const HttpRequest& req) const;
  HttpResponse fetch(const HttpRequest& req, const std::string& key) const;

  TransferService& service_;
  Credentials credentials_;
};

#endif  // HTTP_ROUTER_HPP_
