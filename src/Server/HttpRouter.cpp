#include "HttpRouter.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <tuple>
#include <utility>

#include "logger.hpp"
#include "string_utils.hpp"

using json = nlohmann::json;
namespace beast = boost::beast;

namespace {

constexpr const char* kServerName = "transfer-session-server";
constexpr const char* kRealm = "Please enter your username and password.";
constexpr const char* kDownloadPrefix = "/download/";

const char* kIndexPage = R"html(<!DOCTYPE html>
<html>
<head><meta charset="UTF-8"><title>Transfer Sessions</title></head>
<body>
<h1>Transfer Sessions</h1>
<form method="post" action="/download">
  <input type="text" name="sessionID" placeholder="session id (optional)">
  <input type="text" name="locator" placeholder="URL(s) to download" size="60">
  <button type="submit">Download</button>
</form>
<p><a href="/sessions">sessions</a> | <a href="/completed">completed</a> |
<a href="/files">files</a></p>
</body>
</html>
)html";

StringResponse makeResponse(const HttpRequest& req, http::status status,
                            const std::string& contentType, std::string body) {
  StringResponse res{status, req.version()};
  res.set(http::field::server, kServerName);
  res.set(http::field::content_type, contentType);
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

StringResponse jsonResponse(const HttpRequest& req, http::status status,
                            const json& payload) {
  return makeResponse(req, status, "application/json", payload.dump());
}

StringResponse errorResponse(const HttpRequest& req, http::status status,
                             const std::string& message) {
  return jsonResponse(req, status, json{{"error", message}});
}

json toJson(const SessionSnapshot& snapshot) {
  json out{{"sessionID", snapshot.id},
           {"state", toString(snapshot.state)},
           {"progress", snapshot.percentage},
           {"downloaded_bytes", snapshot.downloadedBytes},
           {"total_size_bytes", snapshot.totalBytes}};
  if (snapshot.filePath) out["file_path"] = snapshot.filePath->string();
  if (!snapshot.error.empty()) out["error"] = snapshot.error;
  return out;
}

std::string sessionIdOf(const RequestTarget& target) {
  auto it = target.query.find("sessionID");
  return it == target.query.end() ? std::string() : utils::trim(it->second);
}

}  // namespace

HttpRouter::HttpRouter(TransferService& service, Credentials credentials)
    : service_(service), credentials_(std::move(credentials)) {}

HttpResponse HttpRouter::handle(const HttpRequest& req) const {
  if (credentials_.enabled()) {
    auto auth = req.find(http::field::authorization);
    std::string header =
        auth == req.end() ? std::string() : std::string(auth->value());
    if (!credentials_.authorize(header)) {
      StringResponse res = makeResponse(req, http::status::unauthorized,
                                        "text/plain", "Unauthorized\n");
      res.set(http::field::www_authenticate,
              std::string("Basic realm=\"") + kRealm + "\"");
      return HttpResponse(std::move(res));
    }
  }

  RequestTarget target = parseTarget(std::string(req.target()));
  const std::string& path = target.path;
  LOG(DEBUG) << req.method_string() << " " << req.target();

  if (path.compare(0, std::string(kDownloadPrefix).size(), kDownloadPrefix) ==
      0) {
    if (req.method() != http::verb::get) {
      return errorResponse(req, http::status::method_not_allowed,
                           "use GET to fetch a file");
    }
    std::string key =
        utils::percentDecode(path.substr(std::string(kDownloadPrefix).size()));
    return fetch(req, key);
  }

  if (path == "/download") {
    if (req.method() != http::verb::post) {
      return errorResponse(req, http::status::method_not_allowed,
                           "use POST to start a download");
    }
    return startDownload(req, target);
  }
  if (path == "/cancel") {
    if (req.method() != http::verb::post) {
      return errorResponse(req, http::status::method_not_allowed,
                           "use POST to cancel");
    }
    return cancel(req, target);
  }

  if (req.method() != http::verb::get) {
    return errorResponse(req, http::status::method_not_allowed,
                         "method not allowed");
  }
  if (path == "/") return index(req);
  if (path == "/progress") return progress(req, target);
  if (path == "/sessions") return sessions(req);
  if (path == "/completed") return completed(req);
  if (path == "/files") return files(req);
  return errorResponse(req, http::status::not_found, "no such endpoint");
}

StringResponse HttpRouter::index(const HttpRequest& req) const {
  return makeResponse(req, http::status::ok, "text/html; charset=utf-8",
                      kIndexPage);
}

StringResponse HttpRouter::startDownload(const HttpRequest& req,
                                         const RequestTarget& target) const {
  ParamMap form = parseUrlEncoded(req.body());
  std::string sessionId = sessionIdOf(target);
  if (sessionId.empty()) {
    auto it = form.find("sessionID");
    if (it != form.end()) sessionId = utils::trim(it->second);
  }
  auto locator = form.find("locator");
  if (locator == form.end() || utils::trim(locator->second).empty()) {
    return errorResponse(req, http::status::bad_request, "locator is required");
  }

  StartResult result = service_.startSession(sessionId, locator->second);
  if (!result.accepted) {
    LOG(WARN) << "Rejected download request: " << result.reason;
    return errorResponse(req, http::status::bad_request, result.reason);
  }
  return jsonResponse(req, http::status::ok,
                      json{{"sessionID", result.sessionId}});
}

StringResponse HttpRouter::progress(const HttpRequest& req,
                                    const RequestTarget& target) const {
  std::string sessionId = sessionIdOf(target);
  if (sessionId.empty()) {
    return errorResponse(req, http::status::bad_request,
                         "sessionID is required");
  }
  auto snapshot = service_.getProgress(sessionId);
  if (!snapshot) {
    return errorResponse(req, http::status::not_found, "session not found");
  }
  return jsonResponse(req, http::status::ok, toJson(*snapshot));
}

StringResponse HttpRouter::cancel(const HttpRequest& req,
                                  const RequestTarget& target) const {
  std::string sessionId = sessionIdOf(target);
  if (sessionId.empty()) {
    return errorResponse(req, http::status::bad_request,
                         "sessionID is required");
  }
  if (service_.cancelSession(sessionId) ==
      SessionRegistry::CancelResult::NotFound) {
    return errorResponse(req, http::status::not_found,
                         "no download in progress for this session");
  }
  return jsonResponse(req, http::status::ok,
                      json{{"sessionID", sessionId}, {"cancelled", true}});
}

StringResponse HttpRouter::sessions(const HttpRequest& req) const {
  json list = json::array();
  for (const auto& snapshot : service_.listSessions()) {
    list.push_back(toJson(snapshot));
  }
  return jsonResponse(req, http::status::ok, list);
}

StringResponse HttpRouter::completed(const HttpRequest& req) const {
  json map = json::object();
  for (const auto& artifact : service_.listCompleted()) {
    map[artifact.id] = artifact.filePath.string();
  }
  return jsonResponse(req, http::status::ok, map);
}

StringResponse HttpRouter::files(const HttpRequest& req) const {
  return jsonResponse(req, http::status::ok, json(service_.listFiles()));
}

HttpResponse HttpRouter::fetch(const HttpRequest& req,
                               const std::string& key) const {
  auto path = service_.fetchArtifact(key);
  if (!path) {
    return errorResponse(req, http::status::not_found, "file not found");
  }

  beast::error_code ec;
  http::file_body::value_type body;
  body.open(path->string().c_str(), beast::file_mode::scan, ec);
  if (ec) {
    LOG(WARN) << "Cannot open " << path->string() << ": " << ec.message();
    return errorResponse(req, http::status::not_found, "file not found");
  }
  auto const size = body.size();

  FileResponse res{std::piecewise_construct, std::make_tuple(std::move(body)),
                   std::make_tuple(http::status::ok, req.version())};
  res.set(http::field::server, kServerName);
  res.set(http::field::content_type, "application/octet-stream");
  res.set(http::field::content_disposition,
          "attachment; filename=\"" +
              attachmentFileName(path->filename().string()) + "\"");
  res.content_length(size);
  res.keep_alive(req.keep_alive());
  return HttpResponse(std::move(res));
}
