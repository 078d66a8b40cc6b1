#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "Server/HttpRouter.hpp"
#include "fake_transfer_engine.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

class HttpRouterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = std::filesystem::temp_directory_path() /
            ("http_router_test_" +
             std::string(::testing::UnitTest::GetInstance()
                             ->current_test_info()
                             ->name()));
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_);

    engine_ = std::make_shared<FakeTransferEngine>();
    ServiceOptions options;
    options.downloadRoot = root_;
    options.listedExtensions = {".mkv", ".mp4"};
    service_ = std::make_unique<TransferService>(options, engine_);
    router_ = std::make_unique<HttpRouter>(*service_, Credentials());
  }

  void TearDown() override {
    router_.reset();
    service_.reset();
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  static HttpRequest request(http::verb verb, const std::string& target,
                             const std::string& body = std::string()) {
    HttpRequest req{verb, target, 11};
    req.set(http::field::host, "localhost");
    if (!body.empty()) {
      req.set(http::field::content_type, "application/x-www-form-urlencoded");
      req.body() = body;
    }
    req.prepare_payload();
    return req;
  }

  StringResponse call(const HttpRequest& req) const {
    HttpResponse response = router_->handle(req);
    EXPECT_TRUE(std::holds_alternative<StringResponse>(response));
    return std::get<StringResponse>(std::move(response));
  }

  std::filesystem::path root_;
  std::shared_ptr<FakeTransferEngine> engine_;
  std::unique_ptr<TransferService> service_;
  std::unique_ptr<HttpRouter> router_;
};

TEST_F(HttpRouterTest, IndexPageHasDownloadForm) {
  auto res = call(request(http::verb::get, "/"));
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_NE(res.body().find("action=\"/download\""), std::string::npos);
}

TEST_F(HttpRouterTest, StartDownloadThenPollUntilCompleted) {
  engine_->addFile("movie.mkv", 300);

  auto started = call(request(http::verb::post, "/download?sessionID=s1",
                              "locator=magnet%3A%3Fxt%3Dabc"));
  ASSERT_EQ(started.result(), http::status::ok) << started.body();
  EXPECT_EQ(json::parse(started.body())["sessionID"], "s1");
  ASSERT_TRUE(service_->waitForSession("s1", 5s));

  auto progress = call(request(http::verb::get, "/progress?sessionID=s1"));
  ASSERT_EQ(progress.result(), http::status::ok);
  auto body = json::parse(progress.body());
  EXPECT_EQ(body["sessionID"], "s1");
  EXPECT_EQ(body["state"], "completed");
  EXPECT_EQ(body["progress"], 100);
  EXPECT_EQ(body["downloaded_bytes"], 300);
  EXPECT_EQ(body["total_size_bytes"], 300);
  EXPECT_EQ(body["file_path"], (root_ / "movie.mkv").string());

  auto completed = json::parse(call(request(http::verb::get, "/completed")).body());
  ASSERT_TRUE(completed.is_object());
  EXPECT_EQ(completed["s1"], (root_ / "movie.mkv").string());

  auto files = json::parse(call(request(http::verb::get, "/files")).body());
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0], "movie.mkv");

  auto sessions = json::parse(call(request(http::verb::get, "/sessions")).body());
  ASSERT_EQ(sessions.size(), 1u);
  EXPECT_EQ(sessions[0]["sessionID"], "s1");
}

TEST_F(HttpRouterTest, SessionIdMayComeFromForm) {
  engine_->addFile("a.mkv", 0);
  auto res = call(request(http::verb::post, "/download",
                          "sessionID=from-form&locator=x"));
  ASSERT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(json::parse(res.body())["sessionID"], "from-form");
}

TEST_F(HttpRouterTest, StartWithoutIdGeneratesOne) {
  engine_->addFile("a.mkv", 0);
  auto res = call(request(http::verb::post, "/download", "locator=x"));
  ASSERT_EQ(res.result(), http::status::ok);
  std::string id = json::parse(res.body())["sessionID"];
  EXPECT_FALSE(id.empty());
}

TEST_F(HttpRouterTest, StartWithoutLocatorIsBadRequest) {
  auto res = call(request(http::verb::post, "/download?sessionID=s1"));
  EXPECT_EQ(res.result(), http::status::bad_request);
  EXPECT_TRUE(json::parse(res.body()).contains("error"));
  EXPECT_FALSE(service_->getProgress("s1").has_value());
}

TEST_F(HttpRouterTest, ProgressNeedsKnownSession) {
  EXPECT_EQ(call(request(http::verb::get, "/progress")).result(),
            http::status::bad_request);
  EXPECT_EQ(call(request(http::verb::get, "/progress?sessionID=nope")).result(),
            http::status::not_found);
}

TEST_F(HttpRouterTest, CancelRunningSession) {
  engine_->addFile("a.mkv", 1000);
  engine_->pauseAt(100);
  ASSERT_EQ(call(request(http::verb::post, "/download?sessionID=s1",
                         "locator=x"))
                .result(),
            http::status::ok);
  ASSERT_TRUE(engine_->waitForDelivered(100, 5s));

  auto res = call(request(http::verb::post, "/cancel?sessionID=s1"));
  ASSERT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(json::parse(res.body())["cancelled"], true);
  ASSERT_TRUE(service_->waitForSession("s1", 5s));

  auto body = json::parse(
      call(request(http::verb::get, "/progress?sessionID=s1")).body());
  EXPECT_EQ(body["state"], "cancelled");
  EXPECT_TRUE(json::parse(call(request(http::verb::get, "/completed")).body())
                  .empty());

  EXPECT_EQ(call(request(http::verb::post, "/cancel?sessionID=s1")).result(),
            http::status::not_found);
}

TEST_F(HttpRouterTest, CancelUnknownSessionIsNotFound) {
  EXPECT_EQ(call(request(http::verb::post, "/cancel?sessionID=ghost")).result(),
            http::status::not_found);
  EXPECT_EQ(call(request(http::verb::post, "/cancel")).result(),
            http::status::bad_request);
}

TEST_F(HttpRouterTest, WrongMethodAndUnknownPath) {
  EXPECT_EQ(call(request(http::verb::get, "/download")).result(),
            http::status::method_not_allowed);
  EXPECT_EQ(call(request(http::verb::get, "/cancel?sessionID=s1")).result(),
            http::status::method_not_allowed);
  EXPECT_EQ(call(request(http::verb::delete_, "/files")).result(),
            http::status::method_not_allowed);
  EXPECT_EQ(call(request(http::verb::get, "/nowhere")).result(),
            http::status::not_found);
}

TEST_F(HttpRouterTest, FetchServesAttachment) {
  {
    std::ofstream ofs(root_ / "clip.mp4", std::ios::binary);
    ofs << "0123456789";
  }
  HttpResponse response =
      router_->handle(request(http::verb::get, "/download/clip.mp4"));
  ASSERT_TRUE(std::holds_alternative<FileResponse>(response));
  auto& res = std::get<FileResponse>(response);
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(std::string(res[http::field::content_disposition]),
            "attachment; filename=\"clip.mp4\"");
  EXPECT_EQ(std::string(res[http::field::content_length]), "10");
}

TEST_F(HttpRouterTest, FetchBySessionId) {
  engine_->addFile("done.mkv", 42);
  ASSERT_EQ(call(request(http::verb::post, "/download?sessionID=s1",
                         "locator=x"))
                .result(),
            http::status::ok);
  ASSERT_TRUE(service_->waitForSession("s1", 5s));

  HttpResponse response =
      router_->handle(request(http::verb::get, "/download/s1"));
  ASSERT_TRUE(std::holds_alternative<FileResponse>(response));
  EXPECT_EQ(
      std::string(std::get<FileResponse>(response)[http::field::content_length]),
      "42");
}

TEST_F(HttpRouterTest, FetchRejectsTraversal) {
  EXPECT_EQ(call(request(http::verb::get, "/download/..%2F..%2Fetc%2Fpasswd"))
                .result(),
            http::status::not_found);
  EXPECT_EQ(call(request(http::verb::get, "/download/missing.mkv")).result(),
            http::status::not_found);
  EXPECT_EQ(call(request(http::verb::post, "/download/missing.mkv")).result(),
            http::status::method_not_allowed);
}

TEST_F(HttpRouterTest, BasicAuthGuardsEveryEndpoint) {
  Credentials credentials = Credentials::parse("admin:secret");
  HttpRouter guarded(*service_, credentials);

  HttpResponse denied = guarded.handle(request(http::verb::get, "/completed"));
  ASSERT_TRUE(std::holds_alternative<StringResponse>(denied));
  auto& res = std::get<StringResponse>(denied);
  EXPECT_EQ(res.result(), http::status::unauthorized);
  EXPECT_EQ(std::string(res[http::field::www_authenticate]),
            "Basic realm=\"Please enter your username and password.\"");

  auto wrong = request(http::verb::get, "/completed");
  wrong.set(http::field::authorization, "Basic YWRtaW46d3Jvbmc=");
  EXPECT_EQ(std::get<StringResponse>(guarded.handle(wrong)).result(),
            http::status::unauthorized);

  auto allowed = request(http::verb::get, "/completed");
  allowed.set(http::field::authorization, "Basic YWRtaW46c2VjcmV0");
  EXPECT_EQ(std::get<StringResponse>(guarded.handle(allowed)).result(),
            http::status::ok);
}
