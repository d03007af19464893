#include "http.hh"

#include <gtest/gtest.h>

#include "socket_pair.hh"
#include "vec.hh"

using namespace portal;

namespace {

TEST(URLDecode, DecodesEscapesAndPlus) {
  EXPECT_EQ(http::URLDecode("My+Home%21"), "My Home!");
  EXPECT_EQ(http::URLDecode("caf%C3%A9"), "caf\xc3\xa9");
  EXPECT_EQ(http::URLDecode("100%"), "100%");
  EXPECT_EQ(http::URLDecode("%zz"), "%zz");
}

TEST(ParseForm, SplitsPairs) {
  std::map<Str, Str> form;
  http::ParseForm("ssid=My+Net&identity=&passphrase=a%26b&flag", form);
  EXPECT_EQ(form["ssid"], "My Net");
  EXPECT_EQ(form["identity"], "");
  EXPECT_EQ(form["passphrase"], "a&b");
  EXPECT_EQ(form.count("flag"), 1u);
}

TEST(Request, ParsesHeadAndBody) {
  Str head = "POST /connect?ssid=Q HTTP/1.1\r\n"
             "Host: 192.168.42.1\r\n"
             "Content-Type: application/x-www-form-urlencoded\r\n"
             "Content-Length: 24\r\n"
             "\r\n";
  Str body = "ssid=Home&passphrase=pw";
  http::Request request(head, body);
  EXPECT_EQ(request.method, "POST");
  EXPECT_EQ(request.path, "/connect");
  EXPECT_EQ(request["Host"], "192.168.42.1");
  EXPECT_EQ(request["Missing"], "");
  EXPECT_EQ(request.params["ssid"], "Home");
  EXPECT_EQ(request.params["passphrase"], "pw");
}

TEST(Request, HeaderNamesIgnoreCase) {
  Str head = "POST /connect HTTP/1.1\r\n"
             "content-type: application/x-www-form-urlencoded\r\n"
             "content-length: 30\r\n"
             "\r\n";
  Str body = "ssid=Home&identity=&passphrase=";
  http::Request request(head, body);
  EXPECT_EQ(request["Content-Length"], "30");
  EXPECT_EQ(request["CONTENT-TYPE"], "application/x-www-form-urlencoded");
  EXPECT_EQ(request.params["ssid"], "Home");
  EXPECT_EQ(request.params.count("passphrase"), 1u);
}

TEST(Request, IgnoresBodyOfOtherContentTypes) {
  http::Request request("POST /x HTTP/1.1\r\nContent-Type: text/plain\r\n\r\n",
                        "a=b");
  EXPECT_TRUE(request.params.empty());
}

class ConnectionTest : public ::testing::Test {
protected:
  http::Server server;
  test::Client client;
  http::Connection *connection = nullptr;
  Vec<Str> paths;
  bool defer = false;

  void SetUp() override {
    server.handler = [this](http::Connection &c, http::Request &request,
                            http::Response &response) {
      paths.emplace_back(request.path);
      if (defer) {
        c.Defer();
        return;
      }
      response.WriteStatus("200 OK");
      response.Write(Str(request.path) + "|" + request.params["ssid"]);
    };
    connection = test::Connect(server, client);
    ASSERT_NE(connection, nullptr);
  }

  void Receive() {
    Status status;
    connection->NotifyRead(status);
  }
};

TEST_F(ConnectionTest, AnswersRequest) {
  client.Write("GET /hello?ssid=x HTTP/1.1\r\n\r\n");
  Receive();
  Str reply = client.Read();
  EXPECT_TRUE(reply.starts_with("HTTP/1.1 200 OK\r\n")) << reply;
  EXPECT_TRUE(reply.ends_with("\r\n\r\n/hello|x")) << reply;
}

TEST_F(ConnectionTest, WaitsForWholeBody) {
  client.Write("POST /connect HTTP/1.1\r\n"
               "Content-Type: application/x-www-form-urlencoded\r\n"
               "Content-Length: 9\r\n\r\nssid");
  Receive();
  EXPECT_TRUE(paths.empty());
  client.Write("=Home");
  Receive();
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_TRUE(client.Read().ends_with("/connect|Home"));
}

TEST_F(ConnectionTest, ReadsBodyWithLowercaseHeaders) {
  client.Write("POST /connect HTTP/1.1\r\n"
               "content-type: application/x-www-form-urlencoded\r\n"
               "content-length: 9\r\n\r\nssid=Home"
               "GET /next HTTP/1.1\r\n\r\n");
  Receive();
  ASSERT_EQ(paths.size(), 2u);
  EXPECT_EQ(paths[0], "/connect");
  EXPECT_EQ(paths[1], "/next");
  EXPECT_TRUE(client.Read().find("/connect|Home") != Str::npos);
}

TEST_F(ConnectionTest, DeferredResponseKeepsOrder) {
  defer = true;
  client.Write("GET /first HTTP/1.1\r\n\r\nGET /second HTTP/1.1\r\n\r\n");
  Receive();
  EXPECT_EQ(paths, (Vec<Str>{"/first"}));
  EXPECT_EQ(client.Read(), "");

  defer = false;
  connection->Respond("200 OK", "application/json", "{}");
  EXPECT_EQ(paths, (Vec<Str>{"/first", "/second"}));
  Str reply = client.Read();
  auto first = reply.find("{}");
  auto second = reply.find("/second|");
  ASSERT_NE(first, Str::npos) << reply;
  ASSERT_NE(second, Str::npos) << reply;
  EXPECT_LT(first, second);
  EXPECT_NE(reply.find("Content-Type: application/json\r\n"), Str::npos);
}

TEST_F(ConnectionTest, RejectsOversizedBody) {
  server.max_request_size = 16;
  bool closed = false;
  server.on_close = [&](http::Connection &) { closed = true; };
  client.Write("POST /connect HTTP/1.1\r\nContent-Length: 100\r\n\r\n");
  Receive();
  EXPECT_TRUE(paths.empty());
  EXPECT_TRUE(client.Read().starts_with("HTTP/1.1 413"));
  EXPECT_TRUE(closed);
  EXPECT_TRUE(server.connections.empty());
  EXPECT_TRUE(client.Closed());
}

TEST_F(ConnectionTest, ClosesOnEOF) {
  int closes = 0;
  server.on_close = [&](http::Connection &) { ++closes; };
  client.Shutdown();
  Receive();
  EXPECT_EQ(closes, 1);
  EXPECT_TRUE(server.connections.empty());
}

} // namespace
