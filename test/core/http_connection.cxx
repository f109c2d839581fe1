#include <catch2/catch.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <future>
#include <mutex>
#include <thread>
#include "core/http-connection.hxx"
#include "core/errors.hxx"
#include "common/net/http_request.hxx"

using std::string;
using std::vector;
using std::mutex;
using std::lock_guard;
using std::runtime_error;
using proxygen::HTTPMethod;
using namespace spanwire;

/*
 *    a controller cluster answering from a script instead of the network
 */

struct Sent
{
  HTTPMethod method;
  string url;
  string body;
  http::Headers headers;

  string header(const string & name) const
  {
    for(const auto & h : headers)
      if(h.first == name) return h.second;
    return "";
  }

  bool to(const string & prefix) const
  {
    return url.compare(0, prefix.size(), prefix) == 0;
  }

  bool isLogin() const
  {
    static const string suffix{"/ws.v1/login"};
    return url.size() >= suffix.size() &&
      url.compare(url.size()-suffix.size(), suffix.size(), suffix) == 0;
  }
};

static http::Message reply(unsigned short code,
                           const string & body = "",
                           const string & cookie = "")
{
  http::Message m;
  m.msg = std::make_unique<proxygen::HTTPMessage>();
  m.msg->setStatusCode(code);
  if(!cookie.empty()) m.msg->getHeaders().add("Set-Cookie", cookie);
  if(!body.empty()) m.content = folly::IOBuf::copyBuffer(body);
  return m;
}

class ScriptedCluster : public HttpConnection
{
  public:
    using Respond = std::function<http::Message(const Sent &)>;

    ScriptedCluster(vector<string> controllers, Respond r)
      : HttpConnection{std::move(controllers), "admin", "s3cret"},
        respond{std::move(r)}
    {}

    vector<Sent> sent()
    {
      lock_guard<mutex> lk{mtx};
      return sent_;
    }

    size_t count(HTTPMethod m, const string & prefix)
    {
      size_t n{0};
      for(const Sent & s : sent())
        if(s.method == m && s.to(prefix)) ++n;
      return n;
    }

  protected:
    http::Message exchange(HTTPMethod m,
                           const string & url,
                           const string & body,
                           http::Headers hdrs) override
    {
      Sent s{m, url, body, std::move(hdrs)};
      {
        lock_guard<mutex> lk{mtx};
        sent_.push_back(s);
      }
      return respond(s);
    }

  private:
    Respond respond;
    mutex mtx;
    vector<Sent> sent_;
};

static const string results{R"({"result_count": 0, "results": []})"};

/*
 *    session handling
 */

TEST_CASE("login-on-first-use", "[http-connection]")
{
  ScriptedCluster c{{"http://a"}, [](const Sent & s)
  {
    if(s.isLogin()) return reply(200, "", "sid=1; Path=/");
    return reply(200, results);
  }};

  Json res = c.querySwitches(Query{});
  REQUIRE( res["result_count"] == 0 );

  vector<Sent> sent = c.sent();
  REQUIRE( sent.size() == 2 );
  REQUIRE( sent[0].method == HTTPMethod::POST );
  REQUIRE( sent[0].url == "http://a/ws.v1/login" );
  REQUIRE( sent[0].body == "username=admin&password=s3cret" );
  REQUIRE( sent[0].header("Content-Type") ==
           "application/x-www-form-urlencoded" );
  REQUIRE( sent[1].to("http://a/ws.v1/lswitch?") );
  REQUIRE( sent[1].header("Cookie") == "sid=1" );

  //the session is kept
  c.queryPorts(Query{});
  sent = c.sent();
  REQUIRE( sent.size() == 3 );
  REQUIRE( sent[2].to("http://a/ws.v1/lswitch/*/lport?") );
  REQUIRE( sent[2].header("Cookie") == "sid=1" );
}

TEST_CASE("relogin-once-on-rejected-session", "[http-connection]")
{
  size_t logins{0};
  ScriptedCluster c{{"http://a"}, [&logins](const Sent & s)
  {
    if(s.isLogin())
      return reply(200, "", "sid=" + std::to_string(++logins));
    if(s.header("Cookie") == "sid=1") return reply(401);
    return reply(200, R"({"uuid": "sw"})");
  }};

  Json res = c.createSwitch(LSwitch{}.displayName("net"));
  REQUIRE( res["uuid"] == "sw" );
  REQUIRE( logins == 2 );

  vector<Sent> sent = c.sent();
  REQUIRE( sent.size() == 4 );
  REQUIRE( sent[1].header("Cookie") == "sid=1" );
  REQUIRE( sent[3].header("Cookie") == "sid=2" );
  REQUIRE( sent[3].body == sent[1].body );
}

TEST_CASE("relogin-only-once", "[http-connection]")
{
  ScriptedCluster c{{"http://a"}, [](const Sent & s)
  {
    if(s.isLogin()) return reply(200, "", "sid=1");
    return reply(403);
  }};

  try
  {
    c.querySwitches(Query{});
    FAIL("a forbidden query must not succeed");
  }
  catch(ControllerError & e)
  {
    REQUIRE( e.status() == 403 );
  }
  REQUIRE( c.sent().size() == 4 );
  REQUIRE( c.count(HTTPMethod::POST, "http://a/ws.v1/login") == 2 );
}

TEST_CASE("login-rejected", "[http-connection]")
{
  ScriptedCluster c{{"http://a", "http://b"}, [](const Sent &)
  {
    return reply(401);
  }};

  try
  {
    c.querySwitches(Query{});
    FAIL("bad credentials must not succeed");
  }
  catch(ControllerError & e)
  {
    REQUIRE( e.status() == 401 );
  }
  //bad credentials are not an unreachable controller
  REQUIRE( c.sent().size() == 1 );
}

/*
 *    endpoint failover
 */

TEST_CASE("failover-in-endpoint-order", "[http-connection]")
{
  ScriptedCluster c{{"http://a", "http://b", "http://c"}, [](const Sent & s)
  {
    if(!s.to("http://c")) throw ConnectError{"connection refused"};
    if(s.isLogin()) return reply(200, "", "sid=c");
    return reply(201, R"({"uuid": "sw"})");
  }};

  Json res = c.createSwitch(LSwitch{}.displayName("net"));
  REQUIRE( res["uuid"] == "sw" );

  vector<Sent> sent = c.sent();
  REQUIRE( sent.size() == 4 );
  REQUIRE( sent[0].url == "http://a/ws.v1/login" );
  REQUIRE( sent[1].url == "http://b/ws.v1/login" );
  REQUIRE( sent[2].url == "http://c/ws.v1/login" );
  REQUIRE( sent[3].url == "http://c/ws.v1/lswitch" );

  //the reachable endpoint is kept for later requests
  c.deleteSwitch("sw");
  sent = c.sent();
  REQUIRE( sent.size() == 5 );
  REQUIRE( sent[4].method == HTTPMethod::DELETE );
  REQUIRE( sent[4].url == "http://c/ws.v1/lswitch/sw" );
}

TEST_CASE("no-endpoint-reachable", "[http-connection]")
{
  ScriptedCluster c{{"http://a", "http://b"}, [](const Sent &) -> http::Message
  {
    throw ConnectError{"connection refused"};
  }};

  try
  {
    c.querySwitches(Query{});
    FAIL("an unreachable cluster must not succeed");
  }
  catch(ControllerError & e)
  {
    REQUIRE( e.status() == 0 );
  }
  REQUIRE( c.sent().size() == 2 );
}

TEST_CASE("failure-after-send-is-not-resent", "[http-connection]")
{
  ScriptedCluster c{{"http://a", "http://b"}, [](const Sent & s)
  {
    if(s.isLogin()) return reply(200, "", "sid=1");
    if(s.method == HTTPMethod::POST)
      throw runtime_error{"connection closed before a response was received"};
    return reply(200, results);
  }};

  REQUIRE_THROWS_WITH(
    c.createSwitch(LSwitch{}.displayName("net")),
    "connection closed before a response was received"
  );
  REQUIRE( c.count(HTTPMethod::POST, "http://a/ws.v1/lswitch") == 1 );
  REQUIRE( c.count(HTTPMethod::POST, "http://b") == 0 );

  //the endpoint is still the current one
  REQUIRE_NOTHROW( c.querySwitches(Query{}) );
  REQUIRE( c.sent().back().to("http://a/ws.v1/lswitch?") );
}

TEST_CASE("port-create-failure-after-send-is-not-resent", "[http-connection]")
{
  ScriptedCluster c{{"http://a", "http://b"}, [](const Sent & s)
  {
    if(s.isLogin()) return reply(200, "", "sid=1");
    throw runtime_error{"stream reset"};
  }};

  REQUIRE_THROWS_AS( c.createPort("sw", LPort{}), runtime_error );
  REQUIRE( c.count(HTTPMethod::POST, "http://a/ws.v1/lswitch/sw/lport") == 1 );
  REQUIRE( c.sent().size() == 2 );
}

/*
 *    status mapping
 */

TEST_CASE("not-found-maps-to-controller-not-found", "[http-connection]")
{
  ScriptedCluster c{{"http://a"}, [](const Sent & s)
  {
    if(s.isLogin()) return reply(200, "", "sid=1");
    return reply(404, R"({"error": "no such lswitch"})");
  }};

  REQUIRE_THROWS_AS( c.deleteSwitch("gone"), ControllerNotFound );
  REQUIRE( c.sent().back().url == "http://a/ws.v1/lswitch/gone" );

  try
  {
    c.deletePort("sw", "gone");
    FAIL("a missing port must not be deleted");
  }
  catch(ControllerNotFound & e)
  {
    REQUIRE( e.status() == 404 );
  }
  REQUIRE( c.sent().back().url == "http://a/ws.v1/lswitch/sw/lport/gone" );
}

TEST_CASE("error-status-maps-to-controller-error", "[http-connection]")
{
  ScriptedCluster c{{"http://a", "http://b"}, [](const Sent & s)
  {
    if(s.isLogin()) return reply(200, "", "sid=1");
    return reply(500, "internal error");
  }};

  try
  {
    c.queryTransportZones(Query{}.uuid("zone"));
    FAIL("a server error must not succeed");
  }
  catch(ControllerNotFound &)
  {
    FAIL("500 is not a missing resource");
  }
  catch(ControllerError & e)
  {
    REQUIRE( e.status() == 500 );
  }
  //an answer from the controller is never retried elsewhere
  REQUIRE( c.sent().size() == 2 );
  REQUIRE( c.sent().back().to("http://a/ws.v1/transport-zone?") );
}

/*
 *    sharing one connection
 */

TEST_CASE("requests-run-concurrently", "[http-connection]")
{
  std::promise<void> first_in, second_in;
  std::shared_future<void> second = second_in.get_future().share();
  bool overlapped{false};

  ScriptedCluster c{{"http://a"}, [&](const Sent & s)
  {
    if(s.isLogin()) return reply(200, "", "sid=1");
    if(s.to("http://a/ws.v1/lswitch?"))
    {
      first_in.set_value();
      overlapped =
        second.wait_for(std::chrono::seconds(2)) == std::future_status::ready;
      return reply(200, results);
    }
    if(s.to("http://a/ws.v1/lswitch/*/lport?")) second_in.set_value();
    return reply(200, results);
  }};

  //log in up front so both requests share the session
  c.queryTransportZones(Query{});

  std::future<void> entered = first_in.get_future();
  std::thread t{[&c]{ c.querySwitches(Query{}); }};
  entered.wait();
  c.queryPorts(Query{});
  t.join();

  REQUIRE( overlapped );
  REQUIRE( c.count(HTTPMethod::POST, "http://a/ws.v1/login") == 1 );
}
