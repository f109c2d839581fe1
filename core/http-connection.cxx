#include <stdexcept>
#include <fmt/format.h>
#include "common/net/http_request.hxx"
#include "core/http-connection.hxx"
#include "core/errors.hxx"

using std::string;
using std::vector;
using std::mutex;
using std::lock_guard;
using std::move;
using proxygen::HTTPMethod;

using namespace spanwire;

static const string api{"/ws.v1"};

HttpConnection::HttpConnection(vector<string> controllers,
                               string user,
                               string password,
                               size_t recv_window)
  : controllers_{move(controllers)},
    user_{move(user)},
    password_{move(password)},
    recv_window_{recv_window}
{}

// transport -------------------------------------------------------------------

http::Message HttpConnection::exchange(HTTPMethod mtd,
                                       const string & url,
                                       const string & body,
                                       http::Headers hdrs)
{
  HttpRequest rq{mtd, url, body, move(hdrs), recv_window_};
  return rq.response().get();
}

http::Message HttpConnection::request(HTTPMethod mtd,
                                      const string & controller,
                                      const string & path,
                                      const string & body,
                                      const string & cookie)
{
  http::Headers hdrs;
  if(!cookie.empty()) hdrs.emplace_back("Cookie", cookie);
  if(!body.empty()) hdrs.emplace_back("Content-Type", "application/json");

  VLOG(1) << proxygen::methodToString(mtd) << " " << controller << path;
  if(!body.empty()) VLOG(1) << body;

  return exchange(mtd, controller + path, body, move(hdrs));
}

string HttpConnection::login(const string & controller)
{
  string form = fmt::format("username={}&password={}",
                            urlEncode(user_), urlEncode(password_));
  http::Headers hdrs{
    {"Content-Type", "application/x-www-form-urlencoded"}
  };

  http::Message res =
    exchange(HTTPMethod::POST, controller + api + "/login", form, move(hdrs));

  if(!res.ok())
  {
    LOG(ERROR) << "login to " << controller << " failed: "
               << res.statusCode();
    throw ControllerError{
      res.statusCode(),
      fmt::format("login to {} as {} failed", controller, user_)
    };
  }

  string cookie = res.header("Set-Cookie");
  size_t end = cookie.find(';');
  if(end != string::npos) cookie = cookie.substr(0, end);

  LOG(INFO) << "logged in to " << controller;
  return cookie;
}

void HttpConnection::keepCookie(size_t controller, const string & cookie)
{
  lock_guard<mutex> lk{mtx_};
  if(current_ == controller) cookie_ = cookie;
}

http::Message HttpConnection::send(HTTPMethod mtd,
                                   const string & path,
                                   const string & body)
{
  if(controllers_.empty())
    throw ControllerError{0, "no controllers configured"};

  for(size_t i=0; i<controllers_.size(); ++i)
  {
    size_t at;
    string cookie;
    {
      lock_guard<mutex> lk{mtx_};
      at = current_;
      cookie = cookie_;
    }
    const string & c = controllers_[at];

    try
    {
      if(cookie.empty())
      {
        cookie = login(c);
        keepCookie(at, cookie);
      }

      http::Message res = request(mtd, c, path, body, cookie);
      if(res.statusCode() == 401 || res.statusCode() == 403)
      {
        LOG(WARNING) << c << " rejected the session, logging in again";
        cookie = login(c);
        keepCookie(at, cookie);
        res = request(mtd, c, path, body, cookie);
      }
      return res;
    }
    catch(ConnectError & e)
    {
      LOG(ERROR) << "controller " << c << " unavailable: " << e.what();
      lock_guard<mutex> lk{mtx_};
      //another caller may have rotated already
      if(current_ == at)
      {
        cookie_.clear();
        current_ = (current_ + 1) % controllers_.size();
      }
    }
  }

  throw ControllerError{0, "no controller reachable"};
}

Json HttpConnection::sendJson(HTTPMethod mtd,
                              const string & path,
                              const string & what,
                              const string & body)
{
  http::Message res = send(mtd, path, body);

  if(res.statusCode() == 404)
    throw ControllerNotFound{fmt::format("{}: {} not found", what, path)};

  if(!res.ok())
  {
    string msg = fmt::format("{} failed: {} {}",
                             what, res.statusCode(), res.bodyAsString());
    LOG(ERROR) << msg;
    throw ControllerError{res.statusCode(), msg};
  }

  return res.bodyAsJson();
}

// switches --------------------------------------------------------------------

Json HttpConnection::createSwitch(const LSwitch & sw)
{
  return sendJson(HTTPMethod::POST, api + "/lswitch", "create lswitch",
                  sw.json().dump());
}

Json HttpConnection::querySwitches(const Query & q)
{
  return sendJson(HTTPMethod::GET, api + "/lswitch?" + q.str(),
                  "query lswitch");
}

void HttpConnection::deleteSwitch(const string & uuid)
{
  sendJson(HTTPMethod::DELETE, fmt::format("{}/lswitch/{}", api, uuid),
           "delete lswitch");
}

// ports -----------------------------------------------------------------------

Json HttpConnection::createPort(const string & switch_uuid, const LPort & p)
{
  return sendJson(HTTPMethod::POST,
                  fmt::format("{}/lswitch/{}/lport", api, switch_uuid),
                  "create lport",
                  p.json().dump());
}

Json HttpConnection::queryPorts(const Query & q)
{
  return sendJson(HTTPMethod::GET, api + "/lswitch/*/lport?" + q.str(),
                  "query lport");
}

void HttpConnection::deletePort(const string & switch_uuid,
                                const string & uuid)
{
  sendJson(HTTPMethod::DELETE,
           fmt::format("{}/lswitch/{}/lport/{}", api, switch_uuid, uuid),
           "delete lport");
}

// transport zones -------------------------------------------------------------

Json HttpConnection::queryTransportZones(const Query & q)
{
  return sendJson(HTTPMethod::GET, api + "/transport-zone?" + q.str(),
                  "query transport-zone");
}
