#include "proto.hxx"

using std::string;
using namespace spanwire;
using folly::IOBuf;

unsigned short http::Message::statusCode() const
{
  if(msg == nullptr) return 0;
  return msg->getStatusCode();
}

bool http::Message::ok() const
{
  unsigned short code = statusCode();
  return code >= 200 && code < 300;
}

string http::Message::header(const string & name) const
{
  if(msg == nullptr) return "";
  return msg->getHeaders().getSingleOrEmpty(name);
}

string http::Message::bodyAsString() const
{
  IOBuf *p = content.get();
  if(p == nullptr) { return ""; }
  std::string s;
  do {
    s += string(reinterpret_cast<const char*>(p->data()), p->length());
    p = p->next();
  } while( p != content.get() );
  return s;
}

Json http::Message::bodyAsJson() const
{
  string s = bodyAsString();
  if(s.empty()) return Json::object();
  return Json::parse(s);
}
