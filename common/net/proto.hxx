#ifndef SPANWIRE_COMMON_NET_PROTO
#define SPANWIRE_COMMON_NET_PROTO

#include <string>
#include <vector>
#include <utility>
#include <proxygen/lib/http/HTTPMessage.h>
#include <folly/io/IOBuf.h>
#include <nlohmann/json.hpp>

namespace spanwire
{
  using Json = nlohmann::json;
  namespace http
  {
    using Headers = std::vector<std::pair<std::string, std::string>>;

    struct Message
    {
      std::unique_ptr<proxygen::HTTPMessage> msg;
      std::unique_ptr<folly::IOBuf> content;

      unsigned short statusCode() const;
      bool ok() const;
      //the value of the first header with the given name, or empty
      std::string header(const std::string & name) const;

      std::string bodyAsString() const;
      Json bodyAsJson() const;
    };
  }
}

#endif
