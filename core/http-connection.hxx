#ifndef SPANWIRE_CORE_HTTP_CONNECTION_HXX
#define SPANWIRE_CORE_HTTP_CONNECTION_HXX

#include <mutex>
#include <string>
#include <vector>
#include <proxygen/lib/http/HTTPMethod.h>
#include "common/net/proto.hxx"
#include "core/nvp.hxx"

namespace spanwire
{
  /*
   * Connection to a controller cluster over its http api. Endpoints are tried
   * in order, the session cookie is obtained on first use and renewed once
   * when the controller stops accepting it. Only a failed connect moves on to
   * the next endpoint, any other failure goes to the caller unretried.
   */
  class HttpConnection : public Connection
  {
    public:
      HttpConnection(std::vector<std::string> controllers,
                     std::string user,
                     std::string password,
                     size_t recv_window = 65536);
      virtual ~HttpConnection() = default;

      Json createSwitch(const LSwitch &) override;
      Json querySwitches(const Query &) override;
      void deleteSwitch(const std::string & uuid) override;

      Json createPort(const std::string & switch_uuid, const LPort &) override;
      Json queryPorts(const Query &) override;
      void deletePort(const std::string & switch_uuid,
                      const std::string & uuid) override;

      Json queryTransportZones(const Query &) override;

    protected:
      /*
       * Perform one http request against a full url. A ConnectError means the
       * request never left, anything else thrown means it may have been seen
       * by the controller.
       */
      virtual http::Message exchange(proxygen::HTTPMethod,
                                     const std::string & url,
                                     const std::string & body,
                                     http::Headers);

    private:
      http::Message send(proxygen::HTTPMethod,
                         const std::string & path,
                         const std::string & body = "");

      http::Message request(proxygen::HTTPMethod,
                            const std::string & controller,
                            const std::string & path,
                            const std::string & body,
                            const std::string & cookie);

      std::string login(const std::string & controller);
      void keepCookie(size_t controller, const std::string & cookie);

      Json sendJson(proxygen::HTTPMethod,
                    const std::string & path,
                    const std::string & what,
                    const std::string & body = "");

      std::vector<std::string> controllers_;
      std::string user_, password_;
      size_t recv_window_;

      //guards cookie_ and current_ only, never held across a request
      std::mutex mtx_;
      std::string cookie_;
      size_t current_{0};
  };
}

#endif
