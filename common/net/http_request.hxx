#ifndef SPANWIRE_COMMON_NET_HTTP_REQUEST_HXX
#define SPANWIRE_COMMON_NET_HTTP_REQUEST_HXX

#include <folly/io/async/EventBase.h>
#include <folly/io/async/SSLContext.h>
#include <proxygen/lib/http/HTTPConnector.h>
#include <proxygen/lib/http/session/HTTPTransaction.h>
#include <proxygen/lib/utils/URL.h>
#include <future>
#include <stdexcept>
#include "proto.hxx"
#include "glog.hxx"

namespace spanwire
{

  //the peer could not be reached, nothing was sent
  struct ConnectError : public std::runtime_error
  {
    explicit ConnectError(const std::string & what)
      : std::runtime_error{what}
    {}
  };

  /*
   * A single blocking http(s) exchange. The request runs to completion inside
   * the constructor, the response future is ready once it returns. Failures
   * are delivered through the future as exceptions, a ConnectError when the
   * peer was never reached and a runtime_error for anything after that.
   */
  class HttpRequest : public proxygen::HTTPConnector::Callback,
                      public proxygen::HTTPTransactionHandler
  {
    public:

      HttpRequest(
        proxygen::HTTPMethod,
        const std::string & url,
        std::string body,
        http::Headers headers = {},
        size_t recv_window=65536,
        std::chrono::milliseconds timeout=std::chrono::milliseconds(3000));

      HttpRequest(
        proxygen::HTTPMethod,
        const std::string & url,
        http::Headers headers = {},
        size_t recv_window=65536,
        std::chrono::milliseconds timeout=std::chrono::milliseconds(3000));

      ~HttpRequest() override;

      // ssl
      void initSSL(const std::string & certPath,
                  const std::string & nextProtos);
      folly::SSLContextPtr getSSLContext();

      // HTTPConnector::Callback
      void connectSuccess(proxygen::HTTPUpstreamSession*) override;
      void connectError(const folly::AsyncSocketException&) override;

      // HTTPTransactionHandler
      void setTransaction(proxygen::HTTPTransaction*) noexcept override;
      void detachTransaction() noexcept override;
      void onHeadersComplete(
          std::unique_ptr<proxygen::HTTPMessage>) noexcept override;
      void onBody(std::unique_ptr<folly::IOBuf>) noexcept override;
      void onTrailers(std::unique_ptr<proxygen::HTTPHeaders>) noexcept override;
      void onEOM() noexcept override;
      void onUpgrade(proxygen::UpgradeProtocol) noexcept override;
      void onError(const proxygen::HTTPException&) noexcept override;
      void onEgressPaused() noexcept override;
      void onEgressResumed() noexcept override;

      // misc
      const std::string & getServerName() const;

      // result
      std::future<http::Message> response();

    protected:
      void fail(std::exception_ptr);
      void fail(const std::string & what);

      proxygen::HTTPTransaction *txn_{nullptr};
      std::unique_ptr<folly::EventBase> evb_{nullptr};
      proxygen::HTTPMethod httpMethod_;
      proxygen::URL url_;
      proxygen::HTTPMessage request_;
      folly::SSLContextPtr sslContext_;
      http::Message response_;
      http::Headers headers_;

      size_t recv_window_;
      std::unique_ptr<folly::IOBuf> body_;
      std::unique_ptr<proxygen::HTTPConnector> connector_{nullptr};
      folly::HHWheelTimer::UniquePtr timer_{nullptr};

      bool done_{false};
      std::promise<http::Message> response_promise_{};
  };

}

#endif
