#include "http_request.hxx"
#include <proxygen/lib/http/HTTPMessage.h>
#include <proxygen/lib/ssl/SSLContextConfig.h>
#include <proxygen/lib/http/session/HTTPUpstreamSession.h>
#include <proxygen/lib/utils/URL.h>
#include <stdexcept>

using namespace folly;
using namespace proxygen;
using namespace std;
using namespace std::chrono;
using namespace spanwire;

HttpRequest::HttpRequest( HTTPMethod mtd,
                          const string & url,
                          string body,
                          http::Headers headers,
                          size_t recv_window,
                          milliseconds timeout )
  : httpMethod_{mtd},
    url_{URL(url)},
    headers_{move(headers)},
    recv_window_{recv_window}
{
  static const string cert_path{"/etc/ssl/certs/ca-certificates.crt"};
  static const string next_protos{"h2,h2-14,spdy/3.1,spdy/3,http/1.1"};

  if(!Glog::initialized) Glog::init("spanwire_http");

  if(!body.empty()) body_ = IOBuf::copyBuffer(body);

  evb_.reset(new EventBase);

  SocketAddress addr{url_.getHost(), url_.getPort(), true};
  VLOG(1) << "connecting to " << addr;

  timer_ = HHWheelTimer::UniquePtr{
    new HHWheelTimer{
        evb_.get(),
        milliseconds(HHWheelTimer::DEFAULT_TICK_INTERVAL),
        AsyncTimeout::InternalEnum::NORMAL,
        timeout}
  };
  connector_.reset(new HTTPConnector{this, timer_.get()});

  static const AsyncSocket::OptionMap opts{{{SOL_SOCKET, SO_REUSEADDR}, 1}};

  if(url_.isSecure())
  {
    initSSL(cert_path, next_protos);
    connector_->connectSSL(
        evb_.get(),
        addr,
        getSSLContext(),
        nullptr,
        timeout,
        opts,
        AsyncSocket::anyAddress(),
        getServerName()
    );
  }
  else
  {
    connector_->connect(evb_.get(), addr, timeout, opts);
  }

  evb_.get()->loop();

  //the loop drained without a complete response
  if(!done_) fail("connection closed before a response was received");
}

HttpRequest::HttpRequest( HTTPMethod mtd,
                          const string & url,
                          http::Headers headers,
                          size_t recv_window,
                          milliseconds timeout )
  : HttpRequest(mtd, url, string{}, move(headers), recv_window, timeout)
{}

HttpRequest::~HttpRequest() { }

// ssl -------------------------------------------------------------------------

void HttpRequest::initSSL(const string & certPath, const string & nextProtos)
{
  sslContext_ = make_shared<SSLContext>();
  sslContext_->setOptions(SSL_OP_NO_COMPRESSION);

  SSLContextConfig config;
  sslContext_->ciphers(config.sslCiphers);
  sslContext_->loadTrustedCertificates(certPath.c_str());
  list<string> ns;
  splitTo<string>(',', nextProtos, inserter(ns, ns.begin()));
  sslContext_->setAdvertisedNextProtocols(ns);
}

SSLContextPtr HttpRequest::getSSLContext() { return sslContext_; }

// HTTPConnector::Callback -----------------------------------------------------

void HttpRequest::connectSuccess(HTTPUpstreamSession *session)
{
  session->setFlowControl(recv_window_,
                          recv_window_,
                          recv_window_);

  HTTPHeaders & hdrs = request_.getHeaders();
  for(const auto & h : headers_) hdrs.add(h.first, h.second);

  if(!hdrs.getNumberOfValues(HTTP_HEADER_USER_AGENT))
    hdrs.add(HTTP_HEADER_USER_AGENT, "spanwire");
  if(!hdrs.getNumberOfValues(HTTP_HEADER_HOST))
    hdrs.add(HTTP_HEADER_HOST, url_.getHostAndPort());
  if(!hdrs.getNumberOfValues(HTTP_HEADER_ACCEPT))
    hdrs.add("Accept", "application/json");

  txn_ = session->newTransaction(this);
  request_.setMethod(httpMethod_);
  request_.setHTTPVersion(1,1);
  request_.setURL(url_.makeRelativeURL());
  request_.setSecure(url_.isSecure());

  if(body_.get() != nullptr)
  {
    hdrs.set(HTTP_HEADER_CONTENT_LENGTH,
             std::to_string(body_->computeChainDataLength()));
  }

  txn_->sendHeaders(request_);
  if(body_.get() != nullptr) txn_->sendBody(move(body_));
  txn_->sendEOM();

  session->closeWhenIdle();
}

void HttpRequest::connectError(const AsyncSocketException &ex)
{
  LOG(ERROR)
    << "couldn't connect to " << url_.getHostAndPort() << ": " << ex.what();
  fail(make_exception_ptr(ConnectError{
    "connect to " + url_.getHostAndPort() + " failed: " + ex.what()}));
}

// HTTPTransactionHandler ------------------------------------------------------

void HttpRequest::setTransaction(HTTPTransaction *) noexcept { }

void HttpRequest::detachTransaction() noexcept { }

void HttpRequest::onHeadersComplete(unique_ptr<proxygen::HTTPMessage> msg) noexcept
{
  response_.msg = move(msg);
}

void HttpRequest::onBody(unique_ptr<folly::IOBuf> chain) noexcept
{
  if(response_.content) response_.content->prependChain(move(chain));
  else response_.content = move(chain);
}

void HttpRequest::onTrailers(unique_ptr<proxygen::HTTPHeaders>) noexcept
{
  VLOG(1) << "discarding trailers";
}

void HttpRequest::onEOM() noexcept
{
  if(done_) return;
  done_ = true;
  response_promise_.set_value(move(response_));
}

void HttpRequest::onUpgrade(proxygen::UpgradeProtocol) noexcept
{
  VLOG(1) << "discarding upgrade protocol";
}

void HttpRequest::onError(const proxygen::HTTPException &error) noexcept
{
  LOG(ERROR) << url_.getUrl() << ": " << error.what();
  fail(error.what());
}

void HttpRequest::onEgressPaused() noexcept { VLOG(1) << "egress paused"; }

void HttpRequest::onEgressResumed() noexcept { VLOG(1) << "egress resumed"; }

// misc ------------------------------------------------------------------------

const string & HttpRequest::getServerName() const
{
  const string &res = request_.getHeaders().getSingleOrEmpty(HTTP_HEADER_HOST);
  if(res.empty()) return url_.getHost();
  return res;
}

void HttpRequest::fail(exception_ptr e)
{
  if(done_) return;
  done_ = true;
  response_promise_.set_exception(e);
}

void HttpRequest::fail(const string & what)
{
  fail(make_exception_ptr(runtime_error{what}));
}

// result ----------------------------------------------------------------------
future<http::Message> HttpRequest::response()
{
  return response_promise_.get_future();
}
