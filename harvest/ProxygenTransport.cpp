#include "HttpTransport.h"
#include "PermitPool.h"

#include <folly/Conv.h>
#include <folly/IPAddress.h>
#include <folly/SocketAddress.h>
#include <folly/io/IOBuf.h>
#include <folly/io/IOBufQueue.h>
#include <folly/io/async/AsyncSocket.h>
#include <folly/io/async/AsyncSocketException.h>
#include <folly/io/async/AsyncSSLSocket.h>
#include <folly/io/async/AsyncTimeout.h>
#include <folly/io/async/EventBase.h>
#include <folly/io/async/SSLContext.h>
#include <folly/ssl/OpenSSLPtrTypes.h>
#include <fmt/format.h>
#include <glog/logging.h>
#include <proxygen/lib/http/HTTPConnector.h>
#include <proxygen/lib/http/HTTPMessage.h>
#include <proxygen/lib/http/session/HTTPTransaction.h>
#include <proxygen/lib/http/session/HTTPUpstreamSession.h>
#include <proxygen/lib/utils/URL.h>

#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <system_error>
#include <unordered_map>

using proxygen::HTTPConnector;
using proxygen::HTTPException;
using proxygen::HTTPMessage;
using proxygen::HTTPTransaction;
using proxygen::HTTPTransactionHandler;
using proxygen::HTTPUpstreamSession;
using proxygen::URL;

bool certificateMatchesHost(X509* cert, const std::string& host) {
  if (!cert || host.empty())
    return false;
  if (folly::IPAddress::validate(host))
    return X509_check_ip_asc(cert, host.c_str(), 0) == 1;
  return X509_check_host(cert, host.data(), host.size(),
                         X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS, nullptr) == 1;
}

/**
 * One request over one connection. Owns itself: it is deleted once the
 * transaction detaches, right after a failed connect, or when the request
 * deadline expires before the connection is up.
 */
class HttpExchange final
    : public HTTPConnector::Callback
    , public HTTPTransactionHandler
{
 public:
  HttpExchange(folly::EventBase* evb, HttpRequest request, URL url,
               const TransportOptions& options)
    : evb_(evb)
    , request_(std::move(request))
    , url_(std::move(url))
    , options_(options)
    , connector_(this, &evb->timer())
  {
  }

  folly::Future<HttpResponse> getFuture() {
    return promise_.getSemiFuture().via(evb_);
  }

  void start(const folly::SocketAddress& addr,
             const std::shared_ptr<folly::SSLContext>& ssl)
  {
    if (options_.request_timeout.count() > 0) {
      deadline_ = folly::AsyncTimeout::make(*evb_, [this]() noexcept {
        expire();
      });
      deadline_->scheduleTimeout(options_.request_timeout);
    }
    if (ssl) {
      connector_.connectSSL(evb_, addr, ssl, nullptr,
                            options_.connect_timeout,
                            folly::emptySocketOptionMap,
                            folly::AsyncSocket::anyAddress(),
                            url_.getHost());
    } else {
      connector_.connect(evb_, addr, options_.connect_timeout);
    }
  }

  void connectSuccess(HTTPUpstreamSession* session) override {
    if (url_.isSecure() && !peerMatchesHost(session)) {
      fail("TLS certificate of " + url_.getHostAndPort() +
           " does not match the host name");
      session->dropConnection();
      destroyLater();
      return;
    }

    HTTPTransaction* txn = session->newTransaction(this);
    if (!txn) {
      fail("cannot open transaction to " + url_.getHostAndPort());
      session->closeWhenIdle();
      destroyLater();
      return;
    }

    HTTPMessage msg;
    msg.setMethod(request_.method);
    msg.setHTTPVersion(1, 1);
    msg.setURL(url_.makeRelativeURL());
    auto& headers = msg.getHeaders();
    headers.add(proxygen::HTTP_HEADER_HOST, url_.getHostAndPort());
    headers.add(proxygen::HTTP_HEADER_USER_AGENT, options_.user_agent);
    for (const auto& h : request_.headers)
      headers.add(h.first, h.second);
    if (request_.method != "GET")
      headers.add(proxygen::HTTP_HEADER_CONTENT_LENGTH,
                  folly::to<std::string>(request_.body.size()));

    txn->setIdleTimeout(options_.request_timeout);
    txn->sendHeaders(msg);
    if (!request_.body.empty())
      txn->sendBody(folly::IOBuf::copyBuffer(request_.body));
    txn->sendEOM();
    session->closeWhenIdle();
  }

  void connectError(const folly::AsyncSocketException& ex) override {
    fail("connect to " + url_.getHostAndPort() + " failed: " + ex.what());
    destroyLater();
  }

  void setTransaction(HTTPTransaction* txn) noexcept override {
    txn_ = txn;
  }

  void detachTransaction() noexcept override {
    txn_ = nullptr;
    fail("connection closed before response was complete");
    destroyLater();
  }

  void onHeadersComplete(std::unique_ptr<HTTPMessage> msg) noexcept override {
    response_.status = msg->getStatusCode();
    response_.headers.clear();
    msg->getHeaders().forEach(
        [this](const std::string& name, const std::string& value) {
          response_.headers.emplace_back(name, value);
        });
  }

  void onBody(std::unique_ptr<folly::IOBuf> chain) noexcept override {
    body_.append(std::move(chain));
  }

  void onTrailers(std::unique_ptr<proxygen::HTTPHeaders>) noexcept override {}

  void onEOM() noexcept override {
    if (auto buf = body_.move())
      response_.body = buf->moveToFbString().toStdString();
    if (!promise_.isFulfilled())
      promise_.setValue(std::move(response_));
    if (deadline_)
      deadline_->cancelTimeout();
  }

  void onUpgrade(proxygen::UpgradeProtocol) noexcept override {}

  void onError(const HTTPException& error) noexcept override {
    fail(url_.getHostAndPort() + ": " + error.what());
  }

  void onEgressPaused() noexcept override {}
  void onEgressResumed() noexcept override {}

 private:
  void fail(std::string message) {
    if (!promise_.isFulfilled())
      promise_.setException(TransportError(std::move(message)));
  }

  void destroyLater() {
    if (dying_)
      return;
    dying_ = true;
    if (deadline_)
      deadline_->cancelTimeout();
    evb_->runInLoop([this] { delete this; });
  }

  /* Total time budget of the request ran out */
  void expire() {
    if (dying_)
      return;
    fail(fmt::format("{}: no complete response within {}ms",
                     url_.getHostAndPort(), options_.request_timeout.count()));
    if (txn_) {
      /* detachTransaction() follows */
      txn_->sendAbort();
    } else {
      connector_.reset();
      destroyLater();
    }
  }

  bool peerMatchesHost(HTTPUpstreamSession* session) const {
    auto transport = session->getTransport();
    auto sock = transport
      ? transport->getUnderlyingTransport<folly::AsyncSSLSocket>()
      : nullptr;
    const SSL* ssl = sock ? sock->getSSL() : nullptr;
    if (!ssl)
      return false;
    folly::ssl::X509UniquePtr cert(SSL_get_peer_certificate(ssl));
    return certificateMatchesHost(cert.get(), url_.getHost());
  }

  folly::EventBase* evb_;
  HttpRequest request_;
  URL url_;
  const TransportOptions& options_;
  HTTPConnector connector_;
  std::unique_ptr<folly::AsyncTimeout> deadline_;
  HTTPTransaction* txn_ = nullptr;
  bool dying_ = false;
  folly::Promise<HttpResponse> promise_;
  HttpResponse response_;
  folly::IOBufQueue body_{folly::IOBufQueue::cacheChainLength()};
};

class ProxygenTransport final : public HttpTransport {
 public:
  ProxygenTransport(folly::EventBase* evb, const TransportOptions& options)
    : evb_(evb)
    , options_(options)
    , connections_(std::max<size_t>(options.max_connections, 1))
    , sslContext_(std::make_shared<folly::SSLContext>())
  {
    sslContext_->setOptions(SSL_OP_NO_COMPRESSION);
    sslContext_->setVerificationOption(
        folly::SSLContext::SSLVerifyPeerEnum::VERIFY);
    if (!options_.ca_bundle.empty())
      sslContext_->loadTrustedCertificates(options_.ca_bundle.c_str());
    else
      SSL_CTX_set_default_verify_paths(sslContext_->getSSLCtx());
    sslContext_->setAdvertisedNextProtocols({"http/1.1"});
  }

  folly::SemiFuture<HttpResponse> send(HttpRequest request) override {
    return connections_.acquire().via(evb_)
      .thenValue([this, request = std::move(request)](
                     PermitPool::Permit permit) mutable {
        return exchange(std::move(request))
          .ensure([permit = std::move(permit)]() {});
      })
      .semi();
  }

 private:
  folly::Future<HttpResponse> exchange(HttpRequest request) {
    URL url(request.url);
    if (!url.isValid() || !url.hasHost()) {
      return folly::makeFuture<HttpResponse>(
          TransportError("invalid URL: " + request.url));
    }

    folly::SocketAddress addr;
    try {
      addr = resolve(url);
    } catch (const std::system_error& e) {
      return folly::makeFuture<HttpResponse>(TransportError(
          "cannot resolve " + url.getHost() + ": " + e.what()));
    }

    auto ex = new HttpExchange(evb_, std::move(request), url, options_);
    auto future = ex->getFuture();
    ex->start(addr, url.isSecure() ? sslContext_ : nullptr);
    return future;
  }

  const folly::SocketAddress& resolve(const URL& url) {
    std::string hostPort = url.getHostAndPort();
    auto it = resolved_.find(hostPort);
    if (it == resolved_.end()) {
      folly::SocketAddress addr(url.getHost(), url.getPort(), true);
      VLOG(1) << "resolved " << hostPort << " to " << addr.describe();
      it = resolved_.emplace(std::move(hostPort), addr).first;
    }
    return it->second;
  }

  folly::EventBase* evb_;
  TransportOptions options_;
  PermitPool connections_;
  std::shared_ptr<folly::SSLContext> sslContext_;
  std::unordered_map<std::string, folly::SocketAddress> resolved_;
};

std::unique_ptr<HttpTransport> makeProxygenTransport(
    folly::EventBase* evb, const TransportOptions& options)
{
  return std::make_unique<ProxygenTransport>(evb, options);
}
