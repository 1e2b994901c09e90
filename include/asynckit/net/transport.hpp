#pragma once

#include <chrono>
#include <map>
#include <string>

#include "asynckit/api/status.hpp"

namespace asynckit {
namespace net {

typedef std::map<std::string, std::string> HeaderMap;

struct Request {
  std::string method = "GET";
  // Logical target, e.g. "https://api.example.com". One breaker and one pool exist per endpoint.
  std::string endpoint;
  std::string path = "/";
  HeaderMap headers;
  std::string body;
  // Per-attempt deadline; 0 uses ClientOptions::request_timeout.
  std::chrono::milliseconds timeout = std::chrono::milliseconds(0);
};

struct Response {
  int status_code = 0;
  HeaderMap headers;
  std::string body;

  bool ok() const { return status_code >= 200 && status_code < 400; }
};

// One reusable connection to an endpoint. Owned by the client's pool, destroyed with delete after
// Close().
class IConnection {
 public:
  virtual ~IConnection() {}

  // 发送一次请求并等待响应。
  // 参数：
  // - request: 请求内容。
  // - timeout: 本次尝试的截止时长，由实现负责执行。
  // 返回：
  // - kOk：收到响应（任意 HTTP 状态码，包括 4xx/5xx）。
  // - kTransportError：连接断开或不可用，连接将被丢弃。
  // - kTimeout：超时，连接将被丢弃。
  // - 其他：按错误类型处理，不计入熔断统计。
  // 线程安全：同一连接同一时刻只会被一个调用方使用。
  virtual api::Result<Response> Send(const Request& request, std::chrono::milliseconds timeout) = 0;

  virtual void Close() = 0;
};

// Opens connections. Borrowed by the client, must outlive it.
class ITransport {
 public:
  virtual ~ITransport() {}

  virtual const char* Name() const = 0;

  // Returns a new connection owned by the caller, or kTransportError when the endpoint is
  // unreachable.
  virtual api::Result<IConnection*> Connect(const std::string& endpoint) = 0;
};

}  // namespace net
}  // namespace asynckit
