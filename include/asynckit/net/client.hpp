#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "asynckit/api/export.hpp"
#include "asynckit/api/status.hpp"
#include "asynckit/breaker/circuit_breaker.hpp"
#include "asynckit/concurrent/cancellation.hpp"
#include "asynckit/net/transport.hpp"
#include "asynckit/observe/i_event_recorder.hpp"
#include "asynckit/pool/resource_pool.hpp"
#include "asynckit/retry/retry_policy.hpp"
#include "asynckit/task/task_runner.hpp"

namespace asynckit {
namespace net {

struct ClientOptions {
  pool::PoolOptions pool;
  breaker::BreakerOptions breaker;
  retry::RetryOptions retry;
  std::chrono::milliseconds request_timeout = std::chrono::milliseconds(30000);
  // Default parallelism of RequestBatch.
  std::size_t batch_workers = 10;
};

struct RequestReport {
  std::uint32_t attempts = 0;
  std::chrono::milliseconds elapsed = std::chrono::milliseconds(0);
  // Last HTTP status seen, 0 when no response arrived.
  int last_status_code = 0;
};

// Resilient request/response client. Each endpoint gets its own circuit breaker and connection pool,
// created on first use and owned by this instance.
//
// Per attempt: breaker admission, pooled connection, send. Transport errors and timeouts discard the
// connection and count as breaker failures. HTTP 408, 429 and every 5xx count as failures but keep
// the connection; only 408, 429, 500, 502, 503 and 504 are retried. Other 4xx count as breaker
// successes and are not retried.
class ASYNCKIT_API Client {
 public:
  Client(ITransport* transport, const ClientOptions& options = ClientOptions(),
         observe::IEventRecorder* recorder = NULL);
  ~Client();

  // 发送请求，按需重试。
  // 返回：
  // - kOk：value 为 2xx/3xx 响应。
  // - kCircuitOpen / kPoolExhausted / kPoolClosed：系统自我保护，未重试。
  // - kRetriesExhausted：可重试错误在 max_retries 次重试后仍然存在。
  // - kNonRetryable：错误被判定为不值得重试（如 4xx）。
  // - kCancelled：cancel 被触发。
  // - kInvalidArgument：endpoint 为空。
  // 失败状态的 cause 为最后一次底层错误，消息包含尝试次数与耗时。
  // 线程安全：线程安全。
  api::Result<Response> Send(const Request& request, RequestReport* report = NULL,
                             const concurrent::CancellationToken& cancel =
                                 concurrent::CancellationToken());

  api::Result<Response> Get(const std::string& endpoint, const std::string& path);
  api::Result<Response> Post(const std::string& endpoint, const std::string& path,
                             const std::string& body);
  api::Result<Response> Put(const std::string& endpoint, const std::string& path,
                            const std::string& body);
  api::Result<Response> Delete(const std::string& endpoint, const std::string& path);

  // Sends every request with at most `max_concurrent` in flight (0 uses batch_workers) and returns
  // one result per request, in input order.
  std::vector<api::Result<Response> > SendBatch(const std::vector<Request>& requests,
                                                std::size_t max_concurrent = 0,
                                                const concurrent::CancellationToken& cancel =
                                                    concurrent::CancellationToken());

  // Breaker of `endpoint`, created when missing. NULL after Shutdown.
  breaker::CircuitBreaker* BreakerFor(const std::string& endpoint);

  // Pool statistics of `endpoint`; zeroed when the endpoint was never used.
  pool::PoolStats PoolStatsFor(const std::string& endpoint) const;

  // Closes every pool. Later requests fail with kPoolClosed. Idempotent.
  void Shutdown();

  const ClientOptions& options() const { return options_; }

 private:
  typedef pool::ResourcePool<IConnection> ConnectionPool;

  struct Endpoint {
    std::unique_ptr<breaker::CircuitBreaker> breaker;
    std::unique_ptr<ConnectionPool> pool;
  };

  Client(const Client&);
  Client& operator=(const Client&);

  std::shared_ptr<Endpoint> EndpointFor(const std::string& endpoint);
  task::TaskRunner* BatchRunner();

  ITransport* transport_;
  const ClientOptions options_;
  const retry::RetryPolicy retry_;
  observe::IEventRecorder* recorder_;

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<Endpoint> > endpoints_;
  bool shut_down_;
  std::unique_ptr<task::TaskRunner> batch_runner_;
};

}  // namespace net
}  // namespace asynckit
