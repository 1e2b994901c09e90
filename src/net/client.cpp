#include "asynckit/net/client.hpp"

#include <glog/logging.h>

#include <exception>
#include <sstream>
#include <utility>

namespace asynckit {
namespace net {

namespace {

typedef std::chrono::steady_clock Clock;

std::string Describe(const Request& request) {
  return request.method + " " + request.endpoint + request.path;
}

// Same code and hex code as `status`, message suffixed with the attempt summary, wrapping `cause`.
api::Status Annotate(const api::Status& status, std::uint32_t attempts,
                     std::chrono::milliseconds elapsed, const api::Status& cause) {
  std::ostringstream msg;
  msg << status.message() << " (attempts=" << attempts << ", elapsed_ms=" << elapsed.count()
      << ")";
  api::Status out(status.code(), msg.str(), status.hex_code());
  if (status.cause() != NULL) return out.WithCause(*status.cause());
  return out.WithCause(cause);
}

void CloseConnection(IConnection* connection) {
  connection->Close();
  delete connection;
}

}  // namespace

Client::Client(ITransport* transport, const ClientOptions& options,
               observe::IEventRecorder* recorder)
    : transport_(transport),
      options_(options),
      retry_(options.retry),
      recorder_(observe::RecorderOrNull(recorder)),
      shut_down_(false) {}

Client::~Client() {
  Shutdown();
  // Joins batch bodies that were cancelled but are still inside Send.
  batch_runner_.reset();
}

std::shared_ptr<Client::Endpoint> Client::EndpointFor(const std::string& endpoint) {
  std::lock_guard<std::mutex> lock(mu_);
  if (shut_down_) return std::shared_ptr<Endpoint>();
  std::map<std::string, std::shared_ptr<Endpoint> >::iterator it = endpoints_.find(endpoint);
  if (it != endpoints_.end()) return it->second;

  std::shared_ptr<Endpoint> created = std::make_shared<Endpoint>();
  created->breaker.reset(new breaker::CircuitBreaker(endpoint, options_.breaker, recorder_));
  ITransport* transport = transport_;
  created->pool.reset(new ConnectionPool(
      options_.pool, [transport, endpoint]() { return transport->Connect(endpoint); },
      &CloseConnection, recorder_, endpoint));
  endpoints_[endpoint] = created;
  VLOG(1) << "client registered endpoint " << endpoint;
  return created;
}

breaker::CircuitBreaker* Client::BreakerFor(const std::string& endpoint) {
  std::shared_ptr<Endpoint> ep = EndpointFor(endpoint);
  return ep ? ep->breaker.get() : NULL;
}

pool::PoolStats Client::PoolStatsFor(const std::string& endpoint) const {
  std::shared_ptr<Endpoint> ep;
  {
    std::lock_guard<std::mutex> lock(mu_);
    std::map<std::string, std::shared_ptr<Endpoint> >::const_iterator it =
        endpoints_.find(endpoint);
    if (it != endpoints_.end()) ep = it->second;
  }
  return ep ? ep->pool->Stats() : pool::PoolStats();
}

api::Result<Response> Client::Send(const Request& request, RequestReport* report,
                                   const concurrent::CancellationToken& cancel) {
  const Clock::time_point started = Clock::now();
  std::uint32_t attempts = 0;
  int last_code = 0;
  api::Status last;

  struct Finisher {
    RequestReport* report;
    const Clock::time_point& started;
    const std::uint32_t& attempts;
    const int& last_code;
    std::chrono::milliseconds Fill() const {
      const std::chrono::milliseconds elapsed =
          std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
      if (report != NULL) {
        report->attempts = attempts;
        report->elapsed = elapsed;
        report->last_status_code = last_code;
      }
      return elapsed;
    }
  } finish = {report, started, attempts, last_code};

  if (request.endpoint.empty()) {
    finish.Fill();
    return api::Result<Response>(api::Status::FromModule(
        api::StatusCode::kInvalidArgument, "request endpoint is empty", api::ErrorModule::kNet));
  }
  std::shared_ptr<Endpoint> ep = EndpointFor(request.endpoint);
  if (!ep) {
    finish.Fill();
    return api::Result<Response>(api::Status::FromModule(
        api::StatusCode::kPoolClosed, "client is shut down", api::ErrorModule::kNet));
  }
  const std::chrono::milliseconds timeout =
      request.timeout.count() > 0 ? request.timeout : options_.request_timeout;

  for (;;) {
    if (cancel.IsCancelled()) {
      const std::chrono::milliseconds elapsed = finish.Fill();
      return api::Result<Response>(Annotate(
          api::Status::FromModule(api::StatusCode::kCancelled, "request cancelled",
                                  api::ErrorModule::kNet),
          attempts, elapsed, last));
    }

    breaker::BreakerTicket ticket;
    const api::Status admitted = ep->breaker->Acquire(&ticket);
    if (!admitted.ok()) {
      const std::chrono::milliseconds elapsed = finish.Fill();
      return api::Result<Response>(Annotate(admitted, attempts, elapsed, last));
    }

    api::Result<pool::ResourceLease<IConnection> > lease =
        ep->pool->Acquire(options_.pool.acquire_timeout, cancel);
    if (!lease.ok()) {
      ep->breaker->Abandon(ticket);
      const std::chrono::milliseconds elapsed = finish.Fill();
      return api::Result<Response>(Annotate(lease.status(), attempts, elapsed, last));
    }

    ++attempts;
    api::Result<Response> sent = api::Result<Response>(api::Status());
    try {
      sent = lease.value()->Send(request, timeout);
    } catch (const std::exception& ex) {
      sent = api::Result<Response>(api::Status::FromModule(
          api::StatusCode::kTransportError, std::string("transport threw: ") + ex.what(),
          api::ErrorModule::kNet));
    }

    retry::ErrorKind kind = retry::ErrorKind::kOther;
    if (sent.ok()) {
      last_code = sent.value().status_code;
      if (sent.value().ok()) {
        ep->breaker->Report(ticket, true);
        lease.value().Release();
        finish.Fill();
        return sent;
      }
      kind = retry::ClassifyHttpStatus(last_code);
      std::ostringstream msg;
      msg << "HTTP " << last_code << " from " << Describe(request);
      last = api::Status::FromModule(api::StatusCode::kApplicationError, msg.str(),
                                     api::ErrorModule::kNet, 0x0001);
      // Any 5xx counts against the endpoint even when it is not retried; other 4xx do not.
      ep->breaker->Report(ticket, !retry::IsRetryable(kind) && last_code < 500);
    } else {
      last = sent.status();
      kind = retry::ClassifyStatus(last);
      if (last.code() == api::StatusCode::kTransportError ||
          last.code() == api::StatusCode::kTimeout) {
        lease.value().MarkInvalid();
        ep->breaker->Report(ticket, false);
      } else {
        ep->breaker->Abandon(ticket);
      }
    }
    lease.value().Release();

    if (kind == retry::ErrorKind::kCancelled) {
      const std::chrono::milliseconds elapsed = finish.Fill();
      return api::Result<Response>(Annotate(
          api::Status::FromModule(api::StatusCode::kCancelled, "request cancelled",
                                  api::ErrorModule::kNet),
          attempts, elapsed, last));
    }

    std::chrono::milliseconds delay(0);
    if (!retry_.NextDelay(attempts, kind, &delay)) {
      const bool retryable = retry::IsRetryable(kind);
      const api::Status surfaced = api::Status::FromModule(
          retryable ? api::StatusCode::kRetriesExhausted : api::StatusCode::kNonRetryable,
          retryable ? Describe(request) + " failed after retries"
                    : Describe(request) + " failed with a non-retryable error",
          api::ErrorModule::kNet, 0x0001);
      const std::chrono::milliseconds elapsed = finish.Fill();
      observe::EventAttributes attrs;
      attrs.push_back(std::make_pair(std::string("endpoint"), request.endpoint));
      attrs.push_back(std::make_pair(std::string("kind"), std::string(retry::ErrorKindName(kind))));
      attrs.push_back(std::make_pair(std::string("error"), last.ToString()));
      recorder_->RecordEvent("net.failure", attrs);
      return api::Result<Response>(Annotate(surfaced, attempts, elapsed, last));
    }

    LOG(WARNING) << Describe(request) << " attempt " << attempts << " failed ("
                 << retry::ErrorKindName(kind) << ": " << last.message() << "), retrying in "
                 << delay.count() << " ms";
    std::ostringstream attempt_text;
    attempt_text << attempts;
    std::ostringstream delay_text;
    delay_text << delay.count();
    observe::EventAttributes attrs;
    attrs.push_back(std::make_pair(std::string("endpoint"), request.endpoint));
    attrs.push_back(std::make_pair(std::string("attempt"), attempt_text.str()));
    attrs.push_back(std::make_pair(std::string("delay_ms"), delay_text.str()));
    recorder_->RecordEvent("net.retry", attrs);

    if (delay.count() > 0 && cancel.WaitFor(delay)) {
      const std::chrono::milliseconds elapsed = finish.Fill();
      return api::Result<Response>(Annotate(
          api::Status::FromModule(api::StatusCode::kCancelled, "request cancelled during backoff",
                                  api::ErrorModule::kNet),
          attempts, elapsed, last));
    }
  }
}

api::Result<Response> Client::Get(const std::string& endpoint, const std::string& path) {
  Request request;
  request.method = "GET";
  request.endpoint = endpoint;
  request.path = path;
  return Send(request);
}

api::Result<Response> Client::Post(const std::string& endpoint, const std::string& path,
                                   const std::string& body) {
  Request request;
  request.method = "POST";
  request.endpoint = endpoint;
  request.path = path;
  request.body = body;
  return Send(request);
}

api::Result<Response> Client::Put(const std::string& endpoint, const std::string& path,
                                  const std::string& body) {
  Request request;
  request.method = "PUT";
  request.endpoint = endpoint;
  request.path = path;
  request.body = body;
  return Send(request);
}

api::Result<Response> Client::Delete(const std::string& endpoint, const std::string& path) {
  Request request;
  request.method = "DELETE";
  request.endpoint = endpoint;
  request.path = path;
  return Send(request);
}

task::TaskRunner* Client::BatchRunner() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!batch_runner_) {
    task::RunnerOptions runner_options;
    runner_options.max_workers = options_.batch_workers == 0 ? 1 : options_.batch_workers;
    runner_options.default_timeout = std::chrono::milliseconds(0);
    batch_runner_.reset(new task::TaskRunner(runner_options, recorder_));
  }
  return batch_runner_.get();
}

std::vector<api::Result<Response> > Client::SendBatch(const std::vector<Request>& requests,
                                                      std::size_t max_concurrent,
                                                      const concurrent::CancellationToken& cancel) {
  std::vector<task::Task<Response> > tasks;
  tasks.reserve(requests.size());
  for (std::size_t i = 0; i < requests.size(); ++i) {
    const Request request = requests[i];
    tasks.push_back(task::Task<Response>(
        Describe(request), [this, request](const task::TaskContext& ctx) {
          return Send(request, NULL, ctx.cancel);
        }));
  }
  task::TaskRunner* runner = BatchRunner();
  task::RunOptions run_options = runner->DefaultRunOptions();
  run_options.max_workers = max_concurrent == 0 ? options_.batch_workers : max_concurrent;
  run_options.cancel = cancel;
  return runner->Run(tasks, run_options);
}

void Client::Shutdown() {
  std::map<std::string, std::shared_ptr<Endpoint> > endpoints;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shut_down_) return;
    shut_down_ = true;
    endpoints = endpoints_;
  }
  for (std::map<std::string, std::shared_ptr<Endpoint> >::iterator it = endpoints.begin();
       it != endpoints.end(); ++it) {
    it->second->pool->Shutdown();
  }
  LOG(INFO) << "client shut down, closed " << endpoints.size() << " endpoint pools";
}

}  // namespace net
}  // namespace asynckit
