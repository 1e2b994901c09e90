#include "asynckit/asynckit.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

namespace {

// Loopback transport: every third request to "flaky" fails at the transport level.
class LoopbackTransport : public asynckit::net::ITransport {
 public:
  LoopbackTransport() : counter_(0) {}

  const char* Name() const override { return "loopback"; }

  asynckit::api::Result<asynckit::net::IConnection*> Connect(const std::string&) override {
    return asynckit::api::Result<asynckit::net::IConnection*>(new Connection(&counter_));
  }

 private:
  class Connection : public asynckit::net::IConnection {
   public:
    explicit Connection(std::atomic<int>* counter) : counter_(counter) {}

    asynckit::api::Result<asynckit::net::Response> Send(const asynckit::net::Request& request,
                                                        std::chrono::milliseconds) override {
      const int n = counter_->fetch_add(1);
      if (request.endpoint == "flaky" && n % 3 == 0) {
        return asynckit::api::Result<asynckit::net::Response>(asynckit::api::Status(
            asynckit::api::StatusCode::kTransportError, "connection reset by peer"));
      }
      asynckit::net::Response response;
      response.status_code = 200;
      response.body = request.method + " " + request.path;
      return asynckit::api::Result<asynckit::net::Response>(response);
    }

    void Close() override {}

   private:
    std::atomic<int>* counter_;
  };

  std::atomic<int> counter_;
};

}  // namespace

int main(int argc, char* argv[]) {
  const std::string runtime_path = argc > 1 ? argv[1] : "config/runtime.json";
  const std::string logging_path = argc > 2 ? argv[2] : "config/logging.conf";

  asynckit::api::Status st = asynckit::log::LogManager::Init(argv[0], logging_path);
  if (!st.ok()) {
    std::fprintf(stderr, "log init failed: %s\n", st.ToString().c_str());
    return 1;
  }

  asynckit::api::Result<asynckit::config::RuntimeOptions> loaded =
      asynckit::config::LoadRuntimeOptions(runtime_path);
  if (!loaded.ok()) {
    std::fprintf(stderr, "runtime config: %s\n", loaded.status().ToString().c_str());
    asynckit::log::LogManager::Shutdown();
    return 1;
  }
  asynckit::config::RuntimeOptions options = loaded.value();
  st = asynckit::config::ApplyEnvironmentOverrides(&options);
  if (st.ok()) st = asynckit::config::ValidateRuntimeOptions(options);
  if (!st.ok()) {
    std::fprintf(stderr, "runtime config: %s\n", st.ToString().c_str());
    asynckit::log::LogManager::Shutdown();
    return 1;
  }

  asynckit::observe::IEventRecorder* recorder = asynckit_create_log_event_recorder();

  {
    asynckit::task::TaskRunner runner(options.runner, recorder);
    std::vector<asynckit::task::Task<int> > tasks;
    for (int i = 0; i < 6; ++i) {
      tasks.push_back(asynckit::task::Task<int>(
          "square-" + std::to_string(i),
          [i](const asynckit::task::TaskContext&) -> asynckit::api::Result<int> {
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (6 - i)));
            return asynckit::api::Result<int>(i * i);
          }));
    }
    asynckit::task::RunStats stats;
    std::vector<asynckit::api::Result<int> > results = runner.Run(tasks, &stats);
    for (std::size_t i = 0; i < results.size(); ++i) {
      std::printf("task %zu -> %d\n", i, results[i].ok() ? results[i].value() : -1);
    }
    std::printf("batch: %zu ok, %zu failed, %lld ms\n", stats.succeeded, stats.failed,
                static_cast<long long>(stats.elapsed.count()));
  }

  {
    std::vector<int> readings;
    for (int i = 1; i <= 20; ++i) readings.push_back(i);
    asynckit::api::Result<std::vector<std::vector<int> > > windows =
        asynckit::stream::Stream<int>::FromVector(readings, options.stream)
            .Filter([](const int& x) { return x % 2 == 0; })
            .Map([](int x) { return x * 10; })
            .Window(3, 2)
            .Collect();
    if (windows.ok()) {
      std::printf("stream produced %zu windows\n", windows.value().size());
    } else {
      std::printf("stream failed: %s\n", windows.status().ToString().c_str());
    }
  }

  {
    LoopbackTransport transport;
    asynckit::net::ClientOptions client_options = options.client;
    client_options.retry.backoff_base = std::chrono::milliseconds(5);
    asynckit::net::Client client(&transport, client_options, recorder);

    std::vector<asynckit::net::Request> requests;
    for (int i = 0; i < 5; ++i) {
      asynckit::net::Request request;
      request.endpoint = i % 2 == 0 ? "flaky" : "stable";
      request.path = "/items/" + std::to_string(i);
      requests.push_back(request);
    }
    std::vector<asynckit::api::Result<asynckit::net::Response> > responses =
        client.SendBatch(requests);
    for (std::size_t i = 0; i < responses.size(); ++i) {
      if (responses[i].ok()) {
        std::printf("%s -> %d %s\n", requests[i].path.c_str(), responses[i].value().status_code,
                    responses[i].value().body.c_str());
      } else {
        std::printf("%s -> %s\n", requests[i].path.c_str(),
                    responses[i].status().ToString().c_str());
      }
    }
    const asynckit::pool::PoolStats flaky = client.PoolStatsFor("flaky");
    std::printf("flaky pool: %zu live, %llu created, %llu destroyed\n", flaky.live,
                static_cast<unsigned long long>(flaky.created),
                static_cast<unsigned long long>(flaky.destroyed));
    client.Shutdown();
  }

  asynckit_destroy_event_recorder(recorder);
  asynckit::log::LogManager::Shutdown();
  return 0;
}
