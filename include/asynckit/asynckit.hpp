#pragma once

#include "asynckit/api/factory.hpp"
#include "asynckit/api/status.hpp"
#include "asynckit/api/version.hpp"
#include "asynckit/breaker/circuit_breaker.hpp"
#include "asynckit/concurrent/bounded_channel.hpp"
#include "asynckit/concurrent/cancellation.hpp"
#include "asynckit/config/runtime_options.hpp"
#include "asynckit/json/i_json.hpp"
#include "asynckit/log/ilog_manager.hpp"
#include "asynckit/log/log_manager.hpp"
#include "asynckit/log/log_types.hpp"
#include "asynckit/net/client.hpp"
#include "asynckit/net/transport.hpp"
#include "asynckit/observe/i_event_recorder.hpp"
#include "asynckit/observe/memory_event_recorder.hpp"
#include "asynckit/pool/resource_pool.hpp"
#include "asynckit/retry/retry_policy.hpp"
#include "asynckit/stream/stream.hpp"
#include "asynckit/task/iexecutor.hpp"
#include "asynckit/task/task_runner.hpp"
