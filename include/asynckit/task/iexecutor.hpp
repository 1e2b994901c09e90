#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "asynckit/api/status.hpp"
#include "asynckit/api/version.hpp"

namespace asynckit {
namespace task {

typedef std::uint64_t TaskId;
typedef std::function<void()> TaskFn;

enum class TaskPriority : std::uint8_t {
  kBackground = 0,
  kLow = 1,
  kNormal = 2,
  kHigh = 3,
  kCritical = 4
};

struct ExecutorOptions {
  // 0 picks hardware_concurrency.
  std::size_t worker_count = 0;
  // Upper bound for on-demand workers spawned when every worker is busy; 0 keeps the pool fixed.
  std::size_t max_worker_count = 0;
  // 0 means unbounded.
  std::size_t queue_capacity = 0;
};

struct TaskSubmitOptions {
  TaskPriority priority = TaskPriority::kNormal;
  std::uint32_t tag = 0;
};

struct ExecutorStats {
  std::uint64_t submitted = 0;
  std::uint64_t completed = 0;
  std::uint64_t failed = 0;
  std::uint64_t canceled = 0;
  std::uint64_t rejected = 0;
  std::size_t queue_depth = 0;
  std::size_t queue_high_watermark = 0;
  std::size_t worker_count = 0;
  std::size_t active_workers = 0;
};

class IExecutor {
 public:
  virtual ~IExecutor() {}

  // 返回实现名称，便于定位运行时使用的是哪种调度后端。
  virtual const char* Name() const = 0;

  // 返回当前对象遵循的接口版本。
  virtual std::uint32_t ApiVersion() const = 0;

  // 释放实例对象本身。调用后指针失效。
  virtual void Release() = 0;

  // 提交一个异步任务并返回任务 ID。
  // 参数：
  // - fn: 任务函数，不允许为空。
  // - options: 调度选项；高优先级先出队，同优先级保持 FIFO。
  // 返回：
  // - kOk：任务已入调度队列，value 为任务 ID。
  // - kInvalidArgument：fn 为空。
  // - kWouldBlock：队列已满（queue_capacity > 0 时）。
  // - kCancelled：执行器已关闭。
  // 线程安全：线程安全。
  virtual api::Result<TaskId> Submit(const TaskFn& fn, const TaskSubmitOptions& options) = 0;

  // 等待指定任务完成。timeout_ms=0 表示无限等待。
  // 返回：kOk 完成；kTimeout 超时；kNotFound 未知 ID。
  virtual api::Status Wait(TaskId id, std::uint32_t timeout_ms) = 0;

  // 尝试取消一个尚未运行的任务。已运行或已完成返回 kWouldBlock。
  virtual api::Status TryCancel(TaskId id) = 0;

  // 等待当前执行器中"此前提交"的任务全部结束。
  // 线程安全：线程安全；不可在任务函数内部调用。
  virtual api::Status WaitAll() = 0;

  // 获取执行器运行时统计信息。
  virtual api::Result<ExecutorStats> QueryStats() const = 0;

  // 停止接收新任务，执行完已入队任务后回收全部工作线程。重复调用返回 kOk。
  // 线程安全：线程安全；不可在任务函数内部调用。
  virtual api::Status Shutdown() = 0;
};

}  // namespace task
}  // namespace asynckit
