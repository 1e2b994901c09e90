#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "asynckit/api/export.hpp"
#include "asynckit/api/version.hpp"

namespace asynckit {
namespace observe {

typedef std::vector<std::pair<std::string, std::string> > EventAttributes;

class IEventRecorder {
 public:
  virtual ~IEventRecorder() {}

  // 返回实现名称。
  virtual const char* Name() const = 0;

  // 返回当前对象遵循的接口版本。
  virtual std::uint32_t ApiVersion() const = 0;

  // 释放实例对象本身。调用后指针失效。
  virtual void Release() = 0;

  // 记录一条运行时事件（task.start、breaker.transition 等）。
  // 参数：
  // - name: 事件名，点号分隔。
  // - attributes: 有序键值对。
  // 约束：实现不得抛出异常，也不得回调运行时组件；运行时的行为不依赖记录是否成功。
  // 线程安全：必须线程安全，会被多个工作线程并发调用。
  virtual void RecordEvent(const std::string& name, const EventAttributes& attributes) = 0;
};

// Shared recorder that drops every event. Never released.
ASYNCKIT_API IEventRecorder* NullEventRecorder();

// `recorder` itself, or the shared null recorder when it is NULL.
inline IEventRecorder* RecorderOrNull(IEventRecorder* recorder) {
  return recorder == NULL ? NullEventRecorder() : recorder;
}

}  // namespace observe
}  // namespace asynckit
