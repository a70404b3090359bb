#pragma once

#include <functional>
#include <memory>

#include "poolkit/api/status.hpp"

namespace poolkit {
namespace pool {

// 由资源池托管的外部资源（连接、句柄等）需要实现的最小能力。
// 资源池只会存放、借出或关闭资源，不关心其内部实现。
class IResource {
 public:
  virtual ~IResource() {}

  // 关闭底层资源。
  // 返回：kOk 表示关闭成功；失败时资源池只记录日志，不会向调用方传播。
  // 约束：资源池对同一个资源最多调用一次 Close。
  // 线程安全：资源池可能在任意线程上调用。
  virtual api::Status Close() = 0;
};

typedef std::shared_ptr<IResource> ResourcePtr;

// 资源工厂：在空闲队列为空时按需创建新资源。
// 返回的错误会原样透传给 Acquire 的调用方。
// 线程安全：必须支持多线程并发调用。
typedef std::function<api::Result<ResourcePtr>()> ResourceFactory;

}  // namespace pool
}  // namespace poolkit
