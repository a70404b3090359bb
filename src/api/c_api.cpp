#include "poolkit/api/factory.hpp"

#include <glog/logging.h>

#include "poolkit/api/version.hpp"

extern "C" {

std::uint32_t poolkit_get_api_version() { return poolkit::api::kApiVersion; }

poolkit::pool::IResourcePool* poolkit_create_resource_pool(
    const poolkit::pool::ResourceFactory* factory, const poolkit::pool::PoolOptions* options) {
  if (factory == NULL || options == NULL) {
    return NULL;
  }
  poolkit::api::Result<poolkit::pool::IResourcePool*> created =
      poolkit::pool::CreateResourcePool(*factory, *options);
  if (!created.ok()) {
    LOG(WARNING) << "poolkit_create_resource_pool failed: " << created.status().ToString();
    return NULL;
  }
  return created.value();
}

void poolkit_destroy_resource_pool(poolkit::pool::IResourcePool* pool) {
  if (pool == NULL) return;
  pool->Release();
}

}
