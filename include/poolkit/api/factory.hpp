#pragma once

#include <cstdint>

#include "poolkit/api/export.hpp"
#include "poolkit/pool/i_resource_pool.hpp"

extern "C" {

// Return packed API version to allow runtime ABI compatibility checks.
POOLKIT_API std::uint32_t poolkit_get_api_version();

// Create a resource pool owned by the caller.
// Returns NULL when factory/options are null or invalid; use
// poolkit::pool::CreateResourcePool to get the failure status.
POOLKIT_API poolkit::pool::IResourcePool* poolkit_create_resource_pool(
    const poolkit::pool::ResourceFactory* factory, const poolkit::pool::PoolOptions* options);

// Close and destroy a pool created by poolkit_create_resource_pool.
POOLKIT_API void poolkit_destroy_resource_pool(poolkit::pool::IResourcePool* pool);

}
