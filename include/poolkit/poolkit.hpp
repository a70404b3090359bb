#pragma once

#include "poolkit/api/factory.hpp"
#include "poolkit/api/status.hpp"
#include "poolkit/api/version.hpp"
#include "poolkit/concurrent/i_queue.hpp"
#include "poolkit/json/i_json.hpp"
#include "poolkit/log/log_manager.hpp"
#include "poolkit/pool/i_resource.hpp"
#include "poolkit/pool/i_resource_pool.hpp"
#include "poolkit/pool/pool_options.hpp"
#include "poolkit/pool/resource_lease.hpp"
