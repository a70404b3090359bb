#include "poolkit/api/status.hpp"

#include <cstdio>

namespace poolkit {
namespace api {

namespace {

inline std::uint32_t PackErrorCode(std::uint8_t module, std::uint8_t status, std::uint32_t detail) {
  return (static_cast<std::uint32_t>(module) << 24) |
         ((static_cast<std::uint32_t>(status) & 0x0Fu) << 20) |
         (detail & 0x000FFFFFu);
}

#define POOLKIT_ECODE(module, status, detail) \
  PackErrorCode(static_cast<std::uint8_t>(module), static_cast<std::uint8_t>(status), detail)

static const ErrorCatalogEntry kErrorCatalog[] = {
    // Core generic status family (detail id = 0)
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kOk, 0x0000), "CORE_OK",
     "Operation succeeded"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kInvalidArgument, 0x0000),
     "CORE_INVALID_ARGUMENT", "Invalid argument"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kNotInitialized, 0x0000),
     "CORE_NOT_INITIALIZED", "Object not initialized"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kNotFound, 0x0000), "CORE_NOT_FOUND",
     "Resource not found"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kWouldBlock, 0x0000), "CORE_WOULD_BLOCK",
     "Operation would block"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kClosed, 0x0000), "CORE_CLOSED",
     "Object is closed"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kIoError, 0x0000), "CORE_IO_ERROR",
     "I/O error"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kInternalError, 0x0000),
     "CORE_INTERNAL_ERROR", "Internal error"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kUnsupported, 0x0000), "CORE_UNSUPPORTED",
     "Operation unsupported"},

    // Module detail ids; keep appending here as a unified lookup table.
    {POOLKIT_ECODE(ErrorModule::kConcurrent, StatusCode::kWouldBlock, kQueueFull),
     "QUEUE_FULL", "Concurrent queue is full"},
    {POOLKIT_ECODE(ErrorModule::kConcurrent, StatusCode::kWouldBlock, kQueueEmpty),
     "QUEUE_EMPTY", "Concurrent queue is empty"},
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kInvalidArgument, kPoolInvalidCapacity),
     "POOL_INVALID_CAPACITY", "Pool capacity must be positive"},
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kInvalidArgument, kPoolNullFactory),
     "POOL_NULL_FACTORY", "Pool resource factory is empty"},
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kInvalidArgument, kPoolInvalidOptions),
     "POOL_INVALID_OPTIONS", "Pool options document is invalid"},
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kClosed, kPoolClosed),
     "POOL_CLOSED", "Pool has been closed"},
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kInternalError, kPoolFactoryNull),
     "POOL_FACTORY_NULL", "Resource factory returned a null resource"},
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kInternalError, kPoolFactoryThrew),
     "POOL_FACTORY_THREW", "Resource factory threw an exception"},
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kIoError, kPoolResourceCloseFailed),
     "POOL_RESOURCE_CLOSE_FAILED", "Closing a pooled resource failed"},
    {POOLKIT_ECODE(ErrorModule::kJson, StatusCode::kInvalidArgument, 0x0001),
     "JSON_PARSE_FAILED", "JSON parse failed"},
};

#undef POOLKIT_ECODE

}  // namespace

std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code, std::uint32_t detail_id) {
  return PackErrorCode(static_cast<std::uint8_t>(module),
                       static_cast<std::uint8_t>(status_code), detail_id);
}

const char* ErrorModuleName(ErrorModule module) {
  switch (module) {
    case ErrorModule::kCore:
      return "core";
    case ErrorModule::kApi:
      return "api";
    case ErrorModule::kLog:
      return "log";
    case ErrorModule::kConcurrent:
      return "concurrent";
    case ErrorModule::kPool:
      return "pool";
    case ErrorModule::kJson:
      return "json";
    default:
      return "unknown";
  }
}

const char* StatusCodeName(StatusCode status_code) {
  switch (status_code) {
    case StatusCode::kOk:
      return "kOk";
    case StatusCode::kInvalidArgument:
      return "kInvalidArgument";
    case StatusCode::kNotInitialized:
      return "kNotInitialized";
    case StatusCode::kNotFound:
      return "kNotFound";
    case StatusCode::kWouldBlock:
      return "kWouldBlock";
    case StatusCode::kClosed:
      return "kClosed";
    case StatusCode::kIoError:
      return "kIoError";
    case StatusCode::kInternalError:
      return "kInternalError";
    case StatusCode::kUnsupported:
      return "kUnsupported";
    default:
      return "kUnknown";
  }
}

const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code) {
  for (std::size_t i = 0; i < sizeof(kErrorCatalog) / sizeof(kErrorCatalog[0]); ++i) {
    if (kErrorCatalog[i].hex_code == hex_code) {
      return &kErrorCatalog[i];
    }
  }
  return NULL;
}

std::string FormatErrorCodeHex(std::uint32_t hex_code) {
  char buf[11] = {0};  // "0xFFFFFFFF"
  std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned int>(hex_code));
  return std::string(buf);
}

std::string Status::ToString() const {
  std::string out(StatusCodeName(code_));
  out += "(";
  out += FormatErrorCodeHex(hex_code_);
  out += ")";
  if (!message_.empty()) {
    out += ": ";
    out += message_;
  }
  return out;
}

}  // namespace api
}  // namespace poolkit
