#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "poolkit/api/export.hpp"

namespace poolkit {
namespace api {

enum class StatusCode {
  kOk = 0,
  kInvalidArgument,
  kNotInitialized,
  kNotFound,
  kWouldBlock,
  kClosed,
  kIoError,
  kInternalError,
  kUnsupported
};

enum class ErrorModule : std::uint8_t {
  kCore = 0x00,
  kApi = 0x01,
  kLog = 0x10,
  kConcurrent = 0x40,
  kPool = 0x50,
  kJson = 0x60,
};

// Module-local detail ids. Each pair (module, detail) has an entry in the
// error catalog so FindErrorCatalogEntry can resolve a status' hex code.
enum ConcurrentDetail : std::uint32_t {
  kQueueFull = 0x0001,
  kQueueEmpty = 0x0002,
};

enum PoolDetail : std::uint32_t {
  kPoolInvalidCapacity = 0x0001,
  kPoolNullFactory = 0x0002,
  kPoolInvalidOptions = 0x0003,
  kPoolClosed = 0x0004,
  kPoolFactoryNull = 0x0005,
  kPoolFactoryThrew = 0x0006,
  kPoolResourceCloseFailed = 0x0007,
};

struct ErrorCatalogEntry {
  std::uint32_t hex_code;
  const char* symbol;
  const char* description;
};

// Code layout: 0xMMSDDDDD
// - MM: module id
// - S: status code family (4 bits)
// - DDDDD: module-local detail id (20 bits)
POOLKIT_API std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code,
                                        std::uint32_t detail_id = 0);
POOLKIT_API const char* ErrorModuleName(ErrorModule module);
POOLKIT_API const char* StatusCodeName(StatusCode status_code);
POOLKIT_API const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code);
POOLKIT_API std::string FormatErrorCodeHex(std::uint32_t hex_code);

class Status {
 public:
  Status() : code_(StatusCode::kOk), hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message)
      : code_(code), message_(std::move(message)),
        hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message, ErrorModule module, std::uint32_t detail_id = 0)
      : code_(code),
        message_(std::move(message)),
        hex_code_(MakeErrorCode(module, code_, detail_id)) {}
  Status(StatusCode code, std::string message, std::uint32_t hex_code)
      : code_(code), message_(std::move(message)), hex_code_(hex_code) {}

  static Status Ok() { return Status(); }
  static Status FromModule(StatusCode code, std::string message, ErrorModule module,
                           std::uint32_t detail_id = 0) {
    return Status(code, std::move(message), module, detail_id);
  }

  bool ok() const { return code_ == StatusCode::kOk; }
  StatusCode code() const { return code_; }
  const std::string& message() const { return message_; }
  std::uint32_t hex_code() const { return hex_code_; }
  std::string hex_code_string() const { return FormatErrorCodeHex(hex_code_); }

  // Human readable form for logs: "kClosed(0x50500004): pool is closed".
  std::string ToString() const;

 private:
  StatusCode code_;
  std::string message_;
  std::uint32_t hex_code_;
};

template <typename T>
class Result {
 public:
  Result(const Status& status) : status_(status), has_value_(false), value_() {}
  Result(const T& value) : status_(Status::Ok()), has_value_(true), value_(value) {}

  bool ok() const { return status_.ok(); }
  bool has_value() const { return has_value_; }
  const Status& status() const { return status_; }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  bool has_value_;
  T value_;
};

}  // namespace api
}  // namespace poolkit
