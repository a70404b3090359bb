#pragma once

#include <string>

#include "poolkit/api/export.hpp"
#include "poolkit/api/status.hpp"

namespace poolkit {
namespace log {

enum class LogSeverity { kInfo = 0, kWarning = 1, kError = 2, kFatal = 3 };

// Normalized logging options parsed from a key=value config file and applied to glog flags.
struct LoggingOptions {
  std::string log_dir;
  bool session_subdir = true;  // create <log_dir>/<timestamp>/ for this run
  bool simple_format = false;  // custom sink: "<ts> [I] message" in app.log
  bool json_format = false;    // custom sink: JSON lines in app.jsonl
  // Installs glog failure signal handler once per process.
  bool install_failure_signal_handler = true;
  // When false, disable glog per-severity file output and keep only custom sink files.
  bool glog_file_output = false;
  bool logtostderr = false;
  bool alsologtostderr = false;
  bool colorlogtostderr = true;
  bool log_prefix = true;
  int min_log_level = 0;       // INFO=0, WARNING=1, ERROR=2, FATAL=3
  int stderr_threshold = 2;    // glog treats this as ERROR by default
  int verbosity = 0;           // VLOG level; pool events are VLOG(1)
  int max_log_size_mb = 1800;  // glog default is 1800 MB
  int logbufsecs = 30;
};

class POOLKIT_API LogManager {
 public:
  // Initialize glog with an application name and optional config file.
  // Returns kOk if already initialized. Safe to call once at process startup.
  static api::Status Init(const std::string& app_name, const std::string& config_path = {});

  // Reload configuration at runtime. On failure the applied options are kept.
  static api::Status Reload(const std::string& config_path);

  // Access the currently applied options.
  static LoggingOptions CurrentOptions();

  // Directory the custom sink writes to, empty when log_dir is unset.
  static std::string OutputDir();

  // Shutdown glog. Call once during program teardown.
  static void Shutdown();

  // Lightweight logging API that avoids exposing glog headers to callers.
  static void Log(LogSeverity severity, const std::string& message);

  // Parse a key=value config body. Unknown keys are ignored; malformed values
  // produce kInvalidArgument naming the first bad line.
  static api::Result<LoggingOptions> ParseConfig(const std::string& text);
};

}  // namespace log
}  // namespace poolkit
