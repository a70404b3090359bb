#include "poolkit/log/log_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <glog/logging.h>

namespace poolkit {
namespace log {

#define PK_STATUS(code, message) api::Status::FromModule((code), (message), api::ErrorModule::kLog)

namespace {

struct GlobalState {
  std::mutex mu;
  bool initialized = false;
  bool failure_handler_installed = false;
  LoggingOptions options;
  std::string session_dir;
  std::string base_dir;
  std::string output_dir;
  std::unique_ptr<google::LogSink> sink;
};

GlobalState& State() {
  static GlobalState state;
  return state;
}

std::string BaseName(const std::string& path) {
  const size_t end = path.find_last_not_of('/');
  if (end == std::string::npos) return {};
  const size_t pos = path.find_last_of('/', end);
  if (pos == std::string::npos) return path.substr(0, end + 1);
  return path.substr(pos + 1, end - pos);
}

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (right.empty()) return left;
  if (left[left.size() - 1] == '/') return left + right;
  return left + "/" + right;
}

bool DirectoryExists(const std::string& path) {
  struct stat info;
  if (path.empty() || stat(path.c_str(), &info) != 0) return false;
  return S_ISDIR(info.st_mode);
}

bool CreateDirectories(const std::string& path) {
  if (path.empty()) return false;
  if (DirectoryExists(path)) return true;
  size_t pos = path[0] == '/' ? 1 : 0;
  for (;;) {
    const size_t next = path.find('/', pos);
    const std::string prefix = next == std::string::npos ? path : path.substr(0, next);
    if (!prefix.empty() && !DirectoryExists(prefix)) {
      errno = 0;
      if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) return false;
    }
    if (next == std::string::npos) break;
    pos = next + 1;
  }
  return DirectoryExists(path);
}

std::string Trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ParseBool(const std::string& value, bool* out) {
  const std::string v = ToLower(value);
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseInt(const std::string& value, int* out) {
  if (value.empty()) return false;
  char* end = NULL;
  errno = 0;
  const long parsed = std::strtol(value.c_str(), &end, 10);
  if (errno != 0 || end == NULL || *end != '\0') return false;
  if (parsed < INT_MIN || parsed > INT_MAX) return false;
  *out = static_cast<int>(parsed);
  return true;
}

bool ParseLevel(const std::string& value, int* out) {
  const std::string v = ToLower(value);
  if (v == "info") {
    *out = google::GLOG_INFO;
  } else if (v == "warning" || v == "warn") {
    *out = google::GLOG_WARNING;
  } else if (v == "error") {
    *out = google::GLOG_ERROR;
  } else if (v == "fatal") {
    *out = google::GLOG_FATAL;
  } else if (!ParseInt(v, out) || *out < 0 || *out > 3) {
    return false;
  }
  return true;
}

std::string StripComment(const std::string& value) {
  size_t pos = value.find('#');
  const size_t slash = value.find("//");
  if (slash != std::string::npos) pos = std::min(pos, slash);
  return pos == std::string::npos ? value : Trim(value.substr(0, pos));
}

// Returns false when key is known but value is malformed.
bool ApplyKey(const std::string& key, const std::string& value, LoggingOptions* options) {
  bool* bool_field = NULL;
  if (key == "session_subdir") bool_field = &options->session_subdir;
  else if (key == "simple_format") bool_field = &options->simple_format;
  else if (key == "json_format") bool_field = &options->json_format;
  else if (key == "install_failure_signal_handler" || key == "crash_stacktrace")
    bool_field = &options->install_failure_signal_handler;
  else if (key == "glog_file_output") bool_field = &options->glog_file_output;
  else if (key == "logtostderr") bool_field = &options->logtostderr;
  else if (key == "alsologtostderr") bool_field = &options->alsologtostderr;
  else if (key == "colorlogtostderr") bool_field = &options->colorlogtostderr;
  else if (key == "log_prefix") bool_field = &options->log_prefix;
  if (bool_field != NULL) return ParseBool(value, bool_field);

  if (key == "log_dir") {
    options->log_dir = value;
    return true;
  }
  if (key == "minloglevel") return ParseLevel(value, &options->min_log_level);
  if (key == "stderrthreshold") return ParseLevel(value, &options->stderr_threshold);
  if (key == "v" || key == "verbosity") return ParseInt(value, &options->verbosity);
  if (key == "max_log_size") {
    return ParseInt(value, &options->max_log_size_mb) && options->max_log_size_mb >= 0;
  }
  if (key == "logbufsecs") return ParseInt(value, &options->logbufsecs);
  // Unknown keys are ignored.
  return true;
}

std::string TimestampDir() {
  const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d-%02d%02d%02d", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  return std::string(buf);
}

std::string JsonEscape(const std::string& input) {
  std::ostringstream out;
  for (unsigned char c : input) {
    switch (c) {
      case '\\':
        out << "\\\\";
        break;
      case '"':
        out << "\\\"";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        if (c < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(c) << std::dec;
        } else {
          out << static_cast<char>(c);
        }
        break;
    }
  }
  return out.str();
}

// Writes each glog message to app.log / app.jsonl, one line per message.
class FormattedSink : public google::LogSink {
 public:
  enum class Mode { kSimple, kJson };

  FormattedSink(const std::string& file_path, Mode mode)
      : stream_(file_path.c_str(), std::ios::app), mode_(mode) {}

  bool is_open() const { return stream_.is_open(); }

  void send(google::LogSeverity severity, const char*, const char* base_filename, int line,
            const std::tm* tm_time, const char* message, size_t message_len) override {
    static const char kLevels[] = {'I', 'W', 'E', 'F'};
    const char level = kLevels[std::max(0, std::min(static_cast<int>(severity), 3))];
    std::string msg(message != NULL ? message : "", message != NULL ? message_len : 0);
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();

    char ts[32] = {0};
    if (tm_time != NULL) {
      std::strftime(ts, sizeof(ts), "%Y%m%d %H:%M:%S", tm_time);
    }

    std::ostringstream out;
    if (mode_ == Mode::kSimple) {
      out << ts << " [" << level << "] " << base_filename << ":" << line << " " << msg;
    } else {
      out << "{\"ts\":\"" << ts << "\",\"level\":\"" << level << "\",\"file\":\""
          << JsonEscape(base_filename != NULL ? base_filename : "") << "\",\"line\":" << line
          << ",\"message\":\"" << JsonEscape(msg) << "\"}";
    }

    std::lock_guard<std::mutex> lock(mu_);
    stream_ << out.str() << '\n';
    stream_.flush();
  }

 private:
  std::mutex mu_;
  std::ofstream stream_;
  Mode mode_;
};

void RemoveSinkLocked(GlobalState& state) {
  if (state.sink) {
    google::RemoveLogSink(state.sink.get());
    state.sink.reset();
  }
}

api::Result<LoggingOptions> LoadFromFile(const std::string& path) {
  if (path.empty()) return api::Result<LoggingOptions>(LoggingOptions());
  std::ifstream input(path.c_str());
  if (!input.is_open()) {
    return api::Result<LoggingOptions>(
        PK_STATUS(api::StatusCode::kNotFound, "logging config not found: " + path));
  }
  std::stringstream buffer;
  buffer << input.rdbuf();
  return LogManager::ParseConfig(buffer.str());
}

api::Status ApplyOptionsLocked(GlobalState& state, const LoggingOptions& options) {
  std::string output_dir;
  if (!options.log_dir.empty()) {
    output_dir = options.log_dir;
    if (options.session_subdir) {
      // Keep one session directory per process unless log_dir changes.
      if (state.session_dir.empty() || state.base_dir != options.log_dir) {
        state.session_dir = JoinPath(options.log_dir, TimestampDir());
      }
      output_dir = state.session_dir;
    } else {
      state.session_dir.clear();
    }
    if (!CreateDirectories(output_dir)) {
      return PK_STATUS(api::StatusCode::kIoError, "cannot create log directory: " + output_dir);
    }
    state.base_dir = options.log_dir;
  } else {
    state.session_dir.clear();
    state.base_dir.clear();
  }

  std::unique_ptr<FormattedSink> sink;
  if (options.simple_format || options.json_format) {
    const bool use_json = options.json_format;
    const std::string base = output_dir.empty() ? "." : output_dir;
    sink.reset(new FormattedSink(JoinPath(base, use_json ? "app.jsonl" : "app.log"),
                                 use_json ? FormattedSink::Mode::kJson
                                          : FormattedSink::Mode::kSimple));
    if (!sink->is_open()) {
      return PK_STATUS(api::StatusCode::kIoError, "cannot open log sink file in " + base);
    }
  }

  if (options.glog_file_output && !output_dir.empty()) {
    FLAGS_log_dir = output_dir;
    FLAGS_timestamp_in_logfile_name = false;
  } else {
    FLAGS_log_dir.clear();
  }

  // Without glog file output everything goes to stderr so glog never creates fallback files.
  FLAGS_logtostderr = options.glog_file_output ? options.logtostderr : true;
  FLAGS_alsologtostderr = options.glog_file_output ? options.alsologtostderr : false;
  FLAGS_colorlogtostderr = options.colorlogtostderr;
  FLAGS_log_prefix = options.log_prefix;
  FLAGS_minloglevel = options.min_log_level;
  FLAGS_stderrthreshold = options.stderr_threshold;
  FLAGS_v = options.verbosity;
  FLAGS_max_log_size = static_cast<unsigned int>(options.max_log_size_mb);
  FLAGS_logbufsecs = options.logbufsecs;
  if (options.install_failure_signal_handler && !state.failure_handler_installed) {
    google::InstallFailureSignalHandler();
    state.failure_handler_installed = true;
  }

  RemoveSinkLocked(state);
  if (sink) {
    state.sink.reset(sink.release());
    google::AddLogSink(state.sink.get());
  }

  state.output_dir = output_dir;
  state.options = options;
  return api::Status::Ok();
}

}  // namespace

api::Result<LoggingOptions> LogManager::ParseConfig(const std::string& text) {
  LoggingOptions options;
  std::istringstream input(text);
  std::string line;
  int lineno = 0;
  while (std::getline(input, line)) {
    ++lineno;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed.compare(0, 2, "//") == 0) continue;

    const size_t sep = trimmed.find_first_of("=:");
    if (sep == std::string::npos) continue;

    const std::string key = ToLower(Trim(trimmed.substr(0, sep)));
    const std::string value = StripComment(Trim(trimmed.substr(sep + 1)));
    if (!ApplyKey(key, value, &options)) {
      std::ostringstream msg;
      msg << "invalid value for '" << key << "' at line " << lineno;
      return api::Result<LoggingOptions>(PK_STATUS(api::StatusCode::kInvalidArgument, msg.str()));
    }
  }
  return api::Result<LoggingOptions>(options);
}

api::Status LogManager::Init(const std::string& app_name, const std::string& config_path) {
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (state.initialized) return api::Status::Ok();

  api::Result<LoggingOptions> loaded = LoadFromFile(config_path);
  if (!loaded.ok()) return loaded.status();

  // Boot diagnostics go to stderr until the options are applied.
  FLAGS_logtostderr = true;
  FLAGS_alsologtostderr = false;
  const std::string name = BaseName(app_name).empty() ? "poolkit" : BaseName(app_name);
  google::InitGoogleLogging(name.c_str());

  api::Status applied = ApplyOptionsLocked(state, loaded.value());
  if (!applied.ok()) {
    RemoveSinkLocked(state);
    state.session_dir.clear();
    state.base_dir.clear();
    state.output_dir.clear();
    google::ShutdownGoogleLogging();
    return applied;
  }
  state.initialized = true;
  return api::Status::Ok();
}

api::Status LogManager::Reload(const std::string& config_path) {
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) {
    return PK_STATUS(api::StatusCode::kNotInitialized, "LogManager::Init has not been called");
  }
  if (config_path.empty()) {
    return PK_STATUS(api::StatusCode::kInvalidArgument, "config_path is empty");
  }
  api::Result<LoggingOptions> loaded = LoadFromFile(config_path);
  if (!loaded.ok()) return loaded.status();
  return ApplyOptionsLocked(state, loaded.value());
}

LoggingOptions LogManager::CurrentOptions() {
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  return state.options;
}

std::string LogManager::OutputDir() {
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  return state.output_dir;
}

void LogManager::Shutdown() {
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) return;
  RemoveSinkLocked(state);
  google::ShutdownGoogleLogging();
  state.session_dir.clear();
  state.base_dir.clear();
  state.output_dir.clear();
  state.options = LoggingOptions();
  state.initialized = false;
}

void LogManager::Log(LogSeverity severity, const std::string& message) {
  const int level = std::max(0, std::min(static_cast<int>(severity), 3));
  google::LogMessage(__FILE__, __LINE__, static_cast<google::LogSeverity>(level)).stream()
      << message;
}

#undef PK_STATUS

}  // namespace log
}  // namespace poolkit
