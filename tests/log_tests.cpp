#include "poolkit/log/log_manager.hpp"
#include "poolkit/pool/i_resource_pool.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

using poolkit::api::StatusCode;
using poolkit::log::LogManager;

class NullResource : public poolkit::pool::IResource {
 public:
  poolkit::api::Status Close() override { return poolkit::api::Status::Ok(); }
};

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (right.empty()) return left;
  if (left[left.size() - 1] == '/') return left + right;
  return left + "/" + right;
}

bool DirectoryExists(const std::string& path) {
  struct stat info;
  if (stat(path.c_str(), &info) != 0) return false;
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

void RemoveTree(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == NULL) {
    std::remove(path.c_str());
    return;
  }
  for (struct dirent* entry = readdir(dir); entry != NULL; entry = readdir(dir)) {
    const std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    RemoveTree(JoinPath(path, name));
  }
  closedir(dir);
  rmdir(path.c_str());
}

std::string TempDirectory() {
  const char* tmp = std::getenv("TMPDIR");
  if (tmp && *tmp) return tmp;
  return "/tmp";
}

std::string UniqueTestDir(const std::string& name) {
  const long long now = std::chrono::steady_clock::now().time_since_epoch().count();
  return JoinPath(TempDirectory(), "poolkit_" + name + "_" + std::to_string(now));
}

bool WriteTextFile(const std::string& path, const std::string& content) {
  std::ofstream out(path.c_str());
  if (!out.is_open()) return false;
  out << content;
  return out.good();
}

std::string ReadTextFile(const std::string& path) {
  std::ifstream in(path.c_str());
  if (!in.is_open()) return std::string();
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool TestReloadBeforeInitFails() {
  return LogManager::Reload("not_used.conf").code() == StatusCode::kNotInitialized;
}

bool TestParseConfig() {
  poolkit::api::Result<poolkit::log::LoggingOptions> parsed = LogManager::ParseConfig(
      "# pool service logging\n"
      "log_dir = /var/log/pool\n"
      "session_subdir: no\n"
      "json_format = true   # one object per line\n"
      "minloglevel = warning\n"
      "v = 1\n"
      "unknown_key = ignored\n");
  if (!parsed.ok()) return false;
  const poolkit::log::LoggingOptions& o = parsed.value();
  if (o.log_dir != "/var/log/pool" || o.session_subdir || !o.json_format) return false;
  if (o.min_log_level != 1 || o.verbosity != 1) return false;

  poolkit::api::Result<poolkit::log::LoggingOptions> bad =
      LogManager::ParseConfig("json_format = true\nlogbufsecs = soon\n");
  if (bad.ok() || bad.status().code() != StatusCode::kInvalidArgument ||
      bad.status().message().find("line 2") == std::string::npos) {
    return false;
  }

  // 4294967297 would wrap to 1 if narrowed to int.
  poolkit::api::Result<poolkit::log::LoggingOptions> wide =
      LogManager::ParseConfig("max_log_size = 4294967297\n");
  poolkit::api::Result<poolkit::log::LoggingOptions> negative =
      LogManager::ParseConfig("v = -9999999999\n");
  poolkit::api::Result<poolkit::log::LoggingOptions> fits =
      LogManager::ParseConfig("max_log_size = 2147483647\n");
  return !wide.ok() && wide.status().code() == StatusCode::kInvalidArgument && !negative.ok() &&
         fits.ok() && fits.value().max_log_size_mb == 2147483647;
}

bool TestJsonSinkCapturesPoolEvents() {
  const std::string root = UniqueTestDir("json_sink");
  const std::string logs_dir = JoinPath(root, "logs");
  const std::string cfg = JoinPath(root, "logging.conf");
  if (!CreateDirectories(root)) return false;

  const std::string config = "log_dir = " + logs_dir + "\n" + "session_subdir = false\n" +
                             "json_format = true\n" + "v = 1\n" +
                             "install_failure_signal_handler = false\n" +
                             "logtostderr = false\n" + "alsologtostderr = false\n";
  if (!WriteTextFile(cfg, config)) return false;

  if (!LogManager::Init("log_tests", cfg).ok()) return false;
  const poolkit::log::LoggingOptions opts = LogManager::CurrentOptions();
  if (!opts.json_format || opts.verbosity != 1 || LogManager::OutputDir() != logs_dir) {
    LogManager::Shutdown();
    return false;
  }

  poolkit::pool::ResourceFactory factory = []() {
    return poolkit::api::Result<poolkit::pool::ResourcePtr>(
        poolkit::pool::ResourcePtr(new NullResource()));
  };
  poolkit::api::Result<poolkit::pool::IResourcePool*> created =
      poolkit::pool::NewResourcePool(factory, 1);
  if (!created.ok()) {
    LogManager::Shutdown();
    return false;
  }
  poolkit::pool::IResourcePool* pool = created.value();
  poolkit::api::Result<poolkit::pool::ResourcePtr> r = pool->Acquire();
  if (r.ok()) pool->ReleaseResource(r.value());
  pool->Release();
  LogManager::Log(poolkit::log::LogSeverity::kError, "error-json");
  LogManager::Shutdown();

  const std::string body = ReadTextFile(JoinPath(logs_dir, "app.jsonl"));
  const bool ok = r.ok() && body.find("served via factory") != std::string::npos &&
                  body.find("returned to idle") != std::string::npos &&
                  body.find("closed, drained 1 idle resource(s)") != std::string::npos &&
                  body.find("\"message\":\"error-json\"") != std::string::npos &&
                  body.find("\"level\":\"E\"") != std::string::npos;

  RemoveTree(root);
  return ok;
}

bool TestReloadInvalidConfigKeepsOptions() {
  const std::string root = UniqueTestDir("reload_invalid");
  const std::string logs_dir = JoinPath(root, "logs");
  const std::string good_cfg = JoinPath(root, "good.conf");
  const std::string bad_cfg = JoinPath(root, "bad.conf");
  if (!CreateDirectories(root)) return false;

  const std::string good = "log_dir = " + logs_dir + "\n" + "session_subdir = false\n" +
                           "simple_format = true\n" + "v = 2\n" +
                           "install_failure_signal_handler = false\n";
  const std::string bad = "v = not_a_number\n";
  if (!WriteTextFile(good_cfg, good) || !WriteTextFile(bad_cfg, bad)) return false;

  if (!LogManager::Init("log_tests", good_cfg).ok()) return false;
  const poolkit::log::LoggingOptions before = LogManager::CurrentOptions();
  const poolkit::api::Status reload = LogManager::Reload(bad_cfg);
  const poolkit::api::Status missing = LogManager::Reload(JoinPath(root, "missing.conf"));
  const poolkit::log::LoggingOptions after = LogManager::CurrentOptions();
  LogManager::Shutdown();

  RemoveTree(root);
  if (reload.code() != StatusCode::kInvalidArgument) return false;
  if (missing.code() != StatusCode::kNotFound) return false;
  return before.verbosity == 2 && before.verbosity == after.verbosity &&
         before.simple_format == after.simple_format && after.log_dir == logs_dir;
}

}  // namespace

int main() {
  struct Case {
    const char* name;
    bool (*fn)();
  };
  const Case cases[] = {{"reload_before_init", TestReloadBeforeInitFails},
                        {"parse_config", TestParseConfig},
                        {"json_sink_pool_events", TestJsonSinkCapturesPoolEvents},
                        {"reload_invalid_keep_options", TestReloadInvalidConfigKeepsOptions}};

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); ++i) {
    const bool ok = cases[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << cases[i].name << '\n';
    if (!ok) ++failed;
  }
  return failed == 0 ? 0 : 1;
}
