#include "asynckit/log/log_manager.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#if defined(_WIN32)
#include <direct.h>
#include <sys/stat.h>
#else
#include <sys/stat.h>
#include <sys/types.h>
#endif

namespace asynckit {
namespace log {

#define ASYNCKIT_LOG_STATUS(code, message) \
  api::Status::FromModule((code), (message), api::ErrorModule::kLog)

namespace {

struct LogState {
  std::mutex mu;
  LoggingOptions options;
  std::string session_dir;
  std::string session_base;
  std::unique_ptr<google::LogSink> sink;
  bool initialized = false;
  bool failure_handler_installed = false;
};

LogState& State() {
  static LogState state;
  return state;
}

std::string Trim(const std::string& s) {
  const std::size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return std::string();
  const std::size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ParseBool(const std::string& text, bool* out) {
  const std::string v = ToLower(text);
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

bool ParseInt(const std::string& text, int* out) {
  if (text.empty()) return false;
  char* end = NULL;
  errno = 0;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == NULL || *end != '\0') return false;
  *out = static_cast<int>(value);
  return true;
}

// Accepts glog level names or their numeric value.
bool ParseLevel(const std::string& text, int* out) {
  const std::string v = ToLower(text);
  if (v == "info") {
    *out = google::GLOG_INFO;
  } else if (v == "warning" || v == "warn") {
    *out = google::GLOG_WARNING;
  } else if (v == "error") {
    *out = google::GLOG_ERROR;
  } else if (v == "fatal") {
    *out = google::GLOG_FATAL;
  } else if (!ParseInt(v, out)) {
    return false;
  }
  return *out >= google::GLOG_INFO && *out <= google::GLOG_FATAL;
}

struct BoolKey {
  const char* key;
  bool LoggingOptions::*field;
};

struct IntKey {
  const char* key;
  int LoggingOptions::*field;
  bool is_level;
};

const BoolKey kBoolKeys[] = {
    {"session_subdir", &LoggingOptions::session_subdir},
    {"simple_format", &LoggingOptions::simple_format},
    {"json_format", &LoggingOptions::json_format},
    {"glog_file_output", &LoggingOptions::glog_file_output},
    {"install_failure_signal_handler", &LoggingOptions::install_failure_signal_handler},
    {"logtostderr", &LoggingOptions::logtostderr},
    {"alsologtostderr", &LoggingOptions::alsologtostderr},
    {"colorlogtostderr", &LoggingOptions::colorlogtostderr},
    {"log_prefix", &LoggingOptions::log_prefix},
    {"stop_logging_if_full_disk", &LoggingOptions::stop_logging_if_full_disk},
};

const IntKey kIntKeys[] = {
    {"minloglevel", &LoggingOptions::min_log_level, true},
    {"stderrthreshold", &LoggingOptions::stderr_threshold, true},
    {"v", &LoggingOptions::verbosity, false},
    {"verbosity", &LoggingOptions::verbosity, false},
    {"max_log_size", &LoggingOptions::max_log_size_mb, false},
    {"logbufsecs", &LoggingOptions::logbufsecs, false},
};

std::string StripTrailingComment(const std::string& value) {
  std::size_t pos = value.find('#');
  const std::size_t slash = value.find("//");
  if (slash != std::string::npos) pos = std::min(pos, slash);
  return pos == std::string::npos ? value : Trim(value.substr(0, pos));
}

// Returns false when the key is known but the value cannot be parsed.
bool ApplyKey(const std::string& key, const std::string& value, LoggingOptions* options) {
  if (key == "log_dir") {
    options->log_dir = value;
    return true;
  }
  for (std::size_t i = 0; i < sizeof(kBoolKeys) / sizeof(kBoolKeys[0]); ++i) {
    if (key == kBoolKeys[i].key) return ParseBool(value, &(options->*kBoolKeys[i].field));
  }
  for (std::size_t i = 0; i < sizeof(kIntKeys) / sizeof(kIntKeys[0]); ++i) {
    if (key != kIntKeys[i].key) continue;
    int parsed = 0;
    const bool ok = kIntKeys[i].is_level ? ParseLevel(value, &parsed) : ParseInt(value, &parsed);
    if (!ok) return false;
    options->*kIntKeys[i].field = parsed;
    return true;
  }
  return true;
}

bool IsPathSeparator(char c) { return c == '/' || c == '\\'; }

std::string BaseName(const std::string& path) {
  std::size_t end = path.size();
  while (end > 0 && IsPathSeparator(path[end - 1])) --end;
  if (end == 0) return std::string();
  const std::size_t pos = path.find_last_of("/\\", end - 1);
  if (pos == std::string::npos) return path.substr(0, end);
  return path.substr(pos + 1, end - pos - 1);
}

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (IsPathSeparator(left[left.size() - 1])) return left + right;
  return left + "/" + right;
}

bool DirectoryExists(const std::string& path) {
#if defined(_WIN32)
  struct _stat info;
  if (_stat(path.c_str(), &info) != 0) return false;
#else
  struct stat info;
  if (stat(path.c_str(), &info) != 0) return false;
#endif
  return (info.st_mode & S_IFDIR) != 0;
}

int MakeDir(const std::string& path) {
#if defined(_WIN32)
  return _mkdir(path.c_str());
#else
  return mkdir(path.c_str(), 0755);
#endif
}

bool CreateDirectories(const std::string& path) {
  if (path.empty()) return false;
  if (DirectoryExists(path)) return true;
  std::size_t pos = IsPathSeparator(path[0]) ? 1 : 0;
  for (;;) {
    const std::size_t next = path.find_first_of("/\\", pos);
    const std::string prefix = next == std::string::npos ? path : path.substr(0, next);
    if (!prefix.empty() && !DirectoryExists(prefix)) {
      errno = 0;
      if (MakeDir(prefix) != 0 && errno != EEXIST) return false;
    }
    if (next == std::string::npos) break;
    pos = next + 1;
  }
  return DirectoryExists(path);
}

std::tm LocalTime(std::time_t t) {
  std::tm tm = std::tm();
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  return tm;
}

std::string FormatNow(bool for_directory) {
  const std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
  const std::tm tm = LocalTime(std::chrono::system_clock::to_time_t(now));
  char buf[64];
  if (for_directory) {
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d-%02d%02d%02d", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  } else {
    const long long micros = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() %
        1000000LL);
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%06lld", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, micros);
  }
  return std::string(buf);
}

std::string JsonEscape(const std::string& input) {
  std::ostringstream out;
  for (std::size_t i = 0; i < input.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(input[i]);
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
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
              << std::dec;
        } else {
          out << static_cast<char>(c);
        }
    }
  }
  return out.str();
}

// Writes every glog record to one file as either "<ts> [I] msg" or a JSON line.
class FormattedSink : public google::LogSink {
 public:
  FormattedSink(const std::string& file_path, bool json)
      : stream_(file_path.c_str(), std::ios::app), json_(json) {}

  bool is_open() const { return stream_.is_open(); }

  void send(google::LogSeverity severity, const char*, const char*, int, const std::tm*,
            const char* message, size_t message_len) override {
    std::string msg(message == NULL ? "" : std::string(message, message_len));
    while (!msg.empty() && (msg[msg.size() - 1] == '\n' || msg[msg.size() - 1] == '\r')) {
      msg.erase(msg.size() - 1);
    }
    static const char kLevels[] = {'I', 'W', 'E', 'F'};
    const char level = kLevels[std::min(std::max(static_cast<int>(severity), 0), 3)];

    std::lock_guard<std::mutex> lock(mu_);
    if (json_) {
      stream_ << "{\"ts\":\"" << FormatNow(false) << "\",\"level\":\"" << level
              << "\",\"message\":\"" << JsonEscape(msg) << "\"}\n";
    } else {
      stream_ << FormatNow(false) << " [" << level << "] " << msg << '\n';
    }
    stream_.flush();
  }

 private:
  std::mutex mu_;
  std::ofstream stream_;
  bool json_;
};

void RemoveSinkLocked(LogState* state) {
  if (state->sink) {
    google::RemoveLogSink(state->sink.get());
    state->sink.reset();
  }
}

}  // namespace

api::Result<LoggingOptions> LogManager::ParseOptions(const std::string& text) {
  LoggingOptions options;
  std::istringstream input(text);
  std::string line;
  int lineno = 0;
  while (std::getline(input, line)) {
    ++lineno;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed.compare(0, 2, "//") == 0) continue;
    const std::size_t sep = trimmed.find_first_of("=:");
    if (sep == std::string::npos) continue;

    const std::string key = ToLower(Trim(trimmed.substr(0, sep)));
    const std::string value = StripTrailingComment(Trim(trimmed.substr(sep + 1)));
    if (!ApplyKey(key, value, &options)) {
      std::ostringstream msg;
      msg << "invalid value for '" << key << "' at line " << lineno;
      return api::Result<LoggingOptions>(
          api::Status::FromModule(api::StatusCode::kInvalidArgument, msg.str(),
                                  api::ErrorModule::kLog, 0x0001));
    }
  }
  return api::Result<LoggingOptions>(options);
}

api::Result<LoggingOptions> LogManager::LoadOptions(const std::string& path) {
  if (path.empty()) return api::Result<LoggingOptions>(LoggingOptions());
  std::ifstream input(path.c_str());
  if (!input.is_open()) {
    return api::Result<LoggingOptions>(
        ASYNCKIT_LOG_STATUS(api::StatusCode::kNotFound, "log config not found: " + path));
  }
  std::stringstream buffer;
  buffer << input.rdbuf();
  return ParseOptions(buffer.str());
}

api::Status LogManager::Init(const std::string& app_name, const std::string& config_path) {
  if (app_name.empty()) {
    return ASYNCKIT_LOG_STATUS(api::StatusCode::kInvalidArgument, "app_name is empty");
  }
  LogState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (state.initialized) return api::Status::Ok();

  api::Result<LoggingOptions> loaded = LoadOptions(config_path);
  if (!loaded.ok()) return loaded.status();

  const std::string base = BaseName(app_name);
  google::InitGoogleLogging(base.empty() ? "asynckit" : base.c_str());
  api::Status st = ApplyOptions(loaded.value());
  if (!st.ok()) {
    RemoveSinkLocked(&state);
    state.session_dir.clear();
    state.session_base.clear();
    google::ShutdownGoogleLogging();
    return st;
  }
  state.initialized = true;
  return api::Status::Ok();
}

api::Status LogManager::Reload(const std::string& config_path) {
  if (config_path.empty()) {
    return ASYNCKIT_LOG_STATUS(api::StatusCode::kInvalidArgument, "config_path is empty");
  }
  LogState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) {
    return ASYNCKIT_LOG_STATUS(api::StatusCode::kInvalidArgument, "logging is not initialized");
  }
  api::Result<LoggingOptions> loaded = LoadOptions(config_path);
  if (!loaded.ok()) return loaded.status();
  return ApplyOptions(loaded.value());
}

LoggingOptions LogManager::CurrentOptions() {
  LogState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  return state.options;
}

bool LogManager::IsInitialized() {
  LogState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  return state.initialized;
}

void LogManager::Shutdown() {
  LogState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) return;
  RemoveSinkLocked(&state);
  google::ShutdownGoogleLogging();
  state.session_dir.clear();
  state.session_base.clear();
  state.options = LoggingOptions();
  state.initialized = false;
}

void LogManager::Log(LogSeverity severity, const std::string& message) {
  const int level = std::min(std::max(static_cast<int>(severity), 0), 3);
  google::LogMessage(__FILE__, __LINE__, static_cast<google::LogSeverity>(level)).stream()
      << message;
}

bool LogManager::IsVerbose(int level) { return FLAGS_v >= level; }

// Caller holds State().mu.
api::Status LogManager::ApplyOptions(const LoggingOptions& options) {
  LogState& state = State();
  std::string output_dir;
  if (!options.log_dir.empty()) {
    output_dir = options.log_dir;
    if (options.session_subdir) {
      if (state.session_dir.empty() || state.session_base != options.log_dir) {
        state.session_dir = JoinPath(options.log_dir, FormatNow(true));
        state.session_base = options.log_dir;
      }
      output_dir = state.session_dir;
    }
    if (!CreateDirectories(output_dir)) {
      return ASYNCKIT_LOG_STATUS(api::StatusCode::kIoError,
                                 "cannot create log directory: " + output_dir);
    }
  }

  if (options.glog_file_output && !output_dir.empty()) {
    FLAGS_log_dir = output_dir;
    FLAGS_logtostderr = options.logtostderr;
    FLAGS_alsologtostderr = options.alsologtostderr;
  } else {
    // Keep glog from opening its own per-severity files.
    FLAGS_log_dir.clear();
    FLAGS_logtostderr = true;
    FLAGS_alsologtostderr = false;
  }
  FLAGS_colorlogtostderr = options.colorlogtostderr;
  FLAGS_log_prefix = options.log_prefix;
  FLAGS_minloglevel = options.min_log_level;
  FLAGS_stderrthreshold = options.stderr_threshold;
  FLAGS_v = options.verbosity;
  FLAGS_max_log_size = static_cast<google::uint32>(std::max(0, options.max_log_size_mb));
  FLAGS_logbufsecs = options.logbufsecs;
  FLAGS_stop_logging_if_full_disk = options.stop_logging_if_full_disk;
  if (options.install_failure_signal_handler && !state.failure_handler_installed) {
    google::InstallFailureSignalHandler();
    state.failure_handler_installed = true;
  }

  RemoveSinkLocked(&state);
  if (options.simple_format || options.json_format) {
    const std::string dir = output_dir.empty() ? std::string(".") : output_dir;
    const std::string file = JoinPath(dir, options.json_format ? "app.jsonl" : "app.log");
    std::unique_ptr<FormattedSink> sink(new FormattedSink(file, options.json_format));
    if (!sink->is_open()) {
      return ASYNCKIT_LOG_STATUS(api::StatusCode::kIoError, "cannot open log sink: " + file);
    }
    google::AddLogSink(sink.get());
    state.sink.reset(sink.release());
  }

  state.options = options;
  return api::Status::Ok();
}

#undef ASYNCKIT_LOG_STATUS

}  // namespace log
}  // namespace asynckit
