#pragma once

#include <string>

namespace asynckit {
namespace log {

enum class LogSeverity { kInfo = 0, kWarning = 1, kError = 2, kFatal = 3 };

// Normalized logging options parsed from a key = value config file and applied to glog flags.
struct LoggingOptions {
  std::string log_dir;
  bool session_subdir = true;  // create <log_dir>/<timestamp>/ for this run
  bool simple_format = false;  // custom sink: "<ts> [I] message" into app.log
  bool json_format = false;    // custom sink: JSON lines into app.jsonl
  // When false, glog per-severity files are disabled and only the custom sink writes files.
  bool glog_file_output = false;
  bool install_failure_signal_handler = false;
  bool logtostderr = false;
  bool alsologtostderr = false;
  bool colorlogtostderr = true;
  bool log_prefix = true;
  int min_log_level = 0;       // INFO=0, WARNING=1, ERROR=2, FATAL=3
  int stderr_threshold = 2;
  int verbosity = 0;           // VLOG level, runtime dispatch tracing starts at 1
  int max_log_size_mb = 1800;
  int logbufsecs = 30;
  bool stop_logging_if_full_disk = false;
};

}  // namespace log
}  // namespace asynckit
