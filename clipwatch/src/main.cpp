/**
 * @file main.cpp
 * @brief clipwatch daemon entry point
 *
 * Appends every CLIPBOARD change to a JSON history file until SIGINT,
 * SIGTERM or SIGHUP arrives.
 */

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include <sys/signalfd.h>
#include <unistd.h>

#include <clipwatch/clipwatch.h>

namespace {

constexpr const char *kComponent = "main";

enum class ParseStatus { Run, Exit, Fail };

void print_usage(const char *argv0) {
  std::cout << "Usage: " << argv0 << " [options]\n"
            << "\n"
            << "Record X11 CLIPBOARD changes to a JSON history file.\n"
            << "\n"
            << "Options:\n"
            << "  -d, --display NAME   X display (default: $DISPLAY)\n"
            << "  -o, --output PATH    history file (default: "
               "$CLIPWATCH_OUTPUT or\n"
            << "                       $XDG_DATA_HOME/clipwatch/"
            << clipwatch::kDefaultOutputName << ")\n"
            << "  -v, --verbose        log protocol details\n"
            << "  -q, --quiet          log errors only\n"
            << "  -h, --help           show this help\n"
            << "      --version        show version\n";
}

ParseStatus parse_args(int argc, char *argv[], clipwatch::WatcherConfig &config) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return ParseStatus::Exit;
    } else if (arg == "--version") {
      std::cout << "clipwatch " << CLIPWATCH_VERSION_STRING << std::endl;
      return ParseStatus::Exit;
    } else if (arg == "-v" || arg == "--verbose") {
      config.log_level = clipwatch::LogLevel::Debug;
    } else if (arg == "-q" || arg == "--quiet") {
      config.log_level = clipwatch::LogLevel::Error;
    } else if (arg == "-d" || arg == "--display" || arg == "-o" ||
               arg == "--output") {
      if (i + 1 >= argc) {
        std::cerr << argv[0] << ": " << arg << " needs a value" << std::endl;
        return ParseStatus::Fail;
      }
      std::string value = argv[++i];
      if (arg == "-d" || arg == "--display") {
        config.display_name = value;
      } else {
        config.output_path = value;
      }
    } else {
      std::cerr << argv[0] << ": unknown option " << arg << std::endl;
      print_usage(argv[0]);
      return ParseStatus::Fail;
    }
  }
  return ParseStatus::Run;
}

/**
 * @brief Owns the signalfd that turns termination signals into a readable fd
 */
class TerminationSignals {
public:
  TerminationSignals() {
    sigemptyset(&mask_);
    sigaddset(&mask_, SIGINT);
    sigaddset(&mask_, SIGTERM);
    sigaddset(&mask_, SIGHUP);
  }

  ~TerminationSignals() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  TerminationSignals(const TerminationSignals &) = delete;
  TerminationSignals &operator=(const TerminationSignals &) = delete;

  clipwatch::Result<void> install() {
    if (sigprocmask(SIG_BLOCK, &mask_, nullptr) != 0) {
      return clipwatch::Error(clipwatch::ErrorCode::Unknown,
                              "sigprocmask failed", std::strerror(errno));
    }
    fd_ = signalfd(-1, &mask_, SFD_CLOEXEC);
    if (fd_ < 0) {
      return clipwatch::Error(clipwatch::ErrorCode::Unknown,
                              "signalfd failed", std::strerror(errno));
    }
    return clipwatch::Result<void>::ok();
  }

  int fd() const { return fd_; }

private:
  sigset_t mask_;
  int fd_ = -1;
};

} // namespace

int main(int argc, char *argv[]) {
  using namespace clipwatch;

  WatcherConfig config;
  config.load_defaults();

  const char *env_output = std::getenv("CLIPWATCH_OUTPUT");
  if (env_output && *env_output) {
    config.output_path = env_output;
  }

  switch (parse_args(argc, argv, config)) {
  case ParseStatus::Exit:
    return EXIT_SUCCESS;
  case ParseStatus::Fail:
    return EXIT_FAILURE;
  case ParseStatus::Run:
    break;
  }

  set_log_level(config.log_level);

  auto valid = config.validate();
  if (valid.is_error()) {
    CLIPWATCH_LOG_ERROR(kComponent, valid.error().to_string());
    return EXIT_FAILURE;
  }

  TerminationSignals signals;
  auto installed = signals.install();
  if (installed.is_error()) {
    CLIPWATCH_LOG_ERROR(kComponent, installed.error().to_string());
    return EXIT_FAILURE;
  }

  X11ConnectOptions options;
  options.display_name = config.display_name;
  options.termination_fd = signals.fd();

  auto transport = connect_x11(options);
  if (transport.is_error()) {
    CLIPWATCH_LOG_ERROR(kComponent, transport.error().to_string());
    return EXIT_FAILURE;
  }

  auto connection = ConnectionHandle::open(std::move(transport).value());
  if (connection.is_error()) {
    CLIPWATCH_LOG_ERROR(kComponent, connection.error().to_string());
    return EXIT_FAILURE;
  }

  JsonFileSink history(config.output_path);
  WatcherOptions watcher_options;
  watcher_options.target_priority = config.target_priority;

  ClipboardWatcher watcher(*connection.value(), history.as_sink(),
                           watcher_options);

  CLIPWATCH_LOG_INFO(kComponent, "clipwatch " << CLIPWATCH_VERSION_STRING
                                              << ", history at "
                                              << history.path().string());

  auto result = watcher.run();

  const WatcherStats &stats = watcher.stats();
  CLIPWATCH_LOG_INFO(kComponent, stats.records_emitted << " of "
                                                       << stats.notifications
                                                       << " changes recorded");

  // Connection is torn down by ConnectionHandle on scope exit
  if (result.is_ok() || result.error().code == ErrorCode::Terminated) {
    return EXIT_SUCCESS;
  }
  CLIPWATCH_LOG_ERROR(kComponent, result.error().to_string());
  return EXIT_FAILURE;
}
