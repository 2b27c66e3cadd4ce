#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace at {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from the command line and config file, not from
  // easylogging's own --v flags
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  // %thread prints the name given by setThreadName
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  return conf;
}

void LogHandler::setupStdoutLogger() {
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format, "%msg");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), conf);
}

void LogHandler::configureLogging(el::Configurations *defaultConf,
                                  const LoggingConfig &config,
                                  const string &filenamePrefix) {
  el::Loggers::setVerboseLevel(config.verbose);
  if (config.silent) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  }

  string logPath =
      createLogFile(config.logDirectory, logFileName(filenamePrefix, ""));
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           config.maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           config.logToStdout ? "true" : "false");

  if (config.redirectStderr && !config.logToStdout) {
    redirectStderr(config.logDirectory,
                   logFileName(filenamePrefix, "stderr-"));
  }

  el::Loggers::reconfigureLogger("default", *defaultConf);
  el::Helpers::installPreRollOutCallback(LogHandler::removeRolledLog);
}

void LogHandler::removeRolledLog(const char *filename, std::size_t size) {
  // The log file is closed while this runs, so nothing may be logged here
  remove(filename);
}

string LogHandler::logFileName(const string &filenamePrefix,
                               const string &kind) {
  char stamp[32];
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &local);
  return filenamePrefix + "-" + kind + stamp + "_" + to_string(getpid()) +
         ".log";
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << directory
                          << ": " << ec.message() << endl;
    exit(1);
  }
  string path = (fs::path(directory) / filename).string();
  int fd = ::open(path.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return path;
}

void LogHandler::redirectStderr(const string &directory,
                                const string &filename) {
  string path = createLogFile(directory, filename);
  FILE *stream = freopen(path.c_str(), "w", stderr);
  if (stream == NULL) {
    STFATAL << "Cannot redirect stderr to " << path;
  }
  setvbuf(stream, NULL, _IOLBF, BUFSIZ);
}
}  // namespace at
