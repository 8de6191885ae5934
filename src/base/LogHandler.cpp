#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace cpa {
namespace {
const char* const LINE_FORMAT = "[%level %datetime %thread %fbase:%line] %msg";
const char* const VERBOSE_LINE_FORMAT =
    "[%levshort%vlevel %datetime %thread %fbase:%line] %msg";

// <prefix>[-<kind>]-<local start time>[_<pid>].log
string logFileName(const string& prefix, const string& kind,
                   const string& startTime, bool appendPid) {
  string name = prefix;
  if (!kind.empty()) {
    name += "-" + kind;
  }
  name += "-" + startTime;
  if (appendPid) {
    name += "_" + to_string(::getpid());
  }
  return name + ".log";
}

string localStartTime() {
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &local);
  return string(buffer);
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int* argc, char*** argv) {
  // Verbosity comes from cxxopts or the INI file; easylogging still parses
  // --v/--vmodule here for debugging single modules.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  // %thread prints the names set per reader thread (login-<id>)
  conf.setGlobally(el::ConfigurationType::Format, LINE_FORMAT);
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           VERBOSE_LINE_FORMAT);
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  return conf;
}

string LogHandler::setupLogFiles(el::Configurations* defaultConf,
                                 const string& path,
                                 const string& filenamePrefix,
                                 bool logToStdout, bool redirectStderrToFile,
                                 bool appendPid, string maxlogsize) {
  const string startTime = localStartTime();
  string logPath = createLogFile(
      path, logFileName(filenamePrefix, "", startTime, appendPid));

  // Size is checked on every write so rolloutHandler fires at maxlogsize
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    stderrToFile(path,
                 logFileName(filenamePrefix, "stderr", startTime, appendPid));
  }
  return logPath;
}

void LogHandler::rolloutHandler(const char* filename, std::size_t size) {
  // Called with the log file closed, logging from here would recurse.
  // Old login transcripts are not kept.
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  // Used for --help, --version and the listening banner
  el::Logger* stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string& path, const string& filename) {
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error& fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << path << ": "
                          << fse.what() << endl;
    exit(1);
  }
  const string logPath = (fs::path(path) / filename).string();
  // Readable by the server user only
  int fd = ::open(logPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT | O_WRONLY,
                  0600);
  FATAL_FAIL(fd);
  FATAL_FAIL(::close(fd));
  return logPath;
}

void LogHandler::stderrToFile(const string& path,
                              const string& stderrFilename) {
  // Crash output of the server lands beside its log
  string stderrPath = createLogFile(path, stderrFilename);
  FILE* stderrStream = freopen(stderrPath.c_str(), "w", stderr);
  if (!stderrStream) {
    STFATAL << "Cannot redirect stderr to " << stderrPath;
  }
  setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);
}

}  // namespace cpa
