#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstdint>
#include <iostream>
#include <string>


namespace detection_eval
{

// Evaluation logger with configurable severity
class Logger
{
public:
  enum class Severity : int32_t
  {
    kERROR = 1,
    kWARNING = 2,
    kINFO = 3,
    kVERBOSE = 4
  };

  /**
   * @brief Create a logger
   * @param min_severity Messages less severe than this are dropped
   * @param out Sink for the formatted messages
   */
  explicit Logger(Severity min_severity = Severity::kINFO, std::ostream & out = std::cerr)
  : min_severity_(min_severity), out_(&out) {}

  void log(Severity severity, const std::string & msg) const noexcept;

  void error(const std::string & msg) const noexcept { log(Severity::kERROR, msg); }
  void warning(const std::string & msg) const noexcept { log(Severity::kWARNING, msg); }
  void info(const std::string & msg) const noexcept { log(Severity::kINFO, msg); }
  void verbose(const std::string & msg) const noexcept { log(Severity::kVERBOSE, msg); }

  Severity min_severity() const noexcept { return min_severity_; }

private:
  Severity min_severity_;
  std::ostream * out_;
};

} // namespace detection_eval
