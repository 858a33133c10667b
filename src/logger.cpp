#include <ostream>

// Local includes
#include "detection_eval/logger.hpp"


namespace detection_eval
{

void Logger::log(Severity severity, const std::string & msg) const noexcept
{
  if (severity <= min_severity_) {
    const char * severity_str;
    switch (severity) {
      case Severity::kERROR: severity_str = "ERROR"; break;
      case Severity::kWARNING: severity_str = "WARNING"; break;
      case Severity::kINFO: severity_str = "INFO"; break;
      case Severity::kVERBOSE: severity_str = "VERBOSE"; break;
      default: severity_str = "UNKNOWN"; break;
    }
    *out_ << "[detection_eval " << severity_str << "] " << msg << std::endl;
  }
}

} // namespace detection_eval
