#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <stdexcept>
#include <string>


namespace detection_eval
{

// Base class for all errors raised by the evaluation engine
class EvaluationException : public std::runtime_error
{
public:
  explicit EvaluationException(const std::string & message)
  : std::runtime_error(message) {}
};

// Fatal configuration problems: bad ground-truth source, inconsistent
// tensors across processes at merge time
class ConfigurationError : public EvaluationException
{
public:
  explicit ConfigurationError(const std::string & message)
  : EvaluationException(message) {}
};

// Only bounding-box evaluation is implemented
class UnsupportedIoUType : public ConfigurationError
{
public:
  explicit UnsupportedIoUType(const std::string & iou_type)
  : ConfigurationError("Unsupported iou type: " + iou_type +
      ", only bbox evaluation is implemented") {}
};

// A participant left the gather, the collective cannot complete
class GatherAborted : public EvaluationException
{
public:
  explicit GatherAborted(const std::string & message)
  : EvaluationException(message) {}
};

} // namespace detection_eval
