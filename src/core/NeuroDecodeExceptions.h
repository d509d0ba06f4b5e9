#ifndef NEURODECODE_EXCEPTIONS_H
#define NEURODECODE_EXCEPTIONS_H

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file NeuroDecodeExceptions.h
 * @brief Exception hierarchy for NeuroDecode
 *
 * Every error raised by the library derives from NeuroDecodeException, which
 * carries the failing component, a category, and suggestions that the
 * command line tool prints alongside the message.
 */

namespace neurodecode {

/**
 * @brief Base exception class for all NeuroDecode errors
 */
class NeuroDecodeException : public std::exception {
public:
  enum class Severity {
    Info,     // Informational, processing can continue
    Warning,  // Warning, might affect results
    Error,    // Error, current operation failed
    Critical, // Critical, analysis state compromised
    Fatal     // Fatal, immediate termination required
  };

  enum class Category {
    InputOutput,   // File I/O and stream decoding errors
    Validation,    // Shape and consistency errors
    Numerical,     // Undefined numerical results
    Configuration, // Parameter errors
    Resource,      // Worker pool and allocation errors
    System         // Everything else
  };

protected:
  std::string m_message;
  std::string m_component;
  std::string m_function;
  Severity m_severity;
  Category m_category;
  std::chrono::system_clock::time_point m_timestamp;
  std::vector<std::string> m_recovery_suggestions;
  std::string m_detailed_context;

public:
  explicit NeuroDecodeException(const std::string &message,
                                const std::string &component = "Unknown",
                                const std::string &function = "Unknown",
                                Severity severity = Severity::Error,
                                Category category = Category::System)
      : m_message(message), m_component(component), m_function(function),
        m_severity(severity), m_category(category),
        m_timestamp(std::chrono::system_clock::now()) {}

  const char *what() const noexcept override { return m_message.c_str(); }

  const std::string &GetMessage() const { return m_message; }
  const std::string &GetComponent() const { return m_component; }
  const std::string &GetFunction() const { return m_function; }
  Severity GetSeverity() const { return m_severity; }
  Category GetCategory() const { return m_category; }

  std::string GetTimestamp() const {
    auto time_t = std::chrono::system_clock::to_time_t(m_timestamp);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
  }

  void AddRecoverySuggestion(const std::string &suggestion) {
    m_recovery_suggestions.push_back(suggestion);
  }

  const std::vector<std::string> &GetRecoverySuggestions() const {
    return m_recovery_suggestions;
  }

  void SetDetailedContext(const std::string &context) {
    m_detailed_context = context;
  }

  const std::string &GetDetailedContext() const { return m_detailed_context; }

  std::string GetFormattedReport() const {
    std::stringstream ss;
    ss << "=== NeuroDecode Error Report ===" << std::endl;
    ss << "Timestamp: " << GetTimestamp() << std::endl;
    ss << "Severity: " << SeverityToString(m_severity) << std::endl;
    ss << "Category: " << CategoryToString(m_category) << std::endl;
    ss << "Component: " << m_component << std::endl;
    ss << "Function: " << m_function << std::endl;
    ss << "Message: " << m_message << std::endl;

    if (!m_detailed_context.empty()) {
      ss << "Context: " << m_detailed_context << std::endl;
    }

    if (!m_recovery_suggestions.empty()) {
      ss << "Recovery Suggestions:" << std::endl;
      for (size_t i = 0; i < m_recovery_suggestions.size(); ++i) {
        ss << "  " << (i + 1) << ". " << m_recovery_suggestions[i] << std::endl;
      }
    }

    return ss.str();
  }

  static std::string SeverityToString(Severity severity) {
    switch (severity) {
    case Severity::Info:
      return "INFO";
    case Severity::Warning:
      return "WARNING";
    case Severity::Error:
      return "ERROR";
    case Severity::Critical:
      return "CRITICAL";
    case Severity::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

  static std::string CategoryToString(Category category) {
    switch (category) {
    case Category::InputOutput:
      return "INPUT_OUTPUT";
    case Category::Validation:
      return "VALIDATION";
    case Category::Numerical:
      return "NUMERICAL";
    case Category::Configuration:
      return "CONFIGURATION";
    case Category::Resource:
      return "RESOURCE";
    case Category::System:
      return "SYSTEM";
    default:
      return "UNKNOWN";
    }
  }
};

/**
 * @brief File access and stream decoding failures
 *
 * Always fatal for the analysis: nothing is written once one is raised.
 */
class DataIOException : public NeuroDecodeException {
public:
  explicit DataIOException(const std::string &filename,
                           const std::string &operation,
                           const std::string &details = "")
      : NeuroDecodeException(
            "Data I/O error during " + operation + " of '" + filename + "'" +
                (details.empty() ? "" : ": " + details),
            "DataIO", operation, Severity::Fatal, Category::InputOutput) {
    AddRecoverySuggestion("Check if file exists and has correct permissions");
    AddRecoverySuggestion(
        "Verify the file was produced by a compatible writer");
    AddRecoverySuggestion("Try using absolute file path");
  }
};

/**
 * @brief Inconsistent matrix shapes between inputs
 */
class ShapeMismatchException : public NeuroDecodeException {
private:
  size_t m_expected;
  size_t m_actual;

public:
  ShapeMismatchException(const std::string &component,
                         const std::string &what_mismatched, size_t expected,
                         size_t actual)
      : NeuroDecodeException("Shape mismatch in " + what_mismatched +
                                 ": expected " + std::to_string(expected) +
                                 ", got " + std::to_string(actual),
                             component, what_mismatched, Severity::Error,
                             Category::Validation),
        m_expected(expected), m_actual(actual) {
    AddRecoverySuggestion("Check that all trial-wise inputs share one row per "
                          "trial in run-major order");
    AddRecoverySuggestion("Check the configured run length");
  }

  size_t GetExpected() const { return m_expected; }
  size_t GetActual() const { return m_actual; }
};

/**
 * @brief Undefined numerical results the configured policy refuses to clamp
 */
class NumericalException : public NeuroDecodeException {
public:
  explicit NumericalException(const std::string &operation,
                              const std::string &problem_description,
                              double offending_value = 0.0)
      : NeuroDecodeException("Numerical error in " + operation + ": " +
                                 problem_description,
                             "Numerics", operation, Severity::Error,
                             Category::Numerical) {
    std::stringstream context;
    context << "Offending value: " << std::setprecision(17) << offending_value;
    SetDetailedContext(context.str());

    AddRecoverySuggestion("Use the clamp correlation policy");
    AddRecoverySuggestion("Check for duplicated or constant test trials");
  }
};

/**
 * @brief Configuration and parameter validation exceptions
 */
class ConfigurationException : public NeuroDecodeException {
public:
  explicit ConfigurationException(const std::string &parameter_name,
                                  const std::string &invalid_value,
                                  const std::string &expected_format = "")
      : NeuroDecodeException(
            "Invalid configuration parameter '" + parameter_name +
                "' with value '" + invalid_value + "'" +
                (expected_format.empty()
                     ? ""
                     : " (expected: " + expected_format + ")"),
            "Configuration", "Parameter Validation", Severity::Error,
            Category::Configuration) {
    AddRecoverySuggestion("Check parameter documentation for valid ranges");
    AddRecoverySuggestion("Use default parameter values as starting point");
  }
};

/**
 * @brief Worker pool and allocation failures
 */
class ResourceException : public NeuroDecodeException {
public:
  explicit ResourceException(const std::string &resource_type,
                             const std::string &failure)
      : NeuroDecodeException("Resource failure for " + resource_type + ": " +
                                 failure,
                             "ResourceManager", resource_type,
                             Severity::Critical, Category::Resource) {
    AddRecoverySuggestion("Reduce the number of worker threads");
    AddRecoverySuggestion("Check available system memory");
  }
};

} // namespace neurodecode

#endif // NEURODECODE_EXCEPTIONS_H
