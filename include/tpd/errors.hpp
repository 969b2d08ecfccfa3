#ifndef TPD_ERRORS_HPP
#define TPD_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace tpd {

/**
 * @brief Raised when an instrument file cannot be turned into channel tables.
 *
 * Covers a missing channel header, inconsistent column counts and numeric tokens that
 * do not convert after decimal normalization. Only the file being parsed is affected.
 */
class ParseError : public std::runtime_error {
  public:
    ParseError(const std::string &experiment_name, std::size_t line_number, const std::string &message)
      : std::runtime_error(format(experiment_name, line_number, message))
      , experiment_name_(experiment_name)
      , line_number_(line_number) {}

    const std::string &experiment_name() const { return experiment_name_; }

    /// 1-based line number of the offending line, 0 when the error is not tied to a line.
    std::size_t line_number() const { return line_number_; }

  private:
    static std::string format(const std::string &experiment_name, std::size_t line_number, const std::string &message) {
        std::string out = "[" + experiment_name + "]";
        if (line_number > 0) { out += " line " + std::to_string(line_number); }
        return out + ": " + message;
    }

    std::string experiment_name_;
    std::size_t line_number_ = 0;
};

/**
 * @brief Raised for invalid analysis options, before any computation starts.
 */
class ConfigError : public std::invalid_argument {
  public:
    explicit ConfigError(const std::string &message)
      : std::invalid_argument(message) {}
};

/**
 * @brief Raised when the nonlinear calibration fit does not converge.
 */
class FitConvergenceError : public std::runtime_error {
  public:
    FitConvergenceError(const std::string &message, std::string solver_report)
      : std::runtime_error(message)
      , solver_report_(std::move(solver_report)) {}

    const std::string &solver_report() const { return solver_report_; }

  private:
    std::string solver_report_;
};

} // namespace tpd

#endif // TPD_ERRORS_HPP
