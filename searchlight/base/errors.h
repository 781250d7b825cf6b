#ifndef SEARCHLIGHT_BASE_ERRORS_H
#define SEARCHLIGHT_BASE_ERRORS_H

#include <stdexcept>
#include <string>

namespace searchlight {

// invalid n_jobs or unknown configuration entry
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// tensor rank / size / per-unit result shape violations
class ShapeError : public std::invalid_argument {
public:
    explicit ShapeError(const std::string& what) : std::invalid_argument(what) {}
};

// requested operation not offered by the model, and no fallback applies
class CapabilityError : public std::logic_error {
public:
    explicit CapabilityError(const std::string& what) : std::logic_error(what) {}
};

// apply / score requested before fit
class NotFittedError : public std::logic_error {
public:
    explicit NotFittedError(const std::string& what) : std::logic_error(what) {}
};

}  // namespace searchlight

#endif  // SEARCHLIGHT_BASE_ERRORS_H
