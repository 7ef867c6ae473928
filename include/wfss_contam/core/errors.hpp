#pragma once

#include <stdexcept>
#include <string>

namespace wfss_contam {

class WfssContamError : public std::runtime_error {
public:
    explicit WfssContamError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public WfssContamError {
public:
    explicit ConfigError(const std::string& message)
        : WfssContamError("Config error: " + message) {}
};

class ValidationError : public WfssContamError {
public:
    explicit ValidationError(const std::string& message)
        : WfssContamError("Validation error: " + message) {}
};

class IOError : public WfssContamError {
public:
    explicit IOError(const std::string& message)
        : WfssContamError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Missing source id, reference-table entry or transform order
class LookupError : public WfssContamError {
public:
    explicit LookupError(const std::string& message)
        : WfssContamError("Lookup error: " + message) {}
};

// Cutout window outside the simulated frame
class BoundsError : public WfssContamError {
public:
    explicit BoundsError(const std::string& message)
        : WfssContamError("Bounds error: " + message) {}
};

} // namespace wfss_contam
