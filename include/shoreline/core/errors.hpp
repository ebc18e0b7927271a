#pragma once

#include <stdexcept>
#include <string>

namespace shoreline {

class ShorelineError : public std::runtime_error {
public:
    explicit ShorelineError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public ShorelineError {
public:
    explicit ConfigError(const std::string& message)
        : ShorelineError("Config error: " + message) {}
};

class ValidationError : public ShorelineError {
public:
    explicit ValidationError(const std::string& message)
        : ShorelineError("Validation error: " + message) {}
};

class IOError : public ShorelineError {
public:
    explicit IOError(const std::string& message)
        : ShorelineError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Missing or empty inputs for a tile
class NoDataError : public ShorelineError {
public:
    explicit NoDataError(const std::string& message)
        : ShorelineError("No data: " + message) {}
};

class GeometryError : public ShorelineError {
public:
    explicit GeometryError(const std::string& message)
        : ShorelineError("Geometry error: " + message) {}
};

class ContourError : public ShorelineError {
public:
    explicit ContourError(const std::string& message)
        : ShorelineError("Contour error: " + message) {}
};

class PipelineError : public ShorelineError {
public:
    explicit PipelineError(const std::string& message)
        : ShorelineError("Pipeline error: " + message) {}
};

} // namespace shoreline
