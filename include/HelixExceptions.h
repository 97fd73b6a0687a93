#ifndef HELIX_EXCEPTIONS_H
#define HELIX_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Helix {

class HelixException : public std::runtime_error {
public:
    explicit HelixException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public HelixException {
public:
    explicit IOException(const std::string& message) : HelixException("IO Error: " + message) {}
};

class ConfigurationException : public HelixException {
public:
    explicit ConfigurationException(const std::string& message) : HelixException("Configuration Error: " + message) {}
};

class ShapeMismatchException : public HelixException {
public:
    explicit ShapeMismatchException(const std::string& message) : HelixException("Shape Mismatch: " + message) {}
};

class ModelFormatException : public HelixException {
public:
    explicit ModelFormatException(const std::string& message) : HelixException("Model Format Error: " + message) {}
};

class IndexNotFoundException : public HelixException {
public:
    explicit IndexNotFoundException(const std::string& message) : HelixException("Index Not Found: " + message) {}
};

} // namespace Helix

#endif // HELIX_EXCEPTIONS_H
