#ifndef IMBALANCE_EXCEPTIONS_H
#define IMBALANCE_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Imbalance {

class ImbalanceException : public std::runtime_error {
public:
    explicit ImbalanceException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public ImbalanceException {
public:
    explicit IOException(const std::string& message) : ImbalanceException("IO Error: " + message) {}
};

class DatasetException : public ImbalanceException {
public:
    explicit DatasetException(const std::string& message) : ImbalanceException("Dataset Error: " + message) {}
};

class ConfigurationException : public ImbalanceException {
public:
    explicit ConfigurationException(const std::string& message) : ImbalanceException("Configuration Error: " + message) {}
};

// Raised when transform() runs before fit() or on data other than the fitted data.
class NotFittedException : public ImbalanceException {
public:
    explicit NotFittedException(const std::string& message) : ImbalanceException("Sampler Error: " + message) {}
};

} // namespace Imbalance

#endif // IMBALANCE_EXCEPTIONS_H
