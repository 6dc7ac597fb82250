#pragma once

#include "api_export.h"
#include <stdexcept>
#include <string>

namespace cloudspend {

// Base for every error raised by the analysis core
class CLOUDSPEND_API CostAnalysisError : public std::runtime_error {
public:
    explicit CostAnalysisError(const std::string& message)
        : std::runtime_error(message) {}
};

// History too short for the requested computation
class CLOUDSPEND_API InsufficientDataError : public CostAnalysisError {
public:
    explicit InsufficientDataError(const std::string& message)
        : CostAnalysisError(message) {}
};

// Recommendation state machine violation (e.g. resolving twice)
class CLOUDSPEND_API InvalidTransitionError : public CostAnalysisError {
public:
    explicit InvalidTransitionError(const std::string& message)
        : CostAnalysisError(message) {}
};

// Unknown recommendation id
class CLOUDSPEND_API NotFoundError : public CostAnalysisError {
public:
    explicit NotFoundError(const std::string& message)
        : CostAnalysisError(message) {}
};

// Narrative provider or upstream cost data source failed
class CLOUDSPEND_API ExternalProviderError : public CostAnalysisError {
public:
    explicit ExternalProviderError(const std::string& message)
        : CostAnalysisError(message) {}
};

// Caller supplied malformed input (bad series, negative amounts, ...)
class CLOUDSPEND_API InvalidInputError : public CostAnalysisError {
public:
    explicit InvalidInputError(const std::string& message)
        : CostAnalysisError(message) {}
};

// Underlying database failure
class CLOUDSPEND_API StorageError : public CostAnalysisError {
public:
    explicit StorageError(const std::string& message)
        : CostAnalysisError(message) {}
};

} // namespace cloudspend
