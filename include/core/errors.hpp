#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace vg {

// ============================================================================
// Error Hierarchy
// ============================================================================

/**
 * @brief Base failure type for everything raised by versegraph
 *
 * Components that wrap a lower-level failure rethrow with std::throw_with_nested,
 * so the original cause stays reachable through std::rethrow_if_nested.
 */
class VerseGraphError : public std::runtime_error {
public:
    explicit VerseGraphError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Source document is missing, unreadable, not JSON, or the data path is invalid
class DataLoadError : public VerseGraphError {
public:
    using VerseGraphError::VerseGraphError;
};

/// Source document is present but structurally wrong
class DataValidationError : public VerseGraphError {
public:
    using VerseGraphError::VerseGraphError;
};

class NormalizationError : public VerseGraphError {
public:
    using VerseGraphError::VerseGraphError;
};

class TokenizationError : public VerseGraphError {
public:
    using VerseGraphError::VerseGraphError;
};

class TransliterationError : public VerseGraphError {
public:
    using VerseGraphError::VerseGraphError;
};

/// Invalid filter bounds or a custom predicate that threw
class FilterError : public VerseGraphError {
public:
    using VerseGraphError::VerseGraphError;
};

class GraphBuildError : public VerseGraphError {
public:
    using VerseGraphError::VerseGraphError;
};

class ExportError : public VerseGraphError {
public:
    using VerseGraphError::VerseGraphError;
};

/// Query issued against a corpus that has not been built
class CorpusStateError : public VerseGraphError {
public:
    using VerseGraphError::VerseGraphError;
};

class ConfigError : public VerseGraphError {
public:
    using VerseGraphError::VerseGraphError;
};

/**
 * @brief Flatten a nested exception chain into "outer: inner: innermost"
 */
std::string describe_exception(const std::exception& e);

} // namespace vg
