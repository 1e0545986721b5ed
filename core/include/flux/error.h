#pragma once

/**
 * @file error.h
 * @brief Structured build errors
 *
 * Every structural failure (schema, rule list, field set, shader validation)
 * is reported as a BuildError value. The previous simulation, if any, keeps
 * running when a rebuild fails.
 */

#include <string>
#include <utility>

namespace flux {

enum class ErrorKind {
    UnsupportedFieldType,
    InvalidSchema,
    CellSizeTooSmall,
    InvalidRule,
    InvalidField,
    InvalidEmitter,
    ShaderValidation,
    PipelineCreation,
    Device,
    InvalidConfig,
    UnknownParameter,
    TypeMismatch
};

/// @brief Human-readable name of an error kind
const char* errorKindName(ErrorKind kind);

struct BuildError {
    ErrorKind kind = ErrorKind::InvalidSchema;
    std::string message;
    int line = 0;      ///< 1-based WGSL line, 0 when not applicable
    int column = 0;    ///< 1-based WGSL column, 0 when not applicable
    std::string stage; ///< Program that failed ("simulate", "render", ...)

    /// @brief Format as "<kind>: <message> (stage line:col)"
    std::string toString() const;
};

inline BuildError makeError(ErrorKind kind, std::string message) {
    BuildError err;
    err.kind = kind;
    err.message = std::move(message);
    return err;
}

} // namespace flux
