// Flux - Build Error Formatting

#include <flux/error.h>

namespace flux {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedFieldType: return "UnsupportedFieldType";
        case ErrorKind::InvalidSchema: return "InvalidSchema";
        case ErrorKind::CellSizeTooSmall: return "CellSizeTooSmall";
        case ErrorKind::InvalidRule: return "InvalidRule";
        case ErrorKind::InvalidField: return "InvalidField";
        case ErrorKind::InvalidEmitter: return "InvalidEmitter";
        case ErrorKind::ShaderValidation: return "ShaderValidation";
        case ErrorKind::PipelineCreation: return "PipelineCreation";
        case ErrorKind::Device: return "Device";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
        case ErrorKind::UnknownParameter: return "UnknownParameter";
        case ErrorKind::TypeMismatch: return "TypeMismatch";
    }
    return "Unknown";
}

std::string BuildError::toString() const {
    std::string out = errorKindName(kind);
    out += ": ";
    out += message;
    if (!stage.empty() || line > 0) {
        out += " (";
        out += stage.empty() ? "shader" : stage;
        if (line > 0) {
            out += " " + std::to_string(line) + ":" + std::to_string(column);
        }
        out += ")";
    }
    return out;
}

} // namespace flux
