#include "admin_result.h"

namespace pluginconf {

QString adminErrorToString(AdminError error) {
    switch (error) {
    case AdminError::None:
        return "None";
    case AdminError::MissingConfiguration:
        return "MissingConfiguration";
    case AdminError::MissingId:
        return "MissingId";
    case AdminError::UnexpectedId:
        return "UnexpectedId";
    case AdminError::IdMismatch:
        return "IdMismatch";
    case AdminError::SchemaViolation:
        return "SchemaViolation";
    case AdminError::InvalidPatchPath:
        return "InvalidPatchPath";
    case AdminError::ResourceInUse:
        return "ResourceInUse";
    case AdminError::DependencyError:
        return "DependencyError";
    case AdminError::ConcurrencyConflict:
        return "ConcurrencyConflict";
    }
    return "Unknown";
}

} // namespace pluginconf
