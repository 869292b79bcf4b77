// errors.cpp - Error code names

#include <treepatch/errors.h>

namespace treepatch {

std::string_view error_code_name(PatchErrorCode code) noexcept
{
    switch (code) {
        case PatchErrorCode::Success:                return "Success";
        case PatchErrorCode::MalformedPointer:       return "MalformedPointer";
        case PatchErrorCode::MissingField:           return "MissingField";
        case PatchErrorCode::UnrecognizedOp:         return "UnrecognizedOp";
        case PatchErrorCode::PathNotFound:           return "PathNotFound";
        case PatchErrorCode::InvalidKeyForContainer: return "InvalidKeyForContainer";
        case PatchErrorCode::OutOfBounds:            return "OutOfBounds";
        case PatchErrorCode::InvalidRootOperation:   return "InvalidRootOperation";
        case PatchErrorCode::TestFailed:             return "TestFailed";
        case PatchErrorCode::DepthLimitExceeded:     return "DepthLimitExceeded";
    }
    return "Unknown";
}

} // namespace treepatch
