// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <contracts/error.h>
#include <util.h>

namespace ABVM {

std::string ContractErrorKindToString(ContractErrorKind kind)
{
    switch (kind) {
        case ContractErrorKind::BAD_INPUT: return "BadInput";
        case ContractErrorKind::BAD_OUTPUT: return "BadOutput";
        case ContractErrorKind::FORBIDDEN: return "Forbidden";
        case ContractErrorKind::NOT_FOUND: return "NotFound";
        case ContractErrorKind::CONFLICT: return "Conflict";
        case ContractErrorKind::INTERNAL_ERROR: return "InternalError";
        case ContractErrorKind::NOT_IMPLEMENTED: return "NotImplemented";
        case ContractErrorKind::UNKNOWN: return "Unknown";
        case ContractErrorKind::CUSTOM: return "Custom";
    }
    return "Unknown";
}

std::optional<ContractError> ContractError::Custom(uint64_t code)
{
    if (code <= 255) {
        return std::nullopt;
    }
    return ContractError(ContractErrorKind::CUSTOM, code);
}

std::optional<ContractError> ContractError::FromExitCode(ExitCode code)
{
    switch (code) {
        case EXIT_CODE_OK: return std::nullopt;
        case 1: return BadInput();
        case 2: return BadOutput();
        case 3: return Forbidden();
        case 4: return NotFound();
        case 5: return Conflict();
        case 6: return InternalError();
        case 7: return NotImplemented();
        default:
            break;
    }
    if (code <= 255) {
        return ContractError(ContractErrorKind::UNKNOWN, code);
    }
    return ContractError(ContractErrorKind::CUSTOM, code);
}

std::string ContractError::ToString() const
{
    if (kind == ContractErrorKind::UNKNOWN || kind == ContractErrorKind::CUSTOM) {
        return strprintf("%s(%u)", ContractErrorKindToString(kind), code);
    }
    return ContractErrorKindToString(kind);
}

} // namespace ABVM
