// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_CONTRACTS_ERROR_H
#define ABVM_CONTRACTS_ERROR_H

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace ABVM {

/**
 * Exit code of a contract method, 0 means success.
 *
 * Codes 1..7 are the well-known errors, 8..255 are reserved and reported as
 * unknown, anything above is a contract-specific custom error.
 */
using ExitCode = uint64_t;

static constexpr ExitCode EXIT_CODE_OK = 0;

enum class ContractErrorKind : uint8_t {
    BAD_INPUT,
    BAD_OUTPUT,
    FORBIDDEN,
    NOT_FOUND,
    CONFLICT,
    INTERNAL_ERROR,
    NOT_IMPLEMENTED,
    UNKNOWN,
    CUSTOM,
};

std::string ContractErrorKindToString(ContractErrorKind kind);

/**
 * @brief Error returned by contract methods and by the executor on their behalf
 */
class ContractError {
public:
    static ContractError BadInput() { return ContractError(ContractErrorKind::BAD_INPUT, 1); }
    static ContractError BadOutput() { return ContractError(ContractErrorKind::BAD_OUTPUT, 2); }
    static ContractError Forbidden() { return ContractError(ContractErrorKind::FORBIDDEN, 3); }
    static ContractError NotFound() { return ContractError(ContractErrorKind::NOT_FOUND, 4); }
    static ContractError Conflict() { return ContractError(ContractErrorKind::CONFLICT, 5); }
    static ContractError InternalError() { return ContractError(ContractErrorKind::INTERNAL_ERROR, 6); }
    static ContractError NotImplemented() { return ContractError(ContractErrorKind::NOT_IMPLEMENTED, 7); }

    /** Custom error, only codes above 255 are accepted */
    static std::optional<ContractError> Custom(uint64_t code);

    /** Interpret a non-zero exit code; returns nothing for EXIT_CODE_OK */
    static std::optional<ContractError> FromExitCode(ExitCode code);

    ContractErrorKind Kind() const { return kind; }
    ExitCode Code() const { return code; }

    std::string ToString() const;

    bool operator==(const ContractError& other) const { return code == other.code; }
    bool operator!=(const ContractError& other) const { return code != other.code; }

private:
    ContractError(ContractErrorKind kindIn, uint64_t codeIn) : kind(kindIn), code(codeIn) {}

    ContractErrorKind kind;
    ExitCode code;
};

inline std::ostream& operator<<(std::ostream& os, const ContractError& error) {
    return os << error.ToString();
}

/**
 * @brief Outcome of a contract call: success or a ContractError
 */
struct ContractResult {
    std::optional<ContractError> error;

    static ContractResult Ok() { return ContractResult(); }
    static ContractResult Err(const ContractError& err) {
        ContractResult result;
        result.error = err;
        return result;
    }
    static ContractResult FromExitCode(ExitCode code) {
        ContractResult result;
        result.error = ContractError::FromExitCode(code);
        return result;
    }

    ExitCode ToExitCode() const { return error ? error->Code() : EXIT_CODE_OK; }

    explicit operator bool() const { return !error.has_value(); }
};

inline std::ostream& operator<<(std::ostream& os, const ContractResult& result) {
    return os << (result ? std::string("Ok") : result.error->ToString());
}

} // namespace ABVM

#endif // ABVM_CONTRACTS_ERROR_H
