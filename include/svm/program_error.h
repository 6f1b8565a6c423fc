#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace pinion {
namespace svm {

/**
 * Typed failure reasons reported by programs and by the host runtime.
 * The numeric values are stable and appear in transaction logs.
 */
enum class ProgramError : uint32_t {
    // Account validation
    NotSigner = 1,
    MissingRequiredSignature,
    InvalidOwner,
    InvalidAccountData,
    InvalidAddress,
    InsufficientAccounts,
    IncorrectProgramId,
    InvalidSeeds,

    // Instruction payload and state
    InvalidInstructionData,
    InvalidArgument,
    InvalidState,
    Expired,

    // Arithmetic and pricing
    ArithmeticOverflow,
    SlippageExceeded,
    ZeroAmount,

    // Token and system semantics
    InsufficientFunds,
    NotRentExempt,
    AccountAlreadyInUse,
    AccountAlreadyInitialized,
    UninitializedAccount,
    MintMismatch,
    OwnerMismatch,
    AccountFrozen,
    NonZeroBalance,

    // Host runtime enforcement
    ReadonlyDataModified,
    ExternalAccountDataModified,
    ExternalAccountLamportSpend,
    UnbalancedInstruction,
    PrivilegeEscalation,
    MissingAccount,
    UnsupportedProgramId,
    CallDepthExceeded,
    ReentrancyNotAllowed,
    ComputeBudgetExceeded
};

const char* program_error_to_string(ProgramError error);

inline std::ostream& operator<<(std::ostream& os, ProgramError error) {
    return os << program_error_to_string(error);
}

/**
 * Success or a typed failure with an optional detail message.
 */
class ProgramStatus {
public:
    ProgramStatus() = default;

    static ProgramStatus ok() { return ProgramStatus(); }

    static ProgramStatus fail(ProgramError error, std::string detail = "") {
        ProgramStatus status;
        status.success_ = false;
        status.error_ = error;
        status.detail_ = std::move(detail);
        return status;
    }

    bool is_ok() const noexcept { return success_; }
    bool is_err() const noexcept { return !success_; }

    /// Only meaningful if is_err()
    ProgramError error() const noexcept { return error_; }
    const std::string& detail() const noexcept { return detail_; }

    const ProgramStatus& status() const noexcept { return *this; }

    /// "InvalidOwner: escrow account" style description
    std::string to_string() const;

private:
    bool success_ = true;
    ProgramError error_ = ProgramError::InvalidArgument;
    std::string detail_;
};

/**
 * Value-or-failure return type for program-side operations.
 *
 * A failed ProgramStatus converts implicitly so handlers can forward a
 * failure without restating it.
 */
template <typename T>
class ProgramResult {
public:
    ProgramResult(T value) : value_(std::move(value)) {}
    ProgramResult(ProgramStatus status) : status_(std::move(status)) {}

    bool is_ok() const noexcept { return status_.is_ok(); }
    bool is_err() const noexcept { return status_.is_err(); }

    /// Only call if is_ok()
    const T& value() const & { return *value_; }
    T&& value() && { return std::move(*value_); }

    ProgramError error() const noexcept { return status_.error(); }
    const std::string& detail() const noexcept { return status_.detail(); }
    const ProgramStatus& status() const noexcept { return status_; }

private:
    std::optional<T> value_;
    ProgramStatus status_;
};

} // namespace svm
} // namespace pinion

/**
 * Return the failure of a ProgramStatus or ProgramResult expression from the
 * enclosing function.
 */
#define RETURN_IF_ERROR(expr) \
    do { \
        auto&& _pinion_status = (expr); \
        if (_pinion_status.is_err()) { \
            return _pinion_status.status(); \
        } \
    } while (0)
