#include "svm/program_error.h"

namespace pinion {
namespace svm {

const char* program_error_to_string(ProgramError error) {
    switch (error) {
        case ProgramError::NotSigner: return "NotSigner";
        case ProgramError::MissingRequiredSignature: return "MissingRequiredSignature";
        case ProgramError::InvalidOwner: return "InvalidOwner";
        case ProgramError::InvalidAccountData: return "InvalidAccountData";
        case ProgramError::InvalidAddress: return "InvalidAddress";
        case ProgramError::InsufficientAccounts: return "InsufficientAccounts";
        case ProgramError::IncorrectProgramId: return "IncorrectProgramId";
        case ProgramError::InvalidSeeds: return "InvalidSeeds";
        case ProgramError::InvalidInstructionData: return "InvalidInstructionData";
        case ProgramError::InvalidArgument: return "InvalidArgument";
        case ProgramError::InvalidState: return "InvalidState";
        case ProgramError::Expired: return "Expired";
        case ProgramError::ArithmeticOverflow: return "ArithmeticOverflow";
        case ProgramError::SlippageExceeded: return "SlippageExceeded";
        case ProgramError::ZeroAmount: return "ZeroAmount";
        case ProgramError::InsufficientFunds: return "InsufficientFunds";
        case ProgramError::NotRentExempt: return "NotRentExempt";
        case ProgramError::AccountAlreadyInUse: return "AccountAlreadyInUse";
        case ProgramError::AccountAlreadyInitialized: return "AccountAlreadyInitialized";
        case ProgramError::UninitializedAccount: return "UninitializedAccount";
        case ProgramError::MintMismatch: return "MintMismatch";
        case ProgramError::OwnerMismatch: return "OwnerMismatch";
        case ProgramError::AccountFrozen: return "AccountFrozen";
        case ProgramError::NonZeroBalance: return "NonZeroBalance";
        case ProgramError::ReadonlyDataModified: return "ReadonlyDataModified";
        case ProgramError::ExternalAccountDataModified: return "ExternalAccountDataModified";
        case ProgramError::ExternalAccountLamportSpend: return "ExternalAccountLamportSpend";
        case ProgramError::UnbalancedInstruction: return "UnbalancedInstruction";
        case ProgramError::PrivilegeEscalation: return "PrivilegeEscalation";
        case ProgramError::MissingAccount: return "MissingAccount";
        case ProgramError::UnsupportedProgramId: return "UnsupportedProgramId";
        case ProgramError::CallDepthExceeded: return "CallDepthExceeded";
        case ProgramError::ReentrancyNotAllowed: return "ReentrancyNotAllowed";
        case ProgramError::ComputeBudgetExceeded: return "ComputeBudgetExceeded";
    }
    return "Unknown";
}

std::string ProgramStatus::to_string() const {
    if (success_) {
        return "Ok";
    }
    std::string text = program_error_to_string(error_);
    if (!detail_.empty()) {
        text += ": " + detail_;
    }
    return text;
}

} // namespace svm
} // namespace pinion
