#include "programs/amm/curve.h"
#include "programs/amm/amm_state.h"
#include <limits>
#include <string>

namespace pinion {
namespace programs {
namespace amm {

using svm::ProgramError;
using svm::ProgramStatus;

namespace {

using u128 = unsigned __int128;

ProgramResult<uint64_t> narrow(u128 value) {
    if (value > std::numeric_limits<uint64_t>::max()) {
        return ProgramStatus::fail(ProgramError::ArithmeticOverflow, "result exceeds u64");
    }
    return static_cast<uint64_t>(value);
}

u128 div_ceil(u128 numerator, u128 denominator) {
    return numerator / denominator + (numerator % denominator != 0 ? 1 : 0);
}

} // namespace

ProgramResult<uint64_t> ConstantProductCurve::mul_div_floor(uint64_t a, uint64_t b, uint64_t divisor) {
    if (divisor == 0) {
        return ProgramStatus::fail(ProgramError::InvalidArgument, "division by zero");
    }
    return narrow(static_cast<u128>(a) * b / divisor);
}

ProgramResult<uint64_t> ConstantProductCurve::mul_div_ceil(uint64_t a, uint64_t b, uint64_t divisor) {
    if (divisor == 0) {
        return ProgramStatus::fail(ProgramError::InvalidArgument, "division by zero");
    }
    return narrow(div_ceil(static_cast<u128>(a) * b, divisor));
}

ProgramResult<XYAmounts> ConstantProductCurve::deposit_amounts(uint64_t reserve_x,
                                                               uint64_t reserve_y,
                                                               uint64_t supply,
                                                               uint64_t amount) {
    auto x = mul_div_ceil(reserve_x, amount, supply);
    RETURN_IF_ERROR(x);
    auto y = mul_div_ceil(reserve_y, amount, supply);
    RETURN_IF_ERROR(y);
    return XYAmounts{x.value(), y.value()};
}

ProgramResult<XYAmounts> ConstantProductCurve::withdraw_amounts(uint64_t reserve_x,
                                                                uint64_t reserve_y,
                                                                uint64_t supply,
                                                                uint64_t amount) {
    if (amount > supply) {
        return ProgramStatus::fail(ProgramError::InsufficientFunds,
                                   "burning " + std::to_string(amount) + " of " + std::to_string(supply));
    }
    if (amount == supply) {
        return XYAmounts{reserve_x, reserve_y};
    }
    auto x = mul_div_floor(reserve_x, amount, supply);
    RETURN_IF_ERROR(x);
    auto y = mul_div_floor(reserve_y, amount, supply);
    RETURN_IF_ERROR(y);
    return XYAmounts{x.value(), y.value()};
}

ProgramResult<uint64_t> ConstantProductCurve::swap_output(uint64_t reserve_in,
                                                          uint64_t reserve_out,
                                                          uint64_t amount,
                                                          uint16_t fee_bps) {
    if (fee_bps >= FEE_DENOMINATOR) {
        return ProgramStatus::fail(ProgramError::InvalidArgument, "fee must be below 10000 bps");
    }
    if (amount == 0) {
        return ProgramStatus::fail(ProgramError::ZeroAmount, "swap amount");
    }
    if (reserve_in == 0 || reserve_out == 0) {
        return ProgramStatus::fail(ProgramError::InvalidState, "pool has no liquidity");
    }

    const u128 k = static_cast<u128>(reserve_in) * reserve_out;
    const u128 new_reserve_out = div_ceil(k, static_cast<u128>(reserve_in) + amount);
    const u128 raw = reserve_out - new_reserve_out;
    const u128 out = raw * (FEE_DENOMINATOR - fee_bps) / FEE_DENOMINATOR;
    return narrow(out);
}

} // namespace amm
} // namespace programs
} // namespace pinion
