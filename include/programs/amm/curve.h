#pragma once

#include "svm/program_error.h"
#include <cstdint>

namespace pinion {
namespace programs {
namespace amm {

using svm::ProgramResult;

struct XYAmounts {
    uint64_t x = 0;
    uint64_t y = 0;
};

/**
 * Constant-product pricing: reserves (x, y) keep x * y = k across swaps,
 * modulo fees. All intermediates are 128-bit; a result that does not fit
 * in 64 bits is ArithmeticOverflow. Rounding always favours the pool.
 */
class ConstantProductCurve {
public:
    /**
     * Token amounts a depositor must add to mint `amount` LP tokens against
     * an existing supply: ceil(reserve * amount / supply) per side.
     */
    static ProgramResult<XYAmounts> deposit_amounts(uint64_t reserve_x,
                                                    uint64_t reserve_y,
                                                    uint64_t supply,
                                                    uint64_t amount);

    /**
     * Token amounts paid out for burning `amount` LP tokens:
     * floor(reserve * amount / supply) per side, or the full reserves when
     * the whole supply is burned.
     */
    static ProgramResult<XYAmounts> withdraw_amounts(uint64_t reserve_x,
                                                     uint64_t reserve_y,
                                                     uint64_t supply,
                                                     uint64_t amount);

    /**
     * Output of depositing `amount` on the input side. The fee in basis
     * points is taken from the output:
     *   raw = Rout - ceil(Rin * Rout / (Rin + amount))
     *   out = floor(raw * (10000 - fee) / 10000)
     */
    static ProgramResult<uint64_t> swap_output(uint64_t reserve_in,
                                               uint64_t reserve_out,
                                               uint64_t amount,
                                               uint16_t fee_bps);

    static ProgramResult<uint64_t> mul_div_floor(uint64_t a, uint64_t b, uint64_t divisor);
    static ProgramResult<uint64_t> mul_div_ceil(uint64_t a, uint64_t b, uint64_t divisor);
};

} // namespace amm
} // namespace programs
} // namespace pinion
