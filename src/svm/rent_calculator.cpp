#include "svm/rent_calculator.h"

namespace pinion {
namespace svm {

RentCalculator::RentCalculator(const RentConfig& config) : config_(config) {
}

RentCalculator::RentCalculator() : config_(RentConfig()) {
}

Lamports RentCalculator::minimum_balance(size_t data_size) const {
    // Yearly rent including the per-account storage overhead
    Lamports yearly_rent = static_cast<Lamports>(ACCOUNT_STORAGE_OVERHEAD + data_size) *
                           config_.lamports_per_byte_year;

    // Apply exemption threshold (typically 2 years worth of rent)
    return static_cast<Lamports>(static_cast<double>(yearly_rent) * config_.exemption_threshold);
}

bool RentCalculator::is_rent_exempt(Lamports balance, size_t data_size) const {
    return balance >= minimum_balance(data_size);
}

} // namespace svm
} // namespace pinion
