#include "simhsm/models/domain.hpp"
#include "simhsm/core/format.hpp"

namespace simhsm::models {

Result<Domain, HsmFailure> Domain::At(const uint8_t number) {
    if (number == 0 || number > DOMAIN_COUNT) {
        return Result<Domain, HsmFailure>::Err(
            HsmFailure::InvalidInput(
                compat::format("Domain number must be in 1..{}, got {}", DOMAIN_COUNT, number)));
    }
    return Result<Domain, HsmFailure>::Ok(Domain(static_cast<uint16_t>(1u << (number - 1))));
}

} // namespace simhsm::models
