#include "simhsm/models/object_handle.hpp"
#include "simhsm/core/format.hpp"

namespace simhsm::models {

std::string ObjectHandle::ToString() const {
    return compat::format("{}#0x{:04x}", enums::ToString(object_type), object_id);
}

} // namespace simhsm::models
