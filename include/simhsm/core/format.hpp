#pragma once

#include <fmt/core.h>

namespace simhsm::compat {
    using fmt::format;
}
