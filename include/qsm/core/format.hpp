#pragma once

#include <fmt/core.h>

namespace qsm::compat {
    using fmt::format;
}
