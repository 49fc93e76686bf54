#pragma once

#include <fmt/core.h>

namespace peerdrop::compat {
    using fmt::format;
}
