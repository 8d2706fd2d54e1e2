#pragma once

#include <fmt/core.h>

namespace cypherpunk::compat {
    using fmt::format;
}
