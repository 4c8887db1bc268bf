#pragma once

#include <fmt/core.h>

namespace olmwire::compat {
    using fmt::format;
}
