#pragma once

#include <fmt/core.h>

namespace certdel::compat {
    using fmt::format;
}
