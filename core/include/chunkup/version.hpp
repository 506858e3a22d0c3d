#pragma once

#include <string_view>

namespace chunkup
{

    std::string_view version() noexcept;

} // namespace chunkup
