#include "chunkup/version.hpp"

#ifndef CHUNKUP_VERSION
#define CHUNKUP_VERSION "0.0.0"
#endif

namespace chunkup
{

    std::string_view version() noexcept
    {
        return CHUNKUP_VERSION;
    }

} // namespace chunkup
