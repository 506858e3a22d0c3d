#include "chunkup/input_inspector.hpp"

#include <system_error>

namespace chunkup
{

    std::string_view to_string(InspectionResult::Kind kind) noexcept
    {
        switch (kind)
        {
        case InspectionResult::Kind::Standard:
            return "standard";
        case InspectionResult::Kind::NonStandard:
            return "non_standard";
        case InspectionResult::Kind::Failure:
            return "failure";
        }
        return "failure";
    }

    InspectionResult PassthroughInputInspector::inspect(const std::filesystem::path &input_file)
    {
        std::error_code ec;
        const auto status = std::filesystem::status(input_file, ec);
        if (ec || !std::filesystem::exists(status))
        {
            return {InspectionResult::Kind::Failure, {}, "Input file not found: " + input_file.string()};
        }
        if (!std::filesystem::is_regular_file(status))
        {
            return {InspectionResult::Kind::Failure, {}, "Input is not a regular file: " + input_file.string()};
        }
        return {};
    }

} // namespace chunkup
