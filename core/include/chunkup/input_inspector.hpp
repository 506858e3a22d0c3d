#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace chunkup
{

    struct InspectionResult
    {
        enum class Kind
        {
            Standard,
            NonStandard,
            Failure
        };

        Kind kind{Kind::Standard};
        // Why the input is not standard; empty unless kind == NonStandard.
        std::vector<std::string> reasons;
        std::string message;
    };

    std::string_view to_string(InspectionResult::Kind kind) noexcept;

    // Decides whether an input can be uploaded as is. Implementations may
    // block; they run on the thread that starts the upload.
    class InputInspector
    {
    public:
        virtual ~InputInspector() = default;

        virtual InspectionResult inspect(const std::filesystem::path &input_file) = 0;
    };

    // Accepts every readable regular file.
    class PassthroughInputInspector : public InputInspector
    {
    public:
        InspectionResult inspect(const std::filesystem::path &input_file) override;
    };

} // namespace chunkup
