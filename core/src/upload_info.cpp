#include "chunkup/upload_info.hpp"

#include <system_error>

#include "chunkup/crypto.hpp"

namespace chunkup
{

    std::string UploadIdentity::key() const
    {
        return crypto::hash_string(upload_url + '\n' + input_file.generic_string());
    }

    UploadIdentity UploadInfo::identity() const
    {
        return UploadIdentity{upload_url, normalize_path(input_file)};
    }

    std::filesystem::path normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

    void to_json(nlohmann::json &json, const UploadInfo &info)
    {
        json = nlohmann::json{
            {"upload_url", info.upload_url},
            {"input_file", info.input_file.generic_string()},
            {"options", info.options},
        };
    }

    void from_json(const nlohmann::json &json, UploadInfo &info)
    {
        info.upload_url = json.at("upload_url").get<std::string>();
        info.input_file = std::filesystem::path(json.at("input_file").get<std::string>());
        info.options = json.value("options", UploadOptions{});
    }

} // namespace chunkup
