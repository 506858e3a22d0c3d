#include "chunkup/upload_ledger.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace chunkup
{

    namespace
    {

        nlohmann::json entry_to_json(const UploadLedger::Entry &entry)
        {
            return {
                {"id", entry.id},
                {"saved_at", std::chrono::duration_cast<std::chrono::seconds>(entry.saved_at.time_since_epoch()).count()},
                {"state_code", static_cast<int>(entry.state_code)},
                {"last_successful_byte", entry.last_successful_byte},
                {"upload_info", entry.upload_info},
            };
        }

        UploadLedger::Entry entry_from_json(const nlohmann::json &json)
        {
            UploadLedger::Entry entry;
            entry.id = json.at("id").get<std::string>();
            const auto seconds = json.value("saved_at", 0LL);
            entry.saved_at = Clock::time_point{std::chrono::seconds{seconds}};
            entry.state_code = json.value("state_code", 0) == 1 ? UploadLedger::StateCode::WasPaused
                                                                : UploadLedger::StateCode::WasInProgress;
            entry.last_successful_byte = json.value("last_successful_byte", 0ULL);
            entry.upload_info = json.at("upload_info").get<UploadInfo>();
            return entry;
        }

    } // namespace

    UploadLedger::UploadLedger(std::filesystem::path path, std::chrono::seconds time_to_live)
        : path_(std::move(path)), time_to_live_(time_to_live)
    {
    }

    std::vector<UploadLedger::Entry> UploadLedger::read_all()
    {
        ensure_loaded();
        return entries_;
    }

    std::optional<UploadLedger::Entry> UploadLedger::read_entry(const std::string &id)
    {
        ensure_loaded();
        const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                     { return entry.id == id; });
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    void UploadLedger::write(Entry entry)
    {
        ensure_loaded();
        if (entry.saved_at == Clock::time_point{})
        {
            entry.saved_at = Clock::now();
        }
        const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &existing)
                                     { return existing.id == entry.id; });
        if (it == entries_.end())
        {
            entries_.push_back(std::move(entry));
        }
        else
        {
            *it = std::move(entry);
        }
        save();
    }

    void UploadLedger::remove(const std::string &id)
    {
        ensure_loaded();
        const auto before = entries_.size();
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                      { return entry.id == id; }),
                       entries_.end());
        if (entries_.size() != before)
        {
            save();
        }
    }

    void UploadLedger::clear()
    {
        loaded_ = true;
        entries_.clear();
        save();
    }

    std::filesystem::path UploadLedger::default_ledger_path()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".chunkup" / "uploads.json";
        }
        return std::filesystem::path(".chunkup") / "uploads.json";
    }

    void UploadLedger::ensure_loaded()
    {
        if (loaded_)
        {
            return;
        }
        entries_.clear();
        if (!std::filesystem::exists(path_))
        {
            loaded_ = true;
            return;
        }
        std::ifstream in(path_);
        if (!in.is_open())
        {
            throw std::runtime_error("Unable to open upload ledger " + path_.string());
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (!json.is_array())
        {
            spdlog::warn("Ignoring malformed upload ledger {}", path_.string());
            loaded_ = true;
            return;
        }

        const auto cutoff = Clock::now() - time_to_live_;
        bool dropped = false;
        for (const auto &item : json)
        {
            try
            {
                auto entry = entry_from_json(item);
                if (entry.saved_at < cutoff)
                {
                    spdlog::debug("Dropping expired ledger entry for {}", entry.upload_info.input_file.string());
                    dropped = true;
                    continue;
                }
                entries_.push_back(std::move(entry));
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Skipping unreadable ledger entry: {}", ex.what());
                dropped = true;
            }
        }
        loaded_ = true;
        if (dropped)
        {
            save();
        }
    }

    void UploadLedger::save() const
    {
        const auto dir = path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back(entry_to_json(entry));
        }
        std::ofstream out(path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Unable to write upload ledger " + path_.string());
        }
        out << json.dump(2);
    }

} // namespace chunkup
