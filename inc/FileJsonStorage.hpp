#pragma once
#include "storage.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <string>

namespace NCafeBooking {

    // Snapshot as a pretty-printed JSON file, change records as JSON lines.
    class TFileJsonStorage: public IStorage {
    public:
        TFileJsonStorage(std::filesystem::path snapshotPath, std::filesystem::path journalPath);

        void AppendChange(const nlohmann::json& change) override;
        std::vector<nlohmann::json> LoadChanges() override;
        void Compact(const nlohmann::json& snapshot) override;
        nlohmann::json LoadSnapshot() override;

    private:
        void AtomicWrite(const std::filesystem::path& path, const nlohmann::json& j);

    private:
        std::filesystem::path SnapshotPath;
        std::filesystem::path JournalPath;
        std::mutex Mutex_;
    };

} // namespace NCafeBooking
