#pragma once
#include <cstdint>
#include <mutex>
#include <vector>
#include <nlohmann/json.hpp>

namespace NCafeBooking {

    // Durable home of the booking table: a compacted snapshot plus the change
    // records written after it. Change records carry an increasing "seq";
    // the snapshot's "journal_seq" is the last record folded into it.
    // Implementations must be thread-safe.
    struct IStorage {
        virtual ~IStorage() = default;

        // Must be durable before it returns; a commit is only as safe as this.
        virtual void AppendChange(const nlohmann::json& change) = 0;
        virtual std::vector<nlohmann::json> LoadChanges() = 0;

        // Replaces the snapshot, then drops the change records. A crash in
        // between leaves records the snapshot's journal_seq already covers.
        virtual void Compact(const nlohmann::json& snapshot) = 0;
        virtual nlohmann::json LoadSnapshot() = 0;
    };

    class TMemoryStorage: public IStorage {
    public:
        void AppendChange(const nlohmann::json& change) override {
            std::scoped_lock lk(Mutex_);
            Changes.push_back(change);
        }

        std::vector<nlohmann::json> LoadChanges() override {
            std::scoped_lock lk(Mutex_);
            return Changes;
        }

        void Compact(const nlohmann::json& snapshot) override {
            std::scoped_lock lk(Mutex_);
            Snapshot = snapshot;
            Changes.clear();
            ++Compactions;
        }

        nlohmann::json LoadSnapshot() override {
            std::scoped_lock lk(Mutex_);
            return Snapshot;
        }

        size_t CompactionCount() {
            std::scoped_lock lk(Mutex_);
            return Compactions;
        }

    private:
        nlohmann::json Snapshot = nlohmann::json::object();
        std::vector<nlohmann::json> Changes;
        size_t Compactions = 0;
        std::mutex Mutex_;
    };

} // namespace NCafeBooking
