#include <FileJsonStorage.hpp>
#include <logging.hpp>

#include <fstream>
#include <system_error>

namespace NCafeBooking {

    namespace {

        void EnsureParent(const std::filesystem::path& path) {
            if (!path.parent_path().empty()) {
                std::filesystem::create_directories(path.parent_path());
            }
        }

    } // namespace

    TFileJsonStorage::TFileJsonStorage(std::filesystem::path snapshotPath, std::filesystem::path journalPath)
        : SnapshotPath(std::move(snapshotPath))
        , JournalPath(std::move(journalPath)) {
    }

    void TFileJsonStorage::AtomicWrite(const std::filesystem::path& path, const nlohmann::json& j) {
        std::error_code ec;
        auto tmp = path;
        tmp += ".tmp";

        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("Cannot open temp file for writing: " + tmp.string());
        }
        ofs << j.dump(2);
        ofs.close();
        if (!ofs) {
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("Write failed: " + tmp.string());
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw std::runtime_error("Atomic rename failed: " + ec.message());
        }
    }

    void TFileJsonStorage::AppendChange(const nlohmann::json& change) {
        std::scoped_lock lk(Mutex_);
        EnsureParent(JournalPath);
        std::ofstream ofs(JournalPath, std::ios::app);
        if (!ofs) {
            throw std::runtime_error("Cannot open journal for append: " + JournalPath.string());
        }
        ofs << change.dump() << '\n';
        ofs.flush();
        if (!ofs) {
            throw std::runtime_error("Journal write failed: " + JournalPath.string());
        }
    }

    std::vector<nlohmann::json> TFileJsonStorage::LoadChanges() {
        std::scoped_lock lk(Mutex_);
        std::vector<nlohmann::json> out;
        if (!std::filesystem::exists(JournalPath)) {
            return out;
        }
        std::ifstream ifs(JournalPath);
        if (!ifs) {
            throw std::runtime_error("Cannot open journal for reading: " + JournalPath.string());
        }
        std::string line;
        size_t lineNo = 0;
        while (std::getline(ifs, line)) {
            ++lineNo;
            if (line.empty()) {
                continue;
            }
            try {
                out.push_back(nlohmann::json::parse(line));
            } catch (const nlohmann::json::parse_error& e) {
                // A torn final line after a crash is expected; skip it.
                LogWarn("storage", "skipping unreadable journal line",
                        {{"path", JournalPath.string()}, {"line", lineNo}, {"error", e.what()}});
            }
        }
        return out;
    }

    void TFileJsonStorage::Compact(const nlohmann::json& snapshot) {
        std::scoped_lock lk(Mutex_);
        EnsureParent(SnapshotPath);
        AtomicWrite(SnapshotPath, snapshot);

        std::ofstream ofs(JournalPath, std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("Cannot truncate journal: " + JournalPath.string());
        }
    }

    nlohmann::json TFileJsonStorage::LoadSnapshot() {
        std::scoped_lock lk(Mutex_);
        if (!std::filesystem::exists(SnapshotPath)) {
            return nlohmann::json::object();
        }
        std::ifstream ifs(SnapshotPath);
        if (!ifs) {
            throw std::runtime_error("Cannot open snapshot for reading: " + SnapshotPath.string());
        }
        return nlohmann::json::parse(ifs);
    }

} // namespace NCafeBooking
