#include <config.hpp>

#include <fstream>

namespace NCafeBooking {

    TConfig ParseConfig(const json& j) {
        TConfig cfg;
        if (j.is_null()) {
            return cfg;
        }
        if (!j.is_object()) {
            throw std::runtime_error("config must be a JSON object");
        }

        if (j.contains("log_level")) {
            auto level = ParseLogLevel(j["log_level"].get<std::string>());
            if (!level) {
                throw std::runtime_error("unknown log_level: " + j["log_level"].get<std::string>());
            }
            cfg.LogLevel = *level;
        }

        if (j.contains("storage")) {
            const auto& s = j["storage"];
            cfg.SnapshotPath = s.value("snapshot", cfg.SnapshotPath);
            cfg.JournalPath = s.value("journal", cfg.JournalPath);
            cfg.CompactEvery = s.value("compact_every", cfg.CompactEvery);
            if (cfg.CompactEvery < 1) {
                throw std::runtime_error("storage.compact_every must be positive");
            }
        }

        cfg.CatalogPath = j.value("catalog", cfg.CatalogPath);

        if (j.contains("booking")) {
            const auto& b = j["booking"];
            cfg.Rules.MaxDaysAhead = b.value("max_days_ahead", cfg.Rules.MaxDaysAhead);
            cfg.Rules.CommitRetries = b.value("commit_retries", cfg.Rules.CommitRetries);
            if (cfg.Rules.MaxDaysAhead < 0) {
                throw std::runtime_error("booking.max_days_ahead must not be negative");
            }
            if (cfg.Rules.CommitRetries < 0) {
                throw std::runtime_error("booking.commit_retries must not be negative");
            }
        }

        if (j.contains("transitions")) {
            cfg.Rules.Transitions = TTransitionMatrix::FromJson(j["transitions"]);
        }
        return cfg;
    }

    TConfig LoadConfig(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("Cannot open config file: " + path);
        }
        json j;
        try {
            j = json::parse(in);
        } catch (const json::parse_error& e) {
            throw std::runtime_error("Malformed config " + path + ": " + e.what());
        }
        return ParseConfig(j);
    }

} // namespace NCafeBooking
