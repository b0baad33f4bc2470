#ifndef ROTAP_STATUS_STORE_HPP
#define ROTAP_STATUS_STORE_HPP

#include "rotap_status.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace rotap {

nlohmann::json status_to_json(const PublishedStatus& status);
nlohmann::json history_to_json(const RotationHistoryEntry& entry);

/// "2026-10-19T08:15:00Z"
std::string iso8601_utc(int64_t unix_seconds);

/**
 * @brief File artifacts shared with the display server and status indicator
 *
 * Status files are replaced atomically (rename), so pollers never see a
 * partial document. History is one JSON object per line, each appended
 * with a single write(). Only schedulers write here; nothing reads back.
 */
class StatusStore {
public:
    struct Options {
        std::string run_dir = "/run/rotap";
        std::string log_dir = "/var/log/rotap";
        uint64_t history_max_bytes = 1024 * 1024;   // 0 = never roll over

        static Options from_config(const DaemonConfig& cfg);
    };

    explicit StatusStore(Options options);

    /// Create run_dir (0755) and log_dir (0750). Returns false on failure.
    bool prepare();

    bool publish(const PublishedStatus& status);
    bool publish_aggregate(const std::vector<PublishedStatus>& statuses, bool dual_ap_mode,
                           int64_t now);
    bool append_history(const RotationHistoryEntry& entry);

    std::string status_path(const std::string& interface_name) const;
    std::string aggregate_path() const;
    std::string history_path() const;

private:
    Options options_;
    std::mutex history_mu_;     // serialises roll-over between interface workers
};

} // namespace rotap

#endif // ROTAP_STATUS_STORE_HPP
