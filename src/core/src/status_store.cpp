#include "../include/rotap_status_store.hpp"
#include "../include/rotap_fs.hpp"
#include "../include/rotap_logger.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <utility>

namespace rotap {

using nlohmann::json;

static constexpr mode_t STATUS_MODE = 0640;
static constexpr mode_t HISTORY_MODE = 0600;

const char* interface_state_name(InterfaceState state) {
    switch (state) {
        case InterfaceState::IDLE:     return "idle";
        case InterfaceState::ROTATING: return "rotating";
        case InterfaceState::DEGRADED: return "degraded";
        case InterfaceState::DISABLED: return "disabled";
    }
    return "unknown";
}

const char* rotation_reason_name(RotationReason reason) {
    switch (reason) {
        case RotationReason::STARTUP:          return "startup";
        case RotationReason::TIME_ELAPSED:     return "time_elapsed";
        case RotationReason::CLIENT_THRESHOLD: return "client_threshold";
        case RotationReason::MANUAL_TRIGGER:   return "manual_trigger";
    }
    return "unknown";
}

std::string iso8601_utc(int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

template <typename T>
static json optional_json(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

json status_to_json(const PublishedStatus& s) {
    json j;
    j["interface"] = s.interface_name;
    j["enabled"] = s.enabled;
    j["state"] = interface_state_name(s.state);
    j["ssid"] = s.ssid;
    j["password"] = s.passphrase;
    j["security"] = security_mode_name(s.security);
    j["channel"] = s.channel;
    j["sequence"] = s.sequence;
    j["created_at"] = s.created_at;
    j["expires_at"] = s.expires_at;
    j["time_remaining"] = s.seconds_until_next;
    j["client_count"] = optional_json(s.client_count);
    j["last_rotation_reason"] = s.last_rotation_reason;
    j["last_success_at"] = optional_json(s.health.last_success_at);
    j["last_error"] = s.health.last_error.empty() ? json(nullptr) : json(s.health.last_error);
    j["last_error_at"] = optional_json(s.health.last_error_at);
    j["consecutive_failures"] = s.health.consecutive_failures;
    j["updated_at"] = s.updated_at;
    return j;
}

json history_to_json(const RotationHistoryEntry& e) {
    json j;
    j["timestamp"] = iso8601_utc(e.time);
    j["time"] = e.time;
    j["interface"] = e.interface_name;
    j["reason"] = rotation_reason_name(e.reason);
    j["sequence"] = e.sequence;
    j["prior_ssid_hash"] = optional_json(e.prior_ssid_hash);
    j["client_count"] = optional_json(e.client_count);
    return j;
}

// ==================== StatusStore ====================

StatusStore::Options StatusStore::Options::from_config(const DaemonConfig& cfg) {
    Options o;
    o.run_dir = cfg.run_dir;
    o.log_dir = cfg.log_dir;
    o.history_max_bytes = cfg.history_max_bytes;
    return o;
}

StatusStore::StatusStore(Options options)
    : options_(std::move(options))
{}

bool StatusStore::prepare() {
    std::string err;
    // run_dir stays world-traversable so the display user can reach status files
    if (!fs::ensure_directory(options_.run_dir, 0755, &err) ||
        !fs::ensure_directory(options_.log_dir, 0750, &err)) {
        ROTAP_LOG_ERROR("Cannot prepare state directories: " + err);
        return false;
    }
    return true;
}

std::string StatusStore::status_path(const std::string& interface_name) const {
    return fs::join(options_.run_dir, "status-" + interface_name + ".json");
}

std::string StatusStore::aggregate_path() const {
    return fs::join(options_.run_dir, "status-all.json");
}

std::string StatusStore::history_path() const {
    return fs::join(options_.log_dir, "rotations.jsonl");
}

bool StatusStore::publish(const PublishedStatus& status) {
    std::string err;
    if (!fs::atomic_write_file(status_path(status.interface_name),
                               status_to_json(status).dump(2) + "\n", STATUS_MODE, &err)) {
        ROTAP_LOG_ERROR("[" + status.interface_name + "] Failed to publish status: " + err);
        return false;
    }
    return true;
}

bool StatusStore::publish_aggregate(const std::vector<PublishedStatus>& statuses,
                                    bool dual_ap_mode, int64_t now) {
    json j;
    j["dual_ap_mode"] = dual_ap_mode;
    json active = json::array();
    json ifs = json::object();
    for (const auto& s : statuses) {
        if (s.enabled && s.state != InterfaceState::DISABLED) active.push_back(s.interface_name);
        ifs[s.interface_name] = status_to_json(s);
    }
    j["active_interfaces"] = active;
    j["interfaces"] = ifs;
    j["updated_at"] = now;

    std::string err;
    if (!fs::atomic_write_file(aggregate_path(), j.dump(2) + "\n", STATUS_MODE, &err)) {
        ROTAP_LOG_ERROR("Failed to publish aggregate status: " + err);
        return false;
    }
    return true;
}

bool StatusStore::append_history(const RotationHistoryEntry& entry) {
    const std::string path = history_path();
    const std::string record = history_to_json(entry).dump() + "\n";

    std::lock_guard<std::mutex> lock(history_mu_);

    if (options_.history_max_bytes > 0) {
        long long size = fs::file_size(path);
        if (size >= 0 && static_cast<uint64_t>(size) + record.size() > options_.history_max_bytes) {
            const std::string rolled = path + ".1";
            if (std::rename(path.c_str(), rolled.c_str()) != 0) {
                ROTAP_LOG_WARN("History roll-over failed: " + std::string(std::strerror(errno)));
            } else {
                ROTAP_LOG_INFO("Rotation history rolled over to " + rolled);
            }
        }
    }

    std::string err;
    if (!fs::append_record(path, record, HISTORY_MODE, &err)) {
        ROTAP_LOG_ERROR("[" + entry.interface_name + "] Failed to append history: " + err);
        return false;
    }
    return true;
}

} // namespace rotap
