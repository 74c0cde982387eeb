#include "settings_loader.h"
#include "../utils/cpp_logger.h"

#include <json/json.h>

#include <fstream>
#include <sstream>
#include <memory>

namespace syncroom {
namespace engine {
namespace config {

namespace {

// ============================================================================
// Typed field readers
// ============================================================================

class SectionReader {
public:
    SectionReader(const Json::Value& root, const char* section)
        : section_name_(section), ok_(true) {
        if (root.isMember(section)) {
            section_ = root[section];
            if (!section_.isObject()) {
                LOG_CPP_ERROR("[SettingsLoader] Section '%s' must be an object.", section);
                ok_ = false;
            }
        }
    }

    void read(const char* key, double& out) {
        const Json::Value* v = find(key);
        if (!v) return;
        if (!v->isNumeric()) {
            reject(key, "a number");
            return;
        }
        out = v->asDouble();
    }

    void read(const char* key, long& out) {
        const Json::Value* v = find(key);
        if (!v) return;
        if (!v->isIntegral()) {
            reject(key, "an integer");
            return;
        }
        out = static_cast<long>(v->asInt64());
    }

    void read(const char* key, int& out) {
        const Json::Value* v = find(key);
        if (!v) return;
        if (!v->isInt()) {
            reject(key, "an integer");
            return;
        }
        out = v->asInt();
    }

    void read(const char* key, bool& out) {
        const Json::Value* v = find(key);
        if (!v) return;
        if (!v->isBool()) {
            reject(key, "a boolean");
            return;
        }
        out = v->asBool();
    }

    bool ok() const { return ok_; }

private:
    const Json::Value* find(const char* key) const {
        if (!ok_ || !section_.isObject()) {
            return nullptr;
        }
        return section_.find(key, key + std::char_traits<char>::length(key));
    }

    void reject(const char* key, const char* expected) {
        LOG_CPP_ERROR("[SettingsLoader] '%s.%s' must be %s.", section_name_, key, expected);
        ok_ = false;
    }

    const char* section_name_;
    Json::Value section_;
    bool ok_;
};

bool apply_document(const Json::Value& root, SyncEngineSettings& s) {
    if (!root.isObject()) {
        LOG_CPP_ERROR("[SettingsLoader] Settings document must be a JSON object.");
        return false;
    }

    SectionReader room(root, "room_clock");
    room.read("heartbeat_interval_ms", s.room_clock.heartbeat_interval_ms);
    room.read("position_change_tolerance_sec", s.room_clock.position_change_tolerance_sec);
    room.read("empty_room_ttl_sec", s.room_clock.empty_room_ttl_sec);
    room.read("cleanup_interval_ms", s.room_clock.cleanup_interval_ms);
    room.read("exclude_originator_from_commands", s.room_clock.exclude_originator_from_commands);

    SectionReader latency(root, "latency");
    latency.read("ping_interval_ms", s.latency.ping_interval_ms);
    latency.read("smoothing_factor", s.latency.smoothing_factor);
    latency.read("probe_timeout_ms", s.latency.probe_timeout_ms);

    SectionReader drift(root, "drift_correction");
    drift.read("hard_seek_threshold_sec", s.drift_correction.hard_seek_threshold_sec);
    drift.read("rate_adjust_threshold_sec", s.drift_correction.rate_adjust_threshold_sec);
    drift.read("catch_up_rate", s.drift_correction.catch_up_rate);
    drift.read("slow_down_rate", s.drift_correction.slow_down_rate);
    drift.read("join_seek_threshold_sec", s.drift_correction.join_seek_threshold_sec);

    SectionReader dual(root, "dual_stream");
    dual.read("buffer_threshold_sec", s.dual_stream.buffer_threshold_sec);
    dual.read("drift_threshold_sec", s.dual_stream.drift_threshold_sec);
    dual.read("heavy_sync_threshold_sec", s.dual_stream.heavy_sync_threshold_sec);
    dual.read("sync_frequency_hz", s.dual_stream.sync_frequency_hz);
    dual.read("heavy_sync_cooldown_base_ms", s.dual_stream.heavy_sync_cooldown_base_ms);
    dual.read("heavy_sync_cooldown_max_exponent", s.dual_stream.heavy_sync_cooldown_max_exponent);
    dual.read("heavy_sync_timeout_ms", s.dual_stream.heavy_sync_timeout_ms);
    dual.read("max_consecutive_failures", s.dual_stream.max_consecutive_failures);
    dual.read("ready_state_threshold", s.dual_stream.ready_state_threshold);
    dual.read("secondary_ahead_rate", s.dual_stream.secondary_ahead_rate);
    dual.read("secondary_behind_rate", s.dual_stream.secondary_behind_rate);
    dual.read("recovery_retry_interval_ms", s.dual_stream.recovery_retry_interval_ms);
    dual.read("max_recovery_attempts", s.dual_stream.max_recovery_attempts);
    dual.read("recovery_min_ready_state", s.dual_stream.recovery_min_ready_state);

    SectionReader reconnect(root, "reconnect");
    reconnect.read("initial_delay_ms", s.reconnect.initial_delay_ms);
    reconnect.read("max_delay_ms", s.reconnect.max_delay_ms);
    reconnect.read("max_attempts", s.reconnect.max_attempts);

    return room.ok() && latency.ok() && drift.ok() && dual.ok() && reconnect.ok();
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

bool apply_settings_json(const std::string& json_text, SyncEngineSettings& settings) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;

    if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errors)) {
        LOG_CPP_ERROR("[SettingsLoader] Failed to parse settings JSON: %s", errors.c_str());
        return false;
    }

    SyncEngineSettings candidate = settings;
    if (!apply_document(root, candidate)) {
        return false;
    }
    settings = candidate;
    return true;
}

std::shared_ptr<SyncEngineSettings> load_settings_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_CPP_ERROR("[SettingsLoader] Cannot open settings file '%s'.", path.c_str());
        return nullptr;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    auto settings = std::make_shared<SyncEngineSettings>();
    if (!apply_settings_json(buffer.str(), *settings)) {
        LOG_CPP_ERROR("[SettingsLoader] Rejected settings file '%s'.", path.c_str());
        return nullptr;
    }
    LOG_CPP_INFO("[SettingsLoader] Loaded settings from '%s'.", path.c_str());
    return settings;
}

std::string settings_to_json(const SyncEngineSettings& s) {
    Json::Value root(Json::objectValue);

    Json::Value& room = root["room_clock"];
    room["heartbeat_interval_ms"] = static_cast<Json::Int64>(s.room_clock.heartbeat_interval_ms);
    room["position_change_tolerance_sec"] = s.room_clock.position_change_tolerance_sec;
    room["empty_room_ttl_sec"] = s.room_clock.empty_room_ttl_sec;
    room["cleanup_interval_ms"] = static_cast<Json::Int64>(s.room_clock.cleanup_interval_ms);
    room["exclude_originator_from_commands"] = s.room_clock.exclude_originator_from_commands;

    Json::Value& latency = root["latency"];
    latency["ping_interval_ms"] = static_cast<Json::Int64>(s.latency.ping_interval_ms);
    latency["smoothing_factor"] = s.latency.smoothing_factor;
    latency["probe_timeout_ms"] = static_cast<Json::Int64>(s.latency.probe_timeout_ms);

    Json::Value& drift = root["drift_correction"];
    drift["hard_seek_threshold_sec"] = s.drift_correction.hard_seek_threshold_sec;
    drift["rate_adjust_threshold_sec"] = s.drift_correction.rate_adjust_threshold_sec;
    drift["catch_up_rate"] = s.drift_correction.catch_up_rate;
    drift["slow_down_rate"] = s.drift_correction.slow_down_rate;
    drift["join_seek_threshold_sec"] = s.drift_correction.join_seek_threshold_sec;

    Json::Value& dual = root["dual_stream"];
    dual["buffer_threshold_sec"] = s.dual_stream.buffer_threshold_sec;
    dual["drift_threshold_sec"] = s.dual_stream.drift_threshold_sec;
    dual["heavy_sync_threshold_sec"] = s.dual_stream.heavy_sync_threshold_sec;
    dual["sync_frequency_hz"] = s.dual_stream.sync_frequency_hz;
    dual["heavy_sync_cooldown_base_ms"] = static_cast<Json::Int64>(s.dual_stream.heavy_sync_cooldown_base_ms);
    dual["heavy_sync_cooldown_max_exponent"] = s.dual_stream.heavy_sync_cooldown_max_exponent;
    dual["heavy_sync_timeout_ms"] = static_cast<Json::Int64>(s.dual_stream.heavy_sync_timeout_ms);
    dual["max_consecutive_failures"] = s.dual_stream.max_consecutive_failures;
    dual["ready_state_threshold"] = s.dual_stream.ready_state_threshold;
    dual["secondary_ahead_rate"] = s.dual_stream.secondary_ahead_rate;
    dual["secondary_behind_rate"] = s.dual_stream.secondary_behind_rate;
    dual["recovery_retry_interval_ms"] = static_cast<Json::Int64>(s.dual_stream.recovery_retry_interval_ms);
    dual["max_recovery_attempts"] = s.dual_stream.max_recovery_attempts;
    dual["recovery_min_ready_state"] = s.dual_stream.recovery_min_ready_state;

    Json::Value& reconnect = root["reconnect"];
    reconnect["initial_delay_ms"] = static_cast<Json::Int64>(s.reconnect.initial_delay_ms);
    reconnect["max_delay_ms"] = static_cast<Json::Int64>(s.reconnect.max_delay_ms);
    reconnect["max_attempts"] = s.reconnect.max_attempts;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    return Json::writeString(writer, root);
}

} // namespace config
} // namespace engine
} // namespace syncroom
