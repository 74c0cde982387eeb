/**
 * @file bindings.cpp
 * @brief Defines the Python module for the SyncRoom C++ sync engine.
 * @details This file uses pybind11 to create the `syncroom_engine` Python module. Bindings are
 *          grouped per component and registered in dependency order: logger first, then plain
 *          types and settings, then the server that uses them.
 */
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "utils/cpp_logger.h"
#include "sync_types.h"
#include "configuration/sync_engine_settings.h"
#include "configuration/settings_loader.h"
#include "client/drift_correction_engine.h"
#include "server/room_server.h"

#include <tuple>

namespace py = pybind11;
using namespace syncroom;

namespace {

void bind_logger(py::module_& m) {
    using namespace syncroom::engine::logging;

    py::enum_<LogLevel>(m, "LogLevel_CPP")
        .value("DEBUG", LogLevel::DEBUG)
        .value("INFO", LogLevel::INFO)
        .value("WARNING", LogLevel::WARNING)
        .value("ERROR", LogLevel::ERR)
        .export_values();

    m.def("get_cpp_log_messages", [](int timeout_ms) {
        std::vector<LogEntry> entries;
        {
            py::gil_scoped_release release_gil;
            entries = retrieve_log_entries(timeout_ms);
        }
        std::vector<std::tuple<LogLevel, std::string, std::string, int, int64_t>> rows;
        rows.reserve(entries.size());
        for (auto& entry : entries) {
            rows.emplace_back(entry.level, std::move(entry.message), std::move(entry.filename),
                              entry.line_number, entry.timestamp_ms);
        }
        return rows;
    }, py::arg("timeout_ms") = 100,
       "Waits up to timeout_ms for engine log entries. Returns (level, message, filename, line, timestamp_ms) tuples.");

    m.def("shutdown_cpp_logger", &shutdown_cpp_logger,
          "Unblocks pending get_cpp_log_messages calls and stops accepting entries.");

    m.def("reset_cpp_logger", &reset_cpp_logger,
          "Clears queued entries and accepts new ones after shutdown_cpp_logger.");

    m.def("set_cpp_log_level", &set_cpp_log_level,
          py::arg("level"),
          "Sets the C++ global log level.");
}

void bind_sync_types(py::module_& m) {
    using namespace syncroom::engine;

    py::enum_<RoomRole>(m, "RoomRole")
        .value("ADMIN", RoomRole::Admin)
        .value("MODERATOR", RoomRole::Moderator)
        .value("USER", RoomRole::User);

    py::enum_<StreamType>(m, "StreamType")
        .value("SINGLE", StreamType::Single)
        .value("DUAL", StreamType::Dual);

    py::enum_<SyncHealth>(m, "SyncHealth")
        .value("GOOD", SyncHealth::Good)
        .value("RECOVERING", SyncHealth::Recovering)
        .value("FAILED", SyncHealth::Failed);

    py::enum_<CorrectionAction>(m, "CorrectionAction")
        .value("NONE", CorrectionAction::None)
        .value("RATE_ADJUST", CorrectionAction::RateAdjust)
        .value("HARD_SEEK", CorrectionAction::HardSeek);

    py::class_<MediaItem>(m, "MediaItem", "A queue entry")
        .def(py::init<>())
        .def_readwrite("id", &MediaItem::id)
        .def_readwrite("title", &MediaItem::title)
        .def_readwrite("is_live", &MediaItem::is_live)
        .def_readwrite("pinned", &MediaItem::pinned)
        .def_readwrite("added_by", &MediaItem::added_by)
        .def_readwrite("thumbnail", &MediaItem::thumbnail)
        .def("__eq__", &MediaItem::operator==);

    py::class_<CorrectionDecision>(m, "CorrectionDecision", "Result of the heartbeat drift policy")
        .def(py::init<>())
        .def_readonly("action", &CorrectionDecision::action)
        .def_readonly("drift", &CorrectionDecision::drift)
        .def_readonly("compensated_position", &CorrectionDecision::compensated_position)
        .def_readonly("target_rate", &CorrectionDecision::target_rate);

    py::class_<RoomSnapshot>(m, "RoomSnapshot", "A consistent copy of a room's state")
        .def(py::init<>())
        .def_readonly("room_id", &RoomSnapshot::room_id)
        .def_readonly("is_playing", &RoomSnapshot::is_playing)
        .def_readonly("position", &RoomSnapshot::position)
        .def_readonly("is_live", &RoomSnapshot::is_live)
        .def_readonly("current_item", &RoomSnapshot::current_item)
        .def_readonly("queue", &RoomSnapshot::queue)
        .def_readonly("playing_index", &RoomSnapshot::playing_index)
        .def_readonly("roles", &RoomSnapshot::roles)
        .def_readonly("permanent", &RoomSnapshot::permanent)
        .def_readonly("members", &RoomSnapshot::members)
        .def_readonly("connection_count", &RoomSnapshot::connection_count);

    py::class_<CoordinatorStats>(m, "CoordinatorStats")
        .def(py::init<>())
        .def_readonly("room_count", &CoordinatorStats::room_count)
        .def_readonly("connection_count", &CoordinatorStats::connection_count)
        .def_readonly("mutations_applied", &CoordinatorStats::mutations_applied)
        .def_readonly("broadcasts_sent", &CoordinatorStats::broadcasts_sent)
        .def_readonly("heartbeats_sent", &CoordinatorStats::heartbeats_sent)
        .def_readonly("dead_connections_removed", &CoordinatorStats::dead_connections_removed);
}

void bind_settings(py::module_& m) {
    using namespace syncroom::engine;

    py::class_<RoomClockTuning>(m, "RoomClockTuning")
        .def(py::init<>())
        .def_readwrite("heartbeat_interval_ms", &RoomClockTuning::heartbeat_interval_ms)
        .def_readwrite("position_change_tolerance_sec", &RoomClockTuning::position_change_tolerance_sec)
        .def_readwrite("empty_room_ttl_sec", &RoomClockTuning::empty_room_ttl_sec)
        .def_readwrite("cleanup_interval_ms", &RoomClockTuning::cleanup_interval_ms)
        .def_readwrite("exclude_originator_from_commands", &RoomClockTuning::exclude_originator_from_commands);

    py::class_<LatencyTuning>(m, "LatencyTuning")
        .def(py::init<>())
        .def_readwrite("ping_interval_ms", &LatencyTuning::ping_interval_ms)
        .def_readwrite("smoothing_factor", &LatencyTuning::smoothing_factor)
        .def_readwrite("probe_timeout_ms", &LatencyTuning::probe_timeout_ms);

    py::class_<DriftCorrectionTuning>(m, "DriftCorrectionTuning")
        .def(py::init<>())
        .def_readwrite("hard_seek_threshold_sec", &DriftCorrectionTuning::hard_seek_threshold_sec)
        .def_readwrite("rate_adjust_threshold_sec", &DriftCorrectionTuning::rate_adjust_threshold_sec)
        .def_readwrite("catch_up_rate", &DriftCorrectionTuning::catch_up_rate)
        .def_readwrite("slow_down_rate", &DriftCorrectionTuning::slow_down_rate)
        .def_readwrite("join_seek_threshold_sec", &DriftCorrectionTuning::join_seek_threshold_sec);

    py::class_<DualStreamTuning>(m, "DualStreamTuning")
        .def(py::init<>())
        .def_readwrite("buffer_threshold_sec", &DualStreamTuning::buffer_threshold_sec)
        .def_readwrite("drift_threshold_sec", &DualStreamTuning::drift_threshold_sec)
        .def_readwrite("heavy_sync_threshold_sec", &DualStreamTuning::heavy_sync_threshold_sec)
        .def_readwrite("sync_frequency_hz", &DualStreamTuning::sync_frequency_hz)
        .def_readwrite("heavy_sync_cooldown_base_ms", &DualStreamTuning::heavy_sync_cooldown_base_ms)
        .def_readwrite("heavy_sync_cooldown_max_exponent", &DualStreamTuning::heavy_sync_cooldown_max_exponent)
        .def_readwrite("heavy_sync_timeout_ms", &DualStreamTuning::heavy_sync_timeout_ms)
        .def_readwrite("max_consecutive_failures", &DualStreamTuning::max_consecutive_failures)
        .def_readwrite("ready_state_threshold", &DualStreamTuning::ready_state_threshold)
        .def_readwrite("secondary_ahead_rate", &DualStreamTuning::secondary_ahead_rate)
        .def_readwrite("secondary_behind_rate", &DualStreamTuning::secondary_behind_rate)
        .def_readwrite("recovery_retry_interval_ms", &DualStreamTuning::recovery_retry_interval_ms)
        .def_readwrite("max_recovery_attempts", &DualStreamTuning::max_recovery_attempts)
        .def_readwrite("recovery_min_ready_state", &DualStreamTuning::recovery_min_ready_state);

    py::class_<ReconnectTuning>(m, "ReconnectTuning")
        .def(py::init<>())
        .def_readwrite("initial_delay_ms", &ReconnectTuning::initial_delay_ms)
        .def_readwrite("max_delay_ms", &ReconnectTuning::max_delay_ms)
        .def_readwrite("max_attempts", &ReconnectTuning::max_attempts);

    py::class_<SyncEngineSettings, std::shared_ptr<SyncEngineSettings>>(m, "SyncEngineSettings")
        .def(py::init<>())
        .def_readwrite("room_clock", &SyncEngineSettings::room_clock)
        .def_readwrite("latency", &SyncEngineSettings::latency)
        .def_readwrite("drift_correction", &SyncEngineSettings::drift_correction)
        .def_readwrite("dual_stream", &SyncEngineSettings::dual_stream)
        .def_readwrite("reconnect", &SyncEngineSettings::reconnect)
        .def("to_json", [](const SyncEngineSettings& self) { return config::settings_to_json(self); },
             "Serializes the settings to a JSON document.")
        .def("apply_json", [](SyncEngineSettings& self, const std::string& text) {
                 return config::apply_settings_json(text, self);
             },
             py::arg("text"),
             "Applies overrides from a JSON document. Returns false and leaves the settings unchanged if it is invalid.");

    m.def("load_settings_file", &config::load_settings_file, py::arg("path"),
          "Loads settings from a JSON file. Returns None on failure.");
}

void bind_room_server(py::module_& m) {
    using namespace syncroom::engine;

    py::class_<RoomServer, std::shared_ptr<RoomServer>>(m, "RoomServer", "WebSocket room synchronization server")
        .def(py::init<std::shared_ptr<SyncEngineSettings>>(), py::arg("settings") = nullptr, "Constructor")
        .def("initialize", &RoomServer::initialize,
             py::arg("port") = 8080,
             py::arg("bind_address") = "",
             py::call_guard<py::gil_scoped_release>(),
             "Starts the coordinator threads and the WebSocket server. Returns true on success.")
        .def("shutdown", &RoomServer::shutdown,
             py::call_guard<py::gil_scoped_release>(),
             "Closes all connections and stops all background threads.")
        .def("is_running", &RoomServer::is_running)
        .def("port", &RoomServer::port)
        .def("list_rooms", &RoomServer::list_rooms, "Returns the ids of all live rooms.")
        .def("get_room_snapshot", &RoomServer::get_room_snapshot, py::arg("room_id"),
             "Returns a RoomSnapshot, or None if the room does not exist.")
        .def("get_stats", &RoomServer::get_stats)
        .def("get_dropped_message_count", &RoomServer::get_dropped_message_count)
        .def("cleanup_stale_rooms", &RoomServer::cleanup_stale_rooms,
             "Runs one stale-room sweep now. Returns the number of rooms destroyed.")
        .def("get_settings", &RoomServer::get_settings)
        .def("set_settings", &RoomServer::set_settings, py::arg("settings"),
             "Replaces the settings. Only allowed while the server is stopped.");

    m.def("evaluate_drift",
          [](double broadcast_position, double latency_sec, double local_time,
             const DriftCorrectionTuning& tuning) {
              return DriftCorrectionEngine::evaluate(broadcast_position, latency_sec, local_time, tuning);
          },
          py::arg("broadcast_position"),
          py::arg("latency_sec"),
          py::arg("local_time"),
          py::arg("tuning") = DriftCorrectionTuning(),
          "Applies the heartbeat drift policy to one measurement.");
}

} // anonymous namespace

PYBIND11_MODULE(syncroom_engine, m) {
    m.doc() = "SyncRoom C++ Playback Synchronization Engine";

    // --- Call Binding Functions in Dependency Order ---
    bind_logger(m);
    bind_sync_types(m);
    bind_settings(m);
    bind_room_server(m);
}
