/**
 * @file settings_loader.h
 * @brief Loads `SyncEngineSettings` overrides from JSON.
 * @details The document mirrors the settings aggregate: one object per tuning struct
 *          (`room_clock`, `latency`, `drift_correction`, `dual_stream`, `reconnect`) whose
 *          members are the field names. Missing sections and fields keep their current values,
 *          unknown keys are ignored, and a value of the wrong JSON type rejects the whole document.
 */
#ifndef SETTINGS_LOADER_H
#define SETTINGS_LOADER_H

#include "sync_engine_settings.h"
#include <string>
#include <memory>

namespace syncroom {
namespace engine {
namespace config {

/**
 * @brief Applies a JSON document to a settings object.
 * @param json_text The JSON text to parse.
 * @param settings The settings to update. Left untouched if the document is rejected.
 * @return true if the document was parsed and applied, false otherwise.
 */
bool apply_settings_json(const std::string& json_text, SyncEngineSettings& settings);

/**
 * @brief Reads a settings file and applies it on top of the defaults.
 * @param path Path to the JSON settings file.
 * @return The loaded settings, or nullptr if the file could not be read or parsed.
 */
std::shared_ptr<SyncEngineSettings> load_settings_file(const std::string& path);

/** @brief Serializes the full settings aggregate, e.g. to write a template file. */
std::string settings_to_json(const SyncEngineSettings& settings);

} // namespace config
} // namespace engine
} // namespace syncroom

#endif // SETTINGS_LOADER_H
