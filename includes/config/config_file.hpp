#pragma once

#include "config/soda_config.hpp"

#include <optional>
#include <string>

namespace soda {

class SodaBuilder;

// Settings read from sodaclient.toml. Every key is optional; disengaged
// members leave the builder or CLI default in place.
struct FileConfig {
    std::optional<int> channel_count;
    std::optional<int> sample_rate;
    std::optional<std::string> language_pack_directory;
    std::optional<std::string> api_key;
    std::optional<RecognitionMode> recognition_mode;
    std::optional<int> max_buffer_bytes;
    std::optional<bool> simulate_realtime_testonly;
    std::optional<bool> reset_on_final_result;
    std::optional<bool> include_timing_metrics;
    std::optional<bool> enable_lang_id;

    std::optional<std::string> engine;         // "soda" or "vosk"
    std::optional<std::string> library_path;   // engine shared library
    std::optional<int> chunk_delay_ms;         // pacing for file input
    std::optional<std::string> db_path;        // transcript log
};

// Returns $XDG_CONFIG_HOME/sodaclient/sodaclient.toml or
// ~/.config/sodaclient/sodaclient.toml
std::string default_config_path();

// Simple TOML/INI-like: key = value. Comments start with '#' or ';' and
// strings may be quoted. A missing file yields an empty FileConfig; values
// that do not parse are ignored.
FileConfig load_config_file(const std::string& path);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

// Copies every engaged recognition setting onto the builder.
void apply_config(const FileConfig& cfg, SodaBuilder& builder);

} // namespace soda
