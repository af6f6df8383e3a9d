#include "config/config_file.hpp"

#include "client/soda_builder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace soda {

using std::string;

static inline void trim_inplace(string& s) {
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

static inline bool is_quoted(const string& s) {
    return s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''));
}

static inline bool ieq(const string& a, const string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i=0;i<a.size();++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

// Strips a trailing comment, ignoring '#' and ';' inside quotes.
static inline string strip_comment(const string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' || c == ';') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/sodaclient/sodaclient.toml";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/sodaclient/sodaclient.toml";
}

FileConfig load_config_file(const std::string& path) {
    FileConfig cfg;
    std::ifstream f(path);
    if (!f.good()) return cfg; // missing is fine

    auto as_int = [](const string& s)->std::optional<int>{
        try {
            size_t used = 0;
            int v = std::stoi(s, &used);
            if (used != s.size()) return std::nullopt;
            return v;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    };
    auto as_bool = [](const string& s)->std::optional<bool>{
        if (ieq(s, "true") || ieq(s,"yes") || s=="1") return true;
        if (ieq(s, "false")|| ieq(s,"no")  || s=="0") return false;
        return std::nullopt;
    };

    string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        line = strip_comment(line);
        trim_inplace(line);
        if (line.empty() || line.front() == '[') continue;   // sections are not used

        // allow 'key = value' or 'key: value'
        size_t sep = line.find('=');
        if (sep == string::npos) sep = line.find(':');
        if (sep == string::npos) {
            std::cerr << "Warning: " << path << ":" << line_no << ": expected key = value\n";
            continue;
        }

        string key = line.substr(0, sep);
        string val = line.substr(sep+1);
        trim_inplace(key);
        trim_inplace(val);
        if (key.empty() || val.empty()) continue;

        if (is_quoted(val)) val = val.substr(1, val.size()-2);

        if (ieq(key, "channel_count")) cfg.channel_count = as_int(val);
        else if (ieq(key, "sample_rate")) cfg.sample_rate = as_int(val);
        else if (ieq(key, "language_pack_directory") || ieq(key, "language_pack")) cfg.language_pack_directory = expand_path(val);
        else if (ieq(key, "api_key")) cfg.api_key = val;
        else if (ieq(key, "recognition_mode")) cfg.recognition_mode = recognitionModeFromString(val);
        else if (ieq(key, "max_buffer_bytes")) cfg.max_buffer_bytes = as_int(val);
        else if (ieq(key, "simulate_realtime_testonly")) cfg.simulate_realtime_testonly = as_bool(val);
        else if (ieq(key, "reset_on_final_result")) cfg.reset_on_final_result = as_bool(val);
        else if (ieq(key, "include_timing_metrics")) cfg.include_timing_metrics = as_bool(val);
        else if (ieq(key, "enable_lang_id")) cfg.enable_lang_id = as_bool(val);
        else if (ieq(key, "engine")) cfg.engine = val;
        else if (ieq(key, "library_path")) cfg.library_path = expand_path(val);
        else if (ieq(key, "chunk_delay_ms")) cfg.chunk_delay_ms = as_int(val);
        else if (ieq(key, "db_path")) cfg.db_path = expand_path(val);
        else std::cerr << "Warning: " << path << ":" << line_no << ": unknown key '" << key << "'\n";
    }
    return cfg;
}

void apply_config(const FileConfig& cfg, SodaBuilder& builder) {
    if (cfg.channel_count) builder.channelCount(*cfg.channel_count);
    if (cfg.sample_rate) builder.sampleRate(*cfg.sample_rate);
    if (cfg.language_pack_directory) builder.languagePackDirectory(*cfg.language_pack_directory);
    if (cfg.api_key) builder.apiKey(*cfg.api_key);
    if (cfg.recognition_mode) builder.recognitionMode(*cfg.recognition_mode);
    if (cfg.max_buffer_bytes) builder.maxBufferBytes(*cfg.max_buffer_bytes);
    if (cfg.simulate_realtime_testonly) builder.simulateRealtimeTestOnly(*cfg.simulate_realtime_testonly);
    if (cfg.reset_on_final_result) builder.resetOnFinalResult(*cfg.reset_on_final_result);
    if (cfg.include_timing_metrics) builder.includeTimingMetrics(*cfg.include_timing_metrics);
    if (cfg.enable_lang_id) builder.enableLangId(*cfg.enable_lang_id);
}

} // namespace soda
