#include "audio/microphone_source.hpp"
#include "client/soda_builder.hpp"
#include "common/error.hpp"
#include "config/config_file.hpp"
#include "engine/engine_library.hpp"
#include "engine/vosk_engine.hpp"
#include "storage/transcript_log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

struct Args {
    std::string config_path = soda::default_config_path();
    std::optional<std::string> engine;
    std::optional<std::string> library_path;
    std::optional<std::string> language_pack;
    std::optional<std::string> api_key;
    std::optional<soda::RecognitionMode> mode;
    std::optional<int> sample_rate;
    std::optional<int> channels;
    std::optional<std::string> db_path;
    std::optional<int> chunk_delay_ms;

    std::string   file;
    bool          mic = false;
    bool          list_devices = false;
    std::optional<int> device_index;
    bool          simple = false;      // plain-text interface
    bool          show_partials = false;
    int           drain_ms = 1500;     // wait for trailing events after a file
};

static void print_help() {
    std::cout << "soda_transcribe: stream audio into a speech recognition engine\n"
              << "  -c, --config <path>        Config file (default XDG sodaclient.toml)\n"
              << "  -e, --engine <soda|vosk>   Engine backend (default soda)\n"
              << "      --library <path>       SODA shared library (default $SODA_LIBRARY_PATH)\n"
              << "  -m, --lang-pack <dir>      Language pack / model directory\n"
              << "      --api-key <key>        Engine API key\n"
              << "      --mode <ime|caption>   Recognition mode\n"
              << "      --sr <Hz>              Sample rate (default 16000)\n"
              << "      --channels <n>         Channel count (default 1)\n"
              << "  -f, --file <path>          Feed a 16-bit PCM file (WAV or raw)\n"
              << "      --chunk-delay <ms>     Delay between chunks for files (default 20, 0 = none)\n"
              << "      --mic                  Capture from the microphone until Ctrl+C\n"
              << "  -l, --list-devices         List input devices\n"
              << "  -d, --device <index>       Use specific input device index\n"
              << "      --db <path>            Log sessions and final results to SQLite\n"
              << "      --simple               Use the plain-text engine interface\n"
              << "      --partials             Print partial results too\n";
}

static Args parse_args(int argc, char** argv) {
    Args a{};
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + s);
            return argv[++i];
        };

        if      (s == "--config" || s == "-c") a.config_path = next();
        else if (s == "--engine" || s == "-e") a.engine = next();
        else if (s == "--library") a.library_path = next();
        else if (s == "--lang-pack" || s == "-m") a.language_pack = next();
        else if (s == "--api-key") a.api_key = next();
        else if (s == "--mode") {
            auto mode = soda::recognitionModeFromString(next());
            if (!mode) throw std::invalid_argument("unknown recognition mode");
            a.mode = mode;
        }
        else if (s == "--sr") a.sample_rate = std::stoi(next());
        else if (s == "--channels") a.channels = std::stoi(next());
        else if (s == "--file" || s == "-f") a.file = next();
        else if (s == "--chunk-delay") a.chunk_delay_ms = std::stoi(next());
        else if (s == "--mic") a.mic = true;
        else if (s == "--list-devices" || s == "-l") a.list_devices = true;
        else if (s == "--device" || s == "-d") a.device_index = std::stoi(next());
        else if (s == "--db") a.db_path = next();
        else if (s == "--simple") a.simple = true;
        else if (s == "--partials") a.show_partials = true;
        else if (s == "--help" || s == "-h") {
            print_help();
            std::exit(0);
        }
        else throw std::invalid_argument("unknown option " + s);
    }
    return a;
}

static soda::EngineApiPtr resolve_engine(const std::string& name, const std::string& library) {
    if (name == "vosk") return soda::voskEngineApi();
    if (name == "soda") return soda::EngineLibrary::load(library);
    throw std::invalid_argument("unknown engine '" + name + "'");
}

int main(int argc, char** argv) {
    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);

    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << " (see --help)\n";
        return 2;
    }

    if (args.list_devices) {
        try {
            soda::MicrophoneSource mic;
            for (const auto& d : mic.listDevices()) {
                std::cout << "[" << d.index << "] " << d.name
                          << ", inCh: " << d.maxInputChannels
                          << ", defaultSR: " << d.defaultSampleRate << "\n";
            }
            return 0;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    if (args.file.empty() == !args.mic) {
        std::cerr << "Error: give exactly one of --file or --mic\n";
        return 2;
    }

    const soda::FileConfig file_cfg = soda::load_config_file(args.config_path);

    soda::SodaBuilder builder;
    soda::apply_config(file_cfg, builder);
    if (args.language_pack) builder.languagePackDirectory(*args.language_pack);
    if (args.api_key) builder.apiKey(*args.api_key);
    if (args.mode) builder.recognitionMode(*args.mode);
    if (args.sample_rate) builder.sampleRate(*args.sample_rate);
    if (args.channels) builder.channelCount(*args.channels);

    const std::string engine_name = args.engine.value_or(file_cfg.engine.value_or("soda"));
    const std::string library = args.library_path.value_or(
        file_cfg.library_path.value_or(soda::EngineLibrary::defaultPath()));
    const int chunk_delay_ms = args.chunk_delay_ms.value_or(
        file_cfg.chunk_delay_ms.value_or(static_cast<int>(soda::Pacer::DEFAULT_CHUNK_DELAY.count())));
    const std::optional<std::string> db_path = args.db_path ? args.db_path : file_cfg.db_path;

    try {
        builder.engine(resolve_engine(engine_name, library));

        std::unique_ptr<soda::TranscriptLog> log;
        std::int64_t session_id = 0;
        if (db_path) {
            log = std::make_unique<soda::TranscriptLog>(*db_path);
            session_id = log->start_session(engine_name, builder.config().languagePackDirectory);
        }

        std::mutex console_mutex;
        auto report = [&](const std::string& text, bool is_final) {
            if (is_final && log) log->log_result(session_id, true, text);
            if (!is_final && !args.show_partials) return;
            std::lock_guard<std::mutex> lock(console_mutex);
            std::cout << (is_final ? "[final]   " : "[partial] ") << text << std::endl;
        };

        std::unique_ptr<soda::AudioSink> client;
        if (args.simple) {
            client = std::make_unique<soda::SimpleSodaClient>(builder.buildSimple(report));
        } else {
            client = std::make_unique<soda::SodaClient>(builder.build(
                [&](const soda::SodaResponse& response) {
                    const auto& result = response.recognitionResult;
                    if (!result || result->hypotheses.empty()) return;
                    report(result->hypotheses.front(), result->isFinal());
                }));
        }

        if (!args.file.empty()) {
            std::ifstream in(args.file, std::ios::binary);
            if (!in.is_open()) {
                std::cerr << "Error: cannot open " << args.file << "\n";
                return 1;
            }
            soda::Pacer pacer = chunk_delay_ms > 0
                ? soda::Pacer::realtime(std::chrono::milliseconds(chunk_delay_ms))
                : soda::Pacer::immediate();
            soda::AudioFeeder feeder(*client, pacer);
            const soda::FeedResult fed = feeder.feed(in);
            std::cerr << "Fed " << fed.bytes << " bytes in " << fed.chunks << " chunks\n";
            if (fed.readError) {
                std::cerr << "Warning: input ended on a read error\n";
            }

            // Results trail the last chunk.
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(args.drain_ms);
            while (!g_stop.load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        } else {
            soda::MicrophoneSource mic;
            soda::MicrophoneSource::Params params;
            params.sampleRate = builder.config().sampleRate;
            params.channels = builder.config().channelCount;
            params.deviceIndex = args.device_index;
            mic.start(params, *client);

            std::cerr << "Listening… (Ctrl+C to stop)\n";
            while (!g_stop.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            mic.stop();
        }

        client.reset();
        if (log) log->end_session(session_id);
        return 0;
    } catch (const soda::SodaError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
