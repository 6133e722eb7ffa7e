#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template<typename T>
void read_field(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("runtime")) {
            auto& r = j["runtime"];
            read_field(r, "url", cfg.runtime.url);
            read_field(r, "timeout_s", cfg.runtime.timeout_s);
            read_field(r, "connect_timeout_s", cfg.runtime.connect_timeout_s);
        }

        if (j.contains("model")) {
            auto& m = j["model"];
            read_field(m, "default_model", cfg.model.default_model);
            read_field(m, "device", cfg.model.device);
            read_field(m, "vad_model", cfg.model.vad_model);
            read_field(m, "punc_model", cfg.model.punc_model);
            read_field(m, "spk_model", cfg.model.spk_model);
            read_field(m, "max_single_segment_time", cfg.model.max_single_segment_time);
        }

        if (j.contains("download")) {
            auto& d = j["download"];
            read_field(d, "hub_url", cfg.download.hub_url);
            read_field(d, "cache_dir", cfg.download.cache_dir);
            read_field(d, "revision", cfg.download.revision);
            read_field(d, "stream_interval_ms", cfg.download.stream_interval_ms);
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            read_field(h, "enabled", cfg.history.enabled);
            read_field(h, "path", cfg.history.path);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
