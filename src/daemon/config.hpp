#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Runtime {
        std::string url = "http://127.0.0.1:17953";
        long timeout_s = 3600;
        long connect_timeout_s = 10;
    } runtime;

    // Defaults applied to initialize requests that leave a field out.
    struct Model {
        std::string default_model;
        std::string device;
        std::string vad_model = "fsmn-vad";
        std::string punc_model = "ct-punc";
        std::string spk_model;
        uint32_t max_single_segment_time = 60000;
    } model;

    struct Download {
        std::string hub_url = "https://modelscope.cn";
        std::string cache_dir; // empty: platform::model_cache_dir()
        std::string revision = "master";
        uint32_t stream_interval_ms = 500;
    } download;

    struct History {
        bool enabled = true;
        std::string path; // empty: {data_dir}/history.db
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};
