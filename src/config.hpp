#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Api {
        std::string url = "https://api.groq.com/openai/v1/audio/transcriptions";
        std::string language = "en";
        uint32_t timeout_seconds = 30;
    } api;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;
        uint32_t long_max_seconds = 300;
        uint32_t stop_grace_ms = 3000;
    } audio;

    struct Output {
        bool auto_paste = true;
        uint32_t paste_delay_ms = 200;
    } output;

    struct Ui {
        bool indicator = true;
        bool notifications = true;
    } ui;

    struct History {
        bool enabled = true;
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};
