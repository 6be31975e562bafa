#pragma once

#include <QDir>
#include <QString>
#include <tuple>
#include <vector>

struct Config
{
    struct window
    {
        bool menubar{true};
        QString title_format{"%1 - kinora"};
        std::tuple<int, int> initial_size{-1,
                                          -1}; // width, height; -1 for default
    } window{};

    struct playback
    {
        bool autoplay{true};
        float seek_step{10.0f}; // seconds
        float default_rate{1.0f};
        std::vector<float> rates{0.5f, 1.0f, 1.25f, 1.5f, 2.0f};
        float volume{1.0f}; // 0.0 to 1.0
    } playback{};

    struct recent
    {
        bool enabled{true};
        int max_entries{10};
        bool open_last_on_startup{false};
        bool show_full_path{false};
    } recent{};

    struct message_bar
    {
        float duration{3.0f}; // seconds
    } message_bar{};
};

// Reads `path` into `config`. Returns true when the file is missing (the
// defaults stay) or was parsed; on a parse error `error` gets the message
// and `config` is left untouched.
bool
loadConfig(const QString &path, Config &config,
           QString *error = nullptr) noexcept;

QDir
configDirectory() noexcept;

inline QString
configFilePath() noexcept
{
    return configDirectory().filePath("config.toml");
}

inline QString
stateFilePath() noexcept
{
    return configDirectory().filePath("state.json");
}
