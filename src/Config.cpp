#include "Config.hpp"

#include <QFile>
#include <QStandardPaths>
#include <algorithm>
#include <toml++/toml.hpp>

namespace
{

static inline void
set_title_format_if_present(toml::node_view<toml::node> n,
                            QString &title_format)
{
    if (auto v = n.value<std::string>())
    {
        QString window_title = QString::fromStdString(*v);
        window_title.replace("{}", "%1");
        title_format = window_title;
    }
}

template <typename T>
static inline void
set(toml::node_view<toml::node> node, T &target)
{
    if (auto v = node.value<T>())
        target = *v;
}

static inline void
set_rates(toml::node_view<toml::node> n, std::vector<float> &dst)
{
    const toml::array *array = n.as_array();
    if (!array)
        return;

    std::vector<float> rates;
    for (const toml::node &node : *array)
    {
        if (auto v = node.value<double>(); v && *v > 0.0)
            rates.push_back(static_cast<float>(*v));
    }

    if (!rates.empty())
        dst = std::move(rates);
}

} // namespace

bool
loadConfig(const QString &path, Config &config, QString *error) noexcept
{
    if (!QFile::exists(path))
        return true;

    toml::table toml;

    try
    {
        toml = toml::parse_file(path.toStdString());
    }
    catch (const std::exception &e)
    {
        if (error)
            *error = QString::fromUtf8(e.what());
        return false;
    }

    Config parsed = config;

    if (auto window = toml["window"])
    {
        set(window["menubar"], parsed.window.menubar);
        set_title_format_if_present(window["title_format"],
                                    parsed.window.title_format);

        if (auto size_table = window["initial_size"])
        {
            auto &[width, height] = parsed.window.initial_size;
            set(size_table["width"], width);
            set(size_table["height"], height);
        }
    }

    if (auto playback = toml["playback"])
    {
        set(playback["autoplay"], parsed.playback.autoplay);
        set(playback["seek_step"], parsed.playback.seek_step);
        set(playback["default_rate"], parsed.playback.default_rate);
        set(playback["volume"], parsed.playback.volume);
        set_rates(playback["rates"], parsed.playback.rates);

        if (parsed.playback.default_rate <= 0.0f)
            parsed.playback.default_rate = 1.0f;
        if (parsed.playback.seek_step <= 0.0f)
            parsed.playback.seek_step = 10.0f;
        parsed.playback.volume
            = std::clamp(parsed.playback.volume, 0.0f, 1.0f);
    }

    if (auto recent = toml["recent"])
    {
        set(recent["enabled"], parsed.recent.enabled);
        set(recent["max_entries"], parsed.recent.max_entries);
        set(recent["open_last_on_startup"], parsed.recent.open_last_on_startup);
        set(recent["show_full_path"], parsed.recent.show_full_path);

        parsed.recent.max_entries
            = std::clamp(parsed.recent.max_entries, 1, 10);
    }

    if (auto message_bar = toml["message_bar"])
    {
        set(message_bar["duration"], parsed.message_bar.duration);
        parsed.message_bar.duration
            = std::clamp(parsed.message_bar.duration, 0.5f, 60.0f);
    }

    config = std::move(parsed);
    return true;
}

QDir
configDirectory() noexcept
{
    return QDir(
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation));
}
