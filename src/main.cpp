#include "Config.hpp"
#include "JsonFileStore.hpp"
#include "Kinora.hpp"
#include "RecentStore.hpp"

#include <QApplication>
#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>
#include <argparse/argparse.hpp>

void
init_args(argparse::ArgumentParser &program)
{
    program.add_argument("-c", "--config")
        .help("Path to config.toml file")
        .nargs(1)
        .metavar("CONFIG_PATH");

    program.add_argument("--list-recent")
        .help("Print the recently watched videos and exit")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--clear-recent")
        .help("Forget the recently watched videos and exit")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("files").remaining().metavar("FILE_PATH(s)");
}

// Headless access to the recent videos, no window is created
static int
run_recent_command(const argparse::ArgumentParser &program)
{
    Config config;
    QString error;
    const QString configPath
        = program.is_used("--config")
              ? QString::fromStdString(program.get<std::string>("--config"))
              : configFilePath();
    if (!loadConfig(configPath, config, &error))
        qWarning() << "Error in configuration file:" << error;

    JsonFileStore state(stateFilePath());
    if (!state.load())
        qWarning() << "Failed to load state store" << state.filePath();

    RecentStore store(&state);
    store.setMaxEntries(config.recent.max_entries);

    if (program.get<bool>("--clear-recent"))
    {
        store.clear();
        return 0;
    }

    QTextStream out(stdout);
    const RecentList list = store.load();
    for (size_t i = 0; i < list.size(); ++i)
    {
        const RecentEntry &entry = list[i];
        const std::optional<ResolvedFile> resolved = entry.fileRef().resolve();
        out << i << '\t' << entry.displayName() << '\t'
            << (resolved ? resolved->path : QString()) << '\t'
            << entry.lastWatched().toString(Qt::ISODate) << '\n';
    }
    return 0;
}

int
main(int argc, char *argv[])
{
    argparse::ArgumentParser program("kinora", APP_VERSION,
                                     argparse::default_arguments::all);
    init_args(program);
    try
    {
        program.parse_args(argc, argv);
    }
    catch (const std::exception &e)
    {
        qDebug() << e.what();
        return 1;
    }

    if (program.get<bool>("--list-recent") || program.get<bool>("--clear-recent"))
    {
        QCoreApplication app(argc, argv);
        QCoreApplication::setApplicationName("kinora");
        return run_recent_command(program);
    }

    QApplication app(argc, argv);
    QApplication::setApplicationName("kinora");
    QApplication::setApplicationVersion(APP_VERSION);
    Kinora k;
    k.Read_args_parser(program);
    return app.exec();
}
