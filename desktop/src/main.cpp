#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QTextStream>
#include <QtGui/QGuiApplication>
#include <memory>

#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/editor/EditorRegistry.hpp"
#include "core/navigation/Navigator.hpp"
#include "core/player/MediaLauncher.hpp"
#include "core/subtitles/Timecode.hpp"

namespace {

QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err() {
    static QTextStream stream(stderr);
    return stream;
}

void printShows(const MomentNav::Navigator& navigator) {
    for (const MomentNav::Show& show : navigator.library().shows()) {
        out() << show.name << "  (" << show.subtitlePaths.size() << " subtitles, "
              << show.matches.matchedCount() << " matched to videos)\n";
    }

    const MomentNav::LibraryStatistics stats = navigator.library().statistics();
    out() << stats.showCount << " shows, " << stats.subtitleCount << " subtitle files, "
          << stats.videoCount << " videos\n";
}

void printResult(const MomentNav::SearchResult& result) {
    QString currentFile;
    int number = 0;
    for (const MomentNav::SearchHit& hit : result.hits) {
        if (hit.subtitlePath != currentFile) {
            currentFile = hit.subtitlePath;
            out() << "\n" << QFileInfo(currentFile).fileName();
            if (!hit.isLaunchable()) {
                out() << "  (no video)";
            }
            out() << "\n";
        }

        out() << "[" << ++number << "] "
              << MomentNav::Timecode::toSrt(hit.cue.startTime) << " --> "
              << MomentNav::Timecode::toSrt(hit.cue.endTime) << "  "
              << hit.cue.text.simplified() << "\n";
    }

    for (const MomentNav::SubtitleFailure& failure : result.failures) {
        err() << "warning: " << QFileInfo(failure.subtitlePath).fileName() << ": "
              << MomentNav::subtitleErrorToString(failure.error) << "\n";
    }

    out() << "\n" << result.hits.size() << " matches for \"" << result.keyword << "\"\n";
}

// 1-based selection from the printed hit list
const MomentNav::SearchHit* hitAt(const MomentNav::SearchResult& result, const QString& value) {
    bool ok = false;
    const int number = value.toInt(&ok);
    if (!ok || number < 1 || number > result.hits.size()) {
        err() << "error: no match numbered " << value << "\n";
        return nullptr;
    }
    return &result.hits.at(number - 1);
}

// Opening a video may fall back to QDesktopServices, which needs a GUI
// application. Everything else runs without a display.
QCoreApplication* createApplication(int& argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const QByteArray arg(argv[i]);
        if (arg == "--open" || arg.startsWith("--open=")) {
            return new QGuiApplication(argc, argv);
        }
    }
    return new QCoreApplication(argc, argv);
}

} // namespace

int main(int argc, char *argv[])
{
    std::unique_ptr<QCoreApplication> application(createApplication(argc, argv));
    QCoreApplication& app = *application;

    // Set application properties
    app.setApplicationName("MomentNavigator");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("MomentNav");

    QCommandLineParser parser;
    parser.setApplicationDescription("Search the subtitles of a video library and jump to the moment");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption rootOption("root", "Media directory to scan (repeatable). Defaults to the configured directories.", "dir");
    const QCommandLineOption addRootOption("add-root", "Remember a media directory for later runs.", "dir");
    const QCommandLineOption removeRootOption("remove-root", "Forget a remembered media directory.", "dir");
    const QCommandLineOption listOption("list-shows", "List the shows found in the media directories.");
    const QCommandLineOption showOption("show", "Show to search in. Defaults to the last selected show.", "name");
    const QCommandLineOption searchOption("search", "Keyword to look for in the show's subtitles.", "keyword");
    const QCommandLineOption openOption("open", "Open match <n> in the video player.", "n");
    const QCommandLineOption editOption("edit", "Send match <n> to the video editor as a clip.", "n");
    const QCommandLineOption playerOption("player", "Player to use: mpc-hc, mpv or default.", "player");
    const QCommandLineOption editorOption("editor", "Editor to use: shotcut or kdenlive.", "editor");
    const QCommandLineOption verboseOption("verbose", "Log debug output to the console.");
    parser.addOptions({rootOption, addRootOption, removeRootOption, listOption, showOption, searchOption, openOption,
                       editOption, playerOption, editorOption, verboseOption});
    parser.process(app);

    try {
        // Initialize core systems
        const auto logLevel = parser.isSet(verboseOption)
            ? MomentNav::Logger::Level::Debug : MomentNav::Logger::Level::Warn;
        MomentNav::Logger::instance().initializeConsole(logLevel);

        auto& config = MomentNav::Config::instance();
        config.initialize();

        MomentNav::Logger::instance().initialize(config.getLogFilePath().toStdString(), logLevel);
        MOMENTNAV_INFO("Starting MomentNavigator v{}", app.applicationVersion().toStdString());

        for (const QString& dir : parser.values(addRootOption)) {
            if (!QFileInfo(dir).isDir()) {
                err() << "error: " << dir << ": "
                      << MomentNav::libraryErrorToString(MomentNav::LibraryError::RootNotFound) << "\n";
                return 1;
            }
            config.addMediaDirectory(dir);
        }
        for (const QString& dir : parser.values(removeRootOption)) {
            if (!config.removeMediaDirectory(dir)) {
                err() << "warning: " << dir << " was not a remembered media directory\n";
            }
        }
        config.sync();

        MomentNav::Config::LibrarySettings librarySettings = config.getLibrarySettings();
        const QStringList roots = parser.isSet(rootOption)
            ? parser.values(rootOption) : librarySettings.mediaDirectories;
        if (roots.isEmpty()) {
            err() << "error: no media directory given and none configured, use --root\n";
            return 1;
        }

        MomentNav::Navigator navigator(librarySettings);
        const auto failedRoots = navigator.reload(roots);
        for (const auto& failure : failedRoots) {
            err() << "warning: " << failure.first << ": "
                  << MomentNav::libraryErrorToString(failure.second) << "\n";
        }

        if (parser.isSet(listOption)) {
            printShows(navigator);
            out().flush();
        }

        if (!parser.isSet(searchOption)) {
            return 0;
        }

        MomentNav::Config::UISettings uiSettings = config.getUISettings();
        const QString showName = parser.isSet(showOption) ? parser.value(showOption) : uiSettings.lastShow;
        if (showName.isEmpty()) {
            err() << "error: no show given, use --show (see --list-shows)\n";
            return 1;
        }

        auto selected = navigator.selectShow(showName);
        if (selected.hasError()) {
            err() << "error: " << showName << ": "
                  << MomentNav::libraryErrorToString(selected.error()) << "\n";
            return 1;
        }

        auto result = navigator.search(parser.value(searchOption));
        if (result.hasError()) {
            err() << "error: " << MomentNav::libraryErrorToString(result.error()) << "\n";
            return 1;
        }
        printResult(result.value());

        uiSettings.lastShow = showName;
        uiSettings.lastQuery = result.value().keyword;
        config.setUISettings(uiSettings);

        int exitCode = 0;

        if (parser.isSet(openOption)) {
            const MomentNav::SearchHit* hit = hitAt(result.value(), parser.value(openOption));
            if (!hit) {
                return 1;
            }

            MomentNav::Config::PlayerSettings playerSettings = config.getPlayerSettings();
            if (parser.isSet(playerOption)) {
                playerSettings.launcher = parser.value(playerOption);
            }

            auto launcher = MomentNav::createLauncher(playerSettings);
            if (launcher.hasError()) {
                err() << "error: " << playerSettings.launcher << ": "
                      << MomentNav::launchErrorToString(launcher.error()) << "\n";
                return 1;
            }

            auto opened = navigator.open(*hit, *launcher.value());
            if (opened.hasError()) {
                err() << "error: " << MomentNav::launchErrorToString(opened.error()) << "\n";
                exitCode = 1;
            }
        }

        if (parser.isSet(editOption)) {
            const MomentNav::SearchHit* hit = hitAt(result.value(), parser.value(editOption));
            if (!hit) {
                return 1;
            }

            MomentNav::Config::EditorSettings editorSettings = config.getEditorSettings();
            if (parser.isSet(editorOption)) {
                editorSettings.editor = parser.value(editorOption);
            }

            auto registry = MomentNav::EditorRegistry::createDefault(
                editorSettings, QDir(config.getCachePath()).filePath("clips"));
            MomentNav::EditorIntegration* editor = registry->lookup(editorSettings.editor);
            if (!editor) {
                err() << "error: " << editorSettings.editor << ": "
                      << MomentNav::editorErrorToString(MomentNav::EditorError::UnknownEditor)
                      << " (available: " << registry->names().join(", ") << ")\n";
                return 1;
            }

            auto clip = navigator.exportClip(*hit, *editor);
            if (clip.hasError()) {
                err() << "error: " << MomentNav::editorErrorToString(clip.error()) << "\n";
                exitCode = 1;
            } else {
                out() << "Clip written to " << clip.value() << "\n";
            }
        }

        // Cleanup
        config.sync();
        return exitCode;

    } catch (const std::exception& e) {
        MOMENTNAV_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
