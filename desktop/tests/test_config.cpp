#include <QtTest/QtTest>
#include "utils/TestUtils.hpp"
#include "../src/core/common/Config.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using namespace MomentNav;
using namespace MomentNav::Test;

class TestConfig : public QObject {
    Q_OBJECT
    
private:
    QString configDir_;
    
private slots:
    void initTestCase() {
        TestUtils::initializeTestEnvironment();
        configDir_ = TestUtils::createTempDirectory("config");
    }
    
    void init() {
        // Fresh settings file per test function
        QFile::remove(configDir_ + "/settings.ini");
        Config::instance().initializeWithFile(configDir_ + "/settings.ini");
    }
    
    void cleanupTestCase() {
        TestUtils::cleanupTempDirectory(configDir_);
    }
    
    void testDefaults() {
        Config& config = Config::instance();
        QVERIFY(config.isInitialized());
        
        const Config::LibrarySettings library = config.getLibrarySettings();
        QVERIFY(library.mediaDirectories.isEmpty());
        QCOMPARE(library.subtitleExtensions, QStringList({"srt", "txt", "vtt"}));
        QVERIFY(library.videoExtensions.contains("mp4"));
        QVERIFY(library.videoExtensions.contains("mkv"));
        QVERIFY(library.noiseTokens.isEmpty());
        QVERIFY(library.skipHiddenEntries);
        
        QCOMPARE(config.getPlayerSettings().launcher, QString("mpc-hc"));
        QVERIFY(config.getPlayerSettings().executablePath.isEmpty());
        QVERIFY(config.getPlayerSettings().fallbackToDefault);
        QCOMPARE(config.getEditorSettings().editor, QString("shotcut"));
        QCOMPARE(config.getUISettings().hotkey, QString("Ctrl+Alt+M"));
    }
    
    void testSettingsPersist() {
        Config& config = Config::instance();
        
        Config::PlayerSettings player;
        player.launcher = "mpv";
        player.executablePath = "/usr/bin/mpv";
        player.fallbackToDefault = false;
        config.setPlayerSettings(player);
        
        Config::UISettings ui;
        ui.lastShow = "Show1";
        ui.lastQuery = "hello";
        config.setUISettings(ui);
        
        Config::LibrarySettings library;
        library.subtitleExtensions = {"srt"};
        library.noiseTokens = {"remastered"};
        library.skipHiddenEntries = false;
        config.setLibrarySettings(library);
        config.sync();
        
        // Re-read from disk
        config.initializeWithFile(configDir_ + "/settings.ini");
        QCOMPARE(config.getPlayerSettings().launcher, QString("mpv"));
        QCOMPARE(config.getPlayerSettings().executablePath, QString("/usr/bin/mpv"));
        QVERIFY(!config.getPlayerSettings().fallbackToDefault);
        QCOMPARE(config.getUISettings().lastShow, QString("Show1"));
        QCOMPARE(config.getUISettings().lastQuery, QString("hello"));
        QCOMPARE(config.getLibrarySettings().subtitleExtensions, QStringList({"srt"}));
        QCOMPARE(config.getLibrarySettings().noiseTokens, QStringList({"remastered"}));
        QVERIFY(!config.getLibrarySettings().skipHiddenEntries);
    }
    
    void testMediaDirectories() {
        Config& config = Config::instance();
        const QString dir = TestUtils::createTempDirectory("media");
        
        QVERIFY(config.addMediaDirectory(dir));
        QVERIFY(!config.addMediaDirectory(dir + "/"));
        QCOMPARE(config.getLibrarySettings().mediaDirectories, QStringList({QDir::cleanPath(dir)}));
        
        QVERIFY(config.removeMediaDirectory(dir));
        QVERIFY(!config.removeMediaDirectory(dir));
        QVERIFY(config.getLibrarySettings().mediaDirectories.isEmpty());
    }
    
    void testLogFileLivesInDataPath() {
        Config& config = Config::instance();
        QVERIFY(config.getLogFilePath().startsWith(config.getDataPath()));
        QVERIFY(config.getLogFilePath().endsWith("momentnav.log"));
    }
    
    void testInitializeQuietAtWarnLevel() {
        Logger::instance().initializeConsole(Logger::Level::Warn);
        QCOMPARE(Logger::instance().level(), Logger::Level::Warn);
        
        std::ostringstream captured;
        auto console = spdlog::get("momentnav_console");
        QVERIFY(console);
        console->sinks().push_back(std::make_shared<spdlog::sinks::ostream_sink_st>(captured));
        
        Config::instance().initialize("MomentNavTests", "ConfigLogging");
        console->sinks().pop_back();
        Logger::instance().initialize("momentnav-tests.log", Logger::Level::Debug);
        
        // Nothing ahead of the command-line output
        QVERIFY2(captured.str().empty(), captured.str().c_str());
        QVERIFY(Config::instance().isInitialized());
        Config::instance().initializeWithFile(configDir_ + "/settings.ini");
    }
};

int runTestConfig(int argc, char** argv) {
    TestConfig test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_config.moc"
