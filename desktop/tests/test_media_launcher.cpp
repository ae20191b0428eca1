#include <QtTest/QtTest>
#include "utils/TestUtils.hpp"
#include "../src/core/player/MediaLauncher.hpp"

using namespace MomentNav;
using namespace MomentNav::Test;

class TestMediaLauncher : public QObject {
    Q_OBJECT
    
private:
    struct StartCapture {
        QString program;
        QStringList arguments;
        int calls = 0;
    };
    
    static ProcessLauncher::ProcessStarter capturingStarter(StartCapture* capture, bool succeed = true) {
        return [capture, succeed](const QString& program, const QStringList& arguments) {
            capture->program = program;
            capture->arguments = arguments;
            capture->calls++;
            return succeed;
        };
    }
    
private slots:
    void initTestCase() {
        TestUtils::initializeTestEnvironment();
    }
    
    void testMpcHcArguments() {
        MpcHcLauncher launcher;
        
        // Milliseconds are dropped, /start takes whole seconds
        QCOMPARE(launcher.arguments("/videos/ep1.mp4", 3723999),
                 QStringList({QDir::toNativeSeparators("/videos/ep1.mp4"), "/start", "01:02:03"}));
        QCOMPARE(launcher.name(), QString("mpc-hc"));
    }
    
    void testMpvArguments() {
        MpvLauncher launcher;
        
        QCOMPARE(launcher.arguments("/videos/ep1.mkv", 61005),
                 QStringList({"--start=00:01:01.005", "/videos/ep1.mkv"}));
    }
    
    void testOpenStartsConfiguredPlayer() {
        TEST_SCOPE("launcher_open");
        const QString dir = _testScope.getTempDirectory();
        const QString video = TestUtils::createEmptyFile(dir, "Show/ep1.mp4");
        const QString player = TestUtils::createEmptyFile(dir, "bin/mpv");
        
        MpvLauncher launcher(player);
        StartCapture capture;
        launcher.setProcessStarter(capturingStarter(&capture));
        
        ASSERT_EXPECTED_VALUE(launcher.open(video, 1500));
        QCOMPARE(capture.calls, 1);
        QCOMPARE(capture.program, QFileInfo(player).absoluteFilePath());
        QCOMPARE(capture.arguments, QStringList({"--start=00:00:01.500", video}));
    }
    
    void testOpenErrors() {
        TEST_SCOPE("launcher_errors");
        const QString dir = _testScope.getTempDirectory();
        const QString video = TestUtils::createEmptyFile(dir, "ep1.mp4");
        const QString player = TestUtils::createEmptyFile(dir, "mpc-hc64.exe");
        
        StartCapture capture;
        
        MpcHcLauncher noVideo(player);
        noVideo.setProcessStarter(capturingStarter(&capture));
        ASSERT_EXPECTED_ERROR(noVideo.open(QString(), 0), LaunchError::NoVideo);
        ASSERT_EXPECTED_ERROR(noVideo.open(dir + "/gone.mp4", 0), LaunchError::VideoNotFound);
        
        MpcHcLauncher missingPlayer(dir + "/not-installed.exe");
        missingPlayer.setProcessStarter(capturingStarter(&capture));
        ASSERT_EXPECTED_ERROR(missingPlayer.resolveExecutable(), LaunchError::PlayerNotFound);
        ASSERT_EXPECTED_ERROR(missingPlayer.open(video, 0), LaunchError::PlayerNotFound);
        
        QCOMPARE(capture.calls, 0);
        
        MpcHcLauncher failingStart(player);
        failingStart.setProcessStarter(capturingStarter(&capture, false));
        ASSERT_EXPECTED_ERROR(failingStart.open(video, 0), LaunchError::StartFailed);
        QCOMPARE(capture.calls, 1);
    }
    
    void testFallsBackToDefaultApplication() {
        TEST_SCOPE("launcher_fallback");
        const QString dir = _testScope.getTempDirectory();
        const QString video = TestUtils::createEmptyFile(dir, "Show/ep1.mp4");
        const QString player = TestUtils::createEmptyFile(dir, "mpc-hc64.exe");
        
        QList<QUrl> opened;
        auto fallback = std::make_unique<DefaultApplicationLauncher>();
        fallback->setUrlOpener([&opened](const QUrl& url) {
            opened.append(url);
            return true;
        });
        
        // Player found but refuses to start
        StartCapture capture;
        MpcHcLauncher failingStart(player);
        failingStart.setProcessStarter(capturingStarter(&capture, false));
        failingStart.setFallback(std::move(fallback));
        
        ASSERT_EXPECTED_VALUE(failingStart.open(video, 5000));
        QCOMPARE(capture.calls, 1);
        QCOMPARE(opened.size(), 1);
        QCOMPARE(opened.first(), QUrl::fromLocalFile(QFileInfo(video).absoluteFilePath()));
        
        // Player not installed at all
        auto secondFallback = std::make_unique<DefaultApplicationLauncher>();
        secondFallback->setUrlOpener([&opened](const QUrl& url) {
            opened.append(url);
            return true;
        });
        MpcHcLauncher missingPlayer(dir + "/not-installed.exe");
        missingPlayer.setProcessStarter(capturingStarter(&capture));
        missingPlayer.setFallback(std::move(secondFallback));
        
        ASSERT_EXPECTED_VALUE(missingPlayer.open(video, 0));
        QCOMPARE(capture.calls, 1);
        QCOMPARE(opened.size(), 2);
    }
    
    void testFailedFallbackReportsPlayerError() {
        TEST_SCOPE("launcher_fallback_error");
        const QString dir = _testScope.getTempDirectory();
        const QString video = TestUtils::createEmptyFile(dir, "ep1.mp4");
        
        auto fallback = std::make_unique<DefaultApplicationLauncher>();
        fallback->setUrlOpener([](const QUrl&) { return false; });
        
        MpvLauncher launcher(dir + "/no-mpv");
        launcher.setFallback(std::move(fallback));
        ASSERT_EXPECTED_ERROR(launcher.open(video, 0), LaunchError::PlayerNotFound);
        
        // Missing videos never reach the fallback
        ASSERT_EXPECTED_ERROR(launcher.open(dir + "/gone.mp4", 0), LaunchError::VideoNotFound);
    }
    
    void testDefaultApplicationLauncher() {
        TEST_SCOPE("launcher_default");
        const QString dir = _testScope.getTempDirectory();
        const QString video = TestUtils::createEmptyFile(dir, "ep1.mkv");
        
        int calls = 0;
        DefaultApplicationLauncher launcher;
        launcher.setUrlOpener([&calls](const QUrl& url) {
            calls++;
            return url.isLocalFile();
        });
        
        QCOMPARE(launcher.name(), QString("default"));
        ASSERT_EXPECTED_VALUE(launcher.open(video, 42000));
        ASSERT_EXPECTED_ERROR(launcher.open(QString(), 0), LaunchError::NoVideo);
        ASSERT_EXPECTED_ERROR(launcher.open(dir + "/gone.mkv", 0), LaunchError::VideoNotFound);
        QCOMPARE(calls, 1);
        
        launcher.setUrlOpener([](const QUrl&) { return false; });
        ASSERT_EXPECTED_ERROR(launcher.open(video, 0), LaunchError::StartFailed);
    }
    
    void testCreateLauncher() {
        Config::PlayerSettings settings;
        
        auto defaults = createLauncher(settings);
        ASSERT_EXPECTED_VALUE(defaults);
        QCOMPARE(defaults.value()->name(), QString("mpc-hc"));
        auto* process = dynamic_cast<ProcessLauncher*>(defaults.value().get());
        QVERIFY(process);
        QVERIFY(process->fallback());
        QCOMPARE(process->fallback()->name(), QString("default"));
        
        settings.launcher = " MPV ";
        auto mpv = createLauncher(settings);
        ASSERT_EXPECTED_VALUE(mpv);
        QCOMPARE(mpv.value()->name(), QString("mpv"));
        
        settings.fallbackToDefault = false;
        auto noFallback = createLauncher(settings);
        ASSERT_EXPECTED_VALUE(noFallback);
        QVERIFY(!dynamic_cast<ProcessLauncher*>(noFallback.value().get())->fallback());
        
        settings.launcher = "default";
        auto desktop = createLauncher(settings);
        ASSERT_EXPECTED_VALUE(desktop);
        QCOMPARE(desktop.value()->name(), QString("default"));
        
        settings.launcher = "vlc";
        ASSERT_EXPECTED_ERROR(createLauncher(settings), LaunchError::UnknownLauncher);
    }
};

int runTestMediaLauncher(int argc, char** argv) {
    TestMediaLauncher test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_media_launcher.moc"
