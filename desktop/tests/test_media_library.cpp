#include <QtTest/QtTest>
#include "utils/TestUtils.hpp"
#include "../src/core/library/LibraryScanner.hpp"
#include "../src/core/library/MediaLibrary.hpp"
#include "../src/core/library/ShowGrouper.hpp"

#include <QtCore/QDir>

using namespace MomentNav;
using namespace MomentNav::Test;

class TestMediaLibrary : public QObject {
    Q_OBJECT
    
private slots:
    void initTestCase() {
        TestUtils::initializeTestEnvironment();
    }
    
    void testClassifyByExtension() {
        MediaLibrary library;
        
        QCOMPARE(library.classify("/m/Show/ep1.srt"), MediaKind::Subtitle);
        QCOMPARE(library.classify("/m/Show/ep1.SRT"), MediaKind::Subtitle);
        QCOMPARE(library.classify("/m/Show/ep1.vtt"), MediaKind::Subtitle);
        QCOMPARE(library.classify("/m/Show/ep1.mp4.srt"), MediaKind::Subtitle);
        QCOMPARE(library.classify("/m/Show/ep1.mkv"), MediaKind::Video);
        QCOMPARE(library.classify("/m/Show/cover.jpg"), MediaKind::Other);
    }
    
    void testConfiguredExtensions() {
        Config::LibrarySettings settings;
        settings.subtitleExtensions = {".ass"};
        settings.videoExtensions = {"ts"};
        MediaLibrary library(settings);
        
        QCOMPARE(library.classify("ep1.ass"), MediaKind::Subtitle);
        QCOMPARE(library.classify("ep1.srt"), MediaKind::Other);
        QCOMPARE(library.classify("ep1.ts"), MediaKind::Video);
        QCOMPARE(library.classify("ep1.mkv"), MediaKind::Other);
    }
    
    void testTopLevelFolderGrouping() {
        TopLevelFolderGrouper grouper;
        
        QCOMPARE(grouper.showNameFor({"/media/anime", "/media/anime/Show A/Season 1/ep1.srt"}), QString("Show A"));
        QCOMPARE(grouper.showNameFor({"/media/anime", "/media/anime/Show B/ep1.mkv"}), QString("Show B"));
        QCOMPARE(grouper.showNameFor({"/media/anime", "/media/anime/loose.srt"}), QString("anime"));
        QCOMPARE(grouper.showNameFor({"/media/anime", "/elsewhere/ep1.srt"}), QString());
    }
    
    void testLoadGroupsAndMatches() {
        const QString root = "/media/library";
        const QList<ScannedFile> files = {
            {root, root + "/Show B/Show B - 01.srt"},
            {root, root + "/Show B/Show B - 01.mkv"},
            {root, root + "/Show A/Season 1/Show A 1x01.mp4.srt"},
            {root, root + "/Show A/Season 1/Show A 1x01.mp4"},
            {root, root + "/Show A/Season 1/Show A 1x02.srt"},
            {root, root + "/Show A/poster.jpg"},
            {root, root + "/Videos Only/clip.mkv"}
        };
        
        MediaLibrary library;
        library.load(files, TopLevelFolderGrouper());
        
        QCOMPARE(library.showNames(), QStringList({"Show A", "Show B"}));
        
        auto showA = library.show("Show A");
        ASSERT_EXPECTED_VALUE(showA);
        QCOMPARE(showA.value().subtitlePaths.size(), 2);
        QCOMPARE(showA.value().videoPaths.size(), 1);
        QCOMPARE(showA.value().matches.videoFor(root + "/Show A/Season 1/Show A 1x01.mp4.srt"),
                 root + "/Show A/Season 1/Show A 1x01.mp4");
        QCOMPARE(showA.value().matches.videoFor(root + "/Show A/Season 1/Show A 1x02.srt"), QString());
        
        const LibraryStatistics stats = library.statistics();
        QCOMPARE(stats.showCount, 2);
        QCOMPARE(stats.subtitleCount, 3);
        QCOMPARE(stats.videoCount, 2);
        QCOMPARE(stats.matchedSubtitleCount, 2);
        QCOMPARE(stats.ignoredFileCount, 2);
    }
    
    void testUnknownShow() {
        MediaLibrary library;
        library.load({}, TopLevelFolderGrouper());
        
        QVERIFY(library.isEmpty());
        ASSERT_EXPECTED_ERROR(library.show("Nope"), LibraryError::ShowNotFound);
    }
    
    void testShowsWithSameNameMergeAcrossRoots() {
        const QList<ScannedFile> files = {
            {"/disk1", "/disk1/Show/ep1.srt"},
            {"/disk2", "/disk2/Show/ep1.mkv"}
        };
        
        MediaLibrary library;
        library.load(files, TopLevelFolderGrouper());
        
        auto show = library.show("Show");
        ASSERT_EXPECTED_VALUE(show);
        QCOMPARE(show.value().matches.videoFor("/disk1/Show/ep1.srt"), QString("/disk2/Show/ep1.mkv"));
    }
    
    void testScannerWalksRecursively() {
        TEST_SCOPE("library_scan");
        const QString root = _testScope.getTempDirectory();
        TestUtils::createTestTextFile(root, "x", "Show/Season 1/ep1.srt");
        TestUtils::createEmptyFile(root, "Show/Season 1/ep1.mkv");
        TestUtils::createEmptyFile(root, "Other/ep1.srt");
        TestUtils::createEmptyFile(root, ".hidden/ep9.srt");
        
        LibraryScanner scanner;
        auto files = scanner.scanRoot(root);
        ASSERT_EXPECTED_VALUE(files);
        
        QStringList paths;
        for (const ScannedFile& file : files.value()) {
            QCOMPARE(file.root, QDir::cleanPath(root));
            paths.append(QDir(root).relativeFilePath(file.path));
        }
        QCOMPARE(paths, QStringList({"Other/ep1.srt", "Show/Season 1/ep1.mkv", "Show/Season 1/ep1.srt"}));
        
        LibraryScanner withHidden(false);
        QCOMPARE(withHidden.scanRoot(root).value().size(), 4);
    }
    
    void testScannerReportsMissingRoots() {
        TEST_SCOPE("library_missing_root");
        const QString root = _testScope.getTempDirectory();
        TestUtils::createEmptyFile(root, "Show/ep1.srt");
        
        LibraryScanner scanner;
        ASSERT_EXPECTED_ERROR(scanner.scanRoot(root + "/does-not-exist"), LibraryError::RootNotFound);
        
        ScanResult result = scanner.scan({root + "/does-not-exist", root});
        QCOMPARE(result.files.size(), 1);
        QCOMPARE(result.failedRoots.size(), 1);
        QCOMPARE(result.failedRoots[0].second, LibraryError::RootNotFound);
    }
};

int runTestMediaLibrary(int argc, char** argv) {
    TestMediaLibrary test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_media_library.moc"
