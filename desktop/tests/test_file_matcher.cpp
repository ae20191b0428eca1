#include <QtTest/QtTest>
#include "../src/core/library/FileMatcher.hpp"

#include <algorithm>

using namespace MomentNav;

class TestFileMatcher : public QObject {
    Q_OBJECT
    
private:
    static QString videoFor(const QList<FileMatch>& matches, const QString& subtitle) {
        return FileMatchTable(matches).videoFor(subtitle);
    }
    
private slots:
    void testExactMatchPicksRightEpisode() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        
        auto matches = matcher.match({"Show1 - 1x01.srt"}, {"Show1 - 1x01.mp4", "Show1 - 1x02.mp4"});
        
        QCOMPARE(matches.size(), 1);
        QCOMPARE(matches[0].videoPath, QString("Show1 - 1x01.mp4"));
        QCOMPARE(matches[0].kind, MatchKind::Exact);
    }
    
    void testIdenticalKeysAcrossContainers() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        
        auto matches = matcher.match({"S01_DISC1_Title1.srt"}, {"S01_DISC1_Title1.mov"});
        
        QCOMPARE(videoFor(matches, "S01_DISC1_Title1.srt"), QString("S01_DISC1_Title1.mov"));
        QVERIFY(matches[0].isMatched());
        // Equal loose keys are settled by the exact pass
        QCOMPARE(matches[0].kind, MatchKind::Exact);
        QCOMPARE(matches[0].overlap, 14); // "s01disc1title1"
    }
    
    void testEmptyKeysNeverMatch() {
        FileMatcher matcher{NameNormalizer()};
        
        auto matches = matcher.match({"---.srt", "Pilot.srt"}, {"___.mkv", "Pilot.mkv"});
        
        QCOMPARE(matches.size(), 2);
        QCOMPARE(matches[0].subtitlePath, QString("---.srt"));
        QVERIFY(!matches[0].isMatched());
        QVERIFY(matches[0].videoPath.isEmpty());
        QCOMPARE(matches[1].videoPath, QString("Pilot.mkv"));
        QCOMPARE(matches[1].kind, MatchKind::Exact);
    }
    
    void testContainmentMatch() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        
        auto matches = matcher.match({"Show1 1x01.srt"}, {"Show1 1x01 Pilot.mp4", "Show1 1x02.mp4"});
        
        QCOMPARE(matches[0].videoPath, QString("Show1 1x01 Pilot.mp4"));
        QCOMPARE(matches[0].kind, MatchKind::Containment);
        QCOMPARE(matches[0].overlap, 9); // "show11x01"
    }
    
    void testExactPassWinsOverContainment() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        
        auto matches = matcher.match({"Pilot.srt"}, {"Pilot Extended.mkv", "Pilot.mkv"});
        
        QCOMPARE(matches[0].videoPath, QString("Pilot.mkv"));
        QCOMPARE(matches[0].kind, MatchKind::Exact);
    }
    
    void testLongestOverlapPreferred() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        
        auto matches = matcher.match({"Show Episode 10.srt"},
                                     {"Show Episode 1.mkv", "Show Episode 10 Extended Cut.mkv"});
        
        QCOMPARE(matches[0].videoPath, QString("Show Episode 10 Extended Cut.mkv"));
        QCOMPARE(matches[0].kind, MatchKind::Containment);
    }
    
    void testTiesGoToShortestThenSmallestPath() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        
        auto containment = matcher.match({"Pilot.srt"}, {"x/Pilot Remastered.mkv", "x/Pilot HD.mkv"});
        QCOMPARE(containment[0].videoPath, QString("x/Pilot HD.mkv"));
        
        auto exact = matcher.match({"Ep 2.srt"}, {"/lib/b/Ep 2.mkv", "/lib/long/Ep 2.mkv", "/lib/a/Ep 2.mkv"});
        QCOMPARE(exact[0].videoPath, QString("/lib/a/Ep 2.mkv"));
    }
    
    void testClaimedVideoLeavesPool() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        
        // Both subtitles normalize to "ep 1"; the first in sorted order wins
        auto matches = matcher.match({"Ep 1.srt", "Ep 1.eng.srt"}, {"Ep 1.mkv"});
        
        QCOMPARE(matches.size(), 2);
        QCOMPARE(videoFor(matches, "Ep 1.eng.srt"), QString("Ep 1.mkv"));
        QCOMPARE(videoFor(matches, "Ep 1.srt"), QString());
        QCOMPARE(FileMatchTable(matches).matchedCount(), 1);
    }
    
    void testNoVideoIsAssignedTwice() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        
        const QStringList subtitles = {
            "Show - 01.srt", "Show - 01.eng.srt", "Show - 01 [Alt].srt", "Show 01 SDH.srt",
            "Show - 02.srt", "Show - 02 Directors Cut.srt", "Show.srt", "Extras.srt"
        };
        const QStringList videos = {
            "Show - 01.mkv", "Show - 02.mkv", "Show - 02 Directors Cut Extended.mkv", "Show.mkv"
        };
        
        auto matches = matcher.match(subtitles, videos);
        QCOMPARE(matches.size(), subtitles.size());
        
        QStringList assigned;
        for (const FileMatch& match : matches) {
            if (match.isMatched()) {
                QVERIFY2(!assigned.contains(match.videoPath), qPrintable(match.videoPath));
                assigned.append(match.videoPath);
            }
        }
        QVERIFY(!assigned.isEmpty());
    }
    
    void testResultIsIndependentOfInputOrder() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        
        QStringList subtitles = {"B 2.srt", "A 1.srt", "A 1 eng.srt", "C.srt"};
        QStringList videos = {"A 1.mkv", "B 2 HD.mkv", "C Part 2.mkv", "C.mkv"};
        
        auto forward = matcher.match(subtitles, videos);
        std::reverse(subtitles.begin(), subtitles.end());
        std::reverse(videos.begin(), videos.end());
        auto backward = matcher.match(subtitles, videos);
        
        QCOMPARE(forward.size(), backward.size());
        for (int i = 0; i < forward.size(); ++i) {
            QCOMPARE(forward[i].subtitlePath, backward[i].subtitlePath);
            QCOMPARE(forward[i].videoPath, backward[i].videoPath);
        }
    }
    
    void testUnmatchedSubtitle() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        
        auto matches = matcher.match({"Commentary.srt", "---.srt"}, {"Show 1.mkv"});
        
        QCOMPARE(matches.size(), 2);
        for (const FileMatch& match : matches) {
            QCOMPARE(match.kind, MatchKind::None);
            QVERIFY(match.videoPath.isEmpty());
        }
    }
    
    void testDuplicateSubtitlePathsCollapse() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        
        auto matches = matcher.match({"Ep 1.srt", "Ep 1.srt"}, {"Ep 1.mkv"});
        QCOMPARE(matches.size(), 1);
        QVERIFY(matches[0].isMatched());
    }
    
    void testMatchTableLookup() {
        NameNormalizer normalizer;
        FileMatcher matcher(normalizer);
        FileMatchTable table(matcher.match({"a/Ep 1.srt", "a/Ep 9.srt"}, {"a/Ep 1.mp4"}));
        
        QCOMPARE(table.size(), 2);
        QCOMPARE(table.videoFor("a/Ep 1.srt"), QString("a/Ep 1.mp4"));
        QVERIFY(table.find("a/Ep 9.srt") != nullptr);
        QVERIFY(!table.find("a/Ep 9.srt")->isMatched());
        QVERIFY(table.find("unknown.srt") == nullptr);
        QCOMPARE(table.videoFor("unknown.srt"), QString());
    }
};

int runTestFileMatcher(int argc, char** argv) {
    TestFileMatcher test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_file_matcher.moc"
