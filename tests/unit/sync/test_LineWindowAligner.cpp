#include <QtTest>
#include "SyncTestUtils.hpp"
#include "sync/LineWindowAligner.hpp"

using namespace ks;
using namespace ks::sync;

class TestLineWindowAligner : public QObject {
    Q_OBJECT

private slots:
    void testWindowFor() {
        const std::vector<ReferenceLine> lines{{"first", 0.5}, {"second", 4.0}};
        SyncConfig cfg;

        const auto w0 = LineWindowAligner::windowFor(lines, 0, cfg);
        QVERIFY(test::near(w0.start, 0.0)); // clamped at zero
        QVERIFY(test::near(w0.end, 5.0));
        QVERIFY(!w0.clamped);

        // Last line: start + defaultLineGap + margin
        const auto w1 = LineWindowAligner::windowFor(lines, 1, cfg);
        QVERIFY(test::near(w1.start, 3.0));
        QVERIFY(test::near(w1.end, 10.0));
    }

    void testDegenerateWindowIsWidened() {
        // Out-of-order starts would give an inverted window
        const std::vector<ReferenceLine> lines{{"late", 10.0}, {"early", 2.0}};
        const auto w = LineWindowAligner::windowFor(lines, 0, SyncConfig{});
        QVERIFY(w.clamped);
        QVERIFY(test::near(w.start, 9.0));
        QVERIFY(test::near(w.end, 14.0));
    }

    void testCandidatesOverlapWindow() {
        const std::vector<RecognizedWord> words{{"before", 0.0, 1.0},
                                                {"edge", 0.5, 1.5},
                                                {"inside", 2.0, 3.0},
                                                {"straddle", 4.9, 5.5},
                                                {"after", 5.0, 5.5}};
        const SearchWindow window{1.0, 5.0, false};

        const auto idx = LineWindowAligner::candidatesIn(words, window);
        const std::vector<std::size_t> expected{1, 2, 3};
        QCOMPARE(idx, expected);
    }

    void testAlignTransfersTimestamps() {
        const std::vector<ReferenceLine> lines{{"Hello, World!", 1.0},
                                               {"next line", 5.0}};
        const std::vector<RecognizedWord> words{{"hello", 1.2, 1.6},
                                                {"world", 1.7, 2.3},
                                                {"next", 5.1, 5.4}};

        const auto line = LineWindowAligner::alignLine(lines, 0, words, SyncConfig{});
        QCOMPARE(line.stage, LineStage::PartiallyAligned);
        QCOMPARE(line.text, std::string("Hello, World!"));
        QCOMPARE(line.words.size(), std::size_t{2});

        // Surface form of the reference is kept
        QCOMPARE(line.words[0].word, std::string("Hello,"));
        QVERIFY(line.words[0].matched);
        QVERIFY(test::near(line.words[0].start_s, 1.2));
        QVERIFY(test::near(line.words[0].end_s, 1.6));
        QVERIFY(line.words[1].matched);
        QVERIFY(test::near(line.words[1].start_s, 1.7));
    }

    void testRepeatedChorusOutsideWindowIgnored() {
        const std::vector<ReferenceLine> lines{{"love me", 0.0},
                                               {"other words", 3.0}};
        const std::vector<RecognizedWord> words{{"other", 3.1, 3.5},
                                                {"words", 3.5, 4.0},
                                                {"love", 120.0, 120.4},
                                                {"me", 120.4, 120.8}};

        const auto line = LineWindowAligner::alignLine(lines, 0, words, SyncConfig{});
        QCOMPARE(line.words.size(), std::size_t{2});
        for (const auto& w : line.words) {
            QVERIFY(!w.matched);
            QVERIFY(w.start_s == 0.0);
            QVERIFY(w.end_s == 0.0);
        }
    }

    void testPunctuationWordIsSkipped() {
        const std::vector<ReferenceLine> lines{{"stay - with me", 0.0}};
        const std::vector<RecognizedWord> words{{"stay", 0.2, 0.6},
                                                {"with", 0.7, 0.9},
                                                {"me", 0.9, 1.3}};

        const auto line = LineWindowAligner::alignLine(lines, 0, words, SyncConfig{});
        QCOMPARE(line.words.size(), std::size_t{4});
        QVERIFY(line.words[0].matched);
        QVERIFY(!line.words[1].matched); // "-"
        QVERIFY(line.words[2].matched);
        QVERIFY(line.words[3].matched);
        QVERIFY(test::near(line.words[2].start_s, 0.7));
        QVERIFY(test::near(line.words[3].end_s, 1.3));
    }

    void testMisheardWordStaysUnmatched() {
        const std::vector<ReferenceLine> lines{{"one two three", 0.0}};
        const std::vector<RecognizedWord> words{{"one", 0.0, 0.3},
                                                {"too", 0.4, 0.8},
                                                {"three", 1.0, 1.3}};

        const auto line = LineWindowAligner::alignLine(lines, 0, words, SyncConfig{});
        QVERIFY(line.words[0].matched);
        QVERIFY(!line.words[1].matched);
        QVERIFY(line.words[2].matched);
        QVERIFY(test::near(line.words[2].start_s, 1.0));
    }

    void testNoCandidates() {
        const std::vector<ReferenceLine> lines{{"alone here", 50.0}};
        const auto line = LineWindowAligner::alignLine(lines, 0, {}, SyncConfig{});
        QCOMPARE(line.words.size(), std::size_t{2});
        QCOMPARE(line.stage, LineStage::PartiallyAligned);
        QVERIFY(!line.words[0].matched);
    }
};

int runTestLineWindowAligner(int argc, char** argv) {
    TestLineWindowAligner tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_LineWindowAligner.moc"
