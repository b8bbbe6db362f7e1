#include <QtTest>
#include "SyncTestUtils.hpp"
#include "sync/GlobalOffsetEstimator.hpp"

using namespace ks;
using namespace ks::sync;

class TestGlobalOffsetEstimator : public QObject {
    Q_OBJECT

private slots:
    void testLateAudioIsDetected() {
        const std::vector<ReferenceLine> lines{{"hello darkness old friend", 0.0},
                                               {"come to talk with you", 5.0}};
        const std::vector<RecognizedWord> words{{"hello", 10.1, 10.4},
                                                {"darkness", 10.4, 10.9},
                                                {"old", 10.9, 11.2},
                                                {"friend", 11.2, 11.8}};
        SyncConfig cfg;

        const auto est = GlobalOffsetEstimator::estimate(lines, words, cfg);
        QVERIFY(est.found());
        QCOMPARE(est.anchorSize, std::size_t{4});
        QVERIFY(test::near(est.offset, 10.1));
        QVERIFY(test::near(est.referenceTime, 0.0));
        QVERIFY(test::near(est.recognizedTime, 10.1));
        QVERIFY(GlobalOffsetEstimator::shouldApply(est, cfg));
    }

    void testEarlyAudioGivesNegativeOffset() {
        const std::vector<ReferenceLine> lines{{"intro", 0.0},
                                               {"walking down the street", 30.0}};
        const std::vector<RecognizedWord> words{{"walking", 24.0, 24.5},
                                                {"down", 24.5, 24.8},
                                                {"the", 24.8, 25.0},
                                                {"street", 25.0, 25.6}};
        const auto est = GlobalOffsetEstimator::estimate(lines, words, SyncConfig{});
        QVERIFY(test::near(est.offset, -6.0));
        QVERIFY(GlobalOffsetEstimator::shouldApply(est, SyncConfig{}));
    }

    void testShortTokensNeverAnchor() {
        // Every shared token is shorter than minTokenLength
        const std::vector<ReferenceLine> lines{{"oh I am so in it", 0.0}};
        const std::vector<RecognizedWord> words{{"oh", 20.0, 20.2},
                                                {"I", 20.2, 20.3},
                                                {"am", 20.3, 20.5}};
        const auto est = GlobalOffsetEstimator::estimate(lines, words, SyncConfig{});
        QVERIFY(!est.found());
        QVERIFY(est.offset == 0.0);
        QVERIFY(!GlobalOffsetEstimator::shouldApply(est, SyncConfig{}));
    }

    void testNoCommonTokens() {
        const std::vector<ReferenceLine> lines{{"completely different words", 0.0}};
        const std::vector<RecognizedWord> words{{"nothing", 3.0, 3.5},
                                                {"shared", 3.5, 4.0}};
        const auto est = GlobalOffsetEstimator::estimate(lines, words, SyncConfig{});
        QVERIFY(est.offset == 0.0);
        QCOMPARE(est.anchorSize, std::size_t{0});
    }

    void testEmptyInputs() {
        const auto noWords = GlobalOffsetEstimator::estimate(
                {{"some line here", 1.0}}, {}, SyncConfig{});
        QVERIFY(noWords.offset == 0.0);

        const auto noLines = GlobalOffsetEstimator::estimate(
                {}, {{"word", 1.0, 2.0}}, SyncConfig{});
        QVERIFY(noLines.offset == 0.0);
    }

    void testSmallDriftIsIgnored() {
        const std::vector<ReferenceLine> lines{{"hold the line tonight", 10.0}};
        const std::vector<RecognizedWord> words{{"hold", 11.5, 11.8},
                                                {"the", 11.8, 12.0},
                                                {"line", 12.0, 12.4},
                                                {"tonight", 12.4, 13.0}};
        SyncConfig cfg;
        const auto est = GlobalOffsetEstimator::estimate(lines, words, cfg);
        QVERIFY(test::near(est.offset, 1.5));
        QVERIFY(!GlobalOffsetEstimator::shouldApply(est, cfg));

        // Exactly at the threshold is still not applied
        OffsetEstimate edge;
        edge.anchorSize = 1;
        edge.offset = cfg.globalOffsetThreshold;
        QVERIFY(!GlobalOffsetEstimator::shouldApply(edge, cfg));
    }

    void testTieGoesToEarliestReferenceRun() {
        // Both lines have a three-token run in the audio; the one earlier
        // in the lyrics anchors the estimate
        const std::vector<ReferenceLine> lines{{"never gonna give", 0.0},
                                               {"never gonna stop", 4.0}};
        const std::vector<RecognizedWord> words{{"never", 12.0, 12.3},
                                                {"gonna", 12.3, 12.6},
                                                {"stop", 12.6, 13.0},
                                                {"never", 20.0, 20.3},
                                                {"gonna", 20.3, 20.6},
                                                {"give", 20.6, 21.0}};
        const auto est = GlobalOffsetEstimator::estimate(lines, words, SyncConfig{});
        QCOMPARE(est.anchorSize, std::size_t{3});
        QVERIFY(test::near(est.offset, 20.0));
    }

    void testApplyOffsetCopies() {
        const std::vector<ReferenceLine> lines{{"a", 1.0}, {"b", 4.0}};
        const auto shifted = GlobalOffsetEstimator::applyOffset(lines, 2.5);

        QCOMPARE(shifted.size(), std::size_t{2});
        QVERIFY(test::near(shifted[0].start_s, 3.5));
        QVERIFY(test::near(shifted[1].start_s, 6.5));
        QCOMPARE(shifted[1].text, std::string("b"));
        // Input untouched
        QVERIFY(test::near(lines[0].start_s, 1.0));
    }
};

int runTestGlobalOffsetEstimator(int argc, char** argv) {
    TestGlobalOffsetEstimator tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_GlobalOffsetEstimator.moc"
