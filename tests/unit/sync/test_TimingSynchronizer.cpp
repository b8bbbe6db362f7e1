#include <QtTest>
#include "SyncTestUtils.hpp"
#include "sync/TimingSynchronizer.hpp"
#include "sync/TokenNormalizer.hpp"

using namespace ks;
using namespace ks::sync;

namespace {

// A long song: unique verse lines, a repeated chorus, recognizer drift of
// +3s, a few misheard words and one line the recognizer missed entirely.
struct SyntheticSong {
    std::vector<ReferenceLine> reference;
    std::vector<RecognizedWord> recognized;
};

SyntheticSong makeSong(std::size_t lineCount) {
    SyntheticSong song;
    const Seconds drift = 3.0;

    for (std::size_t i = 0; i < lineCount; ++i) {
        const Seconds start = 4.0 * static_cast<Seconds>(i);
        const std::string text =
                i % 6 == 5 ? std::string("chorus love love me tonight")
                           : "verse" + std::to_string(i) + " walking alone " +
                                     "mile" + std::to_string(i);
        song.reference.push_back({text, start});

        if (i == 7)
            continue; // dropout

        const auto words = TokenNormalizer::splitWords(text);
        for (std::size_t k = 0; k < words.size(); ++k) {
            if (i % 3 == 1 && k == 1)
                continue; // recognizer skipped a word
            std::string heard = words[k];
            if (i % 5 == 2 && k == 2)
                heard = "misheard";
            const Seconds ws = start + drift + 0.5 * static_cast<Seconds>(k);
            song.recognized.push_back({heard, ws, ws + 0.4});
        }
    }
    return song;
}

} // namespace

class TestTimingSynchronizer : public QObject {
    Q_OBJECT

private slots:
    void testTwoCleanLines() {
        const std::vector<ReferenceLine> reference{{"hello world", 0.0},
                                                   {"goodbye now", 5.0}};
        const std::vector<RecognizedWord> recognized{{"hello", 0.1, 0.4},
                                                     {"world", 0.4, 0.9},
                                                     {"goodbye", 5.2, 5.6},
                                                     {"now", 5.6, 6.0}};
        TimingSynchronizer sync;
        const auto result = sync.synchronize(reference, recognized);
        const auto& lines = result.lines;

        QCOMPARE(lines.size(), std::size_t{2});
        QCOMPARE(result.report.matchedWords, std::size_t{4});
        QVERIFY(!result.report.offsetApplied);
        for (const auto& l : lines) {
            for (const auto& w : l.words)
                QVERIFY(w.matched);
            QVERIFY(l.duration() >= 1.2);
        }
        QVERIFY(lines[0].end_s <= lines[1].start_s);
        QVERIFY(test::near(lines[0].start_s, 0.1));
        QVERIFY(test::near(lines[0].end_s, 1.3));
        QVERIFY(test::near(lines[1].start_s, 5.2));
        QVERIFY(test::near(lines[1].words[1].end_s, 6.0));
        QVERIFY(test::checkTimeline(lines, sync.config().minLineDuration).isEmpty());
    }

    void testDriftIsCorrected() {
        const std::vector<ReferenceLine> reference{
                {"hello darkness old friend", 0.0},
                {"come to talk with you again", 5.0}};
        const std::vector<RecognizedWord> recognized{{"hello", 10.1, 10.4},
                                                     {"darkness", 10.4, 10.9},
                                                     {"old", 10.9, 11.2},
                                                     {"friend", 11.2, 11.8},
                                                     {"come", 15.2, 15.5},
                                                     {"to", 15.5, 15.6},
                                                     {"talk", 15.6, 16.0},
                                                     {"with", 16.0, 16.2},
                                                     {"you", 16.2, 16.5},
                                                     {"again", 16.5, 17.2}};
        const auto result = TimingSynchronizer().synchronize(reference, recognized);

        QVERIFY(result.report.offsetApplied);
        QVERIFY(test::near(result.report.offset.offset, 10.1));
        QCOMPARE(result.report.matchedWords, std::size_t{10});
        QCOMPARE(result.report.syntheticLines, std::size_t{0});
        QVERIFY(test::near(result.lines[0].start_s, 10.1));
        QVERIFY(test::near(result.lines[0].end_s, 11.8));
        QVERIFY(test::near(result.lines[1].start_s, 15.2));
        QVERIFY(test::near(result.lines[1].end_s, 17.2));
    }

    void testMissingWordIsInterpolated() {
        const std::vector<ReferenceLine> reference{{"one two three", 0.0}};
        const std::vector<RecognizedWord> recognized{{"one", 0.0, 0.3},
                                                     {"three", 1.0, 1.3}};
        const auto result = TimingSynchronizer().synchronize(reference, recognized);
        const auto& words = result.lines.at(0).words;

        QCOMPARE(result.report.interpolatedWords, std::size_t{1});
        QVERIFY(test::near(words[1].start_s, 0.3));
        QVERIFY(test::near(words[1].end_s, 1.0));
        QVERIFY(test::near(words[2].start_s, 1.0));
    }

    void testUnmatchedLineIsSpreadEvenly() {
        const std::vector<ReferenceLine> reference{
                {"completely different words", 0.0},
                {"hello there", 4.0}};
        const std::vector<RecognizedWord> recognized{{"hello", 4.1, 4.5},
                                                     {"there", 4.5, 5.0}};
        const auto result = TimingSynchronizer().synchronize(reference, recognized);
        const auto& line = result.lines.at(0);

        QVERIFY(!result.report.offsetApplied);
        QCOMPARE(result.report.syntheticLines, std::size_t{1});
        QVERIFY(test::near(line.start_s, 0.0));
        QVERIFY(test::near(line.end_s, 4.0));
        const Seconds step = 4.0 / 3.0;
        for (std::size_t k = 0; k < line.words.size(); ++k) {
            QVERIFY(test::near(line.words[k].start_s, step * k));
            QVERIFY(test::near(line.words[k].end_s, step * (k + 1)));
        }
        QVERIFY(test::near(result.lines[1].start_s, 4.1));
    }

    void testOverlappingLinesArePushed() {
        const std::vector<ReferenceLine> reference{{"first line here", 0.0},
                                                   {"second line now", 0.5},
                                                   {"third one too", 0.6}};
        TimingSynchronizer sync;
        const auto result = sync.synchronize(reference, {});
        const auto& lines = result.lines;

        QCOMPARE(result.report.pushedLines, std::size_t{2});
        QVERIFY(test::near(lines[1].start_s, 1.2));
        QVERIFY(test::near(lines[2].start_s, 2.4));
        QVERIFY(lines[2].duration() >= 1.2);
        QVERIFY(test::checkTimeline(lines, sync.config().minLineDuration).isEmpty());
    }

    void testShortLineMeetsMinimumExactly() {
        TimingSynchronizer sync;
        const auto result = sync.synchronize({{"hello", 0.14}},
                                             {{"hello", 0.14, 0.34}});
        const auto& line = result.lines.at(0);

        QVERIFY(line.end_s - line.start_s >= sync.config().minLineDuration);
        QVERIFY(test::checkTimeline(result.lines, sync.config().minLineDuration)
                        .isEmpty());
    }

    void testUnheardIntroWithEarlyAudio() {
        // The vocals start 5s earlier than the reference says, and the
        // recognizer hears nothing of the first line.
        const std::vector<ReferenceLine> reference{
                {"instrumental intro", 1.0},
                {"dancing through the fire", 10.0},
                {"burning all the night", 14.0}};
        const std::vector<RecognizedWord> recognized{{"dancing", 5.0, 5.4},
                                                     {"through", 5.4, 5.8},
                                                     {"the", 5.8, 6.0},
                                                     {"fire", 6.0, 6.6},
                                                     {"burning", 9.0, 9.4},
                                                     {"all", 9.4, 9.7},
                                                     {"the", 9.7, 9.9},
                                                     {"night", 9.9, 10.5}};
        TimingSynchronizer sync;
        const auto result = sync.synchronize(reference, recognized);
        const auto& lines = result.lines;

        QVERIFY(result.report.offsetApplied);
        QVERIFY(test::near(result.report.offset.offset, -5.0));
        QCOMPARE(result.report.syntheticLines, std::size_t{1});
        QCOMPARE(result.report.matchedWords, std::size_t{8});

        QVERIFY(test::near(lines[0].start_s, 0.0));
        QVERIFY(test::near(lines[0].end_s, 5.0));
        QVERIFY(test::near(lines[0].words[0].start_s, 0.0));
        QVERIFY(test::near(lines[0].words[1].start_s, 2.5));
        QVERIFY(test::near(lines[1].start_s, 5.0));
        QVERIFY(test::near(lines[2].end_s, 10.5));
        for (const auto& l : lines) {
            QVERIFY(l.start_s >= 0.0);
            for (const auto& w : l.words)
                QVERIFY(w.start_s >= 0.0);
        }

        const QString violation =
                test::checkTimeline(lines, sync.config().minLineDuration);
        QVERIFY2(violation.isEmpty(), qPrintable(violation));
    }

    void testLongSongInvariants() {
        const auto song = makeSong(40);
        const std::vector<ReferenceLine> original = song.reference;

        TimingSynchronizer sync;
        const auto result = sync.synchronize(song.reference, song.recognized);
        const auto& lines = result.lines;

        QCOMPARE(lines.size(), song.reference.size());
        QVERIFY(result.report.offsetApplied);
        QVERIFY(result.report.matchedWords > result.report.wordCount / 2);

        const QString violation =
                test::checkTimeline(lines, sync.config().minLineDuration);
        QVERIFY2(violation.isEmpty(), qPrintable(violation));

        for (std::size_t i = 0; i < lines.size(); ++i) {
            QCOMPARE(lines[i].text, song.reference[i].text);
            QCOMPARE(lines[i].words.size(),
                     TokenNormalizer::splitWords(song.reference[i].text).size());
            QCOMPARE(lines[i].stage, LineStage::Finalized);
        }

        // The caller's reference lines are left untouched
        for (std::size_t i = 0; i < original.size(); ++i)
            QVERIFY(song.reference[i].start_s == original[i].start_s);
    }

    void testDeterministic() {
        const auto song = makeSong(20);
        TimingSynchronizer sync;
        const auto a = sync.synchronize(song.reference, song.recognized);
        const auto b = sync.synchronize(song.reference, song.recognized);

        QCOMPARE(a.lines.size(), b.lines.size());
        for (std::size_t i = 0; i < a.lines.size(); ++i) {
            QVERIFY(a.lines[i].start_s == b.lines[i].start_s);
            QVERIFY(a.lines[i].end_s == b.lines[i].end_s);
            for (std::size_t k = 0; k < a.lines[i].words.size(); ++k) {
                QVERIFY(a.lines[i].words[k].start_s == b.lines[i].words[k].start_s);
                QVERIFY(a.lines[i].words[k].end_s == b.lines[i].words[k].end_s);
            }
        }
    }

    void testNoRecognizedWords() {
        const std::vector<ReferenceLine> reference{{"just the lyrics", 2.0},
                                                   {"nothing heard", 6.0}};
        const auto result = TimingSynchronizer().synchronize(reference, {});

        QCOMPARE(result.lines.size(), std::size_t{2});
        QCOMPARE(result.report.matchedWords, std::size_t{0});
        QCOMPARE(result.report.syntheticLines, std::size_t{2});
        QVERIFY(test::near(result.lines[0].start_s, 2.0));
        QVERIFY(test::near(result.lines[0].end_s, 6.0));
        QVERIFY(test::near(result.lines[1].end_s, 9.0));
    }

    void testNoReferenceLines() {
        const auto result = TimingSynchronizer().synchronize(
                {}, {{"orphan", 1.0, 1.5}});
        QVERIFY(result.lines.empty());
        QCOMPARE(result.report.lineCount, std::size_t{0});
    }

    void testCustomConfig() {
        SyncConfig cfg;
        cfg.minLineDuration = 3.0;
        TimingSynchronizer sync(cfg);

        const auto result = sync.synchronize({{"short", 0.0}, {"later", 10.0}},
                                             {{"short", 0.1, 0.3}, {"later", 10.0, 10.2}});
        QVERIFY(test::near(result.lines[0].end_s, 3.1));
        QVERIFY(test::near(result.lines[1].end_s, 13.0));
    }

    void testFromSegments() {
        std::vector<RecognizedSegment> segments(3);
        segments[0] = {"hey there", 1.0, 2.0, {}};
        segments[1] = {"over here", 1.8, 3.5, {{"over", 1.8, 2.4}, {"here", 2.6, 3.5}}};
        segments[2] = {"", 4.0, 5.0, {}};

        TimingSynchronizer sync;
        const auto result = sync.fromSegments(segments);
        const auto& lines = result.lines;

        QCOMPARE(lines.size(), std::size_t{2});
        QCOMPARE(lines[0].text, std::string("hey there"));
        QCOMPARE(lines[0].words.size(), std::size_t{2});
        QVERIFY(test::near(lines[0].words[1].start_s, 1.5));
        QVERIFY(test::near(lines[0].end_s, 2.2));
        QVERIFY(test::near(lines[1].start_s, 2.2));
        QCOMPARE(result.report.pushedLines, std::size_t{1});
        QCOMPARE(result.report.matchedWords, std::size_t{4});
        QVERIFY(test::checkTimeline(lines, sync.config().minLineDuration).isEmpty());
    }

    void testWordsOf() {
        RecognizedSegment timed{"a b", 0.0, 1.0, {{"a", 0.0, 0.2}, {"b", 0.6, 1.0}}};
        const auto kept = TimingSynchronizer::wordsOf(timed);
        QCOMPARE(kept.size(), std::size_t{2});
        QVERIFY(test::near(kept[1].start_s, 0.6));

        RecognizedSegment bare{"la la la la", 2.0, 4.0, {}};
        const auto split = TimingSynchronizer::wordsOf(bare);
        QCOMPARE(split.size(), std::size_t{4});
        QVERIFY(test::near(split[0].start_s, 2.0));
        QVERIFY(test::near(split[3].start_s, 3.5));
        QVERIFY(test::near(split[3].end_s, 4.0));

        QVERIFY(TimingSynchronizer::wordsOf({"", 0.0, 1.0, {}}).empty());
    }
};

int runTestTimingSynchronizer(int argc, char** argv) {
    TestTimingSynchronizer tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_TimingSynchronizer.moc"
