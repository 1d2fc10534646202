// EN: Unit tests for the streaming processor: batching, backpressure, consumer failures
// FR: Tests unitaires du processeur streaming : lots, contre-pression, échecs du consommateur

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "csv/streaming_processor.hpp"
#include "infrastructure/logging/logger.hpp"
#include "scripted_tokenizer.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <thread>

using namespace CIP;
using namespace CIP::CSV;
using namespace CIP::CSV::Testing;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::MockFunction;

namespace {

std::future<void> settled() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

std::future<void> rejected(const std::string& message) {
    std::promise<void> promise;
    promise.set_exception(std::make_exception_ptr(std::runtime_error(message)));
    return promise.get_future();
}

// EN: Records every batch and settles it immediately
// FR: Enregistre chaque lot et le règle immédiatement
struct BatchRecorder {
    std::vector<std::vector<Record>> batches;
    std::vector<size_t> start_indices;

    BatchCallback callback() {
        return [this](std::vector<Record> records, const BatchInfo& info) {
            start_indices.push_back(info.start_index);
            batches.push_back(std::move(records));
            return settled();
        };
    }

    std::vector<Record> all() const {
        std::vector<Record> out;
        for (const auto& batch : batches) {
            out.insert(out.end(), batch.begin(), batch.end());
        }
        return out;
    }
};

} // namespace

class StreamingProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    ParserInput input(const std::string& text, bool has_headers, size_t chunk_size = DEFAULT_CHUNK_SIZE) {
        ParserInput in;
        in.file = IO::makeMemoryFile("people.csv", text);
        in.config.delimiter = ",";
        in.config.chunk_size = chunk_size;
        in.has_headers = has_headers;
        in.field_assignments = {{"id", 0}, {"name", 1}};
        return in;
    }

    static std::string peopleCsv(size_t count) {
        std::string text = "id,name\n";
        for (size_t i = 0; i < count; ++i) {
            text += std::to_string(i) + ",person" + std::to_string(i) + "\n";
        }
        return text;
    }
};

TEST_F(StreamingProcessorTest, DeliversMappedRecordsWithoutHeader) {
    BatchRecorder recorder;
    size_t progress = 0;
    auto result = process(input("id,name\n1,Ann\n2,Bo\n", true),
                          [&](size_t delta) { progress += delta; }, recorder.callback());

    ASSERT_TRUE(result.ok()) << result.message;
    ASSERT_EQ(recorder.batches.size(), 1u);
    EXPECT_EQ(recorder.start_indices, (std::vector<size_t>{0}));
    EXPECT_EQ(recorder.batches[0],
              (std::vector<Record>{{{"id", "1"}, {"name", "Ann"}}, {{"id", "2"}, {"name", "Bo"}}}));
    EXPECT_EQ(progress, 2u);
    EXPECT_EQ(result.rows_processed, 2u);
    EXPECT_EQ(result.batches, 1u);
    EXPECT_EQ(result.statistics.getRowsSkipped(), 1u);
}

TEST_F(StreamingProcessorTest, KeepsHeaderRowWhenNotDeclared) {
    BatchRecorder recorder;
    auto result = process(input("id,name\n1,Ann\n", false), nullptr, recorder.callback());

    ASSERT_TRUE(result.ok());
    auto records = recorder.all();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].at("name"), "name");
}

TEST_F(StreamingProcessorTest, StartIndicesAreContiguousAcrossSmallChunks) {
    BatchRecorder recorder;
    auto result = process(input(peopleCsv(40), true, 16), nullptr, recorder.callback());

    ASSERT_TRUE(result.ok()) << result.message;
    ASSERT_GT(recorder.batches.size(), 1u);

    size_t expected = 0;
    for (size_t i = 0; i < recorder.batches.size(); ++i) {
        EXPECT_EQ(recorder.start_indices[i], expected);
        EXPECT_FALSE(recorder.batches[i].empty());
        expected += recorder.batches[i].size();
    }
    EXPECT_EQ(expected, 40u);
    EXPECT_EQ(result.rows_processed, 40u);
}

TEST_F(StreamingProcessorTest, ConcatenatedBatchesMatchSingleChunkRun) {
    const std::string text = peopleCsv(25);

    BatchRecorder whole;
    ASSERT_TRUE(process(input(text, true), nullptr, whole.callback()).ok());

    for (size_t chunk_size : {1u, 3u, 7u, 13u}) {
        BatchRecorder pieces;
        auto result = process(input(text, true, chunk_size), nullptr, pieces.callback());
        ASSERT_TRUE(result.ok()) << "chunk_size=" << chunk_size;
        EXPECT_EQ(pieces.all(), whole.all()) << "chunk_size=" << chunk_size;
    }
    ASSERT_EQ(whole.all().size(), 25u);
    EXPECT_EQ(whole.all().back().at("name"), "person24");
}

TEST_F(StreamingProcessorTest, StripsByteOrderMarkFromFirstRowOnly) {
    BatchRecorder with_header;
    ASSERT_TRUE(process(input("\xEF\xBB\xBFid,name\n\xEF\xBB\xBF" "1,Ann\n", true), nullptr,
                        with_header.callback()).ok());
    auto records = with_header.all();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].at("id"), "\xEF\xBB\xBF" "1");

    BatchRecorder without_header;
    ASSERT_TRUE(process(input("\xEF\xBB\xBF" "1,Ann\n2,Bo\n", false), nullptr, without_header.callback()).ok());
    records = without_header.all();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].at("id"), "1");
}

TEST_F(StreamingProcessorTest, OmitsUnassignedAndOutOfRangeFields) {
    ParserInput in = input("1,Ann\n2\n", false);
    in.field_assignments = {{"id", 0}, {"name", 1}, {"notes", std::nullopt}};

    BatchRecorder recorder;
    ASSERT_TRUE(process(in, nullptr, recorder.callback()).ok());
    auto records = recorder.all();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].count("notes"), 0u);
    EXPECT_EQ(records[1], (Record{{"id", "2"}}));
}

TEST_F(StreamingProcessorTest, HoldsDecodingWhileConsumerIsPending) {
    std::deque<std::promise<void>> pending;
    size_t calls = 0;
    BatchCallback consumer = [&](std::vector<Record>, const BatchInfo&) {
        ++calls;
        pending.emplace_back();
        return pending.back().get_future();
    };

    StreamingRun run(input("id,name\n1,Ann\n2,Bo\n3,Cy\n", false, 8), nullptr, consumer);

    size_t waits = 0;
    while (!run.step()) {
        ASSERT_EQ(run.state(), RunState::AWAITING_CONSUMER);
        const size_t bytes = run.sourceBytesRead();
        const size_t seen = calls;

        EXPECT_FALSE(run.step());
        EXPECT_EQ(run.sourceBytesRead(), bytes);
        EXPECT_EQ(calls, seen);

        ASSERT_FALSE(pending.empty());
        pending.back().set_value();
        ++waits;
    }

    EXPECT_EQ(run.state(), RunState::COMPLETED);
    EXPECT_EQ(waits, calls);
    EXPECT_EQ(run.processedCount(), 4u);
    EXPECT_TRUE(run.result().ok());
}

TEST_F(StreamingProcessorTest, ResumesExactlyOncePerChunk) {
    ScriptStep first;
    first.rows = {cells({"1", "Ann"})};
    ScriptStep empty;
    ScriptStep second;
    second.rows = {cells({"2", "Bo"}), cells({"3", "Cy"})};

    ScriptedTokenizer* tokenizer = nullptr;
    BatchRecorder recorder;
    StreamingRun run(input("ignored", false), nullptr, recorder.callback(), scriptedFactory({first, empty, second}, &tokenizer));
    auto result = run.run();

    ASSERT_TRUE(result.ok());
    ASSERT_NE(tokenizer, nullptr);
    EXPECT_EQ(tokenizer->chunksEmitted(), 3u);
    EXPECT_EQ(tokenizer->pauses(), 3u);
    EXPECT_EQ(tokenizer->resumes(), 3u);
}

TEST_F(StreamingProcessorTest, ReportsProgressBeforeConsumerIncludingEmptyChunks) {
    ScriptStep header_only;
    header_only.rows = {cells({"id", "name"})};
    ScriptStep empty;
    ScriptStep data;
    data.rows = {cells({"1", "Ann"}), cells({"2", "Bo"})};

    MockFunction<void(size_t)> progress;
    MockFunction<std::future<void>(std::vector<Record>, const BatchInfo&)> consumer;
    {
        InSequence sequence;
        EXPECT_CALL(progress, Call(0u));
        EXPECT_CALL(progress, Call(0u));
        EXPECT_CALL(progress, Call(2u));
        EXPECT_CALL(consumer, Call(::testing::SizeIs(2), ::testing::Field(&BatchInfo::start_index, 0u)))
            .WillOnce([](std::vector<Record>, const BatchInfo&) { return settled(); });
    }

    ParserInput in = input("ignored", true);
    auto result = process(in, progress.AsStdFunction(), consumer.AsStdFunction(),
                          scriptedFactory({header_only, empty, data}));
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.batches, 1u);
}

TEST_F(StreamingProcessorTest, SkipsHeaderOnFirstNonEmptyChunk) {
    ScriptStep empty;
    ScriptStep header;
    header.rows = {cells({"id", "name"}), cells({"1", "Ann"})};
    ScriptStep more;
    more.rows = {cells({"2", "Bo"})};

    BatchRecorder recorder;
    auto result = process(input("ignored", true), nullptr, recorder.callback(),
                          scriptedFactory({empty, header, more}));
    ASSERT_TRUE(result.ok());
    auto records = recorder.all();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].at("id"), "1");
    EXPECT_EQ(records[1].at("id"), "2");
    EXPECT_EQ(recorder.start_indices, (std::vector<size_t>{0, 1}));
}

TEST_F(StreamingProcessorTest, CollectsConsumerFailuresAndKeepsGoing) {
    size_t calls = 0;
    BatchCallback consumer = [&](std::vector<Record>, const BatchInfo& info) -> std::future<void> {
        ++calls;
        if (info.start_index == 0) {
            return rejected("database unavailable");
        }
        if (calls == 2) {
            throw std::runtime_error("consumer crashed");
        }
        return settled();
    };

    ScriptStep a;
    a.rows = {cells({"1", "Ann"}), cells({"2", "Bo"})};
    ScriptStep b;
    b.rows = {cells({"3", "Cy"})};
    ScriptStep c;
    c.rows = {cells({"4", "Di"})};

    auto result = process(input("ignored", false), nullptr, consumer, scriptedFactory({a, b, c}));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(calls, 3u);
    EXPECT_EQ(result.rows_processed, 4u);
    ASSERT_EQ(result.consumer_failures.size(), 2u);
    EXPECT_EQ(result.consumer_failures[0].start_index, 0u);
    EXPECT_EQ(result.consumer_failures[0].batch_size, 2u);
    EXPECT_EQ(result.consumer_failures[0].message, "database unavailable");
    EXPECT_EQ(result.consumer_failures[1].start_index, 2u);
    EXPECT_THAT(result.consumer_failures[1].message, HasSubstr("consumer crashed"));
    EXPECT_EQ(result.statistics.getConsumerFailures(), 2u);
}

TEST_F(StreamingProcessorTest, RecordsNonStandardConsumerThrows) {
    ScriptStep a;
    a.rows = {cells({"1", "Ann"})};
    ScriptStep b;
    b.rows = {cells({"2", "Bo"})};

    size_t calls = 0;
    BatchCallback consumer = [&](std::vector<Record>, const BatchInfo& info) -> std::future<void> {
        ++calls;
        if (info.start_index == 0) {
            throw 42;
        }
        return settled();
    };

    StreamingResult result;
    EXPECT_NO_THROW(result = process(input("ignored", false), nullptr, consumer, scriptedFactory({a, b})));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(calls, 2u);
    EXPECT_EQ(result.rows_processed, 2u);
    ASSERT_EQ(result.consumer_failures.size(), 1u);
    EXPECT_EQ(result.consumer_failures[0].message, "Unknown consumer error");
    EXPECT_EQ(result.consumer_failures[0].start_index, 0u);
}

TEST_F(StreamingProcessorTest, ReportsConsumerFailuresAsConsumerErrors) {
    ScriptStep a;
    a.rows = {cells({"1", "Ann"})};
    ScriptStep b;
    b.rows = {cells({"2", "Bo"}), cells({"3", "Cy"})};
    BatchCallback consumer = [](std::vector<Record>, const BatchInfo& info) {
        return info.start_index == 1 ? rejected("disk full") : settled();
    };

    auto result = process(input("ignored", false), nullptr, consumer, scriptedFactory({a, b}));

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.consumer_failures.size(), 1u);
    ErrorInfo error = result.consumer_failures[0].toErrorInfo();
    EXPECT_EQ(error.code, IngestError::CONSUMER_ERROR);
    EXPECT_EQ(error.row, 1u);
    EXPECT_EQ(error.toString(), "CONSUMER_ERROR: disk full (row 1)");
}

TEST_F(StreamingProcessorTest, CapsRecordedConsumerFailures) {
    std::vector<ScriptStep> steps(MAX_CONSUMER_FAILURES + 20);
    for (size_t i = 0; i < steps.size(); ++i) {
        steps[i].rows = {cells({"1", "x"})};
    }
    BatchCallback consumer = [](std::vector<Record>, const BatchInfo&) { return rejected("nope"); };

    auto result = process(input("ignored", false), nullptr, consumer, scriptedFactory(steps));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.consumer_failures.size(), MAX_CONSUMER_FAILURES);
    EXPECT_EQ(result.statistics.getConsumerFailures(), MAX_CONSUMER_FAILURES + 20);
    EXPECT_EQ(result.rows_processed, MAX_CONSUMER_FAILURES + 20);
}

TEST_F(StreamingProcessorTest, TreatsInvalidFutureAsSettled) {
    ScriptStep a;
    a.rows = {cells({"1", "Ann"})};
    ScriptStep b;
    b.rows = {cells({"2", "Bo"})};
    size_t calls = 0;
    BatchCallback consumer = [&](std::vector<Record>, const BatchInfo&) {
        ++calls;
        return std::future<void>();
    };

    auto result = process(input("ignored", false), nullptr, consumer, scriptedFactory({a, b}));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(calls, 2u);
    EXPECT_TRUE(result.consumer_failures.empty());
}

TEST_F(StreamingProcessorTest, StopsOnFatalTokenizerError) {
    ScriptStep a;
    a.rows = {cells({"1", "Ann"})};
    ScriptStep fatal;
    fatal.fatal = ErrorInfo{IngestError::ROW_TOO_LARGE, "Row exceeds limit", 1u};
    ScriptStep after;
    after.rows = {cells({"9", "Zed"})};

    BatchRecorder recorder;
    size_t progress_calls = 0;
    StreamingRun run(input("ignored", false), [&](size_t) { ++progress_calls; }, recorder.callback(),
                     scriptedFactory({a, fatal, after}));
    auto result = run.run();

    EXPECT_EQ(run.state(), RunState::FAILED);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, IngestError::ROW_TOO_LARGE);
    EXPECT_EQ(result.message, "Row exceeds limit");
    EXPECT_EQ(recorder.batches.size(), 1u);
    EXPECT_EQ(progress_calls, 1u);
}

TEST_F(StreamingProcessorTest, FailsWhenTokenizerThrows) {
    ScriptStep boom;
    boom.throws = true;
    BatchRecorder recorder;
    auto result = process(input("ignored", false), nullptr, recorder.callback(), scriptedFactory({boom}));
    EXPECT_EQ(result.error, IngestError::TOKENIZER_FATAL);
    EXPECT_THAT(result.message, HasSubstr("scripted tokenizer exception"));
}

TEST_F(StreamingProcessorTest, FailsOnRowTooLargeFromRealTokenizer) {
    ParserInput in = input("id,name\n1,\"" + std::string(64, 'x') + "\"\n", true, 8);
    in.config.max_row_size = 16;

    BatchRecorder recorder;
    auto result = process(in, nullptr, recorder.callback());
    EXPECT_EQ(result.error, IngestError::ROW_TOO_LARGE);
    EXPECT_TRUE(recorder.all().empty());
}

TEST_F(StreamingProcessorTest, FailsForMissingFile) {
    ParserInput in = input("", false);
    in.file = IO::openLocalFile("/nonexistent/people.csv");

    BatchRecorder recorder;
    StreamingResult result;
    EXPECT_NO_THROW(result = process(in, nullptr, recorder.callback()));
    EXPECT_EQ(result.error, IngestError::FILE_NOT_FOUND);
    EXPECT_TRUE(recorder.batches.empty());
}

TEST_F(StreamingProcessorTest, FailsWithoutConsumer) {
    auto result = process(input("1,Ann\n", false), nullptr, nullptr);
    EXPECT_EQ(result.error, IngestError::INVALID_CONFIG);
}

TEST_F(StreamingProcessorTest, RejectsSecondStart) {
    BatchRecorder recorder;
    StreamingRun run(input("1,Ann\n", false), nullptr, recorder.callback());
    run.start();
    EXPECT_THROW(run.start(), IngestException);
    EXPECT_EQ(run.result().error, IngestError::INVALID_STATE);
    EXPECT_TRUE(run.run().ok());
}

TEST_F(StreamingProcessorTest, ProcessesAsynchronouslyWithSlowConsumer) {
    std::vector<size_t> starts;
    BatchCallback consumer = [&](std::vector<Record> records, const BatchInfo& info) {
        starts.push_back(info.start_index);
        return std::async(std::launch::async, [count = records.size()]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(count));
        });
    };

    auto future = processAsync(input(peopleCsv(30), true, 32), nullptr, consumer);
    ASSERT_EQ(future.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    auto result = future.get();

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.rows_processed, 30u);
    ASSERT_FALSE(starts.empty());
    EXPECT_EQ(starts.front(), 0u);
    EXPECT_TRUE(std::is_sorted(starts.begin(), starts.end()));
}

TEST(RunStateTest, NamesEveryState) {
    EXPECT_STREQ(runStateToString(RunState::IDLE), "IDLE");
    EXPECT_STREQ(runStateToString(RunState::AWAITING_CONSUMER), "AWAITING_CONSUMER");
    EXPECT_STREQ(runStateToString(RunState::FAILED), "FAILED");
}
