// EN: Unit tests for the preview engine
// FR: Tests unitaires du moteur d'aperçu

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "csv/preview_engine.hpp"
#include "infrastructure/logging/logger.hpp"
#include "scripted_tokenizer.hpp"

#include <nlohmann/json.hpp>

using namespace CIP;
using namespace CIP::CSV;
using namespace CIP::CSV::Testing;
using ::testing::HasSubstr;

namespace {

class OpaqueResource : public IO::FileResource {
public:
    const std::string& name() const override { return name_; }
    std::optional<size_t> size() const override { return std::nullopt; }
    std::unique_ptr<std::istream> openStream() const override { return nullptr; }
    std::optional<std::string> readAll() const override { return std::nullopt; }

private:
    std::string name_{"opaque.csv"};
};

// EN: Tokenizer whose pump() neither emits nor finishes
// FR: Tokenizer dont pump() n'émet rien et ne termine jamais
class StalledTokenizer : public RowTokenizer {
public:
    void start(IO::SourceStream&, TokenizerHandlers) override { state_ = TokenizerState::RUNNING; }
    void pump() override { ++pumps_; }
    void pause() override {}
    void resume() override {}
    void abort() override { state_ = TokenizerState::ABORTED; }
    TokenizerState state() const override { return state_; }
    size_t rowsEmitted() const override { return 0; }

    size_t pumps() const { return pumps_; }

private:
    TokenizerState state_{TokenizerState::IDLE};
    size_t pumps_{0};
};

} // namespace

class PreviewEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        config_.delimiter = ",";
    }

    const PreviewReport& expectReport(const PreviewOutcome& outcome) {
        EXPECT_TRUE(isSuccess(outcome));
        return std::get<PreviewReport>(outcome);
    }

    const PreviewFailure& expectFailure(const PreviewOutcome& outcome) {
        EXPECT_FALSE(isSuccess(outcome));
        return std::get<PreviewFailure>(outcome);
    }

    ParseConfig config_;
};

TEST_F(PreviewEngineTest, PadsShortFilesToFiveRows) {
    auto file = IO::makeMemoryFile("people.csv", "id,name\n1,Ann\n");
    auto outcome = preview(file, config_);
    ASSERT_TRUE(isSuccess(outcome));
    const auto& report = std::get<PreviewReport>(outcome);

    ASSERT_EQ(report.first_rows.size(), PREVIEW_ROW_COUNT);
    EXPECT_EQ(report.first_rows[0], (StringRow{"id", "name"}));
    EXPECT_EQ(report.first_rows[1], (StringRow{"1", "Ann"}));
    for (size_t i = 2; i < PREVIEW_ROW_COUNT; ++i) {
        EXPECT_TRUE(report.first_rows[i].empty());
    }
    EXPECT_FALSE(report.is_single_line);
    EXPECT_FALSE(report.first_warning.has_value());
    EXPECT_EQ(report.file, file);
}

TEST_F(PreviewEngineTest, FlagsSingleLineFiles) {
    auto outcome = preview(IO::makeMemoryFile("one.csv", "only,row\n"), config_);
    const auto& report = expectReport(outcome);
    EXPECT_TRUE(report.is_single_line);
    EXPECT_EQ(report.first_rows[0], (StringRow{"only", "row"}));
    EXPECT_EQ(report.first_rows.size(), PREVIEW_ROW_COUNT);
}

TEST_F(PreviewEngineTest, KeepsOnlyTheFirstFiveRows) {
    std::string text;
    for (int i = 0; i < 10; ++i) {
        text += std::to_string(i) + ",v" + std::to_string(i) + "\n";
    }
    auto outcome = preview(IO::makeMemoryFile("ten.csv", text), config_);
    const auto& report = expectReport(outcome);

    ASSERT_EQ(report.first_rows.size(), PREVIEW_ROW_COUNT);
    EXPECT_EQ(report.first_rows[0], (StringRow{"0", "v0"}));
    EXPECT_EQ(report.first_rows[4], (StringRow{"4", "v4"}));
    EXPECT_FALSE(report.is_single_line);
}

TEST_F(PreviewEngineTest, ReportsEmptyFileAsFailure) {
    auto outcome = preview(IO::makeMemoryFile("empty.csv", ""), config_);
    const auto& failure = expectFailure(outcome);
    EXPECT_EQ(failure.error.code, IngestError::EMPTY_FILE);
    EXPECT_EQ(failure.error.message, "File is empty");
    ASSERT_TRUE(failure.file);
    EXPECT_EQ(failure.file->name(), "empty.csv");
}

TEST_F(PreviewEngineTest, StripsByteOrderMarkFromFirstRowOnly) {
    auto outcome = preview(IO::makeMemoryFile("bom.csv", "\xEF\xBB\xBFid,name\n\xEF\xBB\xBFx,y\n"), config_);
    const auto& report = expectReport(outcome);
    EXPECT_EQ(report.first_rows[0][0], "id");
    EXPECT_EQ(report.first_rows[1][0], "\xEF\xBB\xBFx");
}

TEST_F(PreviewEngineTest, CapturesFirstChunkText) {
    config_.chunk_size = 8;
    auto outcome = preview(IO::makeMemoryFile("people.csv", "id,name\n1,Ann\n2,Bo\n"), config_);
    const auto& report = expectReport(outcome);
    EXPECT_EQ(report.first_chunk, "id,name\n");
    EXPECT_EQ(report.first_rows[2], (StringRow{"2", "Bo"}));
}

TEST_F(PreviewEngineTest, KeepsFirstRowWarningWithoutFailing) {
    auto outcome = preview(IO::makeMemoryFile("ragged.csv", "a,b\n1\n2,3,4\n"), config_);
    const auto& report = expectReport(outcome);
    ASSERT_TRUE(report.first_warning.has_value());
    EXPECT_EQ(report.first_warning->code, RowErrorCode::TOO_FEW_FIELDS);
    EXPECT_EQ(report.first_warning->row, 1u);
    EXPECT_EQ(report.first_rows[1], (StringRow{"1"}));
    EXPECT_EQ(report.first_rows[2], (StringRow{"2", "3", "4"}));
}

TEST_F(PreviewEngineTest, ReportsUndetectableDelimiter) {
    config_.delimiter.clear();
    auto outcome = preview(IO::makeMemoryFile("words.txt", "alpha\nbeta\n"), config_);
    const auto& report = expectReport(outcome);
    ASSERT_TRUE(report.first_warning.has_value());
    EXPECT_EQ(report.first_warning->code, RowErrorCode::UNDETECTABLE_DELIMITER);
    EXPECT_EQ(report.first_rows[1], (StringRow{"beta"}));
}

TEST_F(PreviewEngineTest, ReturnsFailureForMissingFile) {
    PreviewOutcome outcome;
    EXPECT_NO_THROW(outcome = preview(IO::openLocalFile("/nonexistent/people.csv"), config_));
    const auto& failure = expectFailure(outcome);
    EXPECT_EQ(failure.error.code, IngestError::FILE_NOT_FOUND);
}

TEST_F(PreviewEngineTest, ReturnsFailureForUnreadableResource) {
    auto outcome = preview(std::make_shared<OpaqueResource>(), config_);
    EXPECT_EQ(expectFailure(outcome).error.code, IngestError::UNSUPPORTED_SOURCE);

    auto null_outcome = preview(nullptr, config_);
    EXPECT_EQ(expectFailure(null_outcome).error.code, IngestError::UNSUPPORTED_SOURCE);
}

TEST_F(PreviewEngineTest, ReturnsFailureForUnknownEncoding) {
    config_.encoding = "klingon-8";
    auto outcome = preview(IO::makeMemoryFile("people.csv", "id\n1\n"), config_);
    EXPECT_EQ(expectFailure(outcome).error.code, IngestError::ENCODING_ERROR);
}

TEST_F(PreviewEngineTest, ReturnsFailureWhenTokenizerCannotBeBuilt) {
    TokenizerFactory throwing = [](const ParseConfig&, std::optional<size_t>) -> std::unique_ptr<RowTokenizer> {
        throw std::runtime_error("tokenizer unavailable");
    };
    auto outcome = preview(IO::makeMemoryFile("people.csv", "id\n1\n"), config_, throwing);
    const auto& failure = expectFailure(outcome);
    EXPECT_THAT(failure.error.message, HasSubstr("tokenizer unavailable"));
}

TEST_F(PreviewEngineTest, ReturnsFailureForFatalTokenizerError) {
    ScriptStep fatal;
    fatal.fatal = ErrorInfo{IngestError::ROW_TOO_LARGE, "Row exceeds 16 bytes", 0u};
    auto outcome = preview(IO::makeMemoryFile("people.csv", "id\n1\n"), config_, scriptedFactory({fatal}));

    const auto& failure = expectFailure(outcome);
    EXPECT_EQ(failure.error.code, IngestError::ROW_TOO_LARGE);
    EXPECT_EQ(failure.error.row, 0u);
}

TEST_F(PreviewEngineTest, ReturnsFailureWhenTokenizerThrows) {
    ScriptStep boom;
    boom.throws = true;
    PreviewOutcome outcome;
    EXPECT_NO_THROW(outcome = preview(IO::makeMemoryFile("people.csv", "id\n1\n"), config_, scriptedFactory({boom})));
    EXPECT_EQ(expectFailure(outcome).error.code, IngestError::TOKENIZER_FATAL);
}

TEST_F(PreviewEngineTest, PausesSourceAndAbortsTokenizerOncePreviewIsFull) {
    ScriptStep first;
    first.rows = {cells({"a"}), cells({"b"}), cells({"c"})};
    ScriptStep second;
    second.rows = {cells({"d"}), cells({"e"}), cells({"f"}), cells({"g"})};
    ScriptStep never;
    never.rows = {cells({"h"})};

    ScriptedTokenizer* tokenizer = nullptr;
    auto outcome = preview(IO::makeMemoryFile("letters.csv", "x\n"), config_,
                           scriptedFactory({first, second, never}, &tokenizer));
    const auto& report = expectReport(outcome);

    ASSERT_NE(tokenizer, nullptr);
    EXPECT_EQ(tokenizer->chunksEmitted(), 2u);
    EXPECT_GE(tokenizer->aborts(), 1u);
    EXPECT_TRUE(tokenizer->sourcePausedAtAbort());
    EXPECT_EQ(report.first_rows[4], (StringRow{"e"}));
    EXPECT_EQ(report.first_chunk, "scripted");
}

TEST_F(PreviewEngineTest, CoercesMissingCellsToEmptyStrings) {
    ScriptStep step;
    step.rows = {RawRow{std::string("id"), std::nullopt}, RawRow{std::nullopt}};
    auto outcome = preview(IO::makeMemoryFile("holes.csv", "x\n"), config_, scriptedFactory({step}));
    const auto& report = expectReport(outcome);
    EXPECT_EQ(report.first_rows[0], (StringRow{"id", ""}));
    EXPECT_EQ(report.first_rows[1], (StringRow{""}));
}

TEST_F(PreviewEngineTest, ReturnsFailureWhenTokenizerMakesNoProgress) {
    StalledTokenizer* stalled = nullptr;
    TokenizerFactory factory = [&stalled](const ParseConfig&, std::optional<size_t>) {
        auto tokenizer = std::make_unique<StalledTokenizer>();
        stalled = tokenizer.get();
        return std::unique_ptr<RowTokenizer>(std::move(tokenizer));
    };

    auto outcome = preview(IO::makeMemoryFile("people.csv", "id\n1\n"), config_, factory);
    const auto& failure = expectFailure(outcome);
    EXPECT_EQ(failure.error.code, IngestError::INVALID_STATE);
    EXPECT_THAT(failure.error.message, HasSubstr("without a chunk"));
    ASSERT_NE(stalled, nullptr);
    EXPECT_EQ(stalled->pumps(), 1u);
}

TEST_F(PreviewEngineTest, TagsLogEntriesWithRunAndFile) {
    std::vector<std::string> lines;
    auto& logger = Logger::getInstance();
    logger.setLogLevel(LogLevel::DEBUG);
    logger.setSink([&lines](LogLevel, const std::string& line) { lines.push_back(line); });

    preview(IO::makeMemoryFile("people.csv", "id\n1\n"), config_);
    preview(IO::makeMemoryFile("empty.csv", ""), config_);

    logger.setSink(nullptr);
    logger.setLogLevel(LogLevel::ERROR);

    std::vector<nlohmann::json> preview_entries;
    for (const auto& line : lines) {
        auto entry = nlohmann::json::parse(line);
        if (entry["module"] == "preview") {
            preview_entries.push_back(entry);
        }
    }

    ASSERT_FALSE(preview_entries.empty());
    bool saw_start = false;
    bool saw_failure = false;
    for (const auto& entry : preview_entries) {
        EXPECT_TRUE(entry.contains("run_id"));
        if (entry["message"] == "Starting preview") {
            saw_start = true;
            EXPECT_TRUE(entry.contains("file"));
        }
        if (entry["level"] == "WARN") {
            saw_failure = true;
            EXPECT_EQ(entry["file"], "empty.csv");
            EXPECT_THAT(entry["message"].get<std::string>(), HasSubstr("File is empty"));
        }
    }
    EXPECT_TRUE(saw_start);
    EXPECT_TRUE(saw_failure);
}
