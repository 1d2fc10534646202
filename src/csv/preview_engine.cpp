// EN: Preview engine implementation.
// FR: Implémentation du moteur d'aperçu.

#include "csv/preview_engine.hpp"
#include "csv/row_normalizer.hpp"
#include "infrastructure/logging/logger.hpp"
#include "io/source_stream.hpp"

#include <unordered_map>

namespace CIP {
namespace CSV {

namespace {

PreviewFailure makeFailure(const IO::FileRef& file, ErrorInfo error, const std::string& run_id) {
    std::unordered_map<std::string, std::string> metadata = {
        {"run_id", run_id},
        {"file", file ? file->name() : std::string("<null>")}
    };
    LOG_WARN_META("preview", "Preview failed: " + error.toString(), metadata);
    return PreviewFailure{file, std::move(error)};
}

} // namespace

PreviewOutcome preview(const IO::FileRef& file, const ParseConfig& config, const TokenizerFactory& factory) {
    const std::string run_id = Logger::getInstance().generateCorrelationId();

    try {
        if (!file) {
            return makeFailure(file, ErrorInfo{IngestError::UNSUPPORTED_SOURCE, "No file given", std::nullopt},
                               run_id);
        }

        std::unordered_map<std::string, std::string> start_metadata = {{"run_id", run_id}, {"file", file->name()}};
        LOG_DEBUG_META("preview", "Starting preview", start_metadata);

        auto source = IO::SourceStream::open(file, config.encoding);
        auto tokenizer = factory(config, PREVIEW_ROW_COUNT);
        if (!tokenizer) {
            return makeFailure(file, ErrorInfo{IngestError::INVALID_STATE, "Tokenizer factory returned null",
                                               std::nullopt}, run_id);
        }

        std::string first_chunk;
        std::vector<StringRow> rows;
        std::optional<RowError> first_warning;
        std::optional<ErrorInfo> fatal;
        bool first_row = true;
        bool chunk_seen = false;

        TokenizerHandlers handlers;
        handlers.before_first_chunk = [&](const std::string& text) {
            first_chunk = text;
        };
        handlers.on_chunk = [&](TokenizedChunk& chunk, RowTokenizer& active) {
            chunk_seen = true;
            for (const auto& row : chunk.rows) {
                if (rows.size() >= PREVIEW_ROW_COUNT) {
                    break;
                }
                rows.push_back(normalizeRow(row, first_row));
            }
            if (!first_warning && !chunk.errors.empty()) {
                first_warning = chunk.errors.front();
            }

            // EN: The tokenizer does not pause the source on its own
            // FR: Le tokenizer ne met pas la source en pause de lui-même
            if (rows.size() >= PREVIEW_ROW_COUNT) {
                source->pause();
                active.abort();
            }
        };
        handlers.on_error = [&](const ErrorInfo& error) {
            fatal = error;
        };

        tokenizer->start(*source, std::move(handlers));
        while (!tokenizer->isFinished()) {
            if (tokenizer->state() == TokenizerState::PAUSED) {
                tokenizer->resume();
            }
            chunk_seen = false;
            tokenizer->pump();

            // EN: Every pump must deliver a chunk or reach a terminal state
            // FR: Chaque pump doit livrer un chunk ou atteindre un état terminal
            if (!chunk_seen && !tokenizer->isFinished()) {
                fatal = ErrorInfo{IngestError::INVALID_STATE,
                                  "Tokenizer returned without a chunk or a terminal signal", std::nullopt};
                break;
            }
        }

        source->pause();
        tokenizer->abort();
        source->close();

        if (fatal) {
            return makeFailure(file, *fatal, run_id);
        }

        if (rows.empty()) {
            return makeFailure(file, ErrorInfo{IngestError::EMPTY_FILE, "File is empty", std::nullopt}, run_id);
        }

        PreviewReport report;
        report.file = file;
        report.first_chunk = std::move(first_chunk);
        report.is_single_line = rows.size() == 1;
        report.first_warning = std::move(first_warning);
        rows.resize(PREVIEW_ROW_COUNT);
        report.first_rows = std::move(rows);

        std::unordered_map<std::string, std::string> metadata = {
            {"run_id", run_id},
            {"file", file->name()},
            {"single_line", report.is_single_line ? "true" : "false"}
        };
        if (report.first_warning) {
            metadata["warning"] = report.first_warning->toString();
        }
        LOG_INFO_META("preview", "Preview completed", metadata);
        return report;

    } catch (const IngestException& e) {
        return makeFailure(file, e.toErrorInfo(), run_id);
    } catch (const std::exception& e) {
        return makeFailure(file, ErrorInfo{IngestError::TOKENIZER_FATAL, e.what(), std::nullopt}, run_id);
    } catch (...) {
        return makeFailure(file, ErrorInfo{IngestError::TOKENIZER_FATAL, "Unknown error during preview",
                                           std::nullopt}, run_id);
    }
}

} // namespace CSV
} // namespace CIP
