// EN: Streaming processor implementation: IDLE -> CHUNK_RECEIVED -> AWAITING_CONSUMER -> RESUMING.
// FR: Implémentation du processeur streaming : IDLE -> CHUNK_RECEIVED -> AWAITING_CONSUMER -> RESUMING.

#include "csv/streaming_processor.hpp"
#include "csv/row_normalizer.hpp"
#include "infrastructure/logging/logger.hpp"
#include "io/source_stream.hpp"

#include <chrono>

namespace CIP {
namespace CSV {

const char* runStateToString(RunState state) {
    switch (state) {
        case RunState::IDLE:              return "IDLE";
        case RunState::CHUNK_RECEIVED:    return "CHUNK_RECEIVED";
        case RunState::AWAITING_CONSUMER: return "AWAITING_CONSUMER";
        case RunState::RESUMING:          return "RESUMING";
        case RunState::COMPLETED:         return "COMPLETED";
        case RunState::FAILED:            return "FAILED";
    }
    return "UNKNOWN";
}

StreamingRun::StreamingRun(ParserInput input, ProgressCallback on_progress, BatchCallback on_batch,
                           TokenizerFactory factory)
    : input_(std::move(input)),
      on_batch_(std::move(on_batch)),
      factory_(std::move(factory)),
      run_id_(Logger::getInstance().generateCorrelationId()),
      skip_header_(input_.has_headers),
      tracker_(std::move(on_progress)) {}

StreamingRun::~StreamingRun() {
    // EN: A pending consumer future is left to its owner; only our own resources are released
    // FR: Un future de consommateur en attente est laissé à son propriétaire ; seules nos ressources sont libérées
    if (tokenizer_ && !tokenizer_->isFinished()) {
        tokenizer_->abort();
    }
    if (source_) {
        source_->close();
    }
}

std::unordered_map<std::string, std::string> StreamingRun::metadata() const {
    return {
        {"run_id", run_id_},
        {"file", input_.file ? input_.file->name() : std::string("<null>")},
        {"state", runStateToString(state_)}
    };
}

void StreamingRun::start() {
    if (started_) {
        throw IngestException(IngestError::INVALID_STATE, "Streaming run already started");
    }
    started_ = true;
    stats_.startTiming();

    LOG_INFO_META("streaming", "Starting streaming run", metadata());

    try {
        if (!input_.file) {
            throw IngestException(IngestError::UNSUPPORTED_SOURCE, "No file given");
        }
        if (!on_batch_) {
            throw IngestException(IngestError::INVALID_CONFIG, "No batch consumer given");
        }
        source_ = IO::SourceStream::open(input_.file, input_.config.encoding);
        tokenizer_ = factory_(input_.config, std::nullopt);
        if (!tokenizer_) {
            throw IngestException(IngestError::INVALID_STATE, "Tokenizer factory returned null");
        }

        TokenizerHandlers handlers;
        handlers.on_chunk = [this](TokenizedChunk& chunk, RowTokenizer& tokenizer) {
            onChunk(chunk, tokenizer);
        };
        handlers.on_error = [this](const ErrorInfo& error) {
            finish(error);
        };
        handlers.on_complete = [this]() {
            finish(ErrorInfo{IngestError::SUCCESS, "", std::nullopt});
        };
        tokenizer_->start(*source_, std::move(handlers));
    } catch (const IngestException& e) {
        finish(e.toErrorInfo());
    }
}

bool StreamingRun::step() {
    if (!started_) {
        start();
    }

    while (!isDone()) {
        switch (state_) {
            case RunState::IDLE: {
                chunk_seen_ = false;
                try {
                    tokenizer_->pump();
                } catch (const IngestException& e) {
                    finish(e.toErrorInfo());
                    break;
                } catch (const std::exception& e) {
                    finish(ErrorInfo{IngestError::TOKENIZER_FATAL, e.what(), std::nullopt});
                    break;
                }
                if (state_ == RunState::IDLE && !chunk_seen_ && !isDone()) {
                    finish(ErrorInfo{IngestError::INVALID_STATE,
                                     "Tokenizer returned without a chunk or a terminal signal", std::nullopt});
                }
                break;
            }

            case RunState::CHUNK_RECEIVED:
                // EN: Only observable from inside onChunk
                // FR: Observable uniquement depuis onChunk
                state_ = RunState::RESUMING;
                break;

            case RunState::AWAITING_CONSUMER:
                if (pending_.valid() &&
                    pending_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                    return false;
                }
                settleConsumer();
                break;

            case RunState::RESUMING:
                resumeDecoding();
                break;

            case RunState::COMPLETED:
            case RunState::FAILED:
                break;
        }
    }
    return true;
}

StreamingResult StreamingRun::run() {
    while (!step()) {
        if (state_ == RunState::AWAITING_CONSUMER && pending_.valid()) {
            pending_.wait();
        }
    }
    return result();
}

size_t StreamingRun::sourceBytesRead() const {
    return source_ ? source_->bytesRead() : 0;
}

void StreamingRun::onChunk(TokenizedChunk& chunk, RowTokenizer& tokenizer) {
    chunk_seen_ = true;
    state_ = RunState::CHUNK_RECEIVED;

    // EN: Pausing the tokenizer does not pause the byte source: pause both
    // FR: Mettre le tokenizer en pause ne met pas la source en pause : on met les deux
    source_->pause();
    tokenizer.pause();

    stats_.incrementChunks();
    stats_.setBytesRead(source_->bytesRead());

    if (!chunk.errors.empty()) {
        stats_.addRowWarnings(chunk.errors.size());
        for (const auto& error : chunk.errors) {
            LOG_DEBUG_META("streaming", "Row warning: " + error.toString(), metadata());
        }
    }

    // EN: The header is the first row of the first non-empty chunk
    // FR: L'en-tête est la première ligne du premier chunk non vide
    const bool drop_header = skip_header_ && !chunk.rows.empty();

    std::vector<Record> records;
    records.reserve(chunk.rows.size());
    for (size_t i = 0; i < chunk.rows.size(); ++i) {
        StringRow row = normalizeRow(chunk.rows[i], first_row_);
        if (drop_header && i == 0) {
            continue;
        }
        records.push_back(mapRow(row, input_.field_assignments));
    }

    if (drop_header) {
        skip_header_ = false;
        stats_.incrementRowsSkipped();
    }

    size_t start_index = tracker_.advance(records.size());

    if (records.empty()) {
        state_ = RunState::RESUMING;
        return;
    }
    invokeConsumer(std::move(records), start_index);
}

void StreamingRun::invokeConsumer(std::vector<Record> records, size_t start_index) {
    pending_start_ = start_index;
    pending_size_ = records.size();
    stats_.incrementBatches();
    stats_.addRowsDelivered(records.size());

    try {
        pending_ = on_batch_(std::move(records), BatchInfo{start_index});
        state_ = RunState::AWAITING_CONSUMER;
    } catch (const std::exception& e) {
        // EN: A synchronous throw counts as a failed consumer, decoding still resumes
        // FR: Une exception synchrone compte comme un échec du consommateur, le décodage reprend
        recordConsumerFailure(e.what());
        state_ = RunState::RESUMING;
    } catch (...) {
        recordConsumerFailure("Unknown consumer error");
        state_ = RunState::RESUMING;
    }
}

void StreamingRun::settleConsumer() {
    if (pending_.valid()) {
        try {
            pending_.get();
        } catch (const std::exception& e) {
            recordConsumerFailure(e.what());
        } catch (...) {
            recordConsumerFailure("Unknown consumer error");
        }
    }
    pending_ = std::future<void>();
    state_ = RunState::RESUMING;
}

void StreamingRun::resumeDecoding() {
    // EN: Exactly once per chunk, whatever the consumer outcome
    // FR: Exactement une fois par chunk, quel que soit le résultat du consommateur
    source_->resume();
    tokenizer_->resume();
    state_ = RunState::IDLE;
}

void StreamingRun::recordConsumerFailure(const std::string& message) {
    stats_.incrementConsumerFailures();
    ConsumerFailure failure{pending_start_, pending_size_, message};

    auto meta = metadata();
    meta["start_index"] = std::to_string(pending_start_);
    meta["batch_size"] = std::to_string(pending_size_);
    LOG_WARN_META("streaming", "Consumer failed on batch: " + failure.toErrorInfo().toString(), meta);

    if (failures_.size() < MAX_CONSUMER_FAILURES) {
        failures_.push_back(std::move(failure));
    }
}

void StreamingRun::finish(const ErrorInfo& outcome) {
    if (!tracker_.settle(outcome)) {
        return;
    }

    state_ = outcome.ok() ? RunState::COMPLETED : RunState::FAILED;
    stats_.setBytesRead(sourceBytesRead());
    stats_.stopTiming();

    if (source_) {
        source_->close();
    }

    auto meta = metadata();
    meta["rows"] = std::to_string(tracker_.processedCount());
    if (outcome.ok()) {
        LOG_INFO_META("streaming", "Streaming run completed", meta);
    } else {
        LOG_ERROR_META("streaming", "Streaming run failed: " + outcome.toString(), meta);
    }
}

StreamingResult StreamingRun::result() const {
    StreamingResult result;
    if (!isDone()) {
        result.error = IngestError::INVALID_STATE;
        result.message = std::string("Run not finished (state ") + runStateToString(state_) + ")";
    } else {
        result.error = tracker_.outcome().code;
        result.message = tracker_.outcome().message;
    }
    result.rows_processed = tracker_.processedCount();
    result.batches = stats_.getBatches();
    result.statistics = stats_;
    result.consumer_failures = failures_;
    return result;
}

StreamingResult process(const ParserInput& input, ProgressCallback on_progress, BatchCallback on_batch,
                        TokenizerFactory factory) {
    StreamingRun run(input, std::move(on_progress), std::move(on_batch), std::move(factory));
    return run.run();
}

std::future<StreamingResult> processAsync(ParserInput input, ProgressCallback on_progress, BatchCallback on_batch,
                                          TokenizerFactory factory) {
    return std::async(std::launch::async,
                      [input = std::move(input), on_progress = std::move(on_progress),
                       on_batch = std::move(on_batch), factory = std::move(factory)]() mutable {
                          return process(input, std::move(on_progress), std::move(on_batch), std::move(factory));
                      });
}

} // namespace CSV
} // namespace CIP
