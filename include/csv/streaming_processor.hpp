// EN: Streaming processor: full-file ingestion with per-chunk backpressure on an asynchronous consumer.
// FR: Processeur streaming : ingestion complète avec contre-pression par chunk sur un consommateur asynchrone.

#pragma once

#include "csv/field_mapping.hpp"
#include "csv/parse_config.hpp"
#include "csv/progress_tracker.hpp"
#include "csv/tokenizer.hpp"
#include "infrastructure/system/ingest_error.hpp"
#include "io/file_resource.hpp"

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace CIP {

namespace IO {
class SourceStream;
}

namespace CSV {

// EN: Upper bound on the consumer failures kept in a result
// FR: Borne du nombre d'échecs du consommateur conservés dans un résultat
constexpr size_t MAX_CONSUMER_FAILURES = 100;

// EN: Everything a streaming run reads; immutable during the run
// FR: Tout ce qu'une exécution lit ; immuable pendant l'exécution
struct ParserInput {
    IO::FileRef file;
    ParseConfig config;
    bool has_headers{false};
    FieldAssignmentMap field_assignments;
};

// EN: Position of a batch in the run
// FR: Position d'un lot dans l'exécution
struct BatchInfo {
    size_t start_index{0};   // EN: Records delivered before this batch / FR: Enregistrements livrés avant ce lot
};

// EN: Consumer of record batches. Decoding stays paused until the returned future is ready.
//     An invalid (default constructed) future counts as already settled.
// FR: Consommateur de lots d'enregistrements. Le décodage reste en pause jusqu'à ce que le future
//     retourné soit prêt. Un future invalide (construit par défaut) compte comme déjà réglé.
using BatchCallback = std::function<std::future<void>(std::vector<Record> records, const BatchInfo& info)>;

// EN: A batch the consumer failed on
// FR: Un lot sur lequel le consommateur a échoué
struct ConsumerFailure {
    size_t start_index{0};
    size_t batch_size{0};
    std::string message;

    // EN: CONSUMER_ERROR carrying the batch start as its row
    // FR: CONSUMER_ERROR portant le début du lot comme ligne
    ErrorInfo toErrorInfo() const { return ErrorInfo{IngestError::CONSUMER_ERROR, message, start_index}; }
};

// EN: Outcome of a streaming run
// FR: Résultat d'une exécution streaming
struct StreamingResult {
    IngestError error{IngestError::SUCCESS};
    std::string message;
    size_t rows_processed{0};
    size_t batches{0};
    IngestStatistics statistics;
    std::vector<ConsumerFailure> consumer_failures;   // EN: First MAX_CONSUMER_FAILURES only / FR: Les MAX_CONSUMER_FAILURES premiers seulement

    bool ok() const { return error == IngestError::SUCCESS; }
    ErrorInfo toErrorInfo() const { return ErrorInfo{error, message, std::nullopt}; }
};

// EN: Per-chunk run state
// FR: État de l'exécution par chunk
enum class RunState {
    IDLE,                // EN: Decoding, waiting for the next chunk / FR: Décodage, en attente du prochain chunk
    CHUNK_RECEIVED,      // EN: Source and tokenizer paused, chunk being mapped / FR: Source et tokenizer en pause, chunk en cours
    AWAITING_CONSUMER,   // EN: Consumer future pending / FR: Future du consommateur en attente
    RESUMING,            // EN: Consumer settled, about to resume / FR: Consommateur réglé, reprise imminente
    COMPLETED,
    FAILED
};

const char* runStateToString(RunState state);

// EN: One streaming run. Owns its source and tokenizer; not shareable between threads.
// FR: Une exécution streaming. Possède sa source et son tokenizer ; non partageable entre threads.
class StreamingRun {
public:
    StreamingRun(ParserInput input, ProgressCallback on_progress, BatchCallback on_batch,
                 TokenizerFactory factory = delimitedTokenizerFactory());
    ~StreamingRun();

    StreamingRun(const StreamingRun&) = delete;
    StreamingRun& operator=(const StreamingRun&) = delete;

    // EN: Open the source and bind the tokenizer. Open failures settle the run as FAILED.
    //     Throws IngestException(INVALID_STATE) when called twice.
    // FR: Ouvre la source et lie le tokenizer. Les échecs d'ouverture clôturent l'exécution en FAILED.
    //     Lève IngestException(INVALID_STATE) si appelé deux fois.
    void start();

    // EN: Advance as far as possible without blocking; returns true once the run is settled.
    // FR: Avance autant que possible sans bloquer ; retourne true une fois l'exécution terminée.
    bool step();

    // EN: Block until the run settles (starting it if needed) and return the result.
    // FR: Bloque jusqu'à la fin de l'exécution (en la démarrant si besoin) et retourne le résultat.
    StreamingResult run();

    RunState state() const { return state_; }
    bool isDone() const { return state_ == RunState::COMPLETED || state_ == RunState::FAILED; }
    size_t processedCount() const { return tracker_.processedCount(); }
    size_t sourceBytesRead() const;
    const std::string& runId() const { return run_id_; }

    StreamingResult result() const;

private:
    void onChunk(TokenizedChunk& chunk, RowTokenizer& tokenizer);
    void invokeConsumer(std::vector<Record> records, size_t start_index);
    void settleConsumer();
    void resumeDecoding();
    void recordConsumerFailure(const std::string& message);
    void finish(const ErrorInfo& outcome);
    std::unordered_map<std::string, std::string> metadata() const;

    ParserInput input_;
    BatchCallback on_batch_;
    TokenizerFactory factory_;
    std::string run_id_;

    std::unique_ptr<IO::SourceStream> source_;
    std::unique_ptr<RowTokenizer> tokenizer_;
    RunState state_{RunState::IDLE};
    bool started_{false};
    bool chunk_seen_{false};   // EN: Set by onChunk during a pump / FR: Positionné par onChunk pendant un pump

    // EN: Run-scoped flags, only mutated by onChunk
    // FR: Drapeaux de l'exécution, modifiés uniquement par onChunk
    bool skip_header_{false};
    bool first_row_{true};

    std::future<void> pending_;
    size_t pending_start_{0};
    size_t pending_size_{0};

    ProgressTracker tracker_;
    IngestStatistics stats_;
    std::vector<ConsumerFailure> failures_;
};

// EN: Stream a whole file, blocking the calling thread; callbacks run on that thread.
// FR: Traite un fichier entier en bloquant le thread appelant ; les callbacks s'exécutent sur ce thread.
StreamingResult process(const ParserInput& input, ProgressCallback on_progress, BatchCallback on_batch,
                        TokenizerFactory factory = delimitedTokenizerFactory());

// EN: Same as process() on a background thread; callbacks run on that thread.
// FR: Comme process() sur un thread d'arrière-plan ; les callbacks s'exécutent sur ce thread.
std::future<StreamingResult> processAsync(ParserInput input, ProgressCallback on_progress, BatchCallback on_batch,
                                          TokenizerFactory factory = delimitedTokenizerFactory());

} // namespace CSV
} // namespace CIP
