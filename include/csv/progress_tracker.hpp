// EN: Run counters: batch start indices, progress deltas, exactly-once completion, statistics.
// FR: Compteurs d'exécution : index de début de lot, deltas de progression, fin unique, statistiques.

#pragma once

#include "infrastructure/system/ingest_error.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace CIP {
namespace CSV {

// EN: Called with the number of rows seen in each chunk (possibly 0)
// FR: Appelé avec le nombre de lignes vues dans chaque chunk (éventuellement 0)
using ProgressCallback = std::function<void(size_t delta)>;

// EN: Statistics of one ingest run
// FR: Statistiques d'une exécution d'ingestion
class IngestStatistics {
public:
    // EN: Reset all statistics
    // FR: Remet à zéro toutes les statistiques
    void reset();

    void startTiming();
    void stopTiming();

    void incrementChunks() { chunks_++; }
    void addRowsDelivered(size_t count) { rows_delivered_ += count; }
    void incrementRowsSkipped() { rows_skipped_++; }
    void addRowWarnings(size_t count) { row_warnings_ += count; }
    void incrementBatches() { batches_++; }
    void incrementConsumerFailures() { consumer_failures_++; }
    void setBytesRead(size_t bytes) { bytes_read_ = bytes; }

    size_t getChunks() const { return chunks_; }
    size_t getRowsDelivered() const { return rows_delivered_; }
    size_t getRowsSkipped() const { return rows_skipped_; }
    size_t getRowWarnings() const { return row_warnings_; }
    size_t getBatches() const { return batches_; }
    size_t getConsumerFailures() const { return consumer_failures_; }
    size_t getBytesRead() const { return bytes_read_; }
    std::chrono::duration<double> getDuration() const { return duration_; }
    double getRowsPerSecond() const;

    // EN: Multi-line human readable report
    // FR: Rapport lisible multi-lignes
    std::string generateReport() const;

private:
    size_t chunks_{0};              // EN: Chunks received from the tokenizer / FR: Chunks reçus du tokenizer
    size_t rows_delivered_{0};      // EN: Records handed to the consumer / FR: Enregistrements remis au consommateur
    size_t rows_skipped_{0};        // EN: Header rows dropped / FR: Lignes d'en-tête ignorées
    size_t row_warnings_{0};        // EN: Non-fatal row errors / FR: Erreurs de ligne non fatales
    size_t batches_{0};             // EN: Consumer invocations / FR: Appels du consommateur
    size_t consumer_failures_{0};   // EN: Failed consumer invocations / FR: Appels du consommateur échoués
    size_t bytes_read_{0};          // EN: Raw bytes read from the source / FR: Octets bruts lus de la source
    std::chrono::steady_clock::time_point start_time_{};
    std::chrono::duration<double> duration_{0};
};

// EN: Tracks processedCount and settles the run exactly once.
// FR: Suit processedCount et clôt l'exécution une seule fois.
class ProgressTracker {
public:
    explicit ProgressTracker(ProgressCallback on_progress = nullptr);

    // EN: Start index for a batch of `count` rows; advances the count and reports progress.
    // FR: Index de début pour un lot de `count` lignes ; avance le compteur et rapporte la progression.
    size_t advance(size_t count);

    size_t processedCount() const { return processed_count_; }

    // EN: Return true only for the first settle call; later calls are ignored.
    // FR: Retourne true uniquement au premier appel ; les suivants sont ignorés.
    bool settle(const ErrorInfo& outcome);

    bool isSettled() const { return settled_; }
    const ErrorInfo& outcome() const { return outcome_; }

private:
    ProgressCallback on_progress_;
    size_t processed_count_{0};
    bool settled_{false};
    ErrorInfo outcome_{IngestError::SUCCESS, "", std::nullopt};
};

} // namespace CSV
} // namespace CIP
