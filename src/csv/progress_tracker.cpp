// EN: Progress tracking and ingest statistics implementation.
// FR: Implémentation du suivi de progression et des statistiques d'ingestion.

#include "csv/progress_tracker.hpp"

#include <iomanip>
#include <sstream>

namespace CIP {
namespace CSV {

void IngestStatistics::reset() {
    *this = IngestStatistics();
}

void IngestStatistics::startTiming() {
    start_time_ = std::chrono::steady_clock::now();
}

void IngestStatistics::stopTiming() {
    duration_ = std::chrono::steady_clock::now() - start_time_;
}

double IngestStatistics::getRowsPerSecond() const {
    double seconds = duration_.count();
    if (seconds <= 0.0) return 0.0;
    return static_cast<double>(rows_delivered_) / seconds;
}

std::string IngestStatistics::generateReport() const {
    std::ostringstream report;
    report << std::fixed << std::setprecision(2);

    report << "=== Ingest Statistics ===\n";
    report << "Duration: " << duration_.count() << " seconds\n";
    report << "Rows:\n";
    report << "  - Delivered: " << rows_delivered_ << "\n";
    report << "  - Header skipped: " << rows_skipped_ << "\n";
    report << "  - Row warnings: " << row_warnings_ << "\n";
    report << "Chunks: " << chunks_ << "\n";
    report << "Batches: " << batches_ << " (" << consumer_failures_ << " failed)\n";
    report << "Performance:\n";
    report << "  - Bytes read: " << bytes_read_ << " bytes\n";
    report << "  - Rows/second: " << getRowsPerSecond() << "\n";

    return report.str();
}

ProgressTracker::ProgressTracker(ProgressCallback on_progress)
    : on_progress_(std::move(on_progress)) {}

size_t ProgressTracker::advance(size_t count) {
    size_t start_index = processed_count_;
    processed_count_ += count;
    if (on_progress_) {
        on_progress_(count);
    }
    return start_index;
}

bool ProgressTracker::settle(const ErrorInfo& outcome) {
    if (settled_) {
        return false;
    }
    settled_ = true;
    outcome_ = outcome;
    return true;
}

} // namespace CSV
} // namespace CIP
