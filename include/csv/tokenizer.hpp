// EN: Row tokenizer binding: turns a pausable text source into chunks of raw rows.
// FR: Liaison du tokenizer de lignes : transforme une source de texte pausable en chunks de lignes brutes.

#pragma once

#include "csv/parse_config.hpp"
#include "infrastructure/system/ingest_error.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CIP {

namespace IO {
class SourceStream;
}

namespace CSV {

// EN: A cell as produced by the tokenizer; nullopt marks a cell it could not deliver as text.
// FR: Une cellule produite par le tokenizer ; nullopt marque une cellule non livrable en texte.
using Cell = std::optional<std::string>;
using RawRow = std::vector<Cell>;

// EN: A row after normalization: every cell is a string.
// FR: Une ligne après normalisation : chaque cellule est une chaîne.
using StringRow = std::vector<std::string>;

// EN: Category of a non-fatal row error
// FR: Catégorie d'une erreur de ligne non fatale
enum class RowErrorType {
    QUOTES,
    DELIMITER,
    FIELD_MISMATCH,
    FIELD_SIZE
};

// EN: Precise code of a non-fatal row error
// FR: Code précis d'une erreur de ligne non fatale
enum class RowErrorCode {
    MISSING_QUOTES,           // EN: Quoted field not closed at end of input / FR: Champ quoté non fermé en fin d'entrée
    INVALID_QUOTES,           // EN: Text after a closing quote / FR: Texte après une quote fermante
    UNDETECTABLE_DELIMITER,   // EN: Auto-detection fell back to "," / FR: L'auto-détection s'est rabattue sur ","
    TOO_FEW_FIELDS,           // EN: Fewer cells than the first row / FR: Moins de cellules que la première ligne
    TOO_MANY_FIELDS,          // EN: More cells than the first row / FR: Plus de cellules que la première ligne
    FIELD_TOO_LARGE           // EN: Cell above max_field_size / FR: Cellule au-delà de max_field_size
};

// EN: Non-fatal, row-level tokenizer error (a warning for callers)
// FR: Erreur de tokenizer non fatale au niveau ligne (un avertissement pour l'appelant)
struct RowError {
    RowErrorType type;
    RowErrorCode code;
    std::string message;
    std::optional<size_t> row;   // EN: 0-based row index in the run / FR: Index de ligne base 0 dans l'exécution

    std::string toString() const;
};

const char* rowErrorTypeToString(RowErrorType type);
const char* rowErrorCodeToString(RowErrorCode code);

// EN: Rows completed by one source chunk, plus the row errors found while tokenizing them
// FR: Lignes complétées par un chunk de source, plus les erreurs trouvées en les tokenisant
struct TokenizedChunk {
    std::vector<RawRow> rows;
    std::vector<RowError> errors;
    size_t first_row_index{0};   // EN: Run-wide index of rows[0] / FR: Index global de rows[0]
};

// EN: Tokenizer lifecycle
// FR: Cycle de vie du tokenizer
enum class TokenizerState {
    IDLE,        // EN: Not started / FR: Non démarré
    RUNNING,     // EN: Will read on the next pump() / FR: Lira au prochain pump()
    PAUSED,      // EN: pump() is a no-op until resume() / FR: pump() sans effet jusqu'à resume()
    ABORTED,     // EN: Stopped by the caller, emits nothing more / FR: Arrêté par l'appelant, n'émet plus rien
    COMPLETED,   // EN: End of input (or row cap) reached / FR: Fin d'entrée (ou plafond de lignes) atteinte
    FAILED       // EN: Fatal error reported / FR: Erreur fatale rapportée
};

class RowTokenizer;

// EN: Callbacks a tokenizer drives; on_chunk receives the tokenizer so it can pause or abort it.
// FR: Callbacks pilotés par un tokenizer ; on_chunk reçoit le tokenizer pour le mettre en pause ou l'arrêter.
struct TokenizerHandlers {
    std::function<void(const std::string& first_chunk_text)> before_first_chunk;
    std::function<void(TokenizedChunk& chunk, RowTokenizer& tokenizer)> on_chunk;
    std::function<void(const ErrorInfo& error)> on_error;
    std::function<void()> on_complete;
};

// EN: Push-based tokenizer driven cooperatively through pump().
//     Pausing the tokenizer does not pause the byte source; callers pause both.
// FR: Tokenizer push piloté de façon coopérative via pump().
//     Mettre le tokenizer en pause ne met pas la source en pause ; l'appelant met les deux en pause.
class RowTokenizer {
public:
    virtual ~RowTokenizer() = default;

    // EN: Bind to a source and handlers; the tokenizer does not own the source.
    // FR: Se lie à une source et des handlers ; le tokenizer ne possède pas la source.
    virtual void start(IO::SourceStream& source, TokenizerHandlers handlers) = 0;

    // EN: Read and tokenize until paused, aborted, completed or failed. Exactly one of
    //     on_complete / on_error is ever called, and never after abort().
    // FR: Lit et tokenise jusqu'à pause, arrêt, fin ou échec. Un seul de on_complete / on_error
    //     est appelé, et jamais après abort().
    virtual void pump() = 0;

    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void abort() = 0;

    virtual TokenizerState state() const = 0;
    virtual size_t rowsEmitted() const = 0;

    bool isFinished() const {
        auto s = state();
        return s == TokenizerState::ABORTED || s == TokenizerState::COMPLETED || s == TokenizerState::FAILED;
    }
};

// EN: Creates a tokenizer for one run; row_cap limits the rows emitted (preview mode).
// FR: Crée un tokenizer pour une exécution ; row_cap limite les lignes émises (mode aperçu).
using TokenizerFactory =
    std::function<std::unique_ptr<RowTokenizer>(const ParseConfig& config, std::optional<size_t> row_cap)>;

// EN: Factory for the built-in delimited-text tokenizer.
// FR: Fabrique du tokenizer de texte délimité intégré.
TokenizerFactory delimitedTokenizerFactory();

} // namespace CSV
} // namespace CIP
