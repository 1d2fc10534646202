// EN: Error taxonomy shared by byte sources, the tokenizer, preview and streaming.
// FR: Taxonomie d'erreurs partagée par les sources d'octets, le tokenizer, l'aperçu et le streaming.

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace CIP {

// EN: Error codes for every ingestion failure path
// FR: Codes d'erreur pour chaque chemin d'échec d'ingestion
enum class IngestError {
    SUCCESS,              // EN: No error / FR: Aucune erreur
    UNSUPPORTED_SOURCE,   // EN: Resource can neither stream nor be read fully / FR: Ressource ni streamable ni lisible entièrement
    FILE_NOT_FOUND,       // EN: Input file not found / FR: Fichier d'entrée introuvable
    FILE_READ_ERROR,      // EN: I/O failure while reading / FR: Échec d'E/S pendant la lecture
    ENCODING_ERROR,       // EN: Unknown or unusable text encoding / FR: Encodage de texte inconnu ou inutilisable
    EMPTY_FILE,           // EN: No rows could be read / FR: Aucune ligne n'a pu être lue
    ROW_TOO_LARGE,        // EN: Pending row exceeded max_row_size / FR: Ligne en attente au-delà de max_row_size
    TOKENIZER_FATAL,      // EN: Unrecoverable tokenizer error / FR: Erreur irrécupérable du tokenizer
    CONSUMER_ERROR,       // EN: Batch consumer failed / FR: Échec du consommateur de lots
    INVALID_CONFIG,       // EN: Configuration rejected / FR: Configuration rejetée
    INVALID_STATE         // EN: API used out of order / FR: API utilisée dans le mauvais ordre
};

// EN: Human-readable name of an error code.
// FR: Nom lisible d'un code d'erreur.
const char* errorToString(IngestError error);

// EN: Value-type error carried by outcomes (preview failure, streaming result)
// FR: Erreur de type valeur portée par les résultats (échec d'aperçu, résultat de streaming)
struct ErrorInfo {
    IngestError code{IngestError::SUCCESS};
    std::string message;
    std::optional<size_t> row;  // EN: Row index when the error is row-bound / FR: Index de ligne si l'erreur y est liée

    bool ok() const { return code == IngestError::SUCCESS; }
    std::string toString() const;
};

// EN: Exception thrown by the source adapter and configuration layers.
// FR: Exception levée par l'adaptateur de source et les couches de configuration.
class IngestException : public std::runtime_error {
public:
    IngestException(IngestError code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    IngestError code() const noexcept { return code_; }
    ErrorInfo toErrorInfo() const { return ErrorInfo{code_, what(), std::nullopt}; }

private:
    IngestError code_;
};

// EN: Raised when a resource offers neither native streaming nor read-to-completion.
// FR: Levée lorsqu'une ressource n'offre ni streaming natif ni lecture complète.
class UnsupportedSourceError : public IngestException {
public:
    explicit UnsupportedSourceError(const std::string& resource_name)
        : IngestException(IngestError::UNSUPPORTED_SOURCE,
                          "Resource does not support reading: " + resource_name) {}
};

} // namespace CIP
