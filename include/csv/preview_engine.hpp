// EN: Preview engine: samples the first rows of a file to drive format detection.
// FR: Moteur d'aperçu : échantillonne les premières lignes d'un fichier pour la détection du format.

#pragma once

#include "csv/parse_config.hpp"
#include "csv/tokenizer.hpp"
#include "infrastructure/system/ingest_error.hpp"
#include "io/file_resource.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace CIP {
namespace CSV {

// EN: Number of rows a preview always reports
// FR: Nombre de lignes qu'un aperçu rapporte toujours
constexpr size_t PREVIEW_ROW_COUNT = 5;

// EN: Successful preview. first_rows always holds PREVIEW_ROW_COUNT rows, padded with empty rows.
// FR: Aperçu réussi. first_rows contient toujours PREVIEW_ROW_COUNT lignes, complétées par des lignes vides.
struct PreviewReport {
    IO::FileRef file;
    std::string first_chunk;                 // EN: Decoded text of the first chunk / FR: Texte décodé du premier chunk
    std::vector<StringRow> first_rows;
    bool is_single_line{false};
    std::optional<RowError> first_warning;   // EN: First non-fatal row error / FR: Première erreur de ligne non fatale
};

// EN: Failed preview: the file and what went wrong
// FR: Aperçu échoué : le fichier et ce qui s'est mal passé
struct PreviewFailure {
    IO::FileRef file;
    ErrorInfo error;
};

using PreviewOutcome = std::variant<PreviewReport, PreviewFailure>;

// EN: Preview a file. Never throws: every failure, including synchronous exceptions from the
//     source or the tokenizer, is folded into PreviewFailure.
// FR: Aperçu d'un fichier. Ne lève jamais : chaque échec, y compris les exceptions synchrones de la
//     source ou du tokenizer, est replié dans PreviewFailure.
PreviewOutcome preview(const IO::FileRef& file, const ParseConfig& config,
                       const TokenizerFactory& factory = delimitedTokenizerFactory());

// EN: Helpers for callers inspecting an outcome
// FR: Assistants pour les appelants inspectant un résultat
inline bool isSuccess(const PreviewOutcome& outcome) {
    return std::holds_alternative<PreviewReport>(outcome);
}

} // namespace CSV
} // namespace CIP
