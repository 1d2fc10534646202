// EN: Field assignment: maps named fields onto column indices, plus helpers to pick the assignment.
// FR: Affectation des champs : associe des champs nommés à des index de colonnes, plus des assistants de choix.

#pragma once

#include "csv/preview_engine.hpp"
#include "csv/tokenizer.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace CIP {
namespace CSV {

// EN: Field name -> assigned column index; nullopt means no column was chosen.
// FR: Nom de champ -> index de colonne affecté ; nullopt signifie aucune colonne choisie.
using FieldAssignmentMap = std::map<std::string, std::optional<size_t>>;

// EN: One output record; a field is absent when unassigned or beyond the row end.
// FR: Un enregistrement de sortie ; un champ est absent s'il n'est pas affecté ou hors de la ligne.
using Record = std::map<std::string, std::string>;

// EN: Build the record of one normalized row.
// FR: Construit l'enregistrement d'une ligne normalisée.
Record mapRow(const StringRow& row, const FieldAssignmentMap& assignments);

// EN: A target field offered to the user
// FR: Un champ cible proposé à l'utilisateur
struct FieldDefinition {
    std::string name;
    std::string label;
    bool required{false};
};

// EN: List every problem with an assignment: unknown field, required field left unassigned,
//     index beyond column_count. Several fields may share one column.
// FR: Liste chaque problème d'une affectation : champ inconnu, champ requis non affecté,
//     index au-delà de column_count. Plusieurs champs peuvent partager une colonne.
std::vector<std::string> validateAssignments(const std::vector<FieldDefinition>& fields,
                                             const FieldAssignmentMap& assignments,
                                             size_t column_count);

// EN: Coarse kind of the values seen in a column
// FR: Nature grossière des valeurs vues dans une colonne
enum class CellKind {
    EMPTY,
    INTEGER,
    DECIMAL,
    BOOLEAN,
    TEXT
};

const char* cellKindToString(CellKind kind);

// EN: Classify a single cell value.
// FR: Classe une valeur de cellule.
CellKind sniffCellKind(const std::string& value);

// EN: What the preview shows about one column
// FR: Ce que l'aperçu montre d'une colonne
struct ColumnSummary {
    size_t index{0};
    std::optional<std::string> header;
    std::vector<std::string> samples;   // EN: One per preview row, "" when missing / FR: Une par ligne d'aperçu, "" si absente
    CellKind kind{CellKind::EMPTY};
};

// EN: One summary per column of the first preview row. With has_headers the first row provides
//     the headers and is excluded from kind sniffing.
// FR: Un résumé par colonne de la première ligne d'aperçu. Avec has_headers la première ligne
//     fournit les en-têtes et est exclue de la détection de nature.
std::vector<ColumnSummary> summarizeColumns(const PreviewReport& report, bool has_headers);

} // namespace CSV
} // namespace CIP
