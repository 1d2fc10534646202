// EN: Tokenizer options recognized by preview and streaming runs.
// FR: Options du tokenizer reconnues par les exécutions d'aperçu et de streaming.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace CIP {

class ConfigSection;

namespace CSV {

// EN: Default number of raw bytes per chunk
// FR: Nombre d'octets bruts par chunk par défaut
constexpr size_t DEFAULT_CHUNK_SIZE = 10000;

// EN: Line terminator handling
// FR: Gestion des fins de ligne
enum class NewlineStyle {
    AUTO,   // EN: Detect from the first chunk / FR: Détecter depuis le premier chunk
    LF,     // EN: "\n" / FR: "\n"
    CRLF,   // EN: "\r\n" / FR: "\r\n"
    CR      // EN: "\r" / FR: "\r"
};

// EN: Empty line handling
// FR: Gestion des lignes vides
enum class EmptyLinePolicy {
    KEEP,     // EN: Emit empty lines as one empty cell / FR: Émet les lignes vides comme une cellule vide
    SKIP,     // EN: Drop lines with a single empty cell / FR: Ignore les lignes à une seule cellule vide
    GREEDY    // EN: Drop lines whose cells are all whitespace / FR: Ignore les lignes dont toutes les cellules sont des espaces
};

// EN: Tokenizer configuration bundle
// FR: Ensemble de configuration du tokenizer
struct ParseConfig {
    std::string delimiter;                          // EN: Empty = auto-detect / FR: Vide = auto-détection
    NewlineStyle newline{NewlineStyle::AUTO};       // EN: Line terminator / FR: Fin de ligne
    char quote_char{'"'};                           // EN: Quote character / FR: Caractère de quote
    char escape_char{'"'};                          // EN: Escape for quotes inside quoted fields / FR: Échappement des quotes dans les champs quotés
    std::string comments;                           // EN: Comment prefix, empty = none / FR: Préfixe de commentaire, vide = aucun
    EmptyLinePolicy skip_empty_lines{EmptyLinePolicy::KEEP};
    std::vector<std::string> delimiters_to_guess;   // EN: Empty = built-in candidates / FR: Vide = candidats intégrés
    size_t chunk_size{DEFAULT_CHUNK_SIZE};          // EN: Raw bytes per chunk / FR: Octets bruts par chunk
    std::string encoding{"utf-8"};                  // EN: Source text encoding / FR: Encodage du texte source
    size_t max_row_size{10485760};                  // EN: Largest pending row (10MB) / FR: Plus grande ligne en attente (10MB)
    size_t max_field_size{1048576};                 // EN: Largest cell (1MB) / FR: Plus grande cellule (1MB)
};

// EN: Built-in delimiter candidates: , \t | ; RS US
// FR: Candidats délimiteurs intégrés : , \t | ; RS US
const std::vector<std::string>& defaultDelimiterCandidates();

// EN: Literal line terminator for an explicit style (empty for AUTO).
// FR: Fin de ligne littérale pour un style explicite (vide pour AUTO).
std::string newlineString(NewlineStyle style);

// EN: Throw IngestException(INVALID_CONFIG) listing every problem in the configuration.
// FR: Lève IngestException(INVALID_CONFIG) listant chaque problème de la configuration.
void validateParseConfig(const ParseConfig& config);

// EN: Build a ParseConfig from a "parser" configuration section; missing keys keep defaults.
// FR: Construit une ParseConfig depuis une section "parser" ; les clés absentes gardent leurs défauts.
ParseConfig parseConfigFromSection(const ConfigSection& section);

// EN: Load the "parser" section of the global ConfigManager.
// FR: Charge la section "parser" du ConfigManager global.
ParseConfig loadParseConfig();

} // namespace CSV
} // namespace CIP
