// EN: Row normalization: leading BOM removal on the first row of a run, cell coercion to strings.
// FR: Normalisation des lignes : retrait du BOM en tête de la première ligne, conversion des cellules en chaînes.

#pragma once

#include "csv/tokenizer.hpp"

#include <string>

namespace CIP {
namespace CSV {

// EN: U+FEFF encoded as UTF-8
// FR: U+FEFF encodé en UTF-8
inline constexpr const char* BOM_CODE = "\xEF\xBB\xBF";

// EN: Remove exactly one leading BOM from the first cell; returns true if one was removed.
// FR: Retire exactement un BOM en tête de la première cellule ; retourne true si retiré.
bool stripLeadingBOM(StringRow& row);

// EN: Coerce every cell to a string (missing cells become ""). When first_row is set the
//     leading BOM is stripped, and first_row is cleared whether or not a BOM was found.
// FR: Convertit chaque cellule en chaîne (les cellules absentes deviennent ""). Si first_row est
//     vrai le BOM de tête est retiré, et first_row est remis à faux qu'un BOM soit trouvé ou non.
StringRow normalizeRow(const RawRow& row, bool& first_row);

// EN: Coercion only, never touches a BOM.
// FR: Conversion seule, ne touche jamais au BOM.
StringRow coerceRow(const RawRow& row);

} // namespace CSV
} // namespace CIP
