// EN: Row normalization implementation.
// FR: Implémentation de la normalisation des lignes.

#include "csv/row_normalizer.hpp"

#include <cstring>

namespace CIP {
namespace CSV {

bool stripLeadingBOM(StringRow& row) {
    if (row.empty()) {
        return false;
    }
    static const size_t bom_length = std::strlen(BOM_CODE);
    std::string& cell = row.front();
    if (cell.compare(0, bom_length, BOM_CODE) != 0) {
        return false;
    }
    cell.erase(0, bom_length);
    return true;
}

StringRow coerceRow(const RawRow& row) {
    StringRow result;
    result.reserve(row.size());
    for (const auto& cell : row) {
        result.push_back(cell.value_or(std::string()));
    }
    return result;
}

StringRow normalizeRow(const RawRow& row, bool& first_row) {
    StringRow result = coerceRow(row);
    if (first_row) {
        stripLeadingBOM(result);
        first_row = false;
    }
    return result;
}

} // namespace CSV
} // namespace CIP
