// EN: Field assignment and column summary implementation.
// FR: Implémentation de l'affectation des champs et des résumés de colonnes.

#include "csv/field_mapping.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace CIP {
namespace CSV {

namespace {

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// EN: Merge two kinds seen in one column (INTEGER widens to DECIMAL, anything else mixed is TEXT)
// FR: Fusionne deux natures vues dans une colonne (INTEGER s'élargit en DECIMAL, tout autre mélange est TEXT)
CellKind widen(CellKind current, CellKind seen) {
    if (seen == CellKind::EMPTY) return current;
    if (current == CellKind::EMPTY || current == seen) return seen;
    if ((current == CellKind::INTEGER && seen == CellKind::DECIMAL) ||
        (current == CellKind::DECIMAL && seen == CellKind::INTEGER)) {
        return CellKind::DECIMAL;
    }
    return CellKind::TEXT;
}

} // namespace

Record mapRow(const StringRow& row, const FieldAssignmentMap& assignments) {
    Record record;
    for (const auto& [name, index] : assignments) {
        if (index && *index < row.size()) {
            record.emplace(name, row[*index]);
        }
    }
    return record;
}

std::vector<std::string> validateAssignments(const std::vector<FieldDefinition>& fields,
                                             const FieldAssignmentMap& assignments,
                                             size_t column_count) {
    std::vector<std::string> problems;
    std::set<std::string> known;
    for (const auto& field : fields) {
        known.insert(field.name);
    }

    for (const auto& [name, index] : assignments) {
        if (known.find(name) == known.end()) {
            problems.push_back("Unknown field: " + name);
            continue;
        }
        if (index && *index >= column_count) {
            problems.push_back("Field " + name + " is assigned to column " + std::to_string(*index) +
                               " but only " + std::to_string(column_count) + " columns exist");
        }
    }

    for (const auto& field : fields) {
        if (!field.required) {
            continue;
        }
        auto it = assignments.find(field.name);
        if (it == assignments.end() || !it->second) {
            problems.push_back("Required field " + (field.label.empty() ? field.name : field.label) +
                               " is not assigned");
        }
    }
    return problems;
}

const char* cellKindToString(CellKind kind) {
    switch (kind) {
        case CellKind::EMPTY:   return "empty";
        case CellKind::INTEGER: return "integer";
        case CellKind::DECIMAL: return "decimal";
        case CellKind::BOOLEAN: return "boolean";
        case CellKind::TEXT:    return "text";
    }
    return "text";
}

CellKind sniffCellKind(const std::string& value) {
    static const std::regex integer_pattern(R"(^[+-]?\d+$)");
    static const std::regex decimal_pattern(R"(^[+-]?(\d+\.\d*|\.\d+|\d+)([eE][+-]?\d+)?$)");

    std::string trimmed = trim(value);
    if (trimmed.empty()) {
        return CellKind::EMPTY;
    }
    if (std::regex_match(trimmed, integer_pattern)) {
        return CellKind::INTEGER;
    }
    if (std::regex_match(trimmed, decimal_pattern)) {
        return CellKind::DECIMAL;
    }
    std::string lowered = lowercase(trimmed);
    if (lowered == "true" || lowered == "false" || lowered == "yes" || lowered == "no") {
        return CellKind::BOOLEAN;
    }
    return CellKind::TEXT;
}

std::vector<ColumnSummary> summarizeColumns(const PreviewReport& report, bool has_headers) {
    std::vector<ColumnSummary> summaries;
    if (report.first_rows.empty()) {
        return summaries;
    }

    const StringRow& first = report.first_rows.front();
    for (size_t column = 0; column < first.size(); ++column) {
        ColumnSummary summary;
        summary.index = column;
        if (has_headers) {
            summary.header = first[column];
        }

        for (size_t r = 0; r < report.first_rows.size(); ++r) {
            const StringRow& row = report.first_rows[r];
            std::string value = column < row.size() ? row[column] : std::string();
            summary.samples.push_back(value);
            if (has_headers && r == 0) {
                continue;
            }
            summary.kind = widen(summary.kind, sniffCellKind(value));
        }
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

} // namespace CSV
} // namespace CIP
