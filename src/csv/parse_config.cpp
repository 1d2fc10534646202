// EN: ParseConfig defaults, validation and loading from the configuration store.
// FR: Défauts, validation et chargement de ParseConfig depuis le stockage de configuration.

#include "csv/parse_config.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/ingest_error.hpp"

#include <algorithm>
#include <cctype>

namespace CIP {
namespace CSV {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// EN: Accept "\t", "tab" and friends so YAML authors need not embed control characters
// FR: Accepte "\t", "tab" etc. pour éviter d'écrire des caractères de contrôle en YAML
std::string unescapeDelimiter(const std::string& value) {
    std::string lowered = lowercase(value);
    if (lowered == "\\t" || lowered == "tab") return "\t";
    if (lowered == "pipe") return "|";
    if (lowered == "semicolon") return ";";
    if (lowered == "comma") return ",";
    if (lowered == "\\x1e" || lowered == "rs") return "\x1E";
    if (lowered == "\\x1f" || lowered == "us") return "\x1F";
    return value;
}

void readSize(const ConfigSection& section, const std::string& key, size_t& target,
              std::vector<std::string>& errors) {
    if (!section.has(key)) {
        return;
    }
    auto value = section.get(key).tryAs<int>();
    if (!value || *value <= 0) {
        errors.push_back(key + " must be a positive integer");
        return;
    }
    target = static_cast<size_t>(*value);
}

void readChar(const ConfigSection& section, const std::string& key, char& target,
              std::vector<std::string>& errors) {
    if (!section.has(key)) {
        return;
    }
    auto value = section.get(key).tryAs<std::string>();
    if (!value || value->size() != 1) {
        errors.push_back(key + " must be a single character");
        return;
    }
    target = (*value)[0];
}

} // namespace

const std::vector<std::string>& defaultDelimiterCandidates() {
    static const std::vector<std::string> candidates = {",", "\t", "|", ";", "\x1E", "\x1F"};
    return candidates;
}

std::string newlineString(NewlineStyle style) {
    switch (style) {
        case NewlineStyle::LF:   return "\n";
        case NewlineStyle::CRLF: return "\r\n";
        case NewlineStyle::CR:   return "\r";
        case NewlineStyle::AUTO: return "";
    }
    return "";
}

void validateParseConfig(const ParseConfig& config) {
    std::vector<std::string> errors;

    auto checkDelimiter = [&](const std::string& delimiter, const std::string& what) {
        if (delimiter.find('\n') != std::string::npos || delimiter.find('\r') != std::string::npos) {
            errors.push_back(what + " cannot contain a line break");
        }
        if (delimiter.find(config.quote_char) != std::string::npos) {
            errors.push_back(what + " cannot contain the quote character");
        }
    };

    checkDelimiter(config.delimiter, "delimiter");
    for (const auto& candidate : config.delimiters_to_guess) {
        if (candidate.empty()) {
            errors.push_back("delimiters_to_guess cannot contain an empty entry");
        } else {
            checkDelimiter(candidate, "delimiter candidate");
        }
    }
    if (config.quote_char == '\n' || config.quote_char == '\r') {
        errors.push_back("quote_char cannot be a line break");
    }
    if (config.chunk_size == 0) {
        errors.push_back("chunk_size must be positive");
    }
    if (config.max_row_size == 0) {
        errors.push_back("max_row_size must be positive");
    }
    if (config.max_field_size == 0) {
        errors.push_back("max_field_size must be positive");
    }
    if (!config.comments.empty() && config.comments == config.delimiter) {
        errors.push_back("comments prefix cannot equal the delimiter");
    }

    if (!errors.empty()) {
        std::string message = "Invalid parser configuration:";
        for (const auto& error : errors) {
            message += " " + error + ";";
        }
        throw IngestException(IngestError::INVALID_CONFIG, message);
    }
}

ParseConfig parseConfigFromSection(const ConfigSection& section) {
    ParseConfig config;
    std::vector<std::string> errors;

    if (section.has("delimiter")) {
        auto value = section.get("delimiter").tryAs<std::string>();
        if (value) {
            config.delimiter = lowercase(*value) == "auto" ? std::string() : unescapeDelimiter(*value);
        } else {
            errors.push_back("delimiter must be a string");
        }
    }

    if (section.has("newline")) {
        std::string value = lowercase(section.get("newline").asOrDefault<std::string>(""));
        if (value == "auto" || value.empty()) {
            config.newline = NewlineStyle::AUTO;
        } else if (value == "lf" || value == "\\n") {
            config.newline = NewlineStyle::LF;
        } else if (value == "crlf" || value == "\\r\\n") {
            config.newline = NewlineStyle::CRLF;
        } else if (value == "cr" || value == "\\r") {
            config.newline = NewlineStyle::CR;
        } else {
            errors.push_back("newline must be one of auto, lf, crlf, cr");
        }
    }

    readChar(section, "quote_char", config.quote_char, errors);
    config.escape_char = config.quote_char;
    readChar(section, "escape_char", config.escape_char, errors);

    if (section.has("comments")) {
        ConfigValue value = section.get("comments");
        if (auto flag = value.tryAs<bool>()) {
            config.comments = *flag ? "#" : "";
        } else if (auto prefix = value.tryAs<std::string>()) {
            config.comments = *prefix;
        } else {
            errors.push_back("comments must be a boolean or a prefix string");
        }
    }

    if (section.has("skip_empty_lines")) {
        ConfigValue value = section.get("skip_empty_lines");
        if (auto flag = value.tryAs<bool>()) {
            config.skip_empty_lines = *flag ? EmptyLinePolicy::SKIP : EmptyLinePolicy::KEEP;
        } else if (value.asOrDefault<std::string>("") == "greedy") {
            config.skip_empty_lines = EmptyLinePolicy::GREEDY;
        } else {
            errors.push_back("skip_empty_lines must be true, false or greedy");
        }
    }

    if (section.has("delimiters_to_guess")) {
        auto list = section.get("delimiters_to_guess").tryAs<std::vector<std::string>>();
        if (list) {
            for (const auto& candidate : *list) {
                config.delimiters_to_guess.push_back(unescapeDelimiter(candidate));
            }
        } else {
            errors.push_back("delimiters_to_guess must be a list");
        }
    }

    readSize(section, "chunk_size", config.chunk_size, errors);
    readSize(section, "max_row_size", config.max_row_size, errors);
    readSize(section, "max_field_size", config.max_field_size, errors);

    if (section.has("encoding")) {
        auto value = section.get("encoding").tryAs<std::string>();
        if (value && !value->empty()) {
            config.encoding = *value;
        } else {
            errors.push_back("encoding must be a non-empty string");
        }
    }

    if (!errors.empty()) {
        std::string message = "Invalid parser configuration:";
        for (const auto& error : errors) {
            message += " " + error + ";";
        }
        throw IngestException(IngestError::INVALID_CONFIG, message);
    }

    validateParseConfig(config);
    return config;
}

ParseConfig loadParseConfig() {
    ParseConfig config = parseConfigFromSection(ConfigManager::getInstance().getSection("parser"));
    LOG_DEBUG("config", "Parser configuration loaded (chunk_size " + std::to_string(config.chunk_size) +
                        ", encoding " + config.encoding + ")");
    return config;
}

} // namespace CSV
} // namespace CIP
