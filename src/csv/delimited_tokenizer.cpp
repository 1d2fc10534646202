// EN: Delimited-text tokenizer: chunked, pausable row extraction with quote-aware scanning.
// FR: Tokenizer de texte délimité : extraction de lignes par chunks, pausable, avec analyse des quotes.

#include "csv/delimited_tokenizer.hpp"
#include "infrastructure/logging/logger.hpp"
#include "io/source_stream.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string_view>

namespace CIP {
namespace CSV {

namespace {

// EN: Rows sampled when guessing the delimiter
// FR: Lignes échantillonnées pour deviner le délimiteur
constexpr size_t DELIMITER_SAMPLE_ROWS = 10;

// EN: Characters inspected when guessing the newline
// FR: Caractères inspectés pour deviner la fin de ligne
constexpr size_t NEWLINE_SAMPLE_SIZE = 1024 * 1024;

// EN: Resolved dialect used by the scanner
// FR: Dialecte résolu utilisé par l'analyseur
struct Dialect {
    std::string delimiter;
    std::string newline;
    std::string comments;
    char quote;
    char escape;
    size_t max_field_size;
};

enum class Match { YES, NO, PARTIAL };

// EN: PARTIAL means the text ends inside a prefix of token
// FR: PARTIAL signifie que le texte se termine dans un préfixe du token
Match matchAt(std::string_view text, size_t pos, std::string_view token) {
    size_t available = text.size() - pos;
    if (available >= token.size()) {
        return text.substr(pos, token.size()) == token ? Match::YES : Match::NO;
    }
    return text.substr(pos) == token.substr(0, available) ? Match::PARTIAL : Match::NO;
}

enum class ScanResult {
    ROW,        // EN: A complete row was scanned / FR: Une ligne complète a été analysée
    COMMENT,    // EN: A comment line was skipped / FR: Une ligne de commentaire a été ignorée
    NEED_MORE   // EN: The row continues past the available text / FR: La ligne continue après le texte disponible
};

void pushField(RawRow& row, std::string field, const Dialect& dialect, size_t row_index,
               std::vector<RowError>& errors) {
    if (field.size() > dialect.max_field_size) {
        errors.push_back(RowError{RowErrorType::FIELD_SIZE, RowErrorCode::FIELD_TOO_LARGE,
                                  "Field " + std::to_string(row.size()) + " exceeds " +
                                      std::to_string(dialect.max_field_size) + " bytes",
                                  row_index});
        row.emplace_back(std::nullopt);
        return;
    }
    row.emplace_back(std::move(field));
}

// EN: Scan one row starting at pos. On ROW/COMMENT, next is the position after the terminator.
//     Errors are only appended when a row is produced, since NEED_MORE scans are retried.
// FR: Analyse une ligne à partir de pos. Sur ROW/COMMENT, next est la position après le terminateur.
//     Les erreurs ne sont ajoutées que si une ligne est produite, les analyses NEED_MORE étant rejouées.
ScanResult scanRow(std::string_view text, size_t pos, bool final_input, const Dialect& dialect,
                   size_t row_index, RawRow& row, size_t& next, std::vector<RowError>& errors) {
    const size_t n = text.size();
    std::vector<RowError> row_errors;
    row.clear();

    if (!dialect.comments.empty()) {
        Match comment = matchAt(text, pos, dialect.comments);
        if (comment == Match::PARTIAL && !final_input) {
            return ScanResult::NEED_MORE;
        }
        if (comment == Match::YES) {
            size_t end = text.find(dialect.newline, pos);
            if (end == std::string_view::npos) {
                if (!final_input) {
                    return ScanResult::NEED_MORE;
                }
                next = n;
            } else {
                next = end + dialect.newline.size();
            }
            return ScanResult::COMMENT;
        }
    }

    size_t i = pos;
    // EN: Position of the newline ending the current line, recomputed once a quoted field moves past it
    // FR: Position de la fin de ligne courante, recalculée quand un champ quoté la dépasse
    size_t line_end = std::string_view::npos;
    bool line_end_known = false;
    while (true) {
        if (i < n && text[i] == dialect.quote) {
            // EN: Quoted field, may span lines and chunks
            // FR: Champ quoté, peut s'étendre sur plusieurs lignes et chunks
            std::string field;
            size_t j = i + 1;
            bool closed = false;
            while (j < n) {
                char c = text[j];
                if (c == dialect.escape && dialect.escape != dialect.quote) {
                    if (j + 1 >= n) {
                        if (!final_input) {
                            return ScanResult::NEED_MORE;
                        }
                        field += c;
                        ++j;
                        continue;
                    }
                    char escaped = text[j + 1];
                    if (escaped == dialect.quote || escaped == dialect.escape) {
                        field += escaped;
                        j += 2;
                        continue;
                    }
                    field += c;
                    ++j;
                    continue;
                }
                if (c == dialect.quote) {
                    if (dialect.escape == dialect.quote) {
                        if (j + 1 < n && text[j + 1] == dialect.quote) {
                            field += dialect.quote;
                            j += 2;
                            continue;
                        }
                        if (j + 1 >= n && !final_input) {
                            // EN: Cannot tell a closing quote from a doubled one yet
                            // FR: Impossible de distinguer une quote fermante d'une quote doublée
                            return ScanResult::NEED_MORE;
                        }
                    }
                    ++j;
                    closed = true;
                    break;
                }
                field += c;
                ++j;
            }

            if (!closed) {
                if (!final_input) {
                    return ScanResult::NEED_MORE;
                }
                row_errors.push_back(RowError{RowErrorType::QUOTES, RowErrorCode::MISSING_QUOTES,
                                              "Quoted field unterminated", row_index});
                pushField(row, std::move(field), dialect, row_index, row_errors);
                next = n;
                errors.insert(errors.end(), row_errors.begin(), row_errors.end());
                return ScanResult::ROW;
            }

            // EN: After the closing quote only a delimiter, a newline or the end may follow
            // FR: Après la quote fermante, seuls un délimiteur, une fin de ligne ou la fin peuvent suivre
            i = j;
            bool warned = false;
            bool next_field = false;
            while (!next_field) {
                if (i >= n) {
                    if (!final_input) {
                        return ScanResult::NEED_MORE;
                    }
                    pushField(row, std::move(field), dialect, row_index, row_errors);
                    next = n;
                    errors.insert(errors.end(), row_errors.begin(), row_errors.end());
                    return ScanResult::ROW;
                }
                Match delimiter = matchAt(text, i, dialect.delimiter);
                Match newline = matchAt(text, i, dialect.newline);
                if (delimiter == Match::YES) {
                    pushField(row, std::move(field), dialect, row_index, row_errors);
                    i += dialect.delimiter.size();
                    next_field = true;
                } else if (newline == Match::YES) {
                    pushField(row, std::move(field), dialect, row_index, row_errors);
                    next = i + dialect.newline.size();
                    errors.insert(errors.end(), row_errors.begin(), row_errors.end());
                    return ScanResult::ROW;
                } else if ((delimiter == Match::PARTIAL || newline == Match::PARTIAL) && !final_input) {
                    return ScanResult::NEED_MORE;
                } else {
                    if (!warned) {
                        row_errors.push_back(RowError{RowErrorType::QUOTES, RowErrorCode::INVALID_QUOTES,
                                                      "Trailing quote on quoted field is malformed",
                                                      row_index});
                        warned = true;
                    }
                    field += text[i];
                    ++i;
                }
            }
            continue;
        }

        // EN: Unquoted field ends at the nearest delimiter or newline; the delimiter
        //     search never runs past the end of the current line
        // FR: Un champ non quoté se termine au délimiteur ou à la fin de ligne le plus proche ;
        //     la recherche du délimiteur ne dépasse jamais la fin de la ligne courante
        if (!line_end_known || (line_end != std::string_view::npos && line_end < i)) {
            line_end = text.find(dialect.newline, i);
            line_end_known = true;
        }
        const size_t newline_pos = line_end;
        const size_t limit = newline_pos == std::string_view::npos ? n : newline_pos;
        size_t delimiter_pos = text.substr(0, limit).find(dialect.delimiter, i);

        if (delimiter_pos != std::string_view::npos) {
            pushField(row, std::string(text.substr(i, delimiter_pos - i)), dialect, row_index, row_errors);
            i = delimiter_pos + dialect.delimiter.size();
            continue;
        }

        if (newline_pos != std::string_view::npos) {
            pushField(row, std::string(text.substr(i, newline_pos - i)), dialect, row_index, row_errors);
            next = newline_pos + dialect.newline.size();
            errors.insert(errors.end(), row_errors.begin(), row_errors.end());
            return ScanResult::ROW;
        }

        if (!final_input) {
            return ScanResult::NEED_MORE;
        }
        pushField(row, std::string(text.substr(i)), dialect, row_index, row_errors);
        next = n;
        errors.insert(errors.end(), row_errors.begin(), row_errors.end());
        return ScanResult::ROW;
    }
}

bool isBlank(const Cell& cell) {
    if (!cell) {
        return true;
    }
    for (char c : *cell) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool isEmptyLine(const RawRow& row, EmptyLinePolicy policy) {
    switch (policy) {
        case EmptyLinePolicy::KEEP:
            return false;
        case EmptyLinePolicy::SKIP:
            return row.size() == 1 && row[0] && row[0]->empty();
        case EmptyLinePolicy::GREEDY:
            for (const auto& cell : row) {
                if (!isBlank(cell)) {
                    return false;
                }
            }
            return true;
    }
    return false;
}

} // namespace

DelimitedTokenizer::DelimitedTokenizer(ParseConfig config, std::optional<size_t> row_cap)
    : config_(std::move(config)), row_cap_(row_cap) {
    validateParseConfig(config_);
}

void DelimitedTokenizer::start(IO::SourceStream& source, TokenizerHandlers handlers) {
    if (state_ != TokenizerState::IDLE) {
        throw IngestException(IngestError::INVALID_STATE, "Tokenizer already started");
    }
    source_ = &source;
    handlers_ = std::move(handlers);
    state_ = TokenizerState::RUNNING;
}

void DelimitedTokenizer::pause() {
    if (state_ == TokenizerState::RUNNING) {
        state_ = TokenizerState::PAUSED;
    }
}

void DelimitedTokenizer::resume() {
    if (state_ == TokenizerState::PAUSED) {
        state_ = TokenizerState::RUNNING;
    }
}

void DelimitedTokenizer::abort() {
    if (!isFinished()) {
        state_ = TokenizerState::ABORTED;
        buffer_.clear();
        pending_errors_.clear();
        LOG_DEBUG("tokenizer", "Tokenizer aborted after " + std::to_string(rows_emitted_) + " rows");
    }
}

void DelimitedTokenizer::pump() {
    while (state_ == TokenizerState::RUNNING) {
        if (input_exhausted_) {
            complete();
            return;
        }

        // EN: The byte source may be paused independently of the tokenizer
        // FR: La source d'octets peut être en pause indépendamment du tokenizer
        if (source_->isPaused()) {
            return;
        }

        std::optional<std::string> text;
        try {
            text = source_->readChunk(config_.chunk_size);
        } catch (const IngestException& e) {
            fail(e.toErrorInfo());
            return;
        } catch (const std::exception& e) {
            fail(ErrorInfo{IngestError::FILE_READ_ERROR, e.what(), std::nullopt});
            return;
        }

        const bool final_input = !text || source_->atEnd();

        if (!first_chunk_seen_) {
            first_chunk_seen_ = true;
            resolveDialect(text ? *text : std::string());
            if (text && handlers_.before_first_chunk) {
                handlers_.before_first_chunk(*text);
            }
            if (state_ != TokenizerState::RUNNING && state_ != TokenizerState::PAUSED) {
                return;
            }
        }

        if (text) {
            buffer_ += *text;
        }

        TokenizedChunk chunk = extractRows(final_input);

        if (final_input) {
            input_exhausted_ = true;
        } else if (buffer_.size() > config_.max_row_size) {
            fail(ErrorInfo{IngestError::ROW_TOO_LARGE,
                           "Row exceeds max_row_size of " + std::to_string(config_.max_row_size) + " bytes",
                           rows_emitted_ + chunk.rows.size()});
            return;
        }

        if (row_cap_ && rows_emitted_ + chunk.rows.size() >= *row_cap_) {
            input_exhausted_ = true;
        }

        if (text || !chunk.rows.empty() || !chunk.errors.empty()) {
            emit(chunk);
        }

        // EN: The chunk handler may have paused or aborted us; the loop condition handles both
        // FR: Le handler de chunk a pu nous mettre en pause ou nous arrêter ; la condition de boucle gère les deux
    }
}

void DelimitedTokenizer::resolveDialect(const std::string& first_text) {
    newline_ = config_.newline == NewlineStyle::AUTO
        ? guessNewline(first_text, config_.quote_char)
        : newlineString(config_.newline);

    if (!config_.delimiter.empty()) {
        delimiter_ = config_.delimiter;
    } else if (auto guessed = guessDelimiter(first_text, config_, newline_)) {
        delimiter_ = *guessed;
    } else {
        delimiter_ = ",";
        pending_errors_.push_back(RowError{RowErrorType::DELIMITER, RowErrorCode::UNDETECTABLE_DELIMITER,
                                           "Unable to auto-detect delimiting character; defaulted to ','",
                                           std::nullopt});
    }

    LOG_DEBUG("tokenizer", "Dialect resolved (delimiter " + std::to_string(static_cast<int>(delimiter_[0])) +
                           ", newline length " + std::to_string(newline_.size()) + ")");
}

TokenizedChunk DelimitedTokenizer::extractRows(bool final_input) {
    TokenizedChunk chunk;
    chunk.first_row_index = rows_emitted_;
    chunk.errors = std::move(pending_errors_);
    pending_errors_.clear();

    const Dialect dialect{delimiter_, newline_, config_.comments, config_.quote_char,
                          config_.escape_char, config_.max_field_size};
    std::string_view text(buffer_);
    size_t pos = 0;

    while (pos < text.size()) {
        if (row_cap_ && rows_emitted_ + chunk.rows.size() >= *row_cap_) {
            break;
        }

        size_t row_index = rows_emitted_ + chunk.rows.size();
        RawRow row;
        size_t next = pos;
        std::vector<RowError> row_errors;
        ScanResult result = scanRow(text, pos, final_input, dialect, row_index, row, next, row_errors);

        if (result == ScanResult::NEED_MORE) {
            break;
        }
        pos = next;
        if (result == ScanResult::COMMENT || shouldSkip(row)) {
            continue;
        }

        checkFieldCount(row, row_index, row_errors);
        chunk.errors.insert(chunk.errors.end(), row_errors.begin(), row_errors.end());
        chunk.rows.push_back(std::move(row));
    }

    buffer_.erase(0, pos);
    return chunk;
}

bool DelimitedTokenizer::shouldSkip(const RawRow& row) const {
    return isEmptyLine(row, config_.skip_empty_lines);
}

void DelimitedTokenizer::checkFieldCount(const RawRow& row, size_t row_index, std::vector<RowError>& errors) {
    if (!expected_fields_) {
        expected_fields_ = row.size();
        return;
    }
    if (row.size() < *expected_fields_) {
        errors.push_back(RowError{RowErrorType::FIELD_MISMATCH, RowErrorCode::TOO_FEW_FIELDS,
                                  "Too few fields: expected " + std::to_string(*expected_fields_) +
                                      " fields but parsed " + std::to_string(row.size()),
                                  row_index});
    } else if (row.size() > *expected_fields_) {
        errors.push_back(RowError{RowErrorType::FIELD_MISMATCH, RowErrorCode::TOO_MANY_FIELDS,
                                  "Too many fields: expected " + std::to_string(*expected_fields_) +
                                      " fields but parsed " + std::to_string(row.size()),
                                  row_index});
    }
}

void DelimitedTokenizer::emit(TokenizedChunk& chunk) {
    rows_emitted_ += chunk.rows.size();
    ++chunks_emitted_;
    if (handlers_.on_chunk) {
        handlers_.on_chunk(chunk, *this);
    }
}

void DelimitedTokenizer::complete() {
    state_ = TokenizerState::COMPLETED;
    LOG_DEBUG("tokenizer", "Tokenizer completed: " + std::to_string(rows_emitted_) + " rows in " +
                           std::to_string(chunks_emitted_) + " chunks");
    if (handlers_.on_complete) {
        handlers_.on_complete();
    }
}

void DelimitedTokenizer::fail(const ErrorInfo& error) {
    state_ = TokenizerState::FAILED;
    buffer_.clear();
    LOG_ERROR("tokenizer", "Tokenizer failed: " + error.toString());
    if (handlers_.on_error) {
        handlers_.on_error(error);
    }
}

std::string DelimitedTokenizer::guessNewline(const std::string& sample, char quote_char) {
    // EN: Drop quoted content so line breaks inside fields do not vote
    // FR: Retire le contenu quoté pour que les sauts de ligne dans les champs ne votent pas
    std::string stripped;
    bool in_quotes = false;
    size_t limit = std::min(sample.size(), NEWLINE_SAMPLE_SIZE);
    for (size_t i = 0; i < limit; ++i) {
        char c = sample[i];
        if (c == quote_char) {
            in_quotes = !in_quotes;
            continue;
        }
        if (!in_quotes) {
            stripped += c;
        }
    }

    size_t first_r = stripped.find('\r');
    size_t first_n = stripped.find('\n');
    if (first_r == std::string::npos || (first_n != std::string::npos && first_n < first_r)) {
        return "\n";
    }

    // EN: Count the \r segments that start with \n (i.e. \r\n pairs)
    // FR: Compte les segments \r commençant par \n (c.-à-d. les paires \r\n)
    size_t segments = 1;
    size_t with_n = 0;
    for (size_t i = 0; i < stripped.size(); ++i) {
        if (stripped[i] == '\r') {
            ++segments;
            if (i + 1 < stripped.size() && stripped[i + 1] == '\n') {
                ++with_n;
            }
        }
    }
    return static_cast<double>(with_n) >= static_cast<double>(segments) / 2.0 ? "\r\n" : "\r";
}

std::optional<std::string> DelimitedTokenizer::guessDelimiter(const std::string& sample, const ParseConfig& config,
                                                              const std::string& newline) {
    const auto& candidates = config.delimiters_to_guess.empty() ? defaultDelimiterCandidates()
                                                                : config.delimiters_to_guess;

    std::optional<std::string> best;
    std::optional<double> best_delta;
    std::optional<double> best_average;

    for (const auto& candidate : candidates) {
        const Dialect dialect{candidate, newline, config.comments, config.quote_char,
                              config.escape_char, config.max_field_size};
        std::string_view text(sample);
        size_t pos = 0;
        size_t sampled = 0;
        size_t counted = 0;
        double delta = 0.0;
        double average = 0.0;
        std::optional<size_t> previous;

        while (pos < text.size() && sampled < DELIMITER_SAMPLE_ROWS) {
            RawRow row;
            size_t next = pos;
            std::vector<RowError> ignored;
            ScanResult result = scanRow(text, pos, true, dialect, sampled, row, next, ignored);
            if (result == ScanResult::NEED_MORE || next <= pos) {
                break;
            }
            pos = next;
            if (result == ScanResult::COMMENT) {
                continue;
            }
            ++sampled;
            if (isEmptyLine(row, config.skip_empty_lines)) {
                continue;
            }

            size_t field_count = row.size();
            average += static_cast<double>(field_count);
            ++counted;
            if (!previous) {
                previous = field_count;
                continue;
            }
            if (field_count > 0) {
                delta += std::abs(static_cast<double>(field_count) - static_cast<double>(*previous));
                previous = field_count;
            }
        }

        if (counted > 0) {
            average /= static_cast<double>(counted);
        }

        if ((!best_delta || delta <= *best_delta) && (!best_average || average > *best_average) &&
            average > 1.99) {
            best_delta = delta;
            best_average = average;
            best = candidate;
        }
    }

    return best;
}

// EN: RowError helpers
// FR: Assistants de RowError

const char* rowErrorTypeToString(RowErrorType type) {
    switch (type) {
        case RowErrorType::QUOTES:         return "Quotes";
        case RowErrorType::DELIMITER:      return "Delimiter";
        case RowErrorType::FIELD_MISMATCH: return "FieldMismatch";
        case RowErrorType::FIELD_SIZE:     return "FieldSize";
    }
    return "Unknown";
}

const char* rowErrorCodeToString(RowErrorCode code) {
    switch (code) {
        case RowErrorCode::MISSING_QUOTES:         return "MissingQuotes";
        case RowErrorCode::INVALID_QUOTES:         return "InvalidQuotes";
        case RowErrorCode::UNDETECTABLE_DELIMITER: return "UndetectableDelimiter";
        case RowErrorCode::TOO_FEW_FIELDS:         return "TooFewFields";
        case RowErrorCode::TOO_MANY_FIELDS:        return "TooManyFields";
        case RowErrorCode::FIELD_TOO_LARGE:        return "FieldTooLarge";
    }
    return "Unknown";
}

std::string RowError::toString() const {
    std::string result = std::string(rowErrorTypeToString(type)) + "/" + rowErrorCodeToString(code) + ": " + message;
    if (row) {
        result += " (row " + std::to_string(*row) + ")";
    }
    return result;
}

TokenizerFactory delimitedTokenizerFactory() {
    return [](const ParseConfig& config, std::optional<size_t> row_cap) -> std::unique_ptr<RowTokenizer> {
        return std::make_unique<DelimitedTokenizer>(config, row_cap);
    };
}

} // namespace CSV
} // namespace CIP
