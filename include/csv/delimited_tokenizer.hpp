// EN: Built-in delimited-text tokenizer (quotes, escapes, comments, dialect detection).
// FR: Tokenizer de texte délimité intégré (quotes, échappements, commentaires, détection de dialecte).

#pragma once

#include "csv/tokenizer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace CIP {
namespace CSV {

class DelimitedTokenizer : public RowTokenizer {
public:
    explicit DelimitedTokenizer(ParseConfig config, std::optional<size_t> row_cap = std::nullopt);

    void start(IO::SourceStream& source, TokenizerHandlers handlers) override;
    void pump() override;
    void pause() override;
    void resume() override;
    void abort() override;

    TokenizerState state() const override { return state_; }
    size_t rowsEmitted() const override { return rows_emitted_; }

    // EN: Dialect actually in use (resolved from the first chunk when auto-detected)
    // FR: Dialecte réellement utilisé (résolu depuis le premier chunk si auto-détecté)
    const std::string& delimiter() const { return delimiter_; }
    const std::string& newline() const { return newline_; }

    // EN: Guess the line terminator of a text sample, ignoring quoted content.
    // FR: Devine la fin de ligne d'un échantillon de texte, en ignorant le contenu quoté.
    static std::string guessNewline(const std::string& sample, char quote_char);

    // EN: Guess the delimiter by field-count consistency over the first rows; nullopt if none fits.
    // FR: Devine le délimiteur par cohérence du nombre de champs sur les premières lignes ; nullopt sinon.
    static std::optional<std::string> guessDelimiter(const std::string& sample, const ParseConfig& config,
                                                     const std::string& newline);

private:
    void resolveDialect(const std::string& first_text);
    TokenizedChunk extractRows(bool final_input);
    bool shouldSkip(const RawRow& row) const;
    void checkFieldCount(const RawRow& row, size_t row_index, std::vector<RowError>& errors);
    void emit(TokenizedChunk& chunk);
    void complete();
    void fail(const ErrorInfo& error);

    ParseConfig config_;
    std::optional<size_t> row_cap_;
    IO::SourceStream* source_{nullptr};
    TokenizerHandlers handlers_;
    TokenizerState state_{TokenizerState::IDLE};

    std::string delimiter_;
    std::string newline_;
    std::string buffer_;                   // EN: Text of the pending, incomplete row / FR: Texte de la ligne incomplète en attente
    std::vector<RowError> pending_errors_; // EN: Errors raised before the first chunk / FR: Erreurs levées avant le premier chunk
    std::optional<size_t> expected_fields_;
    size_t rows_emitted_{0};
    size_t chunks_emitted_{0};
    bool first_chunk_seen_{false};
    bool input_exhausted_{false};
};

} // namespace CSV
} // namespace CIP
