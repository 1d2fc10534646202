// EN: Pausable, encoding-aware text stream over a FileResource (the row source adapter).
// FR: Flux de texte pausable et conscient de l'encodage sur une FileResource (adaptateur de source).

#pragma once

#include "io/file_resource.hpp"
#include "io/text_decoder.hpp"

#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace CIP {
namespace IO {

// EN: How the underlying bytes are obtained
// FR: Comment les octets sous-jacents sont obtenus
enum class SourceMode {
    NATIVE_STREAM,   // EN: Resource streamed incrementally / FR: Ressource streamée incrémentalement
    MATERIALIZED     // EN: Resource read fully, then streamed from memory / FR: Ressource lue entièrement puis streamée depuis la mémoire
};

// EN: One run owns one SourceStream; instances are never shared between runs.
// FR: Une exécution possède un SourceStream ; les instances ne sont jamais partagées entre exécutions.
class SourceStream {
public:
    // EN: Open a resource, preferring native streaming and falling back to read-to-completion.
    //     Throws UnsupportedSourceError when neither is available, IngestException(ENCODING_ERROR)
    //     for an unknown encoding, and IngestException for I/O failures while opening.
    // FR: Ouvre une ressource, en préférant le streaming natif avec repli sur la lecture complète.
    //     Lève UnsupportedSourceError si aucun n'est disponible, IngestException(ENCODING_ERROR)
    //     pour un encodage inconnu, et IngestException pour les échecs d'E/S à l'ouverture.
    static std::unique_ptr<SourceStream> open(FileRef file, const std::string& encoding = "utf-8");

    ~SourceStream();

    SourceStream(const SourceStream&) = delete;
    SourceStream& operator=(const SourceStream&) = delete;

    // EN: Idempotent. Once pause() returns, readChunk() refuses to deliver data until resume().
    // FR: Idempotent. Après pause(), readChunk() refuse de livrer des données jusqu'à resume().
    void pause();
    void resume();
    bool isPaused() const { return paused_; }

    // EN: Decode and return the next chunk of at most max_bytes raw bytes; nullopt at end of input.
    //     Throws IngestException(INVALID_STATE) while paused or closed, FILE_READ_ERROR on I/O failure.
    // FR: Décode et retourne le prochain chunk d'au plus max_bytes octets bruts ; nullopt en fin d'entrée.
    //     Lève IngestException(INVALID_STATE) en pause ou fermé, FILE_READ_ERROR sur échec d'E/S.
    std::optional<std::string> readChunk(size_t max_bytes);

    // EN: Release the underlying stream; further reads fail.
    // FR: Libère le flux sous-jacent ; les lectures suivantes échouent.
    void close();

    bool atEnd() const { return ended_; }
    bool isClosed() const { return !stream_; }
    SourceMode mode() const { return mode_; }
    TextEncoding encoding() const { return decoder_.encoding(); }
    const FileRef& file() const { return file_; }
    size_t bytesRead() const { return bytes_read_; }
    size_t chunksRead() const { return chunks_read_; }

private:
    SourceStream(FileRef file, TextEncoding encoding, std::unique_ptr<std::istream> stream, SourceMode mode);

    FileRef file_;
    TextDecoder decoder_;
    std::unique_ptr<std::istream> stream_;
    SourceMode mode_;
    bool paused_{false};
    bool ended_{false};
    size_t bytes_read_{0};
    size_t chunks_read_{0};
};

} // namespace IO
} // namespace CIP
