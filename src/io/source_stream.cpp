// EN: Row source adapter implementation: native streaming with read-to-completion fallback.
// FR: Implémentation de l'adaptateur de source : streaming natif avec repli sur lecture complète.

#include "io/source_stream.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/ingest_error.hpp"

#include <sstream>
#include <vector>

namespace CIP {
namespace IO {

std::unique_ptr<SourceStream> SourceStream::open(FileRef file, const std::string& encoding) {
    if (!file) {
        throw IngestException(IngestError::UNSUPPORTED_SOURCE, "No file resource given");
    }

    auto text_encoding = parseEncodingName(encoding);
    if (!text_encoding) {
        throw IngestException(IngestError::ENCODING_ERROR, "Unsupported text encoding: " + encoding);
    }

    // EN: Prefer the native stream; fall back to materializing the resource
    // FR: Préfère le flux natif ; sinon matérialise la ressource
    SourceMode mode = SourceMode::NATIVE_STREAM;
    std::unique_ptr<std::istream> stream = file->openStream();
    if (!stream) {
        auto content = file->readAll();
        if (!content) {
            throw UnsupportedSourceError(file->name());
        }
        LOG_DEBUG("source", "Resource has no native stream, reading to completion: " + file->name());
        stream = std::make_unique<std::istringstream>(std::move(*content));
        mode = SourceMode::MATERIALIZED;
    }

    LOG_DEBUG_META("source", "Source opened", (std::unordered_map<std::string, std::string>{
        {"file", file->name()},
        {"encoding", encodingName(*text_encoding)},
        {"mode", mode == SourceMode::NATIVE_STREAM ? "native" : "materialized"}
    }));

    return std::unique_ptr<SourceStream>(
        new SourceStream(std::move(file), *text_encoding, std::move(stream), mode));
}

SourceStream::SourceStream(FileRef file, TextEncoding encoding,
                           std::unique_ptr<std::istream> stream, SourceMode mode)
    : file_(std::move(file)), decoder_(encoding), stream_(std::move(stream)), mode_(mode) {}

SourceStream::~SourceStream() = default;

void SourceStream::pause() {
    paused_ = true;
}

void SourceStream::resume() {
    paused_ = false;
}

std::optional<std::string> SourceStream::readChunk(size_t max_bytes) {
    if (!stream_) {
        throw IngestException(IngestError::INVALID_STATE, "Source is closed: " + file_->name());
    }
    if (paused_) {
        throw IngestException(IngestError::INVALID_STATE, "Source is paused: " + file_->name());
    }
    if (ended_) {
        return std::nullopt;
    }
    if (max_bytes == 0) {
        max_bytes = 1;
    }

    std::vector<char> buffer(max_bytes);
    stream_->read(buffer.data(), static_cast<std::streamsize>(max_bytes));
    auto got = static_cast<size_t>(stream_->gcount());

    if (stream_->bad()) {
        throw IngestException(IngestError::FILE_READ_ERROR, "Read failed: " + file_->name());
    }

    if (got == 0) {
        ended_ = true;
        std::string tail = decoder_.finish();
        if (tail.empty()) {
            return std::nullopt;
        }
        ++chunks_read_;
        return tail;
    }

    bytes_read_ += got;
    ++chunks_read_;
    std::string text = decoder_.decode(buffer.data(), got);

    // EN: A short read means end of input: flush the decoder now so the tail is not lost
    // FR: Une lecture courte signifie la fin d'entrée : vide le décodeur pour ne pas perdre la fin
    if (got < max_bytes && stream_->eof()) {
        ended_ = true;
        text += decoder_.finish();
    }
    return text;
}

void SourceStream::close() {
    stream_.reset();
    paused_ = true;
}

} // namespace IO
} // namespace CIP
