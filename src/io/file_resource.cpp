// EN: Local, in-memory and gzip file resources.
// FR: Ressources fichier locales, en mémoire et gzip.

#include "io/file_resource.hpp"
#include "infrastructure/system/ingest_error.hpp"

#include <zlib.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <streambuf>

namespace CIP {
namespace IO {

namespace {

std::string baseName(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

// EN: Read-only stream buffer over a gzFile handle.
// FR: Tampon de flux en lecture seule sur un handle gzFile.
class GzipStreamBuf : public std::streambuf {
public:
    explicit GzipStreamBuf(gzFile handle) : handle_(handle) {
        setg(buffer_, buffer_, buffer_);
    }

    ~GzipStreamBuf() override {
        if (handle_) {
            gzclose(handle_);
        }
    }

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;

protected:
    int_type underflow() override {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }

        int n = gzread(handle_, buffer_, static_cast<unsigned>(sizeof(buffer_)));
        if (n < 0) {
            int errnum = 0;
            const char* message = gzerror(handle_, &errnum);
            // EN: Surface corrupt input as badbit on the owning istream
            // FR: Remonte une entrée corrompue comme badbit sur l'istream propriétaire
            throw IngestException(IngestError::FILE_READ_ERROR,
                                  std::string("gzip read failed: ") + (message ? message : "unknown"));
        }
        if (n == 0) {
            return traits_type::eof();
        }

        setg(buffer_, buffer_, buffer_ + n);
        return traits_type::to_int_type(*gptr());
    }

private:
    gzFile handle_;
    char buffer_[16384];
};

// EN: istream that owns its gzip stream buffer.
// FR: istream propriétaire de son tampon gzip.
class GzipInputStream : public std::istream {
public:
    explicit GzipInputStream(gzFile handle)
        : std::istream(nullptr), buf_(std::make_unique<GzipStreamBuf>(handle)) {
        rdbuf(buf_.get());
        exceptions(std::ios::badbit);
    }

private:
    std::unique_ptr<GzipStreamBuf> buf_;
};

} // namespace

// EN: LocalFile implementation
// FR: Implémentation de LocalFile

LocalFile::LocalFile(std::string path) : path_(std::move(path)), name_(baseName(path_)) {}

std::optional<size_t> LocalFile::size() const {
    std::error_code ec;
    auto file_size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<size_t>(file_size);
}

std::unique_ptr<std::istream> LocalFile::openStream() const {
    auto stream = std::make_unique<std::ifstream>(path_, std::ios::binary);
    if (!stream->is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            throw IngestException(IngestError::FILE_NOT_FOUND, "Cannot open file: " + path_);
        }
        throw IngestException(IngestError::FILE_READ_ERROR, "Cannot read file: " + path_);
    }
    return stream;
}

std::optional<std::string> LocalFile::readAll() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

// EN: MemoryFile implementation
// FR: Implémentation de MemoryFile

MemoryFile::MemoryFile(std::string name, std::string bytes)
    : name_(std::move(name)), bytes_(std::move(bytes)) {}

// EN: GzipFile implementation
// FR: Implémentation de GzipFile

GzipFile::GzipFile(std::string path) : path_(std::move(path)), name_(baseName(path_)) {}

std::unique_ptr<std::istream> GzipFile::openStream() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        throw IngestException(IngestError::FILE_NOT_FOUND, "Cannot open file: " + path_);
    }

    gzFile handle = gzopen(path_.c_str(), "rb");
    if (!handle) {
        throw IngestException(IngestError::FILE_READ_ERROR, "Cannot open gzip file: " + path_);
    }
    return std::make_unique<GzipInputStream>(handle);
}

std::optional<std::string> GzipFile::readAll() const {
    gzFile handle = gzopen(path_.c_str(), "rb");
    if (!handle) {
        return std::nullopt;
    }

    std::string content;
    char buffer[16384];
    int n = 0;
    while ((n = gzread(handle, buffer, static_cast<unsigned>(sizeof(buffer)))) > 0) {
        content.append(buffer, static_cast<size_t>(n));
    }
    gzclose(handle);

    if (n < 0) {
        return std::nullopt;
    }
    return content;
}

FileRef openLocalFile(const std::string& path) {
    return std::make_shared<LocalFile>(path);
}

FileRef makeMemoryFile(const std::string& name, const std::string& bytes) {
    return std::make_shared<MemoryFile>(name, bytes);
}

FileRef openGzipFile(const std::string& path) {
    return std::make_shared<GzipFile>(path);
}

} // namespace IO
} // namespace CIP
