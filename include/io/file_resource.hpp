// EN: File-like byte resources handed to preview and streaming runs.
// FR: Ressources d'octets de type fichier passées aux exécutions d'aperçu et de streaming.

#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace CIP {
namespace IO {

// EN: A readable byte resource. Implementations expose native streaming, read-to-completion, or both.
// FR: Ressource d'octets lisible. Les implémentations exposent le streaming natif, la lecture complète, ou les deux.
class FileResource {
public:
    virtual ~FileResource() = default;

    // EN: Display name (file name or caller-chosen label)
    // FR: Nom d'affichage (nom de fichier ou libellé choisi par l'appelant)
    virtual const std::string& name() const = 0;

    // EN: Size in bytes if known up front
    // FR: Taille en octets si connue à l'avance
    virtual std::optional<size_t> size() const = 0;

    // EN: Open a native byte stream; nullptr when the resource cannot stream.
    // FR: Ouvre un flux d'octets natif ; nullptr si la ressource ne peut pas streamer.
    virtual std::unique_ptr<std::istream> openStream() const = 0;

    // EN: Read the whole resource; nullopt when the resource cannot be materialized.
    // FR: Lit toute la ressource ; nullopt si la ressource ne peut pas être matérialisée.
    virtual std::optional<std::string> readAll() const = 0;
};

using FileRef = std::shared_ptr<const FileResource>;

// EN: File on the local filesystem, streamed through std::ifstream.
// FR: Fichier du système de fichiers local, streamé via std::ifstream.
class LocalFile : public FileResource {
public:
    explicit LocalFile(std::string path);

    const std::string& name() const override { return name_; }
    const std::string& path() const { return path_; }
    std::optional<size_t> size() const override;
    std::unique_ptr<std::istream> openStream() const override;
    std::optional<std::string> readAll() const override;

private:
    std::string path_;
    std::string name_;
};

// EN: In-memory blob without native streaming; readers fall back to read-to-completion.
// FR: Blob en mémoire sans streaming natif ; les lecteurs utilisent la lecture complète.
class MemoryFile : public FileResource {
public:
    MemoryFile(std::string name, std::string bytes);

    const std::string& name() const override { return name_; }
    std::optional<size_t> size() const override { return bytes_.size(); }
    std::unique_ptr<std::istream> openStream() const override { return nullptr; }
    std::optional<std::string> readAll() const override { return bytes_; }

private:
    std::string name_;
    std::string bytes_;
};

// EN: gzip-compressed file decompressed on the fly with zlib.
// FR: Fichier compressé gzip décompressé à la volée avec zlib.
class GzipFile : public FileResource {
public:
    explicit GzipFile(std::string path);

    const std::string& name() const override { return name_; }
    const std::string& path() const { return path_; }
    // EN: Uncompressed size is unknown until the stream is drained
    // FR: La taille décompressée est inconnue avant la fin du flux
    std::optional<size_t> size() const override { return std::nullopt; }
    std::unique_ptr<std::istream> openStream() const override;
    std::optional<std::string> readAll() const override;

private:
    std::string path_;
    std::string name_;
};

// EN: Convenience factories returning shared references.
// FR: Fabriques pratiques retournant des références partagées.
FileRef openLocalFile(const std::string& path);
FileRef makeMemoryFile(const std::string& name, const std::string& bytes);
FileRef openGzipFile(const std::string& path);

} // namespace IO
} // namespace CIP
