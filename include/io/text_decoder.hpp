// EN: Incremental byte-to-UTF-8 decoder that never splits a code point across chunks.
// FR: Décodeur incrémental octets vers UTF-8 qui ne coupe jamais un point de code entre chunks.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace CIP {
namespace IO {

// EN: Text encodings accepted by the source adapter
// FR: Encodages de texte acceptés par l'adaptateur de source
enum class TextEncoding {
    UTF8,          // EN: UTF-8 (default) / FR: UTF-8 (par défaut)
    UTF16,         // EN: UTF-16, byte order from the BOM, little endian without one / FR: UTF-16, ordre des octets selon le BOM, little endian sans BOM
    UTF16_LE,      // EN: UTF-16 Little Endian / FR: UTF-16 Little Endian
    UTF16_BE,      // EN: UTF-16 Big Endian / FR: UTF-16 Big Endian
    LATIN1,        // EN: ISO-8859-1 / FR: ISO-8859-1
    WINDOWS_1252,  // EN: Windows-1252 / FR: Windows-1252
    ASCII          // EN: 7-bit US-ASCII, bytes >= 0x80 become U+FFFD / FR: US-ASCII 7 bits, octets >= 0x80 en U+FFFD
};

// EN: Resolve a case-insensitive encoding label ("utf-8", "utf16le", "latin1", ...).
//     "utf-16" and "ucs-2" map to UTF16 (BOM-sniffed); "ascii" maps to strict ASCII.
// FR: Résout un libellé d'encodage insensible à la casse ("utf-8", "utf16le", "latin1", ...).
//     "utf-16" et "ucs-2" donnent UTF16 (BOM détecté) ; "ascii" donne l'ASCII strict.
std::optional<TextEncoding> parseEncodingName(const std::string& label);

const char* encodingName(TextEncoding encoding);

// EN: Stateful decoder; feed chunks with decode(), then call finish() once at end of input.
// FR: Décodeur à état ; alimenter avec decode(), puis appeler finish() une fois en fin d'entrée.
class TextDecoder {
public:
    explicit TextDecoder(TextEncoding encoding = TextEncoding::UTF8);

    // EN: Decode a chunk; bytes of an incomplete trailing sequence are kept for the next call.
    // FR: Décode un chunk ; les octets d'une séquence finale incomplète sont gardés pour l'appel suivant.
    std::string decode(const char* data, size_t size);
    std::string decode(const std::string& bytes) { return decode(bytes.data(), bytes.size()); }

    // EN: Flush pending bytes; a truncated sequence becomes U+FFFD.
    // FR: Vide les octets en attente ; une séquence tronquée devient U+FFFD.
    std::string finish();

    TextEncoding encoding() const { return encoding_; }
    // EN: Byte order in use; for UTF16 only known once two bytes were seen
    // FR: Ordre des octets utilisé ; pour UTF16 connu seulement après deux octets
    bool bigEndian() const { return big_endian_; }
    size_t pendingBytes() const { return pending_.size(); }
    size_t replacementCount() const { return replacements_; }

    static void appendUtf8(std::string& out, uint32_t code_point);

private:
    std::string decodeUtf8(const std::string& input);
    std::string decodeUtf16(const std::string& input);
    std::string decodeSingleByte(const std::string& input);

    TextEncoding encoding_;
    bool big_endian_{false};
    bool byte_order_known_{false};
    std::string pending_;
    std::optional<uint16_t> pending_high_surrogate_;
    size_t replacements_{0};
};

} // namespace IO
} // namespace CIP
