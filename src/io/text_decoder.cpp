// EN: Incremental text decoding for UTF-8, UTF-16 and single-byte encodings.
// FR: Décodage de texte incrémental pour UTF-8, UTF-16 et les encodages mono-octet.

#include "io/text_decoder.hpp"

#include <algorithm>
#include <cctype>

namespace CIP {
namespace IO {

namespace {

constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

// EN: Windows-1252 code points for bytes 0x80..0x9F (undefined bytes map to themselves)
// FR: Points de code Windows-1252 pour les octets 0x80..0x9F (octets non définis vers eux-mêmes)
constexpr uint16_t WINDOWS_1252_HIGH[32] = {
    0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F,
    0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178
};

} // namespace

std::optional<TextEncoding> parseEncodingName(const std::string& label) {
    std::string name;
    for (char c : label) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    if (name.empty() || name == "utf-8" || name == "utf8" || name == "unicode-1-1-utf-8") {
        return TextEncoding::UTF8;
    }
    if (name == "utf-16" || name == "utf16" || name == "ucs-2") {
        return TextEncoding::UTF16;
    }
    if (name == "utf-16le" || name == "utf16le") {
        return TextEncoding::UTF16_LE;
    }
    if (name == "utf-16be" || name == "utf16be") {
        return TextEncoding::UTF16_BE;
    }
    if (name == "latin1" || name == "latin-1" || name == "iso-8859-1" || name == "iso8859-1" || name == "l1") {
        return TextEncoding::LATIN1;
    }
    if (name == "windows-1252" || name == "cp1252") {
        return TextEncoding::WINDOWS_1252;
    }
    if (name == "ascii" || name == "us-ascii") {
        return TextEncoding::ASCII;
    }
    return std::nullopt;
}

const char* encodingName(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::UTF8:         return "utf-8";
        case TextEncoding::UTF16:        return "utf-16";
        case TextEncoding::UTF16_LE:     return "utf-16le";
        case TextEncoding::UTF16_BE:     return "utf-16be";
        case TextEncoding::LATIN1:       return "iso-8859-1";
        case TextEncoding::WINDOWS_1252: return "windows-1252";
        case TextEncoding::ASCII:        return "us-ascii";
    }
    return "unknown";
}

TextDecoder::TextDecoder(TextEncoding encoding)
    : encoding_(encoding),
      big_endian_(encoding == TextEncoding::UTF16_BE),
      byte_order_known_(encoding != TextEncoding::UTF16) {}

void TextDecoder::appendUtf8(std::string& out, uint32_t code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

std::string TextDecoder::decode(const char* data, size_t size) {
    std::string input;
    input.reserve(pending_.size() + size);
    input.append(pending_);
    input.append(data, size);
    pending_.clear();

    switch (encoding_) {
        case TextEncoding::UTF8:
            return decodeUtf8(input);
        case TextEncoding::UTF16:
        case TextEncoding::UTF16_LE:
        case TextEncoding::UTF16_BE:
            return decodeUtf16(input);
        case TextEncoding::LATIN1:
        case TextEncoding::WINDOWS_1252:
        case TextEncoding::ASCII:
            return decodeSingleByte(input);
    }
    return std::string();
}

std::string TextDecoder::finish() {
    std::string out;
    if (!pending_.empty() || pending_high_surrogate_) {
        appendUtf8(out, REPLACEMENT_CHARACTER);
        ++replacements_;
    }
    pending_.clear();
    pending_high_surrogate_.reset();
    return out;
}

// EN: Validate UTF-8 and copy well-formed sequences through; ill-formed subparts become U+FFFD.
// FR: Valide l'UTF-8 et recopie les séquences bien formées ; les sous-parties mal formées deviennent U+FFFD.
std::string TextDecoder::decodeUtf8(const std::string& input) {
    std::string out;
    out.reserve(input.size());

    const size_t n = input.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        size_t length = 0;
        unsigned char lower = 0x80;
        unsigned char upper = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            length = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            length = 3;
            if (c == 0xE0) lower = 0xA0;
            if (c == 0xED) upper = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            length = 4;
            if (c == 0xF0) lower = 0x90;
            if (c == 0xF4) upper = 0x8F;
        } else {
            appendUtf8(out, REPLACEMENT_CHARACTER);
            ++replacements_;
            ++i;
            continue;
        }

        size_t j = 1;
        bool ill_formed = false;
        for (; j < length && i + j < n; ++j) {
            unsigned char cc = static_cast<unsigned char>(input[i + j]);
            unsigned char lo = (j == 1) ? lower : 0x80;
            unsigned char hi = (j == 1) ? upper : 0xBF;
            if (cc < lo || cc > hi) {
                ill_formed = true;
                break;
            }
        }

        if (ill_formed) {
            appendUtf8(out, REPLACEMENT_CHARACTER);
            ++replacements_;
            i += j;
            continue;
        }

        if (j < length) {
            // EN: Sequence continues in the next chunk
            // FR: La séquence continue dans le chunk suivant
            pending_ = input.substr(i);
            break;
        }

        out.append(input, i, length);
        i += length;
    }

    return out;
}

std::string TextDecoder::decodeUtf16(const std::string& input) {
    std::string out;
    out.reserve(input.size());

    const size_t n = input.size();
    if (!byte_order_known_) {
        if (n < 2) {
            pending_ = input;
            return out;
        }
        // EN: FE FF marks big endian; FF FE or no mark means little endian. The BOM itself is kept.
        // FR: FE FF indique le big endian ; FF FE ou aucune marque donne le little endian. Le BOM est conservé.
        big_endian_ = static_cast<unsigned char>(input[0]) == 0xFE && static_cast<unsigned char>(input[1]) == 0xFF;
        byte_order_known_ = true;
    }
    const bool little_endian = !big_endian_;
    size_t i = 0;
    while (i + 1 < n) {
        auto b0 = static_cast<uint16_t>(static_cast<unsigned char>(input[i]));
        auto b1 = static_cast<uint16_t>(static_cast<unsigned char>(input[i + 1]));
        uint16_t unit = little_endian ? static_cast<uint16_t>(b0 | (b1 << 8))
                                      : static_cast<uint16_t>((b0 << 8) | b1);
        i += 2;

        if (pending_high_surrogate_) {
            uint16_t high = *pending_high_surrogate_;
            pending_high_surrogate_.reset();
            if (unit >= 0xDC00 && unit <= 0xDFFF) {
                uint32_t code_point = 0x10000 + ((static_cast<uint32_t>(high) - 0xD800) << 10) +
                                      (static_cast<uint32_t>(unit) - 0xDC00);
                appendUtf8(out, code_point);
                continue;
            }
            appendUtf8(out, REPLACEMENT_CHARACTER);
            ++replacements_;
        }

        if (unit >= 0xD800 && unit <= 0xDBFF) {
            pending_high_surrogate_ = unit;
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            appendUtf8(out, REPLACEMENT_CHARACTER);
            ++replacements_;
        } else {
            appendUtf8(out, unit);
        }
    }

    if (i < n) {
        pending_ = input.substr(i);
    }
    return out;
}

std::string TextDecoder::decodeSingleByte(const std::string& input) {
    std::string out;
    out.reserve(input.size() * 2);

    for (char ch : input) {
        auto byte = static_cast<unsigned char>(ch);
        uint32_t code_point = byte;
        if (encoding_ == TextEncoding::WINDOWS_1252 && byte >= 0x80 && byte <= 0x9F) {
            code_point = WINDOWS_1252_HIGH[byte - 0x80];
        } else if (encoding_ == TextEncoding::ASCII && byte >= 0x80) {
            code_point = REPLACEMENT_CHARACTER;
            ++replacements_;
        }
        appendUtf8(out, code_point);
    }
    return out;
}

} // namespace IO
} // namespace CIP
