#include "util/TextDecoder.hpp"

namespace ctxpack {
namespace TextDecoder {

/**
 * @brief Expected sequence length and allowed range of the second byte
 *
 * Follows the well-formed byte sequence table of the Unicode standard
 * (Table 3-7). Returns 0 for bytes that can never start a sequence.
 */
static size_t sequenceLength(unsigned char lead, unsigned char& lo, unsigned char& hi) {
    lo = 0x80;
    hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead == 0xE0) { lo = 0xA0; return 3; }
    if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) return 3;
    if (lead == 0xED) { hi = 0x9F; return 3; }  // excludes surrogates
    if (lead == 0xF0) { lo = 0x90; return 4; }
    if (lead >= 0xF1 && lead <= 0xF3) return 4;
    if (lead == 0xF4) { hi = 0x8F; return 4; }  // caps at U+10FFFF
    return 0;
}

DecodedText decodeLossy(const std::string& bytes) {
    DecodedText out;
    out.text.reserve(bytes.size());
    const size_t n = bytes.size();
    size_t i = 0;
    while (i < n) {
        unsigned char b = static_cast<unsigned char>(bytes[i]);
        if (b < 0x80) {
            if (b == '\r') {
                out.text += '\n';
                i += (i + 1 < n && bytes[i + 1] == '\n') ? 2 : 1;
            } else {
                out.text += static_cast<char>(b);
                ++i;
            }
            ++out.charCount;
            continue;
        }

        unsigned char lo = 0, hi = 0;
        size_t len = sequenceLength(b, lo, hi);
        if (len == 0) {
            ++i;
            continue;
        }

        size_t k = 1;
        for (; k < len && i + k < n; ++k) {
            unsigned char c = static_cast<unsigned char>(bytes[i + k]);
            unsigned char min = (k == 1) ? lo : 0x80;
            unsigned char max = (k == 1) ? hi : 0xBF;
            if (c < min || c > max) break;
        }

        if (k == len) {
            out.text.append(bytes, i, len);
            ++out.charCount;
            i += len;
        } else {
            // Drop the maximal ill-formed subpart and resync on the next byte
            i += k;
        }
    }
    return out;
}

}  // namespace TextDecoder
}  // namespace ctxpack
