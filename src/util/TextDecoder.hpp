#pragma once

#include <cstdint>
#include <string>

namespace ctxpack {

/**
 * @brief Result of a best-effort UTF-8 decode
 *
 * text holds well-formed UTF-8; charCount is the number of code points
 * in it (not bytes).
 */
struct DecodedText {
    std::string text;
    uint64_t charCount{0};
};

namespace TextDecoder {

/**
 * @brief Decode raw file bytes as UTF-8, never failing
 *
 * Ill-formed sequences (bad lead bytes, truncated or overlong sequences,
 * surrogates, code points above U+10FFFF) are dropped one maximal subpart
 * at a time. Line endings are translated: "\r\n" and lone "\r" become "\n".
 *
 * @param bytes Raw file content
 * @return Clean text plus its code point count
 */
DecodedText decodeLossy(const std::string& bytes);

}  // namespace TextDecoder

}  // namespace ctxpack
