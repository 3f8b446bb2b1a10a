#pragma once

#include <textprobe/encoding.h>

#include <string_view>

namespace textprobe {

/// True unless more than 30% of the code points are control characters
/// (below U+0020, other than tab, LF and CR). Empty text is plausible.
bool is_likely_text(std::u32string_view text);

/// True when a Western single-byte decoding (cp1252, latin-1) looks like
/// multi-byte Asian text read byte by byte: more than half the code points in
/// U+0080..U+024F and fewer than one space per ten code points.
/// Always false for other encodings and for text of 3 code points or fewer.
bool is_likely_misencoded_asian_text(std::u32string_view text, EncodingId encoding);

/// True when an Asian multi-byte decoding looks like it misread bytes from
/// another encoding. Always false for text of 3 code points or fewer.
///
///  - shift_jis only: more than 30% half-width katakana (U+FF61..U+FF9F).
///  - shift_jis, euc-kr, big5, gbk, gb2312: ASCII and CJK ideographs
///    (U+4E00..U+9FFF) both present, at least two ASCII letters, and CJK
///    below half the text.
bool is_likely_misencoded_cross_asian(std::u32string_view text, EncodingId encoding);

} // namespace textprobe
