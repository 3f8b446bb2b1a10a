#pragma once

#include <textprobe/encoding.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace textprobe::detail {

// Largest slice handed to a single ucnv_toUnicode call. ICU refuses
// source or target spans beyond INT32_MAX.
inline constexpr std::size_t kConversionChunk = std::size_t{1} << 20;

// True if `data` is a complete, well-formed sequence under `grammar`.
// An unrestricted grammar matches everything.
bool matches_grammar(std::span<const std::byte> data, const ByteGrammar& grammar);

// Decode the whole buffer under `candidate`. Returns nullopt if the buffer
// breaks the candidate's byte grammar, contains an unmapped or truncated
// sequence, or the converter cannot be opened.
//
// Bytes below 0x80 outside a two-byte sequence decode to themselves; some
// vendor tables move control characters around. Pairs listed in the
// candidate's overrides decode from that list. Everything else goes through
// ICU `chunk` bytes at a time, and a multi-byte candidate that yields a
// private-use code point fails.
std::optional<std::u32string> decode(std::span<const std::byte> data,
                                     const EncodingCandidate& candidate,
                                     std::size_t chunk = kConversionChunk);

std::string to_utf8(std::u32string_view text);

// True if ICU can open a converter under this name.
bool converter_available(std::string_view icu_name);

} // namespace textprobe::detail
