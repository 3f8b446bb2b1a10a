#pragma once

#include <textprobe/encoding.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace textprobe {

enum class Verdict : uint8_t {
    accepted,
    rejected_corrupt,          // too many control characters
    rejected_script_mismatch,  // a mismatch heuristic flagged the decoding
    decode_error,              // invalid bytes, or converter unavailable
};

struct Attempt {
    const EncodingCandidate* candidate;
    Verdict                  verdict;
};

struct DecodeResult {
    /// UTF-8 text of the first accepted candidate; nullopt means binary.
    std::optional<std::string> text;
    const EncodingCandidate*   encoding = nullptr;

    bool is_binary() const { return !text.has_value(); }
};

/// Decodes `data` with the UTF-8 fast path followed by the default registry.
/// Never throws for undecodable input; the binary case is an empty `text`.
/// When `trace` is non-null, one Attempt per tried candidate is appended.
DecodeResult decode_with_fallback(std::span<const std::byte> data,
                                  std::vector<Attempt>* trace = nullptr);

/// Same, sweeping `registry` instead of the default order. A UTF-8 entry in
/// `registry` is skipped since the fast path already tried it.
DecodeResult decode_with_fallback(std::span<const std::byte> data,
                                  Registry registry,
                                  std::vector<Attempt>* trace = nullptr);

std::string_view to_string(Verdict verdict);

} // namespace textprobe
