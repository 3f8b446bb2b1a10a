#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace textprobe {

enum class EncodingId : uint8_t {
    utf8,
    shift_jis,
    euc_kr,
    big5,
    gbk,
    gb2312,
    cp1251,
    iso_8859_2,
    cp1252,
    latin1,
};

/// Script-mismatch checks applicable to a candidate (bit set).
enum class Check : uint8_t {
    none                   = 0,
    western_misreads_asian = 1 << 0,
    katakana_flood         = 1 << 1,
    ascii_cjk_mix          = 1 << 2,
};

constexpr Check operator|(Check a, Check b) {
    return static_cast<Check>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr bool has_check(Check set, Check c) {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(c)) != 0;
}

/// Static lookup: which mismatch checks run for a given encoding.
constexpr Check applicable_checks(EncodingId id) {
    switch (id) {
        case EncodingId::shift_jis:
            return Check::katakana_flood | Check::ascii_cjk_mix;
        case EncodingId::euc_kr:
        case EncodingId::big5:
        case EncodingId::gbk:
        case EncodingId::gb2312:
            return Check::ascii_cjk_mix;
        case EncodingId::cp1252:
        case EncodingId::latin1:
            return Check::western_misreads_asian;
        default:
            return Check::none;
    }
}

struct ByteRange {
    uint8_t lo;
    uint8_t hi;
};

/// A block of two-byte sequences: every lead in `lead` paired with every
/// trail in `trail`.
struct PairRange {
    ByteRange lead;
    ByteRange trail;
};

/// Which bytes may stand alone, open a two-byte sequence, or follow a lead.
/// `excluded` removes vendor extension blocks that the converter would
/// otherwise assign. A grammar with no single and no lead ranges is
/// unrestricted and leaves validation entirely to the converter (UTF-8).
struct ByteGrammar {
    std::span<const ByteRange> single;
    std::span<const ByteRange> lead;
    std::span<const ByteRange> trail;
    std::span<const PairRange> excluded;

    bool unrestricted() const { return single.empty() && lead.empty(); }
    bool multi_byte() const { return !lead.empty(); }
};

/// Trails `trail_lo..trail_hi` after `lead` decode to consecutive code
/// points starting at `first`, bypassing the converter's table.
struct PairMapping {
    uint8_t  lead;
    uint8_t  trail_lo;
    uint8_t  trail_hi;
    char32_t first;
};

struct EncodingCandidate {
    EncodingId       id;
    std::string_view name;       // canonical name, e.g. "shift_jis"
    std::string_view icu_name;   // converter name handed to ucnv_open
    int              priority;   // 0 is the fast path; the sweep starts at 1
    Check            checks;
    ByteGrammar      grammar;
    std::span<const PairMapping> overrides;
};

/// Ordered candidate list. Pointers into a registry stay valid for as long
/// as the registry's storage does; the default registry is static.
using Registry = std::span<const EncodingCandidate>;

/// UTF-8, attempted before the sweep and exempt from mismatch checks.
const EncodingCandidate& fast_path_candidate();

/// The fixed sweep order. Multi-byte Asian encodings come first, most
/// restrictive to least, then the single-byte encodings, ending with
/// latin-1 which accepts every byte.
///
/// GBK and GB2312 sit after Big5: moving them earlier makes them accept the
/// Korean, Traditional Chinese and Cyrillic buffers the earlier entries get
/// right. The price is that GBK and GB2312 input is itself claimed by
/// EUC-KR or Big5.
Registry default_registry();

/// Looks up a candidate by canonical name or common alias (case-insensitive).
/// Returns nullptr for unknown names.
const EncodingCandidate* find_candidate(std::string_view name);

/// Builds a registry in the given order, renumbering priorities from 1.
/// Throws std::invalid_argument on an unknown or repeated name, or on an
/// empty list.
std::vector<EncodingCandidate> make_registry(const std::vector<std::string>& names);

/// Opens each candidate's converter once. Throws std::runtime_error naming the
/// first candidate whose converter the ICU build does not provide.
void validate_registry(Registry registry);

std::string_view to_string(EncodingId id);

} // namespace textprobe
