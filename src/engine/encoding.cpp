#include <textprobe/encoding.h>

#include "codec.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace textprobe {

namespace {

// ---------------------------------------------------------------------------
// Byte grammars
// ---------------------------------------------------------------------------

constexpr ByteRange kAscii[] = {{0x00, 0x7F}};

constexpr ByteRange kSjisSingle[] = {{0x00, 0x7F}, {0xA1, 0xDF}};
constexpr ByteRange kSjisLead[]   = {{0x81, 0x9F}, {0xE0, 0xEA}};
constexpr ByteRange kSjisTrail[]  = {{0x40, 0x7E}, {0x80, 0xFC}};

// EUC-KR and GB2312 share the EUC row/cell layout.
constexpr ByteRange kEucKrLead[]  = {{0xA1, 0xFE}};
constexpr ByteRange kEucCnLead[]  = {{0xA1, 0xF7}};
constexpr ByteRange kEucTrail[]   = {{0xA1, 0xFE}};

constexpr ByteRange kBig5Lead[]   = {{0xA1, 0xF9}};
constexpr ByteRange kBig5Trail[]  = {{0x40, 0x7E}, {0xA1, 0xFE}};

constexpr ByteRange kGbkLead[]    = {{0x81, 0xFE}};
constexpr ByteRange kGbkTrail[]   = {{0x40, 0x7E}, {0x80, 0xFE}};

// Windows code pages leave a few C1 positions unassigned.
constexpr ByteRange kCp1251Single[] = {{0x00, 0x97}, {0x99, 0xFF}};
constexpr ByteRange kCp1252Single[] = {
    {0x00, 0x80}, {0x82, 0x8C}, {0x8E, 0x8E}, {0x91, 0x9C}, {0x9E, 0xFF},
};

constexpr ByteRange kAnyByte[] = {{0x00, 0xFF}};

// ---------------------------------------------------------------------------
// Vendor extension blocks
//
// ICU's tables for these code pages are the vendor ones (IBM, Microsoft)
// and assign rows the national standards leave empty. Blocks that decode to
// private-use code points are caught after conversion; these decode to
// ordinary characters and have to be cut from the grammar.
// ---------------------------------------------------------------------------

// JIS X 0208 rows 9-15: NEC special characters live in row 13.
constexpr PairRange kSjisExcluded[] = {
    {{0x85, 0x87}, {0x40, 0xFC}},
    {{0x88, 0x88}, {0x40, 0x9E}},
};

// Hangul filler and the two IBM user-defined rows.
constexpr PairRange kEucKrExcluded[] = {
    {{0xA4, 0xA4}, {0xD4, 0xD4}},
    {{0xC9, 0xC9}, {0xA1, 0xFE}},
    {{0xFE, 0xFE}, {0xA1, 0xFE}},
};

// Microsoft euro sign, the tail of the ETEN kana block and ETEN box drawing.
constexpr PairRange kBig5Excluded[] = {
    {{0xA3, 0xA3}, {0xE1, 0xE1}},
    {{0xC7, 0xC7}, {0xFD, 0xFE}},
    {{0xC8, 0xC8}, {0x40, 0xFE}},
    {{0xF9, 0xF9}, {0xD6, 0xFE}},
};

// GBK user-defined areas.
constexpr PairRange kGbkExcluded[] = {
    {{0xA1, 0xA7}, {0x40, 0xA0}},
    {{0xAA, 0xAF}, {0xA1, 0xFE}},
    {{0xF8, 0xFE}, {0xA1, 0xFE}},
};

constexpr PairRange kGb2312Excluded[] = {
    {{0xAA, 0xAF}, {0xA1, 0xFE}},
};

// ---------------------------------------------------------------------------
// Table overrides
//
// Pairs both tables assign, but to different characters. The vendor tables
// prefer fullwidth forms and private-use slots where the national standards
// name a plain character.
// ---------------------------------------------------------------------------

constexpr PairMapping kSjisOverrides[] = {
    {0x81, 0x60, 0x60, 0x301C},   // wave dash
    {0x81, 0x61, 0x61, 0x2016},   // double vertical line
    {0x81, 0x7C, 0x7C, 0x2212},   // minus sign
    {0x81, 0x91, 0x92, 0x00A2},   // cent, pound
    {0x81, 0xCA, 0xCA, 0x00AC},   // not sign
};

// KS X 1001:1998 additions missing from ibm-970.
constexpr PairMapping kEucKrOverrides[] = {
    {0xA2, 0xE6, 0xE6, 0x20AC},
    {0xA2, 0xE7, 0xE7, 0x00AE},
};

constexpr PairMapping kBig5Overrides[] = {
    {0xA1, 0x45, 0x45, 0x2022},
    {0xA1, 0x4E, 0x4E, 0xFF64},
    {0xA1, 0xC2, 0xC2, 0x203E},
    {0xA1, 0xE3, 0xE3, 0x223C},
    {0xA1, 0xF2, 0xF2, 0x2641},
    {0xA1, 0xF3, 0xF3, 0x2609},
    {0xA2, 0x41, 0x41, 0xFF0F},
    {0xA2, 0x42, 0x42, 0xFF3C},
    {0xA2, 0x44, 0x44, 0x00A5},
    {0xA2, 0x46, 0x47, 0x00A2},
    // ETEN kana and Cyrillic, private use in windows-950.
    {0xC6, 0xA1, 0xA1, 0x30FE},
    {0xC6, 0xA2, 0xA3, 0x309D},
    {0xC6, 0xA4, 0xA4, 0x3005},
    {0xC6, 0xA5, 0xF7, 0x3041},
    {0xC6, 0xF8, 0xFE, 0x30A1},
    {0xC7, 0x40, 0x7E, 0x30A8},
    {0xC7, 0xA1, 0xB0, 0x30E7},
    {0xC7, 0xB1, 0xB2, 0x0414},
    {0xC7, 0xB3, 0xB3, 0x0401},
    {0xC7, 0xB4, 0xBA, 0x0416},
    {0xC7, 0xBB, 0xCD, 0x0423},
    {0xC7, 0xCE, 0xCE, 0x0451},
    {0xC7, 0xCF, 0xE8, 0x0436},
    {0xC7, 0xE9, 0xF2, 0x2460},
    {0xC7, 0xF3, 0xFC, 0x2474},
};

constexpr PairMapping kGb2312Overrides[] = {
    {0xA3, 0xA7, 0xA7, 0xFF07},   // fullwidth apostrophe
};

constexpr ByteGrammar kUnrestricted{};

constexpr ByteGrammar single_byte(std::span<const ByteRange> single) {
    return {single, {}, {}, {}};
}

constexpr ByteGrammar double_byte(std::span<const ByteRange> single,
                                  std::span<const ByteRange> lead,
                                  std::span<const ByteRange> trail,
                                  std::span<const PairRange> excluded) {
    return {single, lead, trail, excluded};
}

constexpr EncodingCandidate kUtf8{
    EncodingId::utf8, "utf-8", "UTF-8", 0,
    applicable_checks(EncodingId::utf8), kUnrestricted, {},
};

constexpr std::array<EncodingCandidate, 9> kDefaultRegistry{{
    {EncodingId::shift_jis, "shift_jis", "Shift_JIS", 1,
     applicable_checks(EncodingId::shift_jis),
     double_byte(kSjisSingle, kSjisLead, kSjisTrail, kSjisExcluded),
     kSjisOverrides},
    {EncodingId::euc_kr, "euc-kr", "EUC-KR", 2,
     applicable_checks(EncodingId::euc_kr),
     double_byte(kAscii, kEucKrLead, kEucTrail, kEucKrExcluded),
     kEucKrOverrides},
    {EncodingId::big5, "big5", "Big5", 3,
     applicable_checks(EncodingId::big5),
     double_byte(kAscii, kBig5Lead, kBig5Trail, kBig5Excluded),
     kBig5Overrides},
    {EncodingId::gbk, "gbk", "GBK", 4,
     applicable_checks(EncodingId::gbk),
     double_byte(kAscii, kGbkLead, kGbkTrail, kGbkExcluded), {}},
    {EncodingId::gb2312, "gb2312", "GB2312", 5,
     applicable_checks(EncodingId::gb2312),
     double_byte(kAscii, kEucCnLead, kEucTrail, kGb2312Excluded),
     kGb2312Overrides},
    {EncodingId::cp1251, "cp1251", "windows-1251", 6,
     applicable_checks(EncodingId::cp1251),
     single_byte(kCp1251Single), {}},
    {EncodingId::iso_8859_2, "iso-8859-2", "ISO-8859-2", 7,
     applicable_checks(EncodingId::iso_8859_2),
     single_byte(kAnyByte), {}},
    {EncodingId::cp1252, "cp1252", "windows-1252", 8,
     applicable_checks(EncodingId::cp1252),
     single_byte(kCp1252Single), {}},
    {EncodingId::latin1, "latin-1", "ISO-8859-1", 9,
     applicable_checks(EncodingId::latin1),
     single_byte(kAnyByte), {}},
}};

struct Alias {
    std::string_view alias;
    EncodingId       id;
};

constexpr Alias kAliases[] = {
    {"utf8",         EncodingId::utf8},
    {"sjis",         EncodingId::shift_jis},
    {"shift-jis",    EncodingId::shift_jis},
    {"euckr",        EncodingId::euc_kr},
    {"big-5",        EncodingId::big5},
    {"cp936",        EncodingId::gbk},
    {"euc-cn",       EncodingId::gb2312},
    {"windows-1251", EncodingId::cp1251},
    {"latin2",       EncodingId::iso_8859_2},
    {"windows-1252", EncodingId::cp1252},
    {"latin1",       EncodingId::latin1},
    {"iso-8859-1",   EncodingId::latin1},
};

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const EncodingCandidate* by_id(EncodingId id) {
    if (id == EncodingId::utf8) return &kUtf8;
    for (const auto& c : kDefaultRegistry) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

} // namespace

const EncodingCandidate& fast_path_candidate() {
    return kUtf8;
}

Registry default_registry() {
    return kDefaultRegistry;
}

const EncodingCandidate* find_candidate(std::string_view name) {
    std::string key = lowercase(name);
    if (key == kUtf8.name) return &kUtf8;
    for (const auto& c : kDefaultRegistry) {
        if (key == c.name) return &c;
    }
    for (const auto& a : kAliases) {
        if (key == a.alias) return by_id(a.id);
    }
    return nullptr;
}

std::vector<EncodingCandidate> make_registry(const std::vector<std::string>& names) {
    if (names.empty()) {
        throw std::invalid_argument("encoding order is empty");
    }

    std::vector<EncodingCandidate> registry;
    registry.reserve(names.size());
    for (const auto& name : names) {
        const EncodingCandidate* found = find_candidate(name);
        if (!found) {
            throw std::invalid_argument("unknown encoding: " + name);
        }
        bool repeated = std::any_of(registry.begin(), registry.end(),
                                    [&](const EncodingCandidate& c) { return c.id == found->id; });
        if (repeated) {
            throw std::invalid_argument("encoding listed twice: " + name);
        }
        EncodingCandidate entry = *found;
        entry.priority = static_cast<int>(registry.size()) + 1;
        registry.push_back(entry);
    }
    return registry;
}

void validate_registry(Registry registry) {
    if (!detail::converter_available(fast_path_candidate().icu_name)) {
        throw std::runtime_error("no ICU converter for fast-path encoding utf-8");
    }
    for (const auto& c : registry) {
        if (!detail::converter_available(c.icu_name)) {
            throw std::runtime_error("no ICU converter for encoding " +
                                     std::string(c.name) + " (" +
                                     std::string(c.icu_name) + ")");
        }
    }
}

std::string_view to_string(EncodingId id) {
    const EncodingCandidate* c = by_id(id);
    return c ? c->name : std::string_view("unknown");
}

} // namespace textprobe
