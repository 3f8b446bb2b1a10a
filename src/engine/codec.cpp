#include "codec.h"

#include <unicode/ucnv.h>
#include <unicode/utf16.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <cstdint>
#include <memory>

namespace textprobe::detail {

namespace {

struct ConverterDeleter {
    void operator()(UConverter* cnv) const { ucnv_close(cnv); }
};

using Converter = std::unique_ptr<UConverter, ConverterDeleter>;

Converter open_converter(std::string_view icu_name, UErrorCode& err) {
    std::string name(icu_name);
    Converter cnv(ucnv_open(name.c_str(), &err));
    if (U_FAILURE(err)) cnv.reset();
    return cnv;
}

bool in_ranges(std::span<const ByteRange> ranges, uint8_t b) {
    for (const auto& r : ranges) {
        if (b >= r.lo && b <= r.hi) return true;
    }
    return false;
}

bool in_range(const ByteRange& r, uint8_t b) {
    return b >= r.lo && b <= r.hi;
}

bool is_private_use(char32_t c) {
    return c >= 0xE000 && c <= 0xF8FF;
}

// Length of the grammar unit starting at data[i]: 1 for a single byte, 2 for
// a lead/trail pair, 0 if the bytes there are not a valid unit.
std::size_t unit_length(std::span<const std::byte> data, std::size_t i,
                        const ByteGrammar& grammar) {
    auto b = static_cast<uint8_t>(data[i]);
    if (in_ranges(grammar.single, b)) return 1;
    if (!in_ranges(grammar.lead, b) || i + 1 >= data.size()) return 0;

    auto t = static_cast<uint8_t>(data[i + 1]);
    if (!in_ranges(grammar.trail, t)) return 0;
    for (const auto& block : grammar.excluded) {
        if (in_range(block.lead, b) && in_range(block.trail, t)) return 0;
    }
    return 2;
}

std::optional<char32_t> override_for(std::span<const PairMapping> overrides,
                                     uint8_t lead, uint8_t trail) {
    for (const auto& m : overrides) {
        if (m.lead == lead && trail >= m.trail_lo && trail <= m.trail_hi)
            return static_cast<char32_t>(m.first + (trail - m.trail_lo));
    }
    return std::nullopt;
}

// Converts with the STOP callback so an illegal, unassigned or truncated
// sequence ends the conversion with a failure code instead of a substitute.
// The input is fed `chunk` bytes per call; ICU carries a sequence split
// across calls and only the last call flushes.
std::optional<std::u16string> to_utf16(UConverter* cnv, std::span<const std::byte> data,
                                       std::size_t chunk) {
    UErrorCode err = U_ZERO_ERROR;
    ucnv_resetToUnicode(cnv);
    ucnv_setToUCallBack(cnv, UCNV_TO_U_CALLBACK_STOP, nullptr, nullptr, nullptr, &err);
    if (U_FAILURE(err)) return std::nullopt;

    std::u16string out;
    std::size_t written = 0;
    std::size_t offset = 0;
    do {
        const std::size_t len = std::min(chunk, data.size() - offset);
        const bool last = offset + len == data.size();
        const char* source       = reinterpret_cast<const char*>(data.data()) + offset;
        const char* source_limit = source + len;

        // At most one UTF-16 unit per input byte for every candidate, plus
        // whatever a sequence left over from the previous chunk produces.
        out.resize(written + len + 16);
        for (;;) {
            UChar* target = out.data() + written;
            ucnv_toUnicode(cnv, &target, out.data() + out.size(), &source, source_limit,
                           nullptr, last, &err);
            written = static_cast<std::size_t>(target - out.data());
            if (err != U_BUFFER_OVERFLOW_ERROR) break;
            out.resize(out.size() + len + 16);
            err = U_ZERO_ERROR;
        }
        if (U_FAILURE(err)) return std::nullopt;
        offset += len;
    } while (offset < data.size());

    out.resize(written);
    return out;
}

void append_code_points(const std::u16string& utf16, std::u32string& out) {
    std::size_t i = 0;
    const std::size_t n = utf16.size();
    while (i < n) {
        UChar32 c;
        U16_NEXT(utf16.data(), i, n, c);
        out.push_back(static_cast<char32_t>(c));
    }
}

} // namespace

bool matches_grammar(std::span<const std::byte> data, const ByteGrammar& grammar) {
    if (grammar.unrestricted()) return true;

    std::size_t i = 0;
    while (i < data.size()) {
        std::size_t len = unit_length(data, i, grammar);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

std::optional<std::u32string> decode(std::span<const std::byte> data,
                                     const EncodingCandidate& candidate,
                                     std::size_t chunk) {
    const ByteGrammar& grammar = candidate.grammar;
    if (!matches_grammar(data, grammar)) return std::nullopt;
    if (chunk == 0) chunk = kConversionChunk;

    UErrorCode err = U_ZERO_ERROR;
    Converter cnv = open_converter(candidate.icu_name, err);
    if (!cnv) return std::nullopt;

    std::u32string out;
    out.reserve(data.size());

    if (grammar.unrestricted()) {
        auto utf16 = to_utf16(cnv.get(), data, chunk);
        if (!utf16) return std::nullopt;
        append_code_points(*utf16, out);
        return out;
    }

    // [run, i) holds units still waiting for the converter.
    std::size_t run = 0;
    std::size_t i = 0;
    auto convert_run = [&]() {
        if (run == i) return true;
        auto utf16 = to_utf16(cnv.get(), data.subspan(run, i - run), chunk);
        if (!utf16) return false;
        const std::size_t from = out.size();
        append_code_points(*utf16, out);
        if (grammar.multi_byte() &&
            std::any_of(out.begin() + static_cast<std::ptrdiff_t>(from), out.end(),
                        is_private_use)) {
            return false;
        }
        return true;
    };

    while (i < data.size()) {
        auto b = static_cast<uint8_t>(data[i]);
        std::size_t len = unit_length(data, i, grammar);

        if (len == 1 && b < 0x80) {
            if (!convert_run()) return std::nullopt;
            out.push_back(static_cast<char32_t>(b));
            run = ++i;
            continue;
        }
        if (len == 2) {
            auto mapped = override_for(candidate.overrides, b, static_cast<uint8_t>(data[i + 1]));
            if (mapped) {
                if (!convert_run()) return std::nullopt;
                out.push_back(*mapped);
                i += 2;
                run = i;
                continue;
            }
        }
        i += len;
    }
    if (!convert_run()) return std::nullopt;
    return out;
}

std::string to_utf8(std::u32string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t c : text) {
        uint8_t buf[U8_MAX_LENGTH];
        int32_t len = 0;
        U8_APPEND_UNSAFE(buf, len, static_cast<UChar32>(c));
        out.append(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(len));
    }
    return out;
}

bool converter_available(std::string_view icu_name) {
    UErrorCode err = U_ZERO_ERROR;
    return open_converter(icu_name, err) != nullptr;
}

} // namespace textprobe::detail
