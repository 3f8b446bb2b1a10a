#include <textprobe/heuristics.h>

#include <algorithm>
#include <cstddef>

namespace textprobe {

namespace {

// Texts this short carry too little signal for the ratio checks.
constexpr std::size_t kMinSampleLength = 3;

constexpr double kMaxControlRatio       = 0.3;
constexpr double kMinHighLatinRatio     = 0.5;
constexpr double kMinSpaceRatio         = 0.1;
constexpr double kMaxHalfwidthKanaRatio = 0.3;
constexpr double kMinCjkRatio           = 0.5;

bool is_control(char32_t c) {
    return c < 0x20 && c != U'\t' && c != U'\n' && c != U'\r';
}

bool is_high_latin(char32_t c) {
    // Latin-1 Supplement through Latin Extended-B.
    return c >= 0x0080 && c <= 0x024F;
}

bool is_halfwidth_katakana(char32_t c) {
    return c >= 0xFF61 && c <= 0xFF9F;
}

bool is_cjk_ideograph(char32_t c) {
    return c >= 0x4E00 && c <= 0x9FFF;
}

bool is_ascii_letter(char32_t c) {
    return (c >= U'A' && c <= U'Z') || (c >= U'a' && c <= U'z');
}

template <typename Pred>
std::size_t count_matching(std::u32string_view text, Pred pred) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), pred));
}

double ratio(std::size_t part, std::size_t whole) {
    return static_cast<double>(part) / static_cast<double>(whole);
}

} // namespace

bool is_likely_text(std::u32string_view text) {
    if (text.empty()) return true;
    return ratio(count_matching(text, is_control), text.size()) <= kMaxControlRatio;
}

bool is_likely_misencoded_asian_text(std::u32string_view text, EncodingId encoding) {
    if (!has_check(applicable_checks(encoding), Check::western_misreads_asian) ||
        text.size() <= kMinSampleLength) {
        return false;
    }

    std::size_t high_latin = count_matching(text, is_high_latin);
    std::size_t spaces     = count_matching(text, [](char32_t c) { return c == U' '; });

    return ratio(high_latin, text.size()) > kMinHighLatinRatio &&
           static_cast<double>(spaces) < static_cast<double>(text.size()) * kMinSpaceRatio;
}

bool is_likely_misencoded_cross_asian(std::u32string_view text, EncodingId encoding) {
    if (text.size() <= kMinSampleLength) return false;

    const Check checks = applicable_checks(encoding);

    // Another Asian encoding's double bytes land on the single-byte kana
    // block; genuine Japanese text is mostly full-width.
    if (has_check(checks, Check::katakana_flood)) {
        if (ratio(count_matching(text, is_halfwidth_katakana), text.size()) > kMaxHalfwidthKanaRatio)
            return true;
    }

    // Western text read as CJK keeps its ASCII words with the accented bytes
    // fused into scattered ideographs.
    if (has_check(checks, Check::ascii_cjk_mix)) {
        std::size_t ascii = count_matching(text, [](char32_t c) { return c < 0x80; });
        std::size_t cjk   = count_matching(text, is_cjk_ideograph);
        if (ascii > 0 && cjk > 0) {
            std::size_t letters = count_matching(text, is_ascii_letter);
            if (letters >= 2 && ratio(cjk, text.size()) < kMinCjkRatio)
                return true;
        }
    }

    return false;
}

} // namespace textprobe
