#include <textprobe/decoder.h>
#include <textprobe/heuristics.h>

#include "codec.h"

namespace textprobe {

namespace {

Verdict screen(const std::u32string& text, const EncodingCandidate& candidate) {
    if (!is_likely_text(text))
        return Verdict::rejected_corrupt;

    if (has_check(candidate.checks, Check::western_misreads_asian) &&
        is_likely_misencoded_asian_text(text, candidate.id))
        return Verdict::rejected_script_mismatch;

    if ((has_check(candidate.checks, Check::katakana_flood) ||
         has_check(candidate.checks, Check::ascii_cjk_mix)) &&
        is_likely_misencoded_cross_asian(text, candidate.id))
        return Verdict::rejected_script_mismatch;

    return Verdict::accepted;
}

void record(std::vector<Attempt>* trace, const EncodingCandidate& candidate, Verdict verdict) {
    if (trace) trace->push_back({&candidate, verdict});
}

DecodeResult accept(const std::u32string& text, const EncodingCandidate& candidate) {
    return {detail::to_utf8(text), &candidate};
}

} // namespace

DecodeResult decode_with_fallback(std::span<const std::byte> data,
                                  std::vector<Attempt>* trace) {
    return decode_with_fallback(data, default_registry(), trace);
}

DecodeResult decode_with_fallback(std::span<const std::byte> data,
                                  Registry registry,
                                  std::vector<Attempt>* trace) {
    // Fast path: UTF-8 only has to look like text. It skips the mismatch
    // checks and is not retried if it fails.
    const EncodingCandidate& utf8 = fast_path_candidate();
    if (auto text = detail::decode(data, utf8)) {
        if (is_likely_text(*text)) {
            record(trace, utf8, Verdict::accepted);
            return accept(*text, utf8);
        }
        record(trace, utf8, Verdict::rejected_corrupt);
    } else {
        record(trace, utf8, Verdict::decode_error);
    }

    for (const auto& candidate : registry) {
        if (candidate.id == EncodingId::utf8) continue;

        auto text = detail::decode(data, candidate);
        if (!text) {
            record(trace, candidate, Verdict::decode_error);
            continue;
        }

        Verdict verdict = screen(*text, candidate);
        record(trace, candidate, verdict);
        if (verdict == Verdict::accepted)
            return accept(*text, candidate);
    }

    return {};
}

std::string_view to_string(Verdict verdict) {
    switch (verdict) {
        case Verdict::accepted:                 return "accepted";
        case Verdict::rejected_corrupt:         return "rejected (control characters)";
        case Verdict::rejected_script_mismatch: return "rejected (script mismatch)";
        case Verdict::decode_error:             return "decode error";
    }
    return "unknown";
}

} // namespace textprobe
