#include <doctest/doctest.h>

#include <textprobe/decoder.h>
#include <textprobe/encoding.h>

#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace textprobe;

namespace {

std::span<const std::byte> as_bytes(std::string_view s) {
    return std::as_bytes(std::span(s.data(), s.size()));
}

std::span<const std::byte> as_bytes(const std::vector<unsigned char>& v) {
    return std::as_bytes(std::span(v.data(), v.size()));
}

struct Sample {
    const char* utf8;       // expected text
    std::string_view raw;   // the same text in `encoding`
    const char* encoding;
};

// Texts that come back exactly under the default order.
const Sample kRoundTrips[] = {
    {"Hello, World!", "Hello, World!", "utf-8"},
    {"Windows™ text", "Windows\x99 text", "cp1252"},
    {"こんにちは世界", "\x82\xB1\x82\xF1\x82\xC9\x82\xBF\x82\xCD\x90\xA2\x8A\x45", "shift_jis"},
    {"안녕하세요", "\xBE\xC8\xB3\xE7\xC7\xCF\xBC\xBC\xBF\xE4", "euc-kr"},
    {"繁體中文", "\xC1\x63\xC5\xE9\xA4\xA4\xA4\xE5", "big5"},
    {"Привет мир", "\xCF\xF0\xE8\xE2\xE5\xF2 \xEC\xE8\xF0", "cp1251"},
};

// Texts that an earlier candidate claims under the default order.
const Sample kMisdetections[] = {
    {"你好世界", "\xC4\xE3\xBA\xC3\xCA\xC0\xBD\xE7", "gbk"},
    {"中文测试", "\xD6\xD0\xCE\xC4\xB2\xE2\xCA\xD4", "gb2312"},
    {"Héllo Wörld", "H\xE9llo W\xF6rld", "iso-8859-1"},
    {"Cześć świat", "Cze\xB6\xE6 \xB6wiat", "iso-8859-2"},
};

const std::vector<unsigned char> kBinary[] = {
    {0xFF, 0xFE, 0x00, 0x00, 0x01, 0x02, 0x03},
    std::vector<unsigned char>(10, 0x00),
    {0x01, 0x02, 0x03, 0x04, 0x05},
    {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10},
};

// Buffers where the converters' vendor tables differ from the national
// standards the candidates name.
struct Detection {
    std::string_view raw;
    const char*      encoding;   // nullptr: binary
    const char*      utf8;
};

const Detection kVendorTableCases[] = {
    {"\x1C\x1C\x1C\x1C\x82\xA0", nullptr, nullptr},   // control bytes around one kana
    {"\x1C", nullptr, nullptr},
    {"\x82\xB1\x82\xF1\x82\xC9\x82\xBF\x82\xCD\x7F", "shift_jis", "こんにちは\x7F"},
    {"\x82\xB1\x82\xF1\x82\xC9\x82\xBF\x82\xCD\x1A", "shift_jis", "こんにちは\x1A"},
    {"AB\xA1\x80", "cp1251", "ABЎЂ"},   // GBK user-defined area
    {"\x87\x40\x87\x41\x82\xA0", "gbk", "嘆嘇偁"},   // NEC row 13
    {"\xFE\xA1\xB0\xA1", "cp1251", "юЎ°Ў"},   // IBM user-defined row
    {"\xF9\xF0\xA4\x40", "cp1251", "щр¤@"},   // ETEN box drawing
    {"\x81\x60\x83\x65\x83\x58\x83\x67", "shift_jis", "〜テスト"},   // wave dash
    {"\xA2\xE6 100", "euc-kr", "€ 100"},   // KS X 1001:1998 euro
    {"\xA9\x74\xE2\x5F%\xC7\x77L", "big5", "孤槂%ミL"},
    {"\xC7\x40\xC7\x41\xC7\x42", "big5", "エォオ"},   // ETEN katakana
    {"\xB0\xA1\xC9\xA1", "big5", "陛氶"},
    {"\xA4\xD4\xB0\xA1", "big5", "夭陛"},
};

} // namespace

TEST_CASE("Decoder: documented encodings round trip") {
    for (const auto& s : kRoundTrips) {
        CAPTURE(s.encoding);
        auto result = decode_with_fallback(as_bytes(s.raw));
        REQUIRE(result.text.has_value());
        CHECK(*result.text == s.utf8);
    }
}

TEST_CASE("Decoder: known misdetections still yield different text") {
    for (const auto& s : kMisdetections) {
        CAPTURE(s.encoding);
        auto result = decode_with_fallback(as_bytes(s.raw));
        REQUIRE(result.text.has_value());
        CHECK_FALSE(result.text->empty());
        CHECK(*result.text != s.utf8);
    }
}

TEST_CASE("Decoder: binary data yields the sentinel") {
    for (const auto& bytes : kBinary) {
        auto result = decode_with_fallback(as_bytes(bytes));
        CHECK(result.is_binary());
        CHECK_FALSE(result.text.has_value());
        CHECK(result.encoding == nullptr);
    }
}

TEST_CASE("Decoder: vendor table differences do not change the outcome") {
    for (std::size_t i = 0; i < std::size(kVendorTableCases); ++i) {
        CAPTURE(i);
        const auto& d = kVendorTableCases[i];
        auto result = decode_with_fallback(as_bytes(d.raw));
        if (!d.encoding) {
            CHECK(result.is_binary());
            continue;
        }
        REQUIRE(result.encoding != nullptr);
        CHECK(result.encoding->name == d.encoding);
        REQUIRE(result.text.has_value());
        CHECK(*result.text == d.utf8);
    }
}

TEST_CASE("Decoder: empty buffer is empty text via the fast path") {
    auto result = decode_with_fallback({});
    REQUIRE(result.text.has_value());
    CHECK(result.text->empty());
    REQUIRE(result.encoding != nullptr);
    CHECK(result.encoding->id == EncodingId::utf8);
}

TEST_CASE("Decoder: repeated calls agree") {
    for (const auto& s : kMisdetections) {
        auto first  = decode_with_fallback(as_bytes(s.raw));
        auto second = decode_with_fallback(as_bytes(s.raw));
        CHECK(first.text == second.text);
        CHECK(first.encoding == second.encoding);
    }
}

TEST_CASE("Decoder: reports the accepted candidate") {
    auto result = decode_with_fallback(as_bytes("Windows\x99 text"));
    REQUIRE(result.encoding != nullptr);
    CHECK(result.encoding->id == EncodingId::cp1251);

    auto sjis = decode_with_fallback(as_bytes(kRoundTrips[2].raw));
    REQUIRE(sjis.encoding != nullptr);
    CHECK(sjis.encoding->id == EncodingId::shift_jis);
}

TEST_CASE("Decoder: trace lists every attempt in order") {
    std::vector<Attempt> trace;
    auto result = decode_with_fallback(as_bytes("Windows\x99 text"), &trace);
    REQUIRE(result.text.has_value());

    REQUIRE(trace.size() == 7);
    const char* names[] = {"utf-8", "shift_jis", "euc-kr", "big5", "gbk", "gb2312", "cp1251"};
    for (std::size_t i = 0; i < trace.size(); ++i) {
        CAPTURE(i);
        CHECK(trace[i].candidate->name == names[i]);
        CHECK(trace[i].verdict == (i + 1 < trace.size() ? Verdict::decode_error
                                                        : Verdict::accepted));
    }
}

TEST_CASE("Decoder: UTF-8 that is mostly control characters falls through") {
    std::vector<Attempt> trace;
    auto result = decode_with_fallback(as_bytes(kBinary[2]), &trace);
    CHECK(result.is_binary());
    REQUIRE_FALSE(trace.empty());
    CHECK(trace.front().candidate->id == EncodingId::utf8);
    CHECK(trace.front().verdict == Verdict::rejected_corrupt);
    // Every sweep candidate was still tried.
    CHECK(trace.size() == 1 + default_registry().size());
}

TEST_CASE("Decoder: UTF-8 skips the script checks") {
    // Dense accented Latin with no spaces would trip the Western check.
    auto result = decode_with_fallback(as_bytes("\xC3\x83\xC3\x82\xC3\x84\xC3\x85\xC3\x86"));
    REQUIRE(result.text.has_value());
    CHECK(*result.text == "ÃÂÄÅÆ");
    CHECK(result.encoding->id == EncodingId::utf8);
}

TEST_CASE("Decoder: Western mismatch pushes past cp1252") {
    // Sweep only the Western pair: dense high Latin without spaces is
    // rejected by both, so nothing is accepted.
    auto registry = make_registry({"cp1252", "latin-1"});
    std::vector<Attempt> trace;
    auto result = decode_with_fallback(as_bytes("\xC3\xA3\xC2\xE9\xE8\xEA"), registry, &trace);
    CHECK(result.is_binary());
    REQUIRE(trace.size() == 3);
    CHECK(trace[1].verdict == Verdict::rejected_script_mismatch);
    CHECK(trace[2].verdict == Verdict::rejected_script_mismatch);
}

TEST_CASE("Decoder: reordering the registry changes misdetection outcomes") {
    SUBCASE("latin-1 ahead of cp1251") {
        const auto& s = kMisdetections[2];
        auto registry = make_registry({"latin-1", "cp1251"});
        auto result = decode_with_fallback(as_bytes(s.raw), registry);
        REQUIRE(result.text.has_value());
        CHECK(*result.text == s.utf8);
        CHECK(result.encoding->id == EncodingId::latin1);
    }
    SUBCASE("iso-8859-2 ahead of the Asian encodings") {
        const auto& s = kMisdetections[3];
        auto registry = make_registry({"iso-8859-2", "shift_jis", "euc-kr", "big5"});
        auto result = decode_with_fallback(as_bytes(s.raw), registry);
        REQUIRE(result.text.has_value());
        CHECK(*result.text == s.utf8);
    }
    SUBCASE("gbk ahead of euc-kr") {
        const auto& s = kMisdetections[0];
        auto registry = make_registry({"gbk", "euc-kr", "big5"});
        auto result = decode_with_fallback(as_bytes(s.raw), registry);
        REQUIRE(result.text.has_value());
        CHECK(*result.text == s.utf8);
        CHECK(result.encoding->id == EncodingId::gbk);
    }
}

TEST_CASE("Decoder: a UTF-8 entry in a custom registry is not retried") {
    auto registry = make_registry({"utf-8", "cp1251"});
    std::vector<Attempt> trace;
    auto result = decode_with_fallback(as_bytes(kRoundTrips[5].raw), registry, &trace);
    REQUIRE(result.text.has_value());
    CHECK(*result.text == kRoundTrips[5].utf8);
    REQUIRE(trace.size() == 2);
    CHECK(trace[0].candidate->id == EncodingId::utf8);
    CHECK(trace[1].candidate->id == EncodingId::cp1251);
}

TEST_CASE("Decoder: an unavailable converter is a per-call decode error") {
    auto registry = make_registry({"cp1251", "iso-8859-2"});
    registry[0].icu_name = "x-no-such-converter";
    std::vector<Attempt> trace;
    auto result = decode_with_fallback(as_bytes(kRoundTrips[5].raw), registry, &trace);
    REQUIRE(result.text.has_value());
    CHECK(result.encoding->id == EncodingId::iso_8859_2);
    REQUIRE(trace.size() == 3);
    CHECK(trace[1].verdict == Verdict::decode_error);
}

TEST_CASE("Decoder: verdict names") {
    CHECK(to_string(Verdict::accepted) == "accepted");
    CHECK(to_string(Verdict::decode_error) == "decode error");
}
