#include <doctest/doctest.h>

#include <textprobe/encoding.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace textprobe;

TEST_CASE("Registry: default order") {
    auto registry = default_registry();
    std::vector<std::string> names;
    for (const auto& c : registry) names.emplace_back(c.name);

    CHECK(names == std::vector<std::string>{
        "shift_jis", "euc-kr", "big5", "gbk", "gb2312",
        "cp1251", "iso-8859-2", "cp1252", "latin-1",
    });
}

TEST_CASE("Registry: priorities strictly increase from 1") {
    int expected = 1;
    for (const auto& c : default_registry()) {
        CHECK(c.priority == expected);
        ++expected;
    }
}

TEST_CASE("Registry: fast path is UTF-8 and not part of the sweep") {
    const auto& utf8 = fast_path_candidate();
    CHECK(utf8.id == EncodingId::utf8);
    CHECK(utf8.priority == 0);
    CHECK(utf8.checks == Check::none);
    for (const auto& c : default_registry()) {
        CHECK(c.id != EncodingId::utf8);
    }
}

TEST_CASE("Registry: check flags follow the static lookup") {
    for (const auto& c : default_registry()) {
        CHECK(c.checks == applicable_checks(c.id));
    }
    CHECK(has_check(applicable_checks(EncodingId::shift_jis), Check::katakana_flood));
    CHECK(has_check(applicable_checks(EncodingId::shift_jis), Check::ascii_cjk_mix));
    CHECK_FALSE(has_check(applicable_checks(EncodingId::euc_kr), Check::katakana_flood));
    CHECK(has_check(applicable_checks(EncodingId::gb2312), Check::ascii_cjk_mix));
    CHECK(has_check(applicable_checks(EncodingId::latin1), Check::western_misreads_asian));
    CHECK(applicable_checks(EncodingId::cp1251) == Check::none);
    CHECK(applicable_checks(EncodingId::iso_8859_2) == Check::none);
}

TEST_CASE("Registry: lookup by name and alias") {
    REQUIRE(find_candidate("shift_jis") != nullptr);
    CHECK(find_candidate("shift_jis")->id == EncodingId::shift_jis);
    CHECK(find_candidate("SJIS")->id == EncodingId::shift_jis);
    CHECK(find_candidate("UTF-8")->id == EncodingId::utf8);
    CHECK(find_candidate("latin1")->id == EncodingId::latin1);
    CHECK(find_candidate("ISO-8859-1")->id == EncodingId::latin1);
    CHECK(find_candidate("windows-1252")->id == EncodingId::cp1252);
    CHECK(find_candidate("koi8-r") == nullptr);
    CHECK(find_candidate("") == nullptr);
}

TEST_CASE("Registry: make_registry keeps order and renumbers") {
    auto registry = make_registry({"latin-1", "gbk", "euc-kr"});
    REQUIRE(registry.size() == 3);
    CHECK(registry[0].id == EncodingId::latin1);
    CHECK(registry[1].id == EncodingId::gbk);
    CHECK(registry[2].id == EncodingId::euc_kr);
    CHECK(registry[0].priority == 1);
    CHECK(registry[2].priority == 3);
    CHECK(registry[1].checks == Check::ascii_cjk_mix);
}

TEST_CASE("Registry: make_registry rejects bad lists") {
    CHECK_THROWS_AS(make_registry({}), std::invalid_argument);
    CHECK_THROWS_AS(make_registry({"gbk", "klingon"}), std::invalid_argument);
    CHECK_THROWS_AS(make_registry({"latin-1", "latin1"}), std::invalid_argument);
}

TEST_CASE("Registry: every default converter is available") {
    CHECK_NOTHROW(validate_registry(default_registry()));
}

TEST_CASE("Registry: missing converter is a configuration fault") {
    auto registry = make_registry({"cp1251"});
    registry[0].icu_name = "x-no-such-converter";
    CHECK_THROWS_AS(validate_registry(registry), std::runtime_error);
}

TEST_CASE("Registry: names") {
    CHECK(to_string(EncodingId::utf8) == "utf-8");
    CHECK(to_string(EncodingId::euc_kr) == "euc-kr");
    CHECK(to_string(EncodingId::latin1) == "latin-1");
}
