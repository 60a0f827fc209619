/**
 * @file test_fatal_phrases.cpp
 * @brief Fatal-condition and precondition detection in transcripts, phrase file loading
 * 
 * @author xmv_bridge contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 xmv_bridge contributors

#include <catch2/catch.hpp>

#include "xmv_bridge/errors.hpp"
#include "xmv_bridge/fatal_phrases.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

using namespace xmv::bridge;

namespace {

// Phrase file removed again when the test case ends.
class TempFile {
public:
    explicit TempFile(const std::string& contents)
        : path_(std::filesystem::temp_directory_path() /
                ("xmv_bridge_phrases_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".txt")) {
        std::ofstream(path_) << contents;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

bool contains(const std::vector<std::string>& list, const std::string& item) {
    return std::find(list.begin(), list.end(), item) != list.end();
}

}  // namespace

TEST_CASE("Clean transcripts pass", "[fatal]") {
    const auto phrases = FatalPhrases::defaults();
    REQUIRE_NOTHROW(phrases.check(""));
    REQUIRE_NOTHROW(phrases.check("-- LTL specification G p  is true\r\n"));
}

TEST_CASE("Fatal phrases report only the offending lines", "[fatal]") {
    const auto phrases = FatalPhrases::defaults();
    const std::string transcript =
        "Parsing file counter.smv ..... done.\r\n"
        "file counter.smv: line 3: TYPE ERROR: x := TRUE\r\n"
        "  illegal operand types of \"+\" :  boolean and integer\r\n"
        "done\r\n";

    try {
        phrases.check(transcript);
        FAIL("expected BackendFault");
    } catch (const BackendFault& ex) {
        REQUIRE(std::string(ex.what()) ==
                "file counter.smv: line 3: TYPE ERROR: x := TRUE\n"
                "illegal operand types of \"+\" :  boolean and integer");
    }
}

TEST_CASE("Missing boolean model is recoverable", "[fatal]") {
    const auto phrases = FatalPhrases::defaults();
    try {
        phrases.check("The boolean model must be built before.\n");
        FAIL("expected RecoverablePrecondition");
    } catch (const RecoverablePrecondition& ex) {
        REQUIRE(ex.kind() == Precondition::BooleanModelMissing);
        REQUIRE(std::string(ex.what()) == "The boolean model must be built before.");
    }
}

TEST_CASE("Missing analysis mode is recoverable", "[fatal]") {
    const auto phrases = FatalPhrases::defaults();
    try {
        phrases.check("ERROR: The model must be built before.\n");
        FAIL("expected RecoverablePrecondition");
    } catch (const RecoverablePrecondition& ex) {
        REQUIRE(ex.kind() == Precondition::ModeNotEngaged);
    }
}

TEST_CASE("Preconditions win over fatal phrases", "[fatal]") {
    const auto phrases = FatalPhrases::defaults();
    const std::string transcript =
        "TYPE ERROR somewhere\n"
        "The boolean model must be built before.\n";
    REQUIRE_THROWS_AS(phrases.check(transcript), RecoverablePrecondition);
}

TEST_CASE("Missing input file is fatal", "[fatal]") {
    REQUIRE_THROWS_AS(FatalPhrases::defaults().check("You must set the input file before.\n"), BackendFault);
}

TEST_CASE("Phrase file extends the defaults", "[fatal][loader]") {
    TempFile file(
        "# extra conditions\n"
        "\n"
        "fatal = Parser error\n"
        "precondition.mode=Use the command \"go_msat\"\n"
        "precondition.boolean_model=build it first\n");

    const auto phrases = FatalPhraseLoader{}.load(file.path());
    REQUIRE(contains(phrases.fatal, "Parser error"));
    REQUIRE(contains(phrases.fatal, "TYPE ERROR"));
    REQUIRE(contains(phrases.mode_not_engaged, "Use the command \"go_msat\""));
    REQUIRE(contains(phrases.boolean_model_missing, "build it first"));

    REQUIRE_THROWS_AS(phrases.check("Parser error at line 1\n"), BackendFault);
}

TEST_CASE("Phrase file can replace the defaults", "[fatal][loader]") {
    TempFile file(
        "replace_defaults=yes\n"
        "fatal=boom\n");

    const auto phrases = FatalPhraseLoader{}.load(file.path());
    REQUIRE(phrases.fatal == std::vector<std::string>{"boom"});
    REQUIRE(phrases.boolean_model_missing.empty());
    REQUIRE(phrases.mode_not_engaged.empty());
    REQUIRE_NOTHROW(phrases.check("TYPE ERROR\n"));
}

TEST_CASE("Phrase file errors name the line", "[fatal][loader]") {
    SECTION("replace_defaults after another entry") {
        TempFile file("fatal=boom\nreplace_defaults=true\n");
        REQUIRE_THROWS_AS(FatalPhraseLoader{}.load(file.path()), std::runtime_error);
    }
    SECTION("unknown key") {
        TempFile file("# header\nfatal=boom\nwarning=soft\n");
        try {
            (void)FatalPhraseLoader{}.load(file.path());
            FAIL("expected runtime_error");
        } catch (const std::runtime_error& ex) {
            REQUIRE(std::string(ex.what()).find(":3") != std::string::npos);
        }
    }
    SECTION("empty phrase") {
        TempFile file("fatal=\n");
        REQUIRE_THROWS_AS(FatalPhraseLoader{}.load(file.path()), std::runtime_error);
    }
    SECTION("line without a key") {
        TempFile file("just words\n");
        REQUIRE_THROWS_AS(FatalPhraseLoader{}.load(file.path()), std::runtime_error);
    }
    SECTION("missing file") {
        REQUIRE_THROWS_AS(FatalPhraseLoader{}.load("/nonexistent/xmv_bridge/phrases.txt"), std::runtime_error);
    }
}
