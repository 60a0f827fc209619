/**
 * @file test_trace_parse.cpp
 * @brief Counterexample and simulation trace parsing: state blocks, loop markers, deltas
 * 
 * @author xmv_bridge contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 xmv_bridge contributors

#include <catch2/catch.hpp>

#include "xmv_bridge/errors.hpp"
#include "xmv_bridge/trace.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <variant>
#include <vector>

using namespace xmv::bridge;

namespace {

const std::string kLasso =
    "-- LTL specification G !p  is false\n"
    "-- as demonstrated by the following execution sequence\n"
    "Trace Description: LTL Counterexample \n"
    "Trace Type: Counterexample \n"
    "  -> State: 1.1 <-\n"
    "    p = FALSE\n"
    "    x = 0\n"
    "  -- Loop starts here\n"
    "  -> State: 1.2 <-\n"
    "    x = 1\n"
    "  -> State: 1.3 <-\n"
    "    p = TRUE\n"
    "    x = 0\n";

}  // namespace

TEST_CASE("Lasso counterexample is split into delta states", "[trace]") {
    const auto trace = Trace::parse(kLasso);

    REQUIRE(trace.description == "LTL Counterexample");
    REQUIRE(trace.type == "Counterexample");
    REQUIRE(trace.states.size() == 3);
    REQUIRE(trace.states[0] == State{{"p", "FALSE"}, {"x", "0"}});
    REQUIRE(trace.states[1] == State{{"x", "1"}});
    REQUIRE(trace.states[2] == State{{"p", "TRUE"}, {"x", "0"}});
    REQUIRE(trace.loop_indexes == std::set<std::size_t>{1});
}

TEST_CASE("Carriage returns from the terminal do not leak into values", "[trace]") {
    const std::string text =
        "Trace Description: Simulation\r\n"
        "Trace Type: Simulation\r\n"
        "  -> State: 1.1 <-\r\n"
        "    x = 3\r\n";

    const auto trace = Trace::parse(text);
    REQUIRE(trace.type == "Simulation");
    REQUIRE(trace.states.size() == 1);
    REQUIRE(trace.states[0].at("x") == "3");
}

TEST_CASE("Loop marker before the first state puts the loop at index 0", "[trace]") {
    const std::string text =
        "Trace Description: LTL Counterexample\n"
        "Trace Type: Counterexample\n"
        "  -- Loop starts here\n"
        "  -> State: 1.1 <-\n"
        "    x = 0\n"
        "  -> State: 1.2 <-\n"
        "    x = 1\n";

    REQUIRE(Trace::parse(text).loop_indexes == std::set<std::size_t>{0});
}

TEST_CASE("Loop marker after the last state is dropped", "[trace]") {
    const std::string text =
        "Trace Description: LTL Counterexample\n"
        "Trace Type: Counterexample\n"
        "  -> State: 1.1 <-\n"
        "    x = 0\n"
        "  -- Loop starts here\n";

    const auto trace = Trace::parse(text);
    REQUIRE(trace.states.size() == 1);
    REQUIRE(trace.loop_indexes.empty());
}

TEST_CASE("Several loop markers are all kept", "[trace]") {
    const std::string text =
        "Trace Description: LTL Counterexample\n"
        "Trace Type: Counterexample\n"
        "  -> State: 1.1 <-\n"
        "    x = 0\n"
        "  -- Loop starts here\n"
        "  -> State: 1.2 <-\n"
        "    x = 1\n"
        "  -- Loop starts here\n"
        "  -> State: 1.3 <-\n"
        "    x = 2\n";

    REQUIRE(Trace::parse(text).loop_indexes == std::set<std::size_t>{1, 2});
}

TEST_CASE("Malformed traces raise ParseError", "[trace]") {
    SECTION("missing description label") {
        REQUIRE_THROWS_AS(Trace::parse("Trace Type: Counterexample\n  -> State: 1.1 <-\n  x = 0\n"), ParseError);
    }
    SECTION("missing type label") {
        REQUIRE_THROWS_AS(Trace::parse("Trace Description: d\n  -> State: 1.1 <-\n  x = 0\n"), ParseError);
    }
    SECTION("state line without assignment") {
        const std::string text =
            "Trace Description: d\n"
            "Trace Type: t\n"
            "  -> State: 1.1 <-\n"
            "    garbage\n";
        REQUIRE_THROWS_AS(Trace::parse(text), ParseError);
    }
    SECTION("assignment without a name") {
        REQUIRE_THROWS_AS(parse_state(" = 3\n"), ParseError);
    }
}

TEST_CASE("Full states accumulate the deltas", "[trace]") {
    const auto full = Trace::parse(kLasso).full_states();

    REQUIRE(full.size() == 3);
    REQUIRE(full[0] == State{{"p", "FALSE"}, {"x", "0"}});
    REQUIRE(full[1] == State{{"p", "FALSE"}, {"x", "1"}});
    REQUIRE(full[2] == State{{"p", "TRUE"}, {"x", "0"}});
}

TEST_CASE("Parsed states carry coerced values", "[trace]") {
    const auto trace = Trace::parse(kLasso);

    const auto deltas = trace.parsed_states();
    REQUIRE(deltas[1].size() == 1);
    REQUIRE(std::get<std::int64_t>(deltas[1].at("x")) == 1);

    const auto full = trace.parsed_states(true);
    REQUIRE(std::get<bool>(full[1].at("p")) == false);
    REQUIRE(std::get<bool>(full[2].at("p")) == true);
}

TEST_CASE("Raw state blocks build a trace", "[trace]") {
    const std::vector<std::string> chunks{
        "x = 0\nmode = idle\n",
        "x = 1\n",
    };

    const auto trace = Trace::of_states(chunks, "Simulation", "Simulation");
    REQUIRE(trace.type == "Simulation");
    REQUIRE(trace.states.size() == 2);
    REQUIRE(trace.states[0].at("mode") == "idle");
    REQUIRE(trace.loop_indexes.empty());
}

TEST_CASE("State block parsing skips headers and comments", "[trace]") {
    const auto chunk = parse_state(
        "  -> State: 2.4 <-\n"
        "  -- a comment\n"
        "\n"
        "    y = a = b\n");

    REQUIRE(chunk.state == State{{"y", "a = b"}});
    REQUIRE_FALSE(chunk.loop_starts_next);
}
