/**
 * @file test_controller.cpp
 * @brief Command layer against the scripted engine: environment, warm-up,
 *        precondition remediation, verification and simulation
 * 
 * @author xmv_bridge contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 xmv_bridge contributors

#include <catch2/catch.hpp>

#include "xmv_bridge/controller.hpp"
#include "xmv_bridge/errors.hpp"
#include "xmv_bridge/heuristics.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace xmv::bridge;
using namespace std::chrono_literals;

namespace {

const std::map<std::string, std::string> kDefaultEnvironment{
    {"default_simulation_steps", "10"},
    {"locked_level", "3"},
    {"shown_states", "25"},
};

Controller::Config fake_config(std::optional<std::filesystem::path> model = "counter.smv",
                               std::vector<std::string> extra_args = {}) {
    Controller::Config cfg;
    cfg.session.executable = XMV_BRIDGE_FAKE_NUXMV;
    cfg.session.startup_timeout = 10s;
    cfg.session.arguments.insert(cfg.session.arguments.end(), extra_args.begin(), extra_args.end());
    cfg.model = std::move(model);
    return cfg;
}

std::string stats(Controller& ctl) {
    return ctl.raw("stats", 5s);
}

}  // namespace

TEST_CASE("Environment is read at start-up", "[controller][env]") {
    Controller ctl(fake_config(std::nullopt));

    // input_file is reported as NULL and therefore absent.
    REQUIRE(ctl.environment() == kDefaultEnvironment);
    REQUIRE(ctl.get_environment() == kDefaultEnvironment);
}

TEST_CASE("Loading a model sets the input file and shown states", "[controller][env]") {
    Controller ctl(fake_config());

    const auto& env = ctl.environment();
    REQUIRE(env.at("input_file") == "counter.smv");
    REQUIRE(env.at("shown_states") == "65535");
    REQUIRE(ctl.get_environment() == env);
}

TEST_CASE("Environment updates are mirrored in the cache", "[controller][env]") {
    Controller ctl(fake_config(std::nullopt));

    ctl.set_environment("bmc_length", "12");
    REQUIRE(ctl.environment().at("bmc_length") == "12");
    REQUIRE(ctl.get_environment().at("bmc_length") == "12");

    ctl.set_environment("bmc_length", std::nullopt);
    REQUIRE(ctl.environment().count("bmc_length") == 0);
    REQUIRE(ctl.get_environment().count("bmc_length") == 0);
}

TEST_CASE("Rejected environment updates leave the cache alone", "[controller][env]") {
    Controller ctl(fake_config());

    SECTION("set") {
        REQUIRE_THROWS_AS(ctl.set_environment("shown_states", std::string("bogus")), BackendFault);
        REQUIRE(ctl.environment().at("shown_states") == "65535");
        REQUIRE(ctl.get_environment().at("shown_states") == "65535");

        REQUIRE_THROWS_AS(ctl.set_environment("locked_level", std::string("4")), BackendFault);
        REQUIRE(ctl.environment().at("locked_level") == "3");
    }
    SECTION("unset") {
        REQUIRE_THROWS_AS(ctl.set_environment("locked_level", std::nullopt), BackendFault);
        REQUIRE(ctl.environment().at("locked_level") == "3");
        REQUIRE(ctl.get_environment().at("locked_level") == "3");
    }
}

TEST_CASE("Arguments the engine cannot quote are refused before sending", "[controller]") {
    Controller ctl(fake_config());

    REQUIRE_THROWS_AS(ctl.set_environment("input_file", std::string("a\"b.smv")), std::invalid_argument);
    REQUIRE_FALSE(ctl.environment().at("input_file") == "a\"b.smv");
    REQUIRE_THROWS_AS(ctl.run_property(PropertyKind::LtlIc3, std::nullopt, "G \"x\""), std::invalid_argument);
    REQUIRE_THROWS_AS(ctl.run_property(PropertyKind::Ltl, std::nullopt, "G x\nreset"), std::invalid_argument);

    Heuristic rnd = RandomChoice(3);
    REQUIRE_THROWS_AS(ctl.init_simulation_state(rnd, "x = \"1\""), std::invalid_argument);

    REQUIRE(stats(ctl).find("attempts=0") != std::string::npos);
    REQUIRE(ctl.verify(PropertyKind::LtlIc3, std::nullopt, "G x", 5s).size() == 1);
}

TEST_CASE("Reset with defaults restores the start-up environment", "[controller][env]") {
    Controller ctl(fake_config());
    ctl.set_environment("bmc_length", "12");

    ctl.reset(true);
    REQUIRE(ctl.environment() == kDefaultEnvironment);
    REQUIRE(ctl.get_environment() == kDefaultEnvironment);
}

TEST_CASE("Reset drops both back-ends", "[controller][mode]") {
    Controller ctl(fake_config());
    REQUIRE_FALSE(ctl.boolean_ready());
    REQUIRE_FALSE(ctl.symbolic_ready());

    ctl.verify(PropertyKind::Ltl, std::nullopt, "G x", 5s);
    ctl.verify(PropertyKind::LtlIc3, std::nullopt, "G x", 5s);
    REQUIRE(ctl.boolean_ready());
    REQUIRE(ctl.symbolic_ready());

    ctl.reset();
    REQUIRE_FALSE(ctl.boolean_ready());
    REQUIRE_FALSE(ctl.symbolic_ready());
}

TEST_CASE("A failed warm-up leaves the back-end disengaged", "[controller][mode]") {
    Controller ctl(fake_config(std::nullopt));

    // Without a model both warm-ups report "A model must be read before."
    REQUIRE_THROWS_AS(ctl.verify(PropertyKind::LtlIc3, std::nullopt, "G x", 5s), BackendFault);
    REQUIRE_FALSE(ctl.symbolic_ready());
    REQUIRE_THROWS_AS(ctl.verify(PropertyKind::Ltl, std::nullopt, "G x", 5s), BackendFault);
    REQUIRE_FALSE(ctl.boolean_ready());

    // Once a model is there the next command warms up again.
    ctl.set_model("counter.smv");
    REQUIRE(ctl.verify(PropertyKind::LtlIc3, std::nullopt, "G x", 5s).size() == 1);
    REQUIRE(ctl.symbolic_ready());
    REQUIRE(stats(ctl).find("go_msat=1") != std::string::npos);
}

TEST_CASE("Missing boolean model is built once and the check retried once", "[controller][remediation]") {
    Controller ctl(fake_config());

    const auto outcomes = ctl.verify(PropertyKind::Ltl, std::nullopt, "G x", 5s);
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].verdict == Verdict::True);
    REQUIRE(stats(ctl).find("boolean_builds=1 attempts=2 go=1 go_msat=0") != std::string::npos);

    // Sticky: the next BDD check neither warms up nor builds again.
    ctl.verify(PropertyKind::Ltl, std::nullopt, "F y", 5s);
    REQUIRE(stats(ctl).find("boolean_builds=1 attempts=3 go=1 go_msat=0") != std::string::npos);
}

TEST_CASE("A precondition that survives remediation is a BackendFault", "[controller][remediation]") {
    Controller ctl(fake_config("counter.smv", {"--never-build"}));

    REQUIRE_THROWS_AS(ctl.verify(PropertyKind::Ltl, std::nullopt, "G x", 5s), BackendFault);
    REQUIRE(stats(ctl).find("boolean_builds=1 attempts=2") != std::string::npos);
}

TEST_CASE("Disengaged back-end is warmed up again", "[controller][remediation]") {
    Controller ctl(fake_config());

    ctl.verify(PropertyKind::LtlIc3, std::nullopt, "G x", 5s);
    REQUIRE(ctl.symbolic_ready());

    // The engine forgets go_msat behind the controller's back.
    ctl.raw("disengage", 5s);
    const auto outcomes = ctl.verify(PropertyKind::LtlIc3, std::nullopt, "G x", 5s);
    REQUIRE(outcomes.size() == 1);
    REQUIRE(stats(ctl).find("attempts=3 go=0 go_msat=2") != std::string::npos);
}

TEST_CASE("Checking every property of the model", "[controller][verify]") {
    Controller ctl(fake_config());

    const auto outcomes = ctl.verify(PropertyKind::LtlIc3, 20, std::nullopt, 5s);
    REQUIRE(outcomes.size() == 2);
    REQUIRE(outcomes[0].verdict == Verdict::True);
    REQUIRE(outcomes[1].verdict == Verdict::False);
    REQUIRE(outcomes[1].specification == "F fail");
    REQUIRE(outcomes[1].trace->states.size() == 3);
    REQUIRE(outcomes[1].trace->loop_indexes == std::set<std::size_t>{1});
}

TEST_CASE("Invariant counterexamples are finite paths", "[controller][verify]") {
    Controller ctl(fake_config());

    const auto outcomes = ctl.verify(PropertyKind::InvarIc3, std::nullopt, "x_fail", 5s);
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].logic == "invariant");
    REQUIRE(outcomes[0].specification == "x_fail");
    REQUIRE(outcomes[0].verdict == Verdict::False);
    REQUIRE(outcomes[0].trace->loop_indexes.empty());
}

TEST_CASE("Bounded model checking needs a bound", "[controller][verify]") {
    Controller ctl(fake_config());

    REQUIRE_THROWS_AS(ctl.run_property(PropertyKind::Bmc, std::nullopt, "G x"), std::invalid_argument);
    REQUIRE_THROWS_AS(ctl.run_property(PropertyKind::Bmc, 0, "G x"), std::invalid_argument);

    const auto outcomes = ctl.verify(PropertyKind::Bmc, 10, "G unknown", 5s);
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].verdict == Verdict::Unknown);
}

TEST_CASE("Model loading failures are LoadError", "[controller][load]") {
    try {
        Controller ctl(fake_config("broken.smv"));
        FAIL("expected LoadError");
    } catch (const LoadError& ex) {
        REQUIRE(std::string(ex.what()).find("TYPE ERROR") != std::string::npos);
    }

    Controller ctl(fake_config(std::nullopt));
    REQUIRE_THROWS_AS(ctl.set_model("broken.smv"), LoadError);
    ctl.set_model("counter.smv");
    REQUIRE(ctl.verify(PropertyKind::Ltl, std::nullopt, "G x", 5s).size() == 1);
}

TEST_CASE("Commands time out and the controller stays usable", "[controller]") {
    Controller ctl(fake_config());

    REQUIRE_THROWS_AS(ctl.raw("hang", 200ms), BackendTimeout);
    REQUIRE(stats(ctl).find("attempts=0") != std::string::npos);
}

TEST_CASE("Simulation follows the user's choices", "[controller][simulation]") {
    Controller ctl(fake_config());
    std::istringstream in("1\n0\n1\n");
    std::ostringstream out;
    Heuristic user = UserChoice(in, out);

    const auto initial = ctl.init_simulation_state(user, "TRUE", 5s);
    REQUIRE(initial == State{{"flag", "TRUE"}, {"x", "5"}});
    REQUIRE(ctl.symbolic_ready());

    const auto first = ctl.step_simulation(user, "TRUE", 5s);
    REQUIRE(first.state == State{{"x", "1"}});
    REQUIRE(first.satisfiable);

    const auto second = ctl.step_simulation(user, "TRUE", 5s);
    REQUIRE(second.state == State{{"x", "20"}});

    REQUIRE(ctl.simulated_states().size() == 3);
    const auto trace = ctl.simulation_trace();
    REQUIRE(trace.type == "Simulation");
    REQUIRE(trace.states == ctl.simulated_states());
    REQUIRE(trace.full_states().back() == State{{"flag", "TRUE"}, {"x", "20"}});
}

TEST_CASE("Unbounded simulation stops when the path becomes unsatisfiable", "[controller][simulation]") {
    Controller ctl(fake_config("counter.smv", {"--sat-steps", "2"}));
    Heuristic rnd = RandomChoice(7);

    ctl.init_simulation_state(rnd, "TRUE", 5s);
    REQUIRE_FALSE(ctl.run_simulation(rnd, 0, "TRUE", 5s));
    // initial state, two satisfiable steps, the step that reported UNSAT
    REQUIRE(ctl.simulated_states().size() == 4);
}

TEST_CASE("Bounded simulation runs the requested number of steps", "[controller][simulation]") {
    Controller ctl(fake_config());
    Heuristic rnd = RandomChoice(11);

    ctl.init_simulation_state(rnd, "TRUE", 5s);
    REQUIRE(ctl.run_simulation(rnd, 2, "TRUE", 5s));
    REQUIRE(ctl.simulated_states().size() == 3);
}

TEST_CASE("Single candidate state", "[controller][simulation]") {
    Controller ctl(fake_config());
    Heuristic rnd = RandomChoice(1);

    const auto initial = ctl.init_simulation_state(rnd, "x = 7", 5s);
    REQUIRE(initial.at("x") == "7");
}

TEST_CASE("Inconsistent constraint is a BackendFault", "[controller][simulation]") {
    Controller ctl(fake_config());
    Heuristic rnd = RandomChoice(1);

    try {
        ctl.init_simulation_state(rnd, "FALSE", 5s);
        FAIL("expected BackendFault");
    } catch (const BackendFault& ex) {
        REQUIRE(std::string(ex.what()) == "No trace: constraint and initial state are inconsistent");
    }
    REQUIRE(ctl.simulated_states().empty());

    // Still in sync with the engine.
    REQUIRE(ctl.init_simulation_state(rnd, "TRUE", 5s).count("x") == 1);
}
