#include "xmv_bridge/controller.hpp"
#include "xmv_bridge/errors.hpp"
#include "xmv_bridge/detail/strings.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

using xmv::bridge::detail::kWhitespace;
using xmv::bridge::detail::trim_copy;

constexpr std::string_view kStateSeparator = "================= State =================";
constexpr std::string_view kSimulationSat = "Simulation is SAT";
const char* const kChoosePrompt = R"(Choose a state from the above \(0-[0-9]+\): )";
const char* const kOnlyOneState = "There's only one available state. Press Return to Proceed.";

// Body of `set` without arguments: one `name value` pair per line, NULL for unset.
std::map<std::string, std::string> parse_environment(const std::string& text) {
    std::map<std::string, std::string> env;
    std::istringstream input(text);
    std::string raw_line;
    while (std::getline(input, raw_line)) {
        const auto line = trim_copy(raw_line);
        const auto split = line.find_first_of(kWhitespace);
        if (line.empty() || split == std::string::npos) {
            continue;
        }
        auto name = line.substr(0, split);
        auto value = trim_copy(std::string_view{line}.substr(split));
        if (value == "NULL") {
            continue;
        }
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        env[std::move(name)] = std::move(value);
    }
    return env;
}

// The engine's command parser has no escape for '"' inside a quoted argument,
// and a line break would end the command early.
std::string quote(const std::string& s) {
    if (s.find_first_of("\"\r\n") != std::string::npos) {
        throw std::invalid_argument("argument must not contain '\"' or a line break: " + s);
    }
    return "\"" + s + "\"";
}

const char* warm_up_command(xmv::bridge::Mode mode) {
    return mode == xmv::bridge::Mode::Bdd ? "go" : "go_msat";
}

}  // namespace

namespace xmv::bridge {

Controller::Controller(Config cfg) : cfg_(std::move(cfg)), session_(cfg_.session) {
    session_.start();
    default_env_ = get_environment();
    if (cfg_.model) {
        set_model(*cfg_.model);
    }
}

void Controller::set_model(const std::filesystem::path& model) {
    try {
        reset(true);
        set_environment("shown_states", std::to_string(cfg_.shown_states));
        set_environment("input_file", model.string());
        for (const char* step : {"read_model", "flatten_hierarchy"}) {
            exchange(step, std::nullopt);
        }
    } catch (const BackendFault& ex) {
        throw LoadError(ex.what());
    } catch (const RecoverablePrecondition& ex) {
        throw LoadError(ex.what());
    }
    session_.logger().debug("model loaded: {}", model.string());
}

std::map<std::string, std::string> Controller::get_environment() {
    env_ = parse_environment(raw("set"));
    return env_;
}

void Controller::set_environment(const std::string& name, const std::optional<std::string>& value) {
    raw(value ? "set " + name + " " + quote(*value) : "unset " + name);
    if (value) {
        env_[name] = *value;
    } else {
        env_.erase(name);
    }
}

void Controller::reset(bool restore_defaults) {
    if (restore_defaults) {
        std::vector<std::string> extra;
        for (const auto& [name, value] : env_) {
            if (default_env_.count(name) == 0) extra.push_back(name);
        }
        for (const auto& name : extra) {
            set_environment(name, std::nullopt);
        }
        for (const auto& [name, value] : default_env_) {
            auto it = env_.find(name);
            if (it == env_.end() || it->second != value) {
                set_environment(name, value);
            }
        }
    }
    boolean_ready_ = false;
    symbolic_ready_ = false;
    raw("reset");
}

std::string Controller::run_property(PropertyKind kind,
                                     std::optional<unsigned> bound,
                                     const std::optional<std::string>& property,
                                     Timeout timeout) {
    const bool has_bound = bound && *bound > 0;
    const bool has_property = property && !property->empty();

    std::ostringstream cmd;
    Mode mode = Mode::Symbolic;
    switch (kind) {
        case PropertyKind::Ltl:
            mode = Mode::Bdd;
            cmd << "check_ltlspec";
            if (has_property) cmd << " -p " << quote(*property);
            break;
        case PropertyKind::LtlIc3:
            cmd << "check_ltlspec_ic3";
            if (has_bound) cmd << " -k " << *bound;
            if (has_property) cmd << " -p " << quote(*property);
            break;
        case PropertyKind::InvarIc3:
            cmd << "check_property_as_invar_ic3";
            if (has_bound) cmd << " -k " << *bound;
            if (has_property) cmd << " -L " << quote(*property);
            break;
        case PropertyKind::Bmc:
            if (!has_bound) {
                throw std::invalid_argument("bounded model checking needs a bound");
            }
            cmd << "msat_check_ltlspec_bmc -k " << *bound;
            if (has_property) cmd << " -p " << quote(*property);
            break;
    }

    const auto line = cmd.str();
    return resolve(mode, [&] { return exchange(line, timeout); });
}

std::vector<Outcome> Controller::verify(PropertyKind kind,
                                        std::optional<unsigned> bound,
                                        const std::optional<std::string>& property,
                                        Timeout timeout) {
    return Outcome::parse(run_property(kind, bound, property, timeout));
}

State Controller::init_simulation_state(Heuristic& heuristic, const std::string& constraint, Timeout timeout) {
    const auto cmd = "msat_pick_state -c " + quote(constraint) + " -v -i";
    const auto candidates = resolve(Mode::Symbolic, [&] {
        session_.send(cmd);
        return await_candidates(timeout);
    });

    simulated_.clear();
    std::string transcript;
    auto state = commit_choice(heuristic, candidates, timeout, transcript);
    simulated_.push_back(state);
    return state;
}

SimulationStep Controller::step_simulation(Heuristic& heuristic, const std::string& constraint, Timeout timeout) {
    const auto cmd = "msat_simulate -i -a -k 1 -c " + quote(constraint);
    const auto candidates = resolve(Mode::Symbolic, [&] {
        session_.send(cmd);
        return await_candidates(timeout);
    });

    std::string transcript;
    auto state = commit_choice(heuristic, candidates, timeout, transcript);
    simulated_.push_back(state);
    return {std::move(state), transcript.find(kSimulationSat) != std::string::npos};
}

bool Controller::run_simulation(Heuristic& heuristic, std::size_t steps, const std::string& constraint,
                                Timeout timeout) {
    bool satisfiable = true;
    for (std::size_t i = 0; steps == 0 || i < steps; ++i) {
        satisfiable = step_simulation(heuristic, constraint, timeout).satisfiable;
        if (!satisfiable) {
            session_.logger().debug("simulation became unsatisfiable after {} steps", i + 1);
            break;
        }
    }
    return satisfiable;
}

Trace Controller::simulation_trace() const {
    Trace trace;
    trace.description = "Simulation";
    trace.type = "Simulation";
    trace.states = simulated_;
    return trace;
}

std::string Controller::raw(const std::string& cmd, Timeout timeout) {
    return resolve(Mode::None, [&] { return exchange(cmd, timeout); });
}

std::string Controller::exchange(const std::string& cmd, Timeout timeout) {
    session_.send(trim_copy(cmd));
    return session_.expect_prompt(timeout);
}

// Attempt; on a recoverable precondition build the missing piece and try
// exactly once more. A second precondition is a plain fault.
template <typename Attempt>
auto Controller::resolve(Mode mode, Attempt&& attempt) -> decltype(attempt()) {
    ensure_mode(mode);
    try {
        return attempt();
    } catch (const RecoverablePrecondition& first) {
        session_.logger().debug("recoverable precondition ({}): {}", to_string(first.kind()), first.what());
        remediate(first, mode);
    }
    try {
        return attempt();
    } catch (const RecoverablePrecondition& second) {
        throw BackendFault(second.what());
    }
}

void Controller::ensure_mode(Mode mode) {
    if ((mode == Mode::Bdd && !boolean_ready_) || (mode == Mode::Symbolic && !symbolic_ready_)) {
        warm_up(mode);
    }
}

void Controller::warm_up(Mode mode) {
    try {
        exchange(warm_up_command(mode), std::nullopt);
    } catch (const RecoverablePrecondition& ex) {
        throw BackendFault(ex.what());
    }
    if (mode == Mode::Bdd) {
        boolean_ready_ = true;
    } else {
        symbolic_ready_ = true;
    }
}

void Controller::remediate(const RecoverablePrecondition& cause, Mode mode) {
    switch (cause.kind()) {
        case Precondition::BooleanModelMissing:
            try {
                exchange("build_boolean_model", std::nullopt);
            } catch (const RecoverablePrecondition& ex) {
                throw BackendFault(ex.what());
            }
            return;
        case Precondition::ModeNotEngaged:
            if (mode == Mode::None) {
                throw BackendFault(cause.what());
            }
            warm_up(mode);
            return;
    }
}

std::vector<std::string> Controller::await_candidates(Timeout timeout) {
    const auto match = session_.expect({Pattern::regex(kChoosePrompt),
                                        Pattern::exact(kOnlyOneState),
                                        Pattern::exact(session_.config().prompt)},
                                       timeout);
    if (match.index == 2) {
        throw ParseError("engine did not offer any state to choose from");
    }

    static const std::regex state_number(R"([0-9]+\) -------------------------)");
    std::vector<std::string> candidates;
    auto at = match.before.find(kStateSeparator);
    while (at != std::string::npos) {
        const auto begin = at + kStateSeparator.size();
        const auto next = match.before.find(kStateSeparator, begin);
        const auto chunk = match.before.substr(begin, next == std::string::npos ? next : next - begin);
        candidates.push_back(
            trim_copy(std::regex_replace(chunk, state_number, "", std::regex_constants::format_first_only)));
        at = next;
    }
    if (candidates.empty()) {
        throw ParseError("state selection prompt without candidate states");
    }
    return candidates;
}

State Controller::commit_choice(Heuristic& heuristic, const std::vector<std::string>& candidates,
                                Timeout timeout, std::string& transcript) {
    const auto choice = choose_from(heuristic, candidates);
    if (choice >= candidates.size()) {
        throw std::out_of_range("heuristic chose state " + std::to_string(choice) + " of " +
                                std::to_string(candidates.size()));
    }
    auto state = parse_state(candidates[choice]).state;
    transcript = exchange(std::to_string(choice), timeout);
    return state;
}

}  // namespace xmv::bridge
