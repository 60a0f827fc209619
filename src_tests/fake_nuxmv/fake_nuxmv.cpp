// Scripted stand-in for `nuXmv -int`, driven over a pseudo-terminal by the
// session and controller tests. It echoes every input line like the real
// shell does with readline, and answers the handful of commands the bridge
// sends with canned transcripts.
//
// Options:
//   --never-build    build_boolean_model never takes effect
//   --sat-steps N    msat_simulate reports SAT for N steps, then UNSAT (default 3)
//
// Test-only commands:
//   hang [text]  print text, block until SIGINT, then print "Interrupted"
//   flood N      print N filler lines, then offer two states
//   disengage  forget go/go_msat without touching the model
//   stats      print the counters below
//   crash      exit without a prompt

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr const char* kPrompt = "nuXmv > ";
constexpr const char* kStateSeparator = "================= State =================";

volatile std::sig_atomic_t g_sigint = 0;

extern "C" void on_sigint(int) {
    g_sigint = 1;
}

struct Options {
    bool never_build{false};
    unsigned sat_steps{3};
};

struct Engine {
    std::map<std::string, std::string> env{
        {"default_simulation_steps", "10"}, {"locked_level", "3"}, {"shown_states", "25"}};
    bool model_read{false};
    bool bdd_engaged{false};
    bool msat_engaged{false};
    bool boolean_built{false};
    bool state_picked{false};
    unsigned steps_taken{0};

    unsigned boolean_builds{0};
    unsigned attempts{0};
    unsigned go{0};
    unsigned go_msat{0};
};

// Whitespace-separated words; double quotes group and are dropped.
std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> words;
    std::string current;
    bool quoted = false;
    bool pending = false;
    for (const char c : line) {
        if (c == '"') {
            quoted = !quoted;
            pending = true;
        } else if (!quoted && (c == ' ' || c == '\t')) {
            if (pending) words.push_back(current);
            current.clear();
            pending = false;
        } else {
            current.push_back(c);
            pending = true;
        }
    }
    if (pending) words.push_back(current);
    return words;
}

std::string option_value(const std::vector<std::string>& words, const std::string& flag) {
    for (std::size_t i = 1; i + 1 < words.size(); ++i) {
        if (words[i] == flag) return words[i + 1];
    }
    return {};
}

void print_state(std::size_t index, const std::map<std::string, std::string>& values) {
    std::cout << "\n" << kStateSeparator << "\n" << index << ") -------------------------\n";
    for (const auto& [name, value] : values) {
        std::cout << "    " << name << " = " << value << "\n";
    }
}

void print_counterexample(bool lasso) {
    std::cout << "-- as demonstrated by the following execution sequence\n"
              << "Trace Description: " << (lasso ? "LTL Counterexample" : "AG alpha Counterexample") << "\n"
              << "Trace Type: Counterexample\n"
              << "  -> State: 1.1 <-\n"
              << "    flag = FALSE\n"
              << "    x = 0\n";
    if (lasso) {
        std::cout << "  -- Loop starts here\n";
    }
    std::cout << "  -> State: 1.2 <-\n"
              << "    x = 1\n"
              << "  -> State: 1.3 <-\n"
              << "    flag = TRUE\n"
              << "    x = 0\n";
}

void print_report(const std::string& logic, const std::string& property, bool lasso) {
    const std::string header = logic == "invariant" ? "-- invariant " : "-- " + logic + " specification ";
    if (property.find("fail") != std::string::npos) {
        std::cout << header << property << "  is false\n";
        print_counterexample(lasso);
    } else if (property.find("unknown") != std::string::npos) {
        std::cout << header << property << "  is unknown\n";
    } else {
        std::cout << header << property << "  is true\n";
    }
}

// locked_* variables are read-only and "bogus" is never a valid value.
bool rejects_update(const std::string& name, const std::string* value) {
    if (name.rfind("locked_", 0) == 0) {
        std::cout << "Type System Violation detected: " << name << " is read-only\n";
        return true;
    }
    if (value != nullptr && *value == "bogus") {
        std::cout << "Type System Violation detected: bogus is not a valid value for " << name << "\n";
        return true;
    }
    return false;
}

bool read_line(std::string& line) {
    if (!std::getline(std::cin, line)) return false;
    // Armed before the echo: an interrupt sent right after it must not be lost.
    g_sigint = 0;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    std::cout << line << "\n";
    return true;
}

// Offers candidates, reads the choice and prints the follow-up.
void offer_states(const std::vector<std::map<std::string, std::string>>& states, const std::string& epilogue) {
    std::cout << "***************  AVAILABLE STATES  *************\n";
    for (std::size_t i = 0; i < states.size(); ++i) {
        print_state(i, states[i]);
    }
    std::cout << "\n";
    if (states.size() == 1) {
        std::cout << "There's only one available state. Press Return to Proceed.";
    } else {
        std::cout << "Choose a state from the above (0-" << states.size() - 1 << "): ";
    }
    std::cout << std::flush;

    std::string choice;
    if (!read_line(choice)) std::exit(0);
    std::cout << "Chosen state is: " << (choice.empty() ? "0" : choice) << "\n" << epilogue;
}

void run_check(Engine& engine, const std::vector<std::string>& words) {
    const auto& cmd = words.front();
    const bool symbolic = cmd != "check_ltlspec";
    ++engine.attempts;

    if (symbolic ? !engine.msat_engaged : !engine.bdd_engaged) {
        std::cout << "The model must be built before.\n";
        return;
    }
    if (!symbolic && !engine.boolean_built) {
        std::cout << "The boolean model must be built before.\n";
        return;
    }

    const bool invariant = cmd == "check_property_as_invar_ic3";
    const auto logic = invariant ? std::string("invariant") : std::string("LTL");
    const auto property = option_value(words, invariant ? "-L" : "-p");
    if (property.empty()) {
        print_report(logic, "G TRUE", !invariant);
        print_report(logic, "F fail", !invariant);
    } else {
        print_report(logic, property, !invariant);
    }
}

void dispatch(Engine& engine, const Options& options, const std::vector<std::string>& words) {
    const auto& cmd = words.front();

    if (cmd == "set") {
        if (words.size() == 1) {
            for (const auto& [name, value] : engine.env) {
                std::cout << name << " \"" << value << "\"\n";
            }
            if (engine.env.count("input_file") == 0) {
                std::cout << "input_file NULL\n";
            }
        } else if (words.size() >= 3 && !rejects_update(words[1], &words[2])) {
            engine.env[words[1]] = words[2];
        }
    } else if (cmd == "unset") {
        if (words.size() >= 2 && !rejects_update(words[1], nullptr)) engine.env.erase(words[1]);
    } else if (cmd == "reset") {
        const auto counters = engine;
        engine = Engine{};
        engine.env = counters.env;
        engine.boolean_builds = counters.boolean_builds;
        engine.attempts = counters.attempts;
        engine.go = counters.go;
        engine.go_msat = counters.go_msat;
    } else if (cmd == "read_model") {
        const auto file = engine.env.find("input_file");
        if (file == engine.env.end()) {
            std::cout << "You must set the input file before.\n";
        } else if (file->second.find("broken") != std::string::npos) {
            std::cout << "file " << file->second << ": line 3: TYPE ERROR: x := TRUE\n";
        } else {
            engine.model_read = true;
        }
    } else if (cmd == "flatten_hierarchy") {
        if (!engine.model_read) std::cout << "A model must be read before.\n";
    } else if (cmd == "go" || cmd == "go_msat") {
        if (!engine.model_read) {
            std::cout << "A model must be read before.\n";
        } else if (cmd == "go") {
            ++engine.go;
            engine.bdd_engaged = true;
        } else {
            ++engine.go_msat;
            engine.msat_engaged = true;
        }
    } else if (cmd == "disengage") {
        engine.bdd_engaged = false;
        engine.msat_engaged = false;
    } else if (cmd == "build_boolean_model") {
        ++engine.boolean_builds;
        if (!options.never_build) engine.boolean_built = true;
    } else if (cmd == "check_ltlspec" || cmd == "check_ltlspec_ic3" || cmd == "check_property_as_invar_ic3" ||
               cmd == "msat_check_ltlspec_bmc") {
        run_check(engine, words);
    } else if (cmd == "msat_pick_state") {
        if (!engine.msat_engaged) {
            std::cout << "The model must be built before.\n";
            return;
        }
        const auto constraint = option_value(words, "-c");
        if (constraint == "FALSE") {
            std::cout << "No trace: constraint and initial state are inconsistent\n";
            return;
        }
        engine.steps_taken = 0;
        engine.state_picked = true;
        if (constraint == "x = 7") {
            offer_states({{{"flag", "FALSE"}, {"x", "7"}}}, "");
        } else {
            offer_states({{{"flag", "FALSE"}, {"x", "0"}}, {{"flag", "TRUE"}, {"x", "5"}}}, "");
        }
    } else if (cmd == "msat_simulate") {
        if (!engine.msat_engaged || !engine.state_picked) {
            std::cout << "The model must be built before.\n";
            return;
        }
        ++engine.steps_taken;
        const auto base = std::to_string(engine.steps_taken);
        const auto verdict = engine.steps_taken <= options.sat_steps ? "Simulation is SAT\n" : "Simulation is UNSAT\n";
        offer_states({{{"x", base}}, {{"x", base + "0"}}}, verdict);
    } else if (cmd == "hang") {
        for (std::size_t i = 1; i < words.size(); ++i) {
            std::cout << (i > 1 ? " " : "") << words[i];
        }
        std::cout << "\n" << std::flush;
        while (g_sigint == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        std::cout << "Interrupted\n";
    } else if (cmd == "flood") {
        const auto lines = words.size() > 1 ? std::strtoul(words[1].c_str(), nullptr, 10) : 0UL;
        for (unsigned long i = 0; i < lines; ++i) {
            std::cout << "    -- filler line " << i << " of the state listing .............................\n";
        }
        offer_states({{{"x", "0"}}, {{"x", "1"}}}, "");
    } else if (cmd == "stats") {
        std::cout << "boolean_builds=" << engine.boolean_builds << " attempts=" << engine.attempts
                  << " go=" << engine.go << " go_msat=" << engine.go_msat << "\n";
    } else if (cmd == "crash") {
        std::cout << std::flush;
        std::_Exit(3);
    } else if (cmd == "quit") {
        std::exit(0);
    } else {
        std::cout << "command not found: " << cmd << "\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--never-build") {
            options.never_build = true;
        } else if (arg == "--sat-steps" && i + 1 < argc) {
            options.sat_steps = static_cast<unsigned>(std::strtoul(argv[++i], nullptr, 10));
        }
    }

    struct sigaction action {};
    action.sa_handler = on_sigint;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    sigaction(SIGINT, &action, nullptr);

    Engine engine;
    std::cout << "*** This is a scripted stand-in for nuXmv\n" << kPrompt << std::flush;

    std::string line;
    while (read_line(line)) {
        const auto words = tokenize(line);
        if (!words.empty()) {
            dispatch(engine, options, words);
        }
        std::cout << kPrompt << std::flush;
    }
    return 0;
}
