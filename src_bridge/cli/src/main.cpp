#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "xmv_bridge/controller.hpp"
#include "xmv_bridge/errors.hpp"
#include "xmv_bridge/fatal_phrases.hpp"
#include "xmv_bridge/heuristics.hpp"
#include "xmv_bridge/report_writer.hpp"

using xmv::bridge::BackendTimeout;
using xmv::bridge::Controller;
using xmv::bridge::Error;
using xmv::bridge::FatalPhraseLoader;
using xmv::bridge::HeuristicKind;
using xmv::bridge::Interrupted;
using xmv::bridge::Outcome;
using xmv::bridge::PropertyKind;
using xmv::bridge::ReportFormat;
using xmv::bridge::ReportWriter;
using xmv::bridge::ToolNotFound;
using xmv::bridge::Verdict;

namespace {

enum ExitCode : int {
    kSuccess = 0,
    kUsage = 2,
    kInconclusive = 5,
    kInternalError = 6,
    kVerificationFailed = 10,
    kTimeout = 124,
    kInterrupted = 130,
};

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_signal(int) {
    g_interrupted = 1;
}

// No SA_RESTART: blocking waits have to return so the flag gets noticed.
void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = on_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Args {
    std::string command;
    std::filesystem::path model{};

    // simulate
    std::size_t steps{0};
    std::string constraint{"TRUE"};
    HeuristicKind heuristic{HeuristicKind::User};
    std::optional<std::uint64_t> seed{};
    bool full_states{false};
    bool parse_values{false};

    // ltl / invar
    std::string algorithm{"ic3"};
    std::optional<unsigned> bound{};
    std::vector<std::string> properties;

    // common
    unsigned timeout_seconds{0};
    ReportFormat format{ReportFormat::Text};
    std::filesystem::path fatal_phrases{};
    std::string executable{"nuXmv"};
    bool debug{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "nuXmv bridge\n"
        << "Usage:\n"
        << "  " << argv0 << " simulate [--steps N] [--constraint EXPR] [--heuristic user|random]\n"
        << "                 [--seed N] [--full] [--parse] [common options] <model>\n"
        << "  " << argv0 << " ltl [--algorithm ic3|bmc|bdd] [--bound K] [--property EXPR ...]\n"
        << "                 [common options] <model>\n"
        << "  " << argv0 << " invar [--bound K] [--property EXPR ...] [common options] <model>\n"
        << "  " << argv0 << " version\n"
        << "\n"
        << "Common options:\n"
        << "  --timeout S         Time limit per engine command in seconds (0 = none).\n"
        << "  --format text|json  Output format (default: text).\n"
        << "  --fatal-phrases F   Extra fatal/precondition phrases (key=value file).\n"
        << "  --executable PATH   Engine executable (default: nuXmv from PATH).\n"
        << "  --debug             Log engine traffic to stderr.\n"
        << "  -h, --help          Show this help message.\n"
        << "\n"
        << "Exit codes: 0 success, 2 usage, 5 inconclusive, 6 engine or internal error,\n"
        << "            10 verification failed, 124 timeout, 130 interrupted.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

template <typename T>
T parse_number(std::string_view option, std::string_view raw) {
    T value{};
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        throw UsageError(std::string{option} + " expects a non-negative integer, got '" + std::string{raw} + "'");
    }
    return value;
}

Args parse_args(int argc, char** argv) {
    Args args;
    std::vector<std::string> positional;

    const auto value_of = [&](int& i, std::string_view option) -> std::string_view {
        if (i + 1 >= argc) {
            throw UsageError(std::string{option} + " expects a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            return args;
        } else if (arg_eq(tok, "--steps")) {
            args.steps = parse_number<std::size_t>(tok, value_of(i, tok));
        } else if (arg_eq(tok, "--constraint")) {
            args.constraint = std::string(value_of(i, tok));
        } else if (arg_eq(tok, "--heuristic")) {
            try {
                args.heuristic = xmv::bridge::parse_heuristic_kind(value_of(i, tok));
            } catch (const std::invalid_argument& ex) {
                throw UsageError(ex.what());
            }
        } else if (arg_eq(tok, "--seed")) {
            args.seed = parse_number<std::uint64_t>(tok, value_of(i, tok));
        } else if (arg_eq(tok, "--full")) {
            args.full_states = true;
        } else if (arg_eq(tok, "--parse")) {
            args.parse_values = true;
        } else if (arg_eq(tok, "--algorithm")) {
            args.algorithm = std::string(value_of(i, tok));
        } else if (arg_eq(tok, "--bound")) {
            args.bound = parse_number<unsigned>(tok, value_of(i, tok));
        } else if (arg_eq(tok, "--property")) {
            args.properties.emplace_back(value_of(i, tok));
        } else if (arg_eq(tok, "--timeout")) {
            args.timeout_seconds = parse_number<unsigned>(tok, value_of(i, tok));
        } else if (arg_eq(tok, "--format")) {
            const auto format = value_of(i, tok);
            if (arg_eq(format, "text")) {
                args.format = ReportFormat::Text;
            } else if (arg_eq(format, "json")) {
                args.format = ReportFormat::Json;
            } else {
                throw UsageError("--format expects text or json");
            }
        } else if (arg_eq(tok, "--fatal-phrases")) {
            args.fatal_phrases = std::filesystem::path(value_of(i, tok));
        } else if (arg_eq(tok, "--executable")) {
            args.executable = std::string(value_of(i, tok));
        } else if (arg_eq(tok, "--debug")) {
            args.debug = true;
        } else if (tok.size() > 1 && tok.front() == '-') {
            throw UsageError("unknown option " + std::string{tok});
        } else {
            positional.emplace_back(tok);
        }
    }

    if (positional.empty()) {
        throw UsageError("no command given");
    }
    args.command = positional.front();

    if (args.command == "version") {
        if (positional.size() != 1) {
            throw UsageError("version takes no arguments");
        }
        return args;
    }
    if (args.command != "simulate" && args.command != "ltl" && args.command != "invar") {
        throw UsageError("unknown command " + args.command);
    }
    if (positional.size() != 2) {
        throw UsageError(args.command + " expects exactly one model file");
    }
    args.model = positional[1];
    if (!std::filesystem::exists(args.model)) {
        throw UsageError("model file not found: " + args.model.string());
    }

    if (args.command == "ltl" && args.algorithm != "ic3" && args.algorithm != "bmc" && args.algorithm != "bdd") {
        throw UsageError("--algorithm expects ic3, bmc or bdd");
    }
    if (args.command == "ltl" && args.algorithm == "bmc" && (!args.bound || *args.bound == 0)) {
        throw UsageError("--algorithm bmc needs a positive --bound");
    }

    return args;
}

Controller::Config make_config(const Args& args) {
    Controller::Config cfg;
    cfg.session.executable = args.executable;
    cfg.session.interrupt_flag = &g_interrupted;
    cfg.session.debug = args.debug;
    if (!args.fatal_phrases.empty()) {
        cfg.session.fatal_phrases = FatalPhraseLoader{}.load(args.fatal_phrases);
    }
    cfg.model = args.model;
    return cfg;
}

xmv::bridge::Timeout command_timeout(const Args& args) {
    if (args.timeout_seconds == 0) {
        return std::nullopt;
    }
    return std::chrono::seconds(args.timeout_seconds);
}

int aggregate_exit_code(const std::vector<Outcome>& outcomes) {
    if (outcomes.empty()) return kInconclusive;
    bool any_unknown = false;
    for (const auto& o : outcomes) {
        if (o.verdict == Verdict::False) return kVerificationFailed;
        if (o.verdict == Verdict::Unknown) any_unknown = true;
    }
    return any_unknown ? kInconclusive : kSuccess;
}

int run_simulate(const Args& args, Controller& ctl, const ReportWriter& writer) {
    auto heuristic = xmv::bridge::make_heuristic(args.heuristic, args.seed);
    const auto timeout = command_timeout(args);

    // Whatever was simulated before a timeout or an interrupt still gets printed.
    const auto print_partial = [&] {
        if (!ctl.simulated_states().empty()) {
            writer.write(std::cout, ctl.simulation_trace());
        }
    };

    try {
        ctl.init_simulation_state(heuristic, args.constraint, timeout);
        const bool satisfiable = ctl.run_simulation(heuristic, args.steps, args.constraint, timeout);
        writer.write(std::cout, ctl.simulation_trace());
        if (!satisfiable) {
            std::cerr << "simulation stopped: no successor satisfies the constraint\n";
        }
        return kSuccess;
    } catch (const BackendTimeout&) {
        print_partial();
        throw;
    } catch (const Interrupted&) {
        print_partial();
        throw;
    } catch (const Error&) {
        // A signal that lands while the user heuristic reads stdin closes
        // the input instead of reaching the session.
        if (g_interrupted == 0) {
            throw;
        }
        print_partial();
        throw Interrupted();
    }
}

int run_verification(const Args& args, Controller& ctl, const ReportWriter& writer) {
    PropertyKind kind = PropertyKind::InvarIc3;
    if (args.command == "ltl") {
        if (args.algorithm == "bdd") kind = PropertyKind::Ltl;
        else if (args.algorithm == "bmc") kind = PropertyKind::Bmc;
        else kind = PropertyKind::LtlIc3;
    }

    std::vector<std::optional<std::string>> properties(args.properties.begin(), args.properties.end());
    if (properties.empty()) {
        properties.emplace_back(std::nullopt);
    }

    std::vector<Outcome> outcomes;
    for (const auto& property : properties) {
        auto partial = ctl.verify(kind, args.bound, property, command_timeout(args));
        outcomes.insert(outcomes.end(),
                        std::make_move_iterator(partial.begin()),
                        std::make_move_iterator(partial.end()));
    }

    writer.write(std::cout, outcomes);
    return aggregate_exit_code(outcomes);
}

}  // namespace

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const UsageError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return kUsage;
    }
    if (args.help) {
        print_usage(argv[0]);
        return kSuccess;
    }
    if (args.command == "version") {
        std::cout << "xmv-bridge " << XMV_BRIDGE_VERSION << "\n";
        return kSuccess;
    }

    install_signal_handlers();

    try {
        Controller ctl(make_config(args));
        const ReportWriter writer(ReportWriter::Options{
            .format = args.format,
            .full_states = args.full_states,
            .parse_values = args.parse_values,
        });

        if (args.command == "simulate") {
            return run_simulate(args, ctl, writer);
        }
        return run_verification(args, ctl, writer);
    } catch (const ToolNotFound& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return kInternalError;
    } catch (const BackendTimeout& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return kTimeout;
    } catch (const Interrupted& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return kInterrupted;
    } catch (const std::invalid_argument& ex) {
        // Properties, constraints or paths the engine cannot be given.
        std::cerr << "ERROR: " << ex.what() << "\n";
        return kUsage;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return kInternalError;
    }
}
