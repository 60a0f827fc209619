#pragma once

#include "xmv_bridge/errors.hpp"
#include "xmv_bridge/heuristics.hpp"
#include "xmv_bridge/outcome.hpp"
#include "xmv_bridge/session.hpp"
#include "xmv_bridge/trace.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace xmv::bridge {

/// Verification commands understood by the engine.
enum class PropertyKind {
    Ltl,       // check_ltlspec (BDD)
    LtlIc3,    // check_ltlspec_ic3
    InvarIc3,  // check_property_as_invar_ic3
    Bmc,       // msat_check_ltlspec_bmc
};

/// Engine back-end a command needs; each one has a one-time warm-up.
enum class Mode {
    None,
    Bdd,       // warm-up: go
    Symbolic,  // warm-up: go_msat
};

struct SimulationStep {
    State state;       // state committed by the step
    bool satisfiable;  // false once the path can no longer be extended
};

/**
 * Command layer on top of a Session.
 *
 * Builds nuXmv commands, keeps track of which back-end has been warmed up
 * and resolves the preconditions the engine reports as recoverable: the
 * missing piece is built once and the command is retried once. Errors are
 * thrown, never printed.
 *
 * Lifecycle: the constructor spawns the engine (Ready), set_model() loads a
 * model (ModelLoaded), and the first command of each back-end engages it.
 * reset() drops both back-ends.
 */
class Controller {
public:
    struct Config {
        Session::Config session{};

        // Value of shown_states applied by set_model().
        unsigned shown_states{65535};

        // Model loaded right after start-up, if any.
        std::optional<std::filesystem::path> model{};
    };

    explicit Controller(Config cfg);

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    /**
     * Full reset followed by loading \a model.
     * Throws LoadError when any step reports a fatal condition.
     */
    void set_model(const std::filesystem::path& model);

    /// Query the engine for its configuration and refresh the cache.
    std::map<std::string, std::string> get_environment();

    /// Cached configuration; unset variables are absent.
    [[nodiscard]] const std::map<std::string, std::string>& environment() const noexcept { return env_; }

    /// `set name "value"`, or `unset name` when \a value is empty.
    void set_environment(const std::string& name, const std::optional<std::string>& value);

    /**
     * Send `reset`. With \a restore_defaults the configuration seen at
     * start-up is restored first. Both back-ends have to be warmed up again.
     */
    void reset(bool restore_defaults = false);

    /**
     * Run one verification command and return its transcript.
     *
     * \a bound is required for PropertyKind::Bmc and ignored for
     * PropertyKind::Ltl. Without \a property the engine checks every
     * property of the model.
     */
    std::string run_property(PropertyKind kind,
                             std::optional<unsigned> bound,
                             const std::optional<std::string>& property,
                             Timeout timeout = std::nullopt);

    /// run_property() followed by Outcome::parse().
    std::vector<Outcome> verify(PropertyKind kind,
                                std::optional<unsigned> bound,
                                const std::optional<std::string>& property,
                                Timeout timeout = std::nullopt);

    /**
     * Pick an initial state satisfying \a constraint and start a new
     * simulation from it. Returns the committed state.
     */
    State init_simulation_state(Heuristic& heuristic,
                                const std::string& constraint = "TRUE",
                                Timeout timeout = std::nullopt);

    /// Extend the simulation by one state satisfying \a constraint.
    SimulationStep step_simulation(Heuristic& heuristic,
                                   const std::string& constraint = "TRUE",
                                   Timeout timeout = std::nullopt);

    /**
     * Call step_simulation() up to \a steps times (0 = until the path becomes
     * unsatisfiable). Returns whether the path is still satisfiable.
     */
    bool run_simulation(Heuristic& heuristic,
                        std::size_t steps,
                        const std::string& constraint = "TRUE",
                        Timeout timeout = std::nullopt);

    /// States committed since the last init_simulation_state(), kept across errors.
    [[nodiscard]] const std::vector<State>& simulated_states() const noexcept { return simulated_; }

    [[nodiscard]] Trace simulation_trace() const;

    /// Send an arbitrary command through the precondition resolver.
    std::string raw(const std::string& cmd, Timeout timeout = std::nullopt);

    [[nodiscard]] bool boolean_ready() const noexcept { return boolean_ready_; }
    [[nodiscard]] bool symbolic_ready() const noexcept { return symbolic_ready_; }

    [[nodiscard]] Session& session() noexcept { return session_; }

    void close() noexcept { session_.close(); }

private:
    std::string exchange(const std::string& cmd, Timeout timeout);

    template <typename Attempt>
    auto resolve(Mode mode, Attempt&& attempt) -> decltype(attempt());

    void ensure_mode(Mode mode);
    void warm_up(Mode mode);
    void remediate(const RecoverablePrecondition& cause, Mode mode);

    std::vector<std::string> await_candidates(Timeout timeout);
    State commit_choice(Heuristic& heuristic, const std::vector<std::string>& candidates,
                        Timeout timeout, std::string& transcript);

    Config cfg_;
    Session session_;
    std::map<std::string, std::string> default_env_;
    std::map<std::string, std::string> env_;
    bool boolean_ready_{false};
    bool symbolic_ready_{false};
    std::vector<State> simulated_;
};

}  // namespace xmv::bridge
