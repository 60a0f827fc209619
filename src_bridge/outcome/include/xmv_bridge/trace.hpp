#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xmv::bridge {

/// Variable name to the literal value printed by the engine.
using State = std::map<std::string, std::string>;

/// Display-only typed view of an engine value.
using Value = std::variant<bool, std::int64_t, double, std::string>;

using ParsedState = std::map<std::string, Value>;

/**
 * \brief Coerce an engine literal: `TRUE`/`FALSE` become booleans, numbers
 *        become integers when integral and doubles otherwise, anything else
 *        stays a string.
 */
[[nodiscard]] Value coerce_value(const std::string& raw);

[[nodiscard]] std::string to_string(const Value& value);

/// One state block as printed by the engine.
struct StateChunk {
    State state;
    bool loop_starts_next{false};  ///< a `-- Loop starts here` marker closes the block
};

/**
 * Parse `name = value` lines, skipping comment lines (`--`) and step
 * headers (`->`). Throws ParseError on any other line without `=`.
 */
[[nodiscard]] StateChunk parse_state(std::string_view text);

/**
 * \brief Execution path reported by the engine.
 *
 * States are deltas when they come from a counterexample or a simulation:
 * each one lists only the variables that changed. A non-empty
 * \a loop_indexes makes the trace a lasso; each index is the first state of
 * a suffix that repeats forever.
 */
struct Trace {
    std::string description;
    std::string type;
    std::vector<State> states;
    std::set<std::size_t> loop_indexes;

    /// Parse the part of a property report that starts at `Trace Description:`.
    [[nodiscard]] static Trace parse(std::string_view text);

    /// Build a trace out of raw state blocks (simulation output).
    [[nodiscard]] static Trace of_states(const std::vector<std::string>& chunks,
                                         std::string type,
                                         std::string description);

    /// Running union of the deltas: entry i holds every variable seen up to step i.
    [[nodiscard]] std::vector<State> full_states() const;

    [[nodiscard]] std::vector<ParsedState> parsed_states(bool full = false) const;

    bool operator==(const Trace& other) const = default;
};

}  // namespace xmv::bridge
