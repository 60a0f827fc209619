#pragma once

#include "outcome.hpp"
#include "trace.hpp"

#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace xmv::bridge {

// JSON encoding; Outcome::unparsed is left out and decodes as empty.
void to_json(nlohmann::json& j, const Trace& trace);
void from_json(const nlohmann::json& j, Trace& trace);
void to_json(nlohmann::json& j, const Outcome& outcome);
void from_json(const nlohmann::json& j, Outcome& outcome);

enum class ReportFormat {
    Text,
    Json,
};

/**
 * \brief Renders verification outcomes and simulation traces.
 *
 * - Text: one summary line per outcome followed by its counterexample, in a
 *   layout close to the engine's own.
 * - Json: a document with per-verdict counts and the encoded outcomes, or the
 *   encoded trace.
 *
 * With \a full_states the state deltas are folded before rendering; with
 * \a parse_values values are shown with their coerced types.
 */
class ReportWriter {
public:
    struct Options {
        ReportFormat format{ReportFormat::Text};
        bool full_states{false};
        bool parse_values{false};
    };

    explicit ReportWriter(Options options);

    void write(std::ostream& out, const std::vector<Outcome>& outcomes) const;

    void write(std::ostream& out, const Trace& trace) const;

    [[nodiscard]] std::vector<std::string> render_text(const Trace& trace) const;

    [[nodiscard]] nlohmann::json render_json(const Trace& trace) const;

private:
    Options options_;
};

}  // namespace xmv::bridge
