#pragma once

#include "trace.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xmv::bridge {

enum class Verdict {
    True,
    False,
    Unknown,
};

/// "SUCCESSFUL", "FAILED" or "INCONCLUSIVE".
[[nodiscard]] const char* to_string(Verdict verdict) noexcept;

/**
 * \brief Result of checking one property.
 *
 * \a trace is set exactly when \a verdict is Verdict::False. \a unparsed keeps
 * the slice of the transcript the outcome was built from; it is not part of
 * the JSON encoding.
 */
struct Outcome {
    std::string logic;          ///< tag printed in the report header, e.g. "LTL"
    std::string specification;  ///< property text
    Verdict verdict{Verdict::Unknown};
    std::optional<Trace> trace;
    std::string unparsed;

    /**
     * Split a transcript into per-property reports.
     *
     * Every "is true", "is false" or "is unknown" closes the header line of a
     * report that starts at the nearest preceding `--`. Reports follow each
     * other without overlap, in transcript order. Throws ParseError when a
     * report does not have the expected shape.
     */
    [[nodiscard]] static std::vector<Outcome> parse(std::string_view text);

    /// One-line summary, e.g. "VERIFICATION FAILED for G p (LTL)".
    [[nodiscard]] std::string message() const;
};

}  // namespace xmv::bridge
