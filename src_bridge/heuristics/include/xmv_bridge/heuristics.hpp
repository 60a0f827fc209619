#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xmv::bridge {

/**
 * \brief Picks one of the candidate states uniformly at random.
 *
 * Without an explicit seed the generator is seeded from the wall clock.
 */
class RandomChoice {
public:
    explicit RandomChoice(std::optional<std::uint64_t> seed = std::nullopt);

    /// Throws std::invalid_argument on an empty candidate list.
    std::size_t choose_from(const std::vector<std::string>& candidates);

private:
    std::mt19937_64 rng_;
};

/**
 * \brief Asks a human on \a out and reads the answer from \a in.
 *
 * Every candidate is listed under a `--- i ---` header before the question.
 * Out-of-range or non-numeric answers are asked again. An empty candidate
 * list yields 0 without asking.
 */
class UserChoice {
public:
    UserChoice();
    UserChoice(std::istream& in, std::ostream& out);

    std::size_t choose_from(const std::vector<std::string>& candidates);

private:
    std::istream* in_;
    std::ostream* out_;
};

/// Every available state-selection strategy.
using Heuristic = std::variant<RandomChoice, UserChoice>;

/// Index in [0, candidates.size()) chosen by \a heuristic.
std::size_t choose_from(Heuristic& heuristic, const std::vector<std::string>& candidates);

enum class HeuristicKind {
    User,
    Random,
};

/// "user" or "random"; throws std::invalid_argument otherwise.
[[nodiscard]] HeuristicKind parse_heuristic_kind(std::string_view name);

[[nodiscard]] Heuristic make_heuristic(HeuristicKind kind, std::optional<std::uint64_t> seed = std::nullopt);

}  // namespace xmv::bridge
