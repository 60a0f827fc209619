#include "xmv_bridge/heuristics.hpp"
#include "xmv_bridge/errors.hpp"
#include "xmv_bridge/detail/strings.hpp"

#include <charconv>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace {

std::optional<std::size_t> parse_index(std::string_view raw) {
    raw = xmv::bridge::detail::trim(raw);
    if (raw.empty()) return std::nullopt;

    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) return std::nullopt;
    return value;
}

}  // namespace

namespace xmv::bridge {

RandomChoice::RandomChoice(std::optional<std::uint64_t> seed)
    : rng_(seed ? *seed
                : static_cast<std::uint64_t>(std::chrono::system_clock::now().time_since_epoch().count())) {}

std::size_t RandomChoice::choose_from(const std::vector<std::string>& candidates) {
    if (candidates.empty()) {
        throw std::invalid_argument("no candidate states to choose from");
    }
    std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
    return pick(rng_);
}

UserChoice::UserChoice() : UserChoice(std::cin, std::cout) {}

UserChoice::UserChoice(std::istream& in, std::ostream& out) : in_(&in), out_(&out) {}

std::size_t UserChoice::choose_from(const std::vector<std::string>& candidates) {
    const auto bound = candidates.size();
    if (bound == 0) {
        return 0;
    }
    for (std::size_t i = 0; i < bound; ++i) {
        *out_ << "--- " << i << " ---\n" << candidates[i] << "\n";
    }
    for (;;) {
        *out_ << "Choose a state (0-" << (bound - 1) << "): " << std::flush;
        std::string answer;
        if (!std::getline(*in_, answer)) {
            throw Error("input closed while choosing a state");
        }
        if (auto choice = parse_index(answer); choice && *choice < bound) {
            return *choice;
        }
    }
}

std::size_t choose_from(Heuristic& heuristic, const std::vector<std::string>& candidates) {
    return std::visit([&](auto& h) { return h.choose_from(candidates); }, heuristic);
}

HeuristicKind parse_heuristic_kind(std::string_view name) {
    if (name == "user") return HeuristicKind::User;
    if (name == "random") return HeuristicKind::Random;
    throw std::invalid_argument("unknown heuristic '" + std::string{name} + "' (expected user or random)");
}

Heuristic make_heuristic(HeuristicKind kind, std::optional<std::uint64_t> seed) {
    switch (kind) {
        case HeuristicKind::Random:
            return RandomChoice(seed);
        case HeuristicKind::User:
            break;
    }
    return UserChoice();
}

}  // namespace xmv::bridge
