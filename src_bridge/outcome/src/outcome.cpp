#include "xmv_bridge/outcome.hpp"
#include "xmv_bridge/errors.hpp"
#include "xmv_bridge/detail/strings.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using xmv::bridge::Verdict;

using xmv::bridge::detail::kWhitespace;
using xmv::bridge::detail::trim_copy;

constexpr std::string_view kSpecificationKeyword = "specification";

struct VerdictPhrase {
    std::string_view text;
    Verdict verdict;
};

constexpr std::array<VerdictPhrase, 3> kVerdictPhrases{{
    {"is true", Verdict::True},
    {"is false", Verdict::False},
    {"is unknown", Verdict::Unknown},
}};

struct Mark {
    std::size_t place;
    Verdict verdict;
};

void erase_all(std::string& s, std::string_view what) {
    for (auto at = s.find(what); at != std::string::npos; at = s.find(what, at)) {
        s.erase(at, what.size());
    }
}

// "-- LTL specification G p  is true" -> ("LTL", "G p")
std::pair<std::string, std::string> split_header(std::string_view header) {
    auto body = trim_copy(header.substr(2));
    const auto tag_end = body.find_first_of(kWhitespace);
    std::string logic = body.substr(0, tag_end);
    if (logic.empty()) {
        throw xmv::bridge::ParseError("property report header without a tag: '" + std::string{header} + "'");
    }

    std::string spec;
    if (const auto kw = body.find(kSpecificationKeyword); kw != std::string::npos) {
        spec = body.substr(kw + kSpecificationKeyword.size());
    } else if (tag_end != std::string::npos) {
        spec = body.substr(tag_end);
    }
    for (const auto& phrase : kVerdictPhrases) {
        erase_all(spec, phrase.text);
    }
    return {std::move(logic), trim_copy(spec)};
}

}  // namespace

namespace xmv::bridge {

const char* to_string(Verdict verdict) noexcept {
    switch (verdict) {
        case Verdict::True:
            return "SUCCESSFUL";
        case Verdict::False:
            return "FAILED";
        case Verdict::Unknown:
            return "INCONCLUSIVE";
    }
    return "INCONCLUSIVE";
}

std::vector<Outcome> Outcome::parse(std::string_view text) {
    std::vector<Mark> marks;
    for (const auto& phrase : kVerdictPhrases) {
        for (auto at = text.find(phrase.text); at != std::string_view::npos; at = text.find(phrase.text, at + 1)) {
            marks.push_back({at, phrase.verdict});
        }
    }
    std::sort(marks.begin(), marks.end(), [](const Mark& a, const Mark& b) { return a.place < b.place; });

    // Each report starts at the comment marker closest before its verdict.
    std::vector<Mark> starts;
    for (const auto& mark : marks) {
        const auto start = text.substr(0, mark.place).rfind("--");
        if (start == std::string_view::npos) {
            throw ParseError("verdict without a preceding report header");
        }
        if (!starts.empty() && starts.back().place == start) {
            continue;
        }
        starts.push_back({start, mark.verdict});
    }

    std::vector<Outcome> outcomes;
    outcomes.reserve(starts.size());
    for (std::size_t i = 0; i < starts.size(); ++i) {
        const auto begin = starts[i].place;
        const auto end = i + 1 < starts.size() ? starts[i + 1].place : text.size();
        const auto slice = text.substr(begin, end - begin);

        Outcome outcome;
        auto [logic, spec] = split_header(slice.substr(0, slice.find('\n')));
        outcome.logic = std::move(logic);
        outcome.specification = std::move(spec);
        outcome.verdict = starts[i].verdict;
        if (outcome.verdict == Verdict::False) {
            outcome.trace = Trace::parse(slice);
        }
        outcome.unparsed = std::string{slice};
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

std::string Outcome::message() const {
    return std::string("VERIFICATION ") + to_string(verdict) + " for " + specification + " (" + logic + ")";
}

}  // namespace xmv::bridge
