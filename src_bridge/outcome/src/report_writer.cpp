#include "xmv_bridge/report_writer.hpp"
#include "xmv_bridge/errors.hpp"

#include <cstdint>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using xmv::bridge::Verdict;

const char* verdict_key(Verdict verdict) {
    switch (verdict) {
        case Verdict::True:
            return "true";
        case Verdict::False:
            return "false";
        case Verdict::Unknown:
            return "unknown";
    }
    return "unknown";
}

Verdict verdict_from_key(const std::string& key) {
    if (key == "true") return Verdict::True;
    if (key == "false") return Verdict::False;
    if (key == "unknown") return Verdict::Unknown;
    throw xmv::bridge::ParseError("unknown verdict '" + key + "'");
}

json value_to_json(const xmv::bridge::Value& value) {
    return std::visit([](const auto& v) { return json(v); }, value);
}

// Typed values written with parse_values come back as engine literals.
std::string literal_from_json(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "TRUE" : "FALSE";
    if (value.is_number()) return value.dump();
    throw xmv::bridge::ParseError("unsupported state value " + value.dump());
}

json build_summary(const std::vector<xmv::bridge::Outcome>& outcomes) {
    json summary = {
        {"total", outcomes.size()},
        {"by_verdict", json::object()},
        {"outcomes", json::array()},
    };

    auto& by_verdict = summary["by_verdict"];
    for (const auto& outcome : outcomes) {
        summary["outcomes"].push_back(json(outcome));
        auto& counter = by_verdict[verdict_key(outcome.verdict)];
        if (!counter.is_number()) {
            counter = 0;
        }
        counter = counter.get<std::size_t>() + 1;
    }

    return summary;
}

}  // namespace

namespace xmv::bridge {

void to_json(json& j, const Trace& trace) {
    j = json{
        {"description", trace.description},
        {"type", trace.type},
        {"states", trace.states},
        {"loop_indexes", trace.loop_indexes},
    };
}

void from_json(const json& j, Trace& trace) {
    trace.description = j.at("description").get<std::string>();
    trace.type = j.at("type").get<std::string>();
    trace.states.clear();
    for (const auto& state : j.at("states")) {
        State decoded;
        for (const auto& [name, value] : state.items()) {
            decoded[name] = literal_from_json(value);
        }
        trace.states.push_back(std::move(decoded));
    }
    trace.loop_indexes = j.at("loop_indexes").get<std::set<std::size_t>>();
    if (!trace.loop_indexes.empty() && *trace.loop_indexes.rbegin() >= trace.states.size()) {
        throw ParseError("loop index out of range in encoded trace");
    }
}

void to_json(json& j, const Outcome& outcome) {
    j = json{
        {"logic", outcome.logic},
        {"specification", outcome.specification},
        {"verdict", verdict_key(outcome.verdict)},
        {"trace", outcome.trace ? json(*outcome.trace) : json(nullptr)},
    };
}

void from_json(const json& j, Outcome& outcome) {
    outcome.logic = j.at("logic").get<std::string>();
    outcome.specification = j.at("specification").get<std::string>();
    outcome.verdict = verdict_from_key(j.at("verdict").get<std::string>());
    const auto& trace = j.at("trace");
    if (trace.is_null()) {
        outcome.trace.reset();
    } else {
        outcome.trace = trace.get<Trace>();
    }
    if (outcome.trace.has_value() != (outcome.verdict == Verdict::False)) {
        throw ParseError("encoded outcome carries a trace iff its verdict is false");
    }
    outcome.unparsed.clear();
}

ReportWriter::ReportWriter(Options options) : options_(options) {}

void ReportWriter::write(std::ostream& out, const std::vector<Outcome>& outcomes) const {
    if (options_.format == ReportFormat::Json) {
        json summary = build_summary(outcomes);
        if (options_.full_states || options_.parse_values) {
            auto& encoded = summary["outcomes"];
            for (std::size_t i = 0; i < outcomes.size(); ++i) {
                if (outcomes[i].trace) {
                    encoded[i]["trace"] = render_json(*outcomes[i].trace);
                }
            }
        }
        out << summary.dump(2) << "\n";
        return;
    }

    for (const auto& outcome : outcomes) {
        out << outcome.message() << "\n";
        if (outcome.trace) {
            for (const auto& line : render_text(*outcome.trace)) {
                out << line << "\n";
            }
        }
    }
}

void ReportWriter::write(std::ostream& out, const Trace& trace) const {
    if (options_.format == ReportFormat::Json) {
        out << render_json(trace).dump(2) << "\n";
        return;
    }
    for (const auto& line : render_text(trace)) {
        out << line << "\n";
    }
}

std::vector<std::string> ReportWriter::render_text(const Trace& trace) const {
    std::vector<std::string> lines;
    lines.push_back("Trace Description: " + (trace.description.empty() ? std::string("N/A") : trace.description));
    lines.push_back("Trace Type: " + (trace.type.empty() ? std::string("N/A") : trace.type));

    const auto states = options_.full_states ? trace.full_states() : trace.states;
    for (std::size_t i = 0; i < states.size(); ++i) {
        if (trace.loop_indexes.count(i) != 0) {
            lines.emplace_back("  -- Loop starts here");
        }
        lines.push_back("  -> State: 1." + std::to_string(i + 1) + " <-");
        for (const auto& [name, value] : states[i]) {
            const auto shown = options_.parse_values ? to_string(coerce_value(value)) : value;
            lines.push_back("    " + name + " = " + shown);
        }
    }
    return lines;
}

json ReportWriter::render_json(const Trace& trace) const {
    json j = trace;
    if (!options_.full_states && !options_.parse_values) {
        return j;
    }

    const auto states = options_.full_states ? trace.full_states() : trace.states;
    json encoded = json::array();
    for (const auto& state : states) {
        json entry = json::object();
        for (const auto& [name, value] : state) {
            entry[name] = options_.parse_values ? value_to_json(coerce_value(value)) : json(value);
        }
        encoded.push_back(std::move(entry));
    }
    j["states"] = std::move(encoded);
    return j;
}

}  // namespace xmv::bridge
