#include "xmv_bridge/trace.hpp"
#include "xmv_bridge/errors.hpp"
#include "xmv_bridge/detail/strings.hpp"
#include "xmv_bridge/text_cache.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace {

using xmv::bridge::detail::trim;

constexpr std::string_view kDescriptionLabel = "Trace Description:";
constexpr std::string_view kTypeLabel = "Trace Type:";
constexpr std::string_view kStateHeader = "-> State:";
constexpr std::string_view kLoopMarker = "-- Loop starts here";

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.size();
        lines.push_back(text.substr(pos, eol - pos));
        pos = eol + 1;
    }
    return lines;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

// Text following label on the line where label appears.
std::string_view label_value(std::string_view text, std::string_view label) {
    const auto at = text.find(label);
    if (at == std::string_view::npos) {
        throw xmv::bridge::ParseError("missing '" + std::string{label} + "' in trace");
    }
    auto rest = text.substr(at + label.size());
    return trim(rest.substr(0, rest.find('\n')));
}

xmv::bridge::StateChunk parse_state_uncached(const std::string& text) {
    xmv::bridge::StateChunk chunk;
    for (auto raw : split_lines(text)) {
        const auto line = trim(raw);
        if (line.empty()) continue;
        if (starts_with(line, kLoopMarker)) {
            chunk.loop_starts_next = true;
            continue;
        }
        if (starts_with(line, "--") || starts_with(line, "->")) continue;

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            throw xmv::bridge::ParseError("expected 'name = value' in state, got '" + std::string{line} + "'");
        }
        const auto name = trim(line.substr(0, eq));
        if (name.empty()) {
            throw xmv::bridge::ParseError("empty variable name in state line '" + std::string{line} + "'");
        }
        chunk.state[std::string{name}] = std::string{trim(line.substr(eq + 1))};
    }
    return chunk;
}

xmv::bridge::Value coerce_uncached(const std::string& raw) {
    if (raw == "TRUE") return true;
    if (raw == "FALSE") return false;
    if (raw.empty()) return raw;

    const char* first = raw.data();
    const char* last = raw.data() + raw.size();

    std::int64_t integer = 0;
    if (auto [ptr, ec] = std::from_chars(first, last, integer); ec == std::errc{} && ptr == last) {
        return integer;
    }

    // Keeps words such as inf, nan or hex literals out of strtod.
    if (raw.find_first_not_of("0123456789+-.eE") != std::string::npos) return raw;
    char* end = nullptr;
    const double real = std::strtod(first, &end);
    if (end != last) return raw;

    constexpr double kMaxExact = 9007199254740992.0;  // 2^53
    if (std::isfinite(real) && std::trunc(real) == real && std::fabs(real) <= kMaxExact) {
        return static_cast<std::int64_t>(real);
    }
    return real;
}

}  // namespace

namespace xmv::bridge {

Value coerce_value(const std::string& raw) {
    thread_local TextCache<Value> cache(64);
    return cache.get_or_compute(raw, coerce_uncached);
}

std::string to_string(const Value& value) {
    struct Printer {
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(std::int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            char buf[64];
            const auto res = std::to_chars(buf, buf + sizeof(buf), d);
            return std::string(buf, res.ptr);
        }
        std::string operator()(const std::string& s) const { return s; }
    };
    return std::visit(Printer{}, value);
}

StateChunk parse_state(std::string_view text) {
    thread_local TextCache<StateChunk> cache(128);
    return cache.get_or_compute(std::string{text}, parse_state_uncached);
}

Trace Trace::parse(std::string_view text) {
    const auto start = text.find(kDescriptionLabel);
    if (start == std::string_view::npos) {
        throw ParseError("missing '" + std::string{kDescriptionLabel} + "' in trace");
    }
    const auto body = text.substr(start);

    std::vector<std::string_view> chunks;
    auto header = body.find(kStateHeader);
    const auto preamble = body.substr(0, header);
    while (header != std::string_view::npos) {
        const auto close = body.find("<-", header);
        if (close == std::string_view::npos) {
            throw ParseError("unterminated state header in trace");
        }
        const auto next = body.find(kStateHeader, close);
        chunks.push_back(body.substr(close + 2, next == std::string_view::npos ? next : next - close - 2));
        header = next;
    }

    Trace trace;
    trace.description = std::string{label_value(preamble, kDescriptionLabel)};
    trace.type = std::string{label_value(preamble, kTypeLabel)};

    // A marker in the preamble puts the loop start at the very first state.
    bool loop_next = preamble.find(kLoopMarker) != std::string_view::npos;
    for (const auto chunk : chunks) {
        auto parsed = parse_state(chunk);
        if (loop_next) {
            trace.loop_indexes.insert(trace.states.size());
        }
        loop_next = parsed.loop_starts_next;
        trace.states.push_back(std::move(parsed.state));
    }
    return trace;
}

Trace Trace::of_states(const std::vector<std::string>& chunks, std::string type, std::string description) {
    Trace trace;
    trace.description = std::move(description);
    trace.type = std::move(type);
    bool loop_next = false;
    for (const auto& chunk : chunks) {
        auto parsed = parse_state(chunk);
        if (loop_next) {
            trace.loop_indexes.insert(trace.states.size());
        }
        loop_next = parsed.loop_starts_next;
        trace.states.push_back(std::move(parsed.state));
    }
    return trace;
}

std::vector<State> Trace::full_states() const {
    std::vector<State> result;
    result.reserve(states.size());
    State accum;
    for (const auto& delta : states) {
        for (const auto& [name, value] : delta) {
            accum[name] = value;
        }
        result.push_back(accum);
    }
    return result;
}

std::vector<ParsedState> Trace::parsed_states(bool full) const {
    const auto& source = full ? full_states() : states;
    std::vector<ParsedState> result;
    result.reserve(source.size());
    for (const auto& state : source) {
        ParsedState parsed;
        for (const auto& [name, value] : state) {
            parsed.emplace(name, coerce_value(value));
        }
        result.push_back(std::move(parsed));
    }
    return result;
}

}  // namespace xmv::bridge
