#include "xmv_bridge/fatal_phrases.hpp"
#include "xmv_bridge/detail/strings.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using xmv::bridge::detail::trim_copy;

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

bool parse_boolean(std::string_view raw,
                   const std::filesystem::path& file,
                   std::size_t line_no) {
    const auto lowered = to_lower_copy(raw);
    if (lowered == "true" || lowered == "yes" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0") {
        return false;
    }
    throw std::runtime_error("Invalid boolean value '" + std::string{raw} + "' at " +
                             file.string() + ":" + std::to_string(line_no));
}

// Lines of the transcript containing any of the fragments, joined by '\n'.
std::string matching_lines(std::string_view text, const std::vector<std::string>& fragments) {
    std::string out;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto eol = text.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = text.size();
        }
        auto line = text.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        const bool hit = std::any_of(fragments.begin(), fragments.end(), [&](const std::string& f) {
            return !f.empty() && line.find(f) != std::string_view::npos;
        });
        if (hit) {
            if (!out.empty()) {
                out += '\n';
            }
            out += trim_copy(line);
        }
        pos = eol + 1;
    }
    return out;
}

}  // namespace

namespace xmv::bridge {

const char* to_string(Precondition kind) noexcept {
    switch (kind) {
        case Precondition::BooleanModelMissing:
            return "boolean model missing";
        case Precondition::ModeNotEngaged:
            return "analysis mode not engaged";
    }
    return "unknown precondition";
}

FatalPhrases FatalPhrases::defaults() {
    FatalPhrases phrases;
    phrases.boolean_model_missing = {"The boolean model must be built before."};
    phrases.mode_not_engaged = {"The model must be built before."};
    phrases.fatal = {
        "A model must be read before.",
        "You must set the input file before.",
        "illegal operand types",
        "Impossible to build a BDD FSM with infinite precision variables",
        "Nested next operator",
        "No trace: constraint and initial state are inconsistent",
        "not well typed",
        "TYPE ERROR",
        "Type System Violation detected",
        "unexpected expression encountered during parsing",
    };
    return phrases;
}

void FatalPhrases::check(std::string_view transcript) const {
    if (auto lines = matching_lines(transcript, boolean_model_missing); !lines.empty()) {
        throw RecoverablePrecondition(Precondition::BooleanModelMissing, lines);
    }
    if (auto lines = matching_lines(transcript, mode_not_engaged); !lines.empty()) {
        throw RecoverablePrecondition(Precondition::ModeNotEngaged, lines);
    }
    if (auto lines = matching_lines(transcript, fatal); !lines.empty()) {
        throw BackendFault(lines);
    }
}

FatalPhrases FatalPhraseLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("Fatal phrase file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Fatal phrase path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open fatal phrase file: " + file.string());
    }

    FatalPhrases phrases = FatalPhrases::defaults();
    bool touched = false;

    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;

        const auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            throw std::runtime_error("Expected 'key=value' entry at " + file.string() + ":" +
                                     std::to_string(line_no));
        }

        auto key = trim_copy(std::string_view{trimmed}.substr(0, delimiter));
        auto value = trim_copy(std::string_view{trimmed}.substr(delimiter + 1));

        if (key == "replace_defaults") {
            if (touched) {
                throw std::runtime_error("replace_defaults must come first at " + file.string() +
                                         ":" + std::to_string(line_no));
            }
            if (parse_boolean(value, file, line_no)) {
                phrases = FatalPhrases{};
            }
            touched = true;
            continue;
        }

        if (value.empty()) {
            throw std::runtime_error("Empty phrase at " + file.string() + ":" +
                                     std::to_string(line_no));
        }

        touched = true;

        if (key == "fatal") {
            phrases.fatal.emplace_back(std::move(value));
        } else if (key == "precondition.boolean_model") {
            phrases.boolean_model_missing.emplace_back(std::move(value));
        } else if (key == "precondition.mode") {
            phrases.mode_not_engaged.emplace_back(std::move(value));
        } else {
            throw std::runtime_error("Unknown key '" + key + "' at " + file.string() + ":" +
                                     std::to_string(line_no));
        }
    }

    return phrases;
}

}  // namespace xmv::bridge
