#pragma once

#include "errors.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace xmv::bridge {

/**
 * \brief Fragments of engine output that mark a command as failed.
 *
 * Two fragment lists map to remediable preconditions; every other fragment is
 * fatal. The defaults cover the conditions known for nuXmv 2.x and can be
 * replaced or extended from a file (see FatalPhraseLoader).
 */
struct FatalPhrases {
    std::vector<std::string> boolean_model_missing;
    std::vector<std::string> mode_not_engaged;
    std::vector<std::string> fatal;

    [[nodiscard]] static FatalPhrases defaults();

    /**
     * Throws RecoverablePrecondition or BackendFault when \a transcript
     * contains a known fragment; returns normally otherwise.
     *
     * Precondition fragments take priority over fatal ones.
     */
    void check(std::string_view transcript) const;
};

/**
 * \brief Reads a fatal-phrase configuration file.
 *
 * The syntax mirrors the scenario files: one `key=value` entry per line,
 * blank lines and lines starting with `#` ignored.
 *
 * Recognised keys:
 *   - `fatal`: fragment that makes a command fail with BackendFault.
 *   - `precondition.boolean_model`: fragment meaning the boolean model is missing.
 *   - `precondition.mode`: fragment meaning the analysis mode is not engaged.
 *   - `replace_defaults`: when true, start from empty lists instead of the
 *     built-in defaults. Must precede every other entry.
 *
 * Example:
 * \code{.txt}
 * # extra conditions seen with nuXmv 2.0.0
 * fatal=Parser error
 * precondition.mode=Use the command "go_msat"
 * \endcode
 */
class FatalPhraseLoader {
public:
    FatalPhraseLoader() = default;

    [[nodiscard]] FatalPhrases load(const std::filesystem::path& file) const;
};

}  // namespace xmv::bridge
