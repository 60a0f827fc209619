#pragma once

#include <stdexcept>
#include <string>

namespace xmv::bridge {

/**
 * \brief Root of every error raised by the session driver, the command layer
 *        and the output parser.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The engine executable could not be located.
class ToolNotFound : public Error {
public:
    explicit ToolNotFound(const std::string& executable)
        : Error(executable + " not in PATH"), executable_(executable) {}

    [[nodiscard]] const std::string& executable() const noexcept { return executable_; }

private:
    std::string executable_;
};

/**
 * \brief A wait exceeded its deadline.
 *
 * The engine has already been sent an interrupt when this is thrown; the
 * session can accept the next command.
 */
class BackendTimeout : public Error {
public:
    BackendTimeout() : Error("engine did not answer before the deadline") {}
};

/// A blocking wait was cut short by an external signal.
class Interrupted : public Error {
public:
    Interrupted() : Error("interrupted") {}
};

/**
 * \brief A recognised fatal phrase appeared in a transcript.
 *
 * The message holds only the offending lines, never the whole transcript.
 */
class BackendFault : public Error {
public:
    using Error::Error;
};

/// A BackendFault raised by one of the model loading steps.
class LoadError : public BackendFault {
public:
    using BackendFault::BackendFault;
};

/// Which remediable condition a RecoverablePrecondition stands for.
enum class Precondition {
    BooleanModelMissing,  ///< needs `build_boolean_model`
    ModeNotEngaged,       ///< needs `go` or `go_msat`
};

[[nodiscard]] const char* to_string(Precondition kind) noexcept;

/**
 * \brief The engine refused a command because a known preparation step is
 *        missing. The command layer remediates it once and retries.
 */
class RecoverablePrecondition : public Error {
public:
    RecoverablePrecondition(Precondition kind, const std::string& lines)
        : Error(lines), kind_(kind) {}

    [[nodiscard]] Precondition kind() const noexcept { return kind_; }

private:
    Precondition kind_;
};

/// A transcript did not have the shape the parser expects.
class ParseError : public Error {
public:
    using Error::Error;
};

}  // namespace xmv::bridge
