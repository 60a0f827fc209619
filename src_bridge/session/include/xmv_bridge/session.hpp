#pragma once

#include "fatal_phrases.hpp"

#include <sys/types.h>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace spdlog { class logger; }

namespace xmv::bridge {

using Timeout = std::optional<std::chrono::milliseconds>;

/**
 * \brief Something to wait for in the engine's output stream.
 *
 * Either a literal string or an ECMAScript regular expression. A regular
 * expression may start with a line break but must not span further lines.
 */
class Pattern {
public:
    [[nodiscard]] static Pattern exact(std::string text);
    [[nodiscard]] static Pattern regex(const std::string& expression);

    // \a text as a complete line of its own, CR LF or LF terminated.
    [[nodiscard]] static Pattern line(const std::string& text);

    // Position and length of the first occurrence at or after \a from, if any.
    [[nodiscard]] std::optional<std::pair<std::size_t, std::size_t>> find_in(const std::string& buffer,
                                                                           std::size_t from = 0) const;

    // Where to resume searching once the first \a scanned bytes of buffer
    // are known not to contain a match.
    [[nodiscard]] std::size_t resume_from(const std::string& buffer, std::size_t scanned) const;

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    Pattern() = default;

    std::string text_;
    std::optional<std::regex> regex_;
};

/**
 * Session driver for one interactive engine process.
 *
 * The engine runs on a pseudo-terminal with local echo disabled and talks
 * plain lines. One command is outstanding at a time: send() writes it and
 * swallows the engine's own echo, expect() blocks until one of the patterns
 * shows up and hands back everything printed before it.
 *
 * Every transcript returned by expect() has been checked against the
 * configured fatal phrases, so callers only ever see output of commands
 * that completed. After a timeout or an interrupt the rest of the cut-off
 * command's output is discarded by the next send().
 */
class Session {
public:
    struct Config {
        // Engine executable; looked up on PATH unless it contains a '/'.
        std::string executable{"nuXmv"};

        // Arguments passed to the engine (interactive mode).
        std::vector<std::string> arguments{"-int"};

        // Quiescence marker printed by the engine when it waits for input.
        std::string prompt{"nuXmv > "};

        // Deadline for the engine to echo a command back (nullopt = none).
        Timeout echo_timeout{std::chrono::seconds(30)};

        // Deadline for the first prompt after spawning (nullopt = none).
        Timeout startup_timeout{std::chrono::seconds(60)};

        FatalPhrases fatal_phrases{FatalPhrases::defaults()};

        // Set by a signal handler owned by the caller; when a wait is cut
        // short by a signal and the flag is raised, expect() throws Interrupted.
        const volatile std::sig_atomic_t* interrupt_flag{nullptr};

        // Log commands and transcripts at debug level.
        bool debug{false};
    };

    struct Match {
        std::size_t index{0};   // which pattern matched
        std::string before;     // text preceding the match
    };

    explicit Session(Config cfg);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * Spawn the engine and wait for its first prompt.
     *
     * Throws ToolNotFound when the executable cannot be located, Error when
     * the pseudo-terminal cannot be set up.
     */
    void start();

    [[nodiscard]] bool running() const noexcept { return pid_ > 0; }

    /// Write one command line and consume its echo.
    void send(const std::string& cmd);

    /**
     * Block until one of \a patterns appears or \a timeout elapses.
     *
     * On timeout the engine receives ^C and BackendTimeout is thrown. On a
     * match the preceding output is scanned for fatal phrases before it is
     * returned.
     */
    Match expect(const std::vector<Pattern>& patterns, Timeout timeout = std::nullopt);

    /// expect() on the ready prompt only; returns the transcript.
    std::string expect_prompt(Timeout timeout = std::nullopt);

    /// Send the interrupt control character to the engine.
    void interrupt();

    /// Kill the engine. Safe to call more than once.
    void close() noexcept;

    [[nodiscard]] const Config& config() const noexcept { return cfg_; }

    [[nodiscard]] spdlog::logger& logger() const noexcept { return *log_; }

private:
    Match wait_for(const std::vector<Pattern>& patterns, Timeout timeout);
    bool fill(std::chrono::steady_clock::time_point deadline, bool bounded);
    void write_all(const std::string& data);

    Config cfg_;
    std::shared_ptr<spdlog::logger> log_;
    pid_t pid_{-1};
    int master_fd_{-1};
    std::string buffer_;
    // An interrupted command may still print up to its prompt.
    bool resync_{false};
};

[[nodiscard]] std::optional<std::string> find_executable(const std::string& name);

/// Remaining time as a poll(2) timeout: 0 when past, capped at INT_MAX.
[[nodiscard]] int poll_timeout_ms(std::chrono::milliseconds left) noexcept;

}  // namespace xmv::bridge
