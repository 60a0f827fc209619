#include "xmv_bridge/session.hpp"
#include "xmv_bridge/errors.hpp"

#include <pty.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <poll.h>
#include <signal.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace xmv::bridge {

namespace {

constexpr char kInterrupt = '\x03';

bool is_executable_file(const std::string& path) {
    if (::access(path.c_str(), X_OK) != 0) {
        return false;
    }
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string regex_escape(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size() * 2);
    for (const char c : text) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

}  // namespace

std::optional<std::string> find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return name;
        return std::nullopt;
    }

    const char* env_path = std::getenv("PATH");
    const std::string search = env_path ? env_path : "/usr/local/bin:/usr/bin:/bin";
    std::size_t pos = 0;
    while (pos <= search.size()) {
        auto end = search.find(':', pos);
        if (end == std::string::npos) end = search.size();
        std::string dir = search.substr(pos, end - pos);
        if (dir.empty()) dir = ".";
        const std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) return candidate;
        pos = end + 1;
    }
    return std::nullopt;
}

Pattern Pattern::exact(std::string text) {
    Pattern p;
    p.text_ = std::move(text);
    return p;
}

Pattern Pattern::regex(const std::string& expression) {
    Pattern p;
    p.text_ = expression;
    p.regex_.emplace(expression, std::regex::ECMAScript);
    return p;
}

Pattern Pattern::line(const std::string& text) {
    // Terminal control sequences may precede the line break.
    auto p = regex(R"((^|\n))" + regex_escape(text) + R"((?:\x1b\[[0-9;?]*[A-Za-z]|\r)*\n)");
    p.text_ = text;
    return p;
}

std::optional<std::pair<std::size_t, std::size_t>> Pattern::find_in(const std::string& buffer,
                                                                    std::size_t from) const {
    if (from > buffer.size()) return std::nullopt;
    if (regex_) {
        // Past the start of the buffer '^' no longer matches.
        auto flags = std::regex_constants::match_default;
        if (from > 0) flags |= std::regex_constants::match_prev_avail;
        std::smatch m;
        if (!std::regex_search(buffer.cbegin() + static_cast<std::ptrdiff_t>(from), buffer.cend(), m, *regex_,
                               flags)) {
            return std::nullopt;
        }
        return std::make_pair(static_cast<std::size_t>(m[0].first - buffer.cbegin()),
                              static_cast<std::size_t>(m.length(0)));
    }
    if (text_.empty()) return std::nullopt;
    const auto pos = buffer.find(text_, from);
    if (pos == std::string::npos) return std::nullopt;
    return std::make_pair(pos, text_.size());
}

std::size_t Pattern::resume_from(const std::string& buffer, std::size_t scanned) const {
    if (scanned == 0) return 0;
    if (regex_) {
        // Matches end within one line, so restart at the last line break seen.
        const auto nl = buffer.rfind('\n', scanned - 1);
        return nl == std::string::npos ? 0 : nl;
    }
    return scanned >= text_.size() ? scanned - text_.size() + 1 : 0;
}

int poll_timeout_ms(std::chrono::milliseconds left) noexcept {
    if (left.count() <= 0) return 0;
    if (left.count() >= std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    return static_cast<int>(left.count());
}

Session::Session(Config cfg)
    : cfg_(std::move(cfg)),
      log_(std::make_shared<spdlog::logger>("xmv_bridge", std::make_shared<spdlog::sinks::stderr_sink_mt>())) {
    log_->set_level(cfg_.debug ? spdlog::level::debug : spdlog::level::warn);
}

Session::~Session() { close(); }

void Session::start() {
    if (running()) return;

    const auto resolved = find_executable(cfg_.executable);
    if (!resolved) {
        throw ToolNotFound(cfg_.executable);
    }

    // argv is assembled before forking; the child only calls async-signal-safe functions.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(resolved->c_str()));
    for (auto& arg : cfg_.arguments) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int master = -1;
    const pid_t pid = ::forkpty(&master, nullptr, nullptr, nullptr);
    if (pid < 0) {
        throw Error(std::string("forkpty failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        struct termios tio {};
        if (::tcgetattr(STDIN_FILENO, &tio) == 0) {
            tio.c_lflag &= ~(ECHO | ECHONL);
            ::tcsetattr(STDIN_FILENO, TCSANOW, &tio);
        }
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    pid_ = pid;
    master_fd_ = master;
    buffer_.clear();
    resync_ = false;
    log_->debug("spawned {} (pid {})", *resolved, pid_);

    try {
        wait_for({Pattern::exact(cfg_.prompt)}, cfg_.startup_timeout);
    } catch (...) {
        close();
        throw;
    }
}

void Session::send(const std::string& cmd) {
    if (!running()) {
        throw Error("engine is not running");
    }
    if (resync_) {
        const auto stale = wait_for({Pattern::exact(cfg_.prompt)}, cfg_.echo_timeout);
        log_->debug("discarded after interrupt: {}", stale.before);
    }
    log_->debug("> {}", cmd);
    write_all(cmd + "\n");
    // The engine echoes the line back; drop it so it never reaches a transcript.
    wait_for({Pattern::line(cmd)}, cfg_.echo_timeout);
}

Session::Match Session::expect(const std::vector<Pattern>& patterns, Timeout timeout) {
    auto match = wait_for(patterns, timeout);
    log_->debug("< [{}] {}", patterns[match.index].text(), match.before);
    cfg_.fatal_phrases.check(match.before);
    return match;
}

std::string Session::expect_prompt(Timeout timeout) {
    return expect({Pattern::exact(cfg_.prompt)}, timeout).before;
}

void Session::interrupt() {
    if (!running()) return;
    const char ctrl_c = kInterrupt;
    if (::write(master_fd_, &ctrl_c, 1) != 1) {
        log_->warn("failed to deliver interrupt: {}", std::strerror(errno));
    }
}

void Session::close() noexcept {
    if (pid_ > 0) {
        ::kill(pid_, SIGKILL);
        while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
    }
    if (master_fd_ >= 0) {
        ::close(master_fd_);
        master_fd_ = -1;
    }
}

Session::Match Session::wait_for(const std::vector<Pattern>& patterns, Timeout timeout) {
    if (!running()) {
        throw Error("engine is not running");
    }
    const auto deadline = timeout ? std::chrono::steady_clock::now() + *timeout
                                  : std::chrono::steady_clock::time_point::max();
    // Bytes already searched without a hit; only newer output is searched again.
    std::size_t scanned = 0;
    for (;;) {
        std::optional<std::size_t> best;
        std::size_t best_pos = 0;
        std::size_t best_len = 0;
        for (std::size_t i = 0; i < patterns.size(); ++i) {
            const auto hit = patterns[i].find_in(buffer_, patterns[i].resume_from(buffer_, scanned));
            if (hit && (!best || hit->first < best_pos)) {
                best = i;
                best_pos = hit->first;
                best_len = hit->second;
            }
        }
        if (best) {
            Match match{*best, buffer_.substr(0, best_pos)};
            buffer_.erase(0, best_pos + best_len);
            if (patterns[*best].text() == cfg_.prompt) {
                resync_ = false;
            }
            return match;
        }
        scanned = buffer_.size();
        if (!fill(deadline, timeout.has_value())) {
            log_->debug("timeout while waiting for output, interrupting engine");
            interrupt();
            resync_ = true;
            throw BackendTimeout();
        }
    }
}

// Reads whatever the engine has written so far. Returns false when the
// deadline passed without any data.
bool Session::fill(std::chrono::steady_clock::time_point deadline, bool bounded) {
    const bool interrupted = cfg_.interrupt_flag != nullptr && *cfg_.interrupt_flag != 0;
    if (interrupted) {
        interrupt();
        resync_ = true;
        throw Interrupted();
    }

    int wait_ms = -1;
    if (bounded) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        wait_ms = poll_timeout_ms(left);
    }

    struct pollfd pfd {};
    pfd.fd = master_fd_;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, wait_ms);
    if (rc == 0) {
        return false;
    }
    if (rc < 0) {
        if (errno == EINTR) {
            // Re-enter; the flag check at the top decides whether to give up.
            return true;
        }
        throw Error(std::string("poll failed: ") + std::strerror(errno));
    }

    char chunk[4096];
    const ssize_t n = ::read(master_fd_, chunk, sizeof(chunk));
    if (n > 0) {
        buffer_.append(chunk, static_cast<std::size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    // EIO on the master side means the slave has been closed: the engine is gone.
    throw BackendFault("engine terminated unexpectedly");
}

void Session::write_all(const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(master_fd_, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw Error(std::string("write to engine failed: ") + std::strerror(errno));
        }
        off += static_cast<std::size_t>(n);
    }
}

}  // namespace xmv::bridge
