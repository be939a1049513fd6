//
// ProcessEngine.cpp
// rpyfmt Runtime - External Formatter Process Implementation
//

#include "ProcessEngine.h"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <regex>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace RpyFmt {

namespace {

std::once_flag g_ignoreSigpipeOnce;

// Held from pipe creation until fork so no child inherits another call's
// pipe ends before they are marked close-on-exec
std::mutex g_spawnMutex;

// How often a finished-output engine is checked for exit
const std::chrono::milliseconds kWaitPollInterval(5);

// A formatter that exits early must not kill us with SIGPIPE
void ignoreSigpipe() {
    std::call_once(g_ignoreSigpipeOnce, []() {
        std::signal(SIGPIPE, SIG_IGN);
    });
}

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void setCloseOnExec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Pipe pair with both ends close-on-exec; dup2 clears the flag in the child
bool makePipe(int fds[2]) {
    if (pipe(fds) != 0) {
        return false;
    }
    setCloseOnExec(fds[0]);
    setCloseOnExec(fds[1]);
    return true;
}

std::string firstLine(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return std::string();
    }
    size_t end = text.find('\n', start);
    std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

// Read whatever is available; returns false at end of stream
bool drain(int fd, std::string& into) {
    char buffer[8192];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            into.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN: nothing more for now; anything else ends the stream
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // namespace

// =============================================================================
// ProcessEngine
// =============================================================================

ProcessEngine::ProcessEngine(const std::string& commandTemplate)
    : commandTemplate_(commandTemplate) {
}

std::string ProcessEngine::defaultCommand() {
    return "black -q --line-length {line_length} -";
}

std::string ProcessEngine::getName() const {
    std::istringstream iss(commandTemplate_);
    std::string program;
    iss >> program;
    size_t slash = program.rfind('/');
    if (slash != std::string::npos) {
        program = program.substr(slash + 1);
    }
    return program.empty() ? "process" : program;
}

std::string ProcessEngine::expandCommand(const EngineOptions& options) const {
    std::string result;
    size_t pos = 0;

    while (pos < commandTemplate_.size()) {
        size_t open = commandTemplate_.find('{', pos);
        if (open == std::string::npos) {
            result += commandTemplate_.substr(pos);
            break;
        }
        size_t close = commandTemplate_.find('}', open);
        if (close == std::string::npos) {
            result += commandTemplate_.substr(pos);
            break;
        }

        result += commandTemplate_.substr(pos, open - pos);
        std::string key = commandTemplate_.substr(open + 1, close - open - 1);

        if (key == "line_length") {
            result += std::to_string(options.lineLength);
        } else {
            auto it = options.extra.find(key);
            if (it != options.extra.end()) {
                result += it->second;
            } else {
                // Unknown placeholders are left for the shell to see
                result += commandTemplate_.substr(open, close - open + 1);
            }
        }
        pos = close + 1;
    }

    return result;
}

bool ProcessEngine::parseSyntaxError(const std::string& stderrText,
                                     int& line, int& column, std::string& message) {
    static const std::regex blackPattern(
        R"(Cannot parse(?: for target version [^:]*)?: (\d+):(\d+):\s*(.*))");
    static const std::regex ruffPattern(
        R"(Failed to parse (?:at )?(?:\S*?:)?(\d+):(\d+):\s*(.*))");

    std::smatch match;
    int columnBase = 0;
    if (std::regex_search(stderrText, match, blackPattern)) {
        // black counts columns from 0
        columnBase = 1;
    } else if (!std::regex_search(stderrText, match, ruffPattern)) {
        return false;
    }

    line = std::stoi(match[1].str());
    column = std::stoi(match[2].str()) + columnBase;
    message = firstLine(match[3].str());
    if (message.empty()) {
        message = "cannot parse";
    }
    return true;
}

EngineOutput ProcessEngine::format(const std::string& source,
                                   const EngineOptions& options,
                                   std::chrono::milliseconds timeout) const {
    ignoreSigpipe();

    const std::string command = expandCommand(options);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};

    std::unique_lock<std::mutex> spawnLock(g_spawnMutex);

    if (!makePipe(inPipe) || !makePipe(outPipe) || !makePipe(errPipe)) {
        std::string reason = std::strerror(errno);
        closeFd(inPipe[0]); closeFd(inPipe[1]);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        return EngineOutput::engineError("cannot create pipes: " + reason);
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        closeFd(inPipe[0]); closeFd(inPipe[1]);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        return EngineOutput::engineError("cannot start engine: " + reason);
    }

    if (pid == 0) {
        // Child: own process group so a timeout can kill the whole pipeline
        setpgid(0, 0);
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    spawnLock.unlock();
    setpgid(pid, pid);
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    int inFd = inPipe[1];
    int outFd = outPipe[0];
    int errFd = errPipe[0];
    setNonBlocking(inFd);
    setNonBlocking(outFd);
    setNonBlocking(errFd);

    std::string output;
    std::string errors;
    size_t written = 0;
    bool timedOut = false;

    if (source.empty()) {
        closeFd(inFd);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (outFd >= 0 || errFd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            timedOut = true;
            break;
        }

        struct pollfd fds[3];
        int count = 0;
        int inIndex = -1, outIndex = -1, errIndex = -1;

        if (inFd >= 0) {
            fds[count].fd = inFd;
            fds[count].events = POLLOUT;
            fds[count].revents = 0;
            inIndex = count++;
        }
        if (outFd >= 0) {
            fds[count].fd = outFd;
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            outIndex = count++;
        }
        if (errFd >= 0) {
            fds[count].fd = errFd;
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            errIndex = count++;
        }

        int ready = poll(fds, static_cast<nfds_t>(count), static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = std::strerror(errno);
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            closeFd(inFd);
            closeFd(outFd);
            closeFd(errFd);
            return EngineOutput::engineError("poll failed: " + reason);
        }
        if (ready == 0) {
            continue;
        }

        if (inIndex >= 0 && (fds[inIndex].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t n = write(inFd, source.data() + written, source.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                if (written == source.size()) {
                    closeFd(inFd);
                }
            } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                // Engine stopped reading (EPIPE); its exit status tells the story
                closeFd(inFd);
            }
        }
        if (outIndex >= 0 && (fds[outIndex].revents & (POLLIN | POLLERR | POLLHUP))) {
            if (!drain(outFd, output)) {
                closeFd(outFd);
            }
        }
        if (errIndex >= 0 && (fds[errIndex].revents & (POLLIN | POLLERR | POLLHUP))) {
            if (!drain(errFd, errors)) {
                closeFd(errFd);
            }
        }
    }

    closeFd(inFd);
    closeFd(outFd);
    closeFd(errFd);

    // The engine may close its output and keep running; the deadline still holds
    int status = 0;
    while (!timedOut) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = std::strerror(errno);
            kill(-pid, SIGKILL);
            return EngineOutput::engineError("cannot wait for engine: " + reason);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timedOut = true;
            break;
        }
        std::this_thread::sleep_for(kWaitPollInterval);
    }

    if (timedOut) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        waitpid(pid, nullptr, 0);
        return EngineOutput::engineError("timed out after " +
                                         std::to_string(timeout.count()) + " ms");
    }

    if (WIFSIGNALED(status)) {
        return EngineOutput::engineError(getName() + " terminated by signal " +
                                         std::to_string(WTERMSIG(status)));
    }

    int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exitCode == 0) {
        return EngineOutput::ok(output);
    }

    int line = 0;
    int column = 0;
    std::string message;
    if (parseSyntaxError(errors, line, column, message)) {
        return EngineOutput::syntaxError(message, line, column);
    }

    std::string detail = firstLine(errors);
    if (exitCode == 127 && detail.empty()) {
        detail = "command not found";
    }
    std::string text = getName() + " exited with status " + std::to_string(exitCode);
    if (!detail.empty()) {
        text += ": " + detail;
    }
    return EngineOutput::engineError(text);
}

} // namespace RpyFmt
