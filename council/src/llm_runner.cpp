#include <council/llm_runner.hpp>
#include <council/strings.hpp>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace council {

namespace {

// Pipe pair that closes whatever end is still open
struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() {
        if (pipe(fds) != 0) {
            throw std::runtime_error(std::string("pipe() failed: ") + strerror(errno));
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }
    void close_read() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

std::string describe(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

// Built-in engine table
std::vector<std::string> default_command(const std::string& engine) {
    if (engine == "claude") return {"claude", "-p"};
    if (engine == "sonnet" || engine == "opus" || engine == "haiku") {
        return {"claude", "--model", engine, "-p"};
    }
    if (engine == "gemini") return {"gemini"};
    if (engine == "gpt" || engine == "codex") return {"codex", "exec", "-"};
    if (engine == "grok") return {"grok", "-p"};
    return {engine, "-p"};
}

} // namespace

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream ss(command);
    std::string part;
    while (ss >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::string CliRunner::env_var_for(const std::string& engine) {
    std::string name = "COUNCIL_CMD_";
    for (char c : engine) {
        unsigned char uc = static_cast<unsigned char>(c);
        name += std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_';
    }
    return name;
}

std::vector<std::string> CliRunner::command_for(const std::string& engine) const {
    auto it = overrides_.find(engine);
    if (it != overrides_.end() && !it->second.empty()) {
        return it->second;
    }
    if (const char* env = std::getenv(env_var_for(engine).c_str())) {
        auto argv = split_command(env);
        if (!argv.empty()) return argv;
    }
    return default_command(engine);
}

std::string CliRunner::run(const std::string& engine, const std::string& prompt) {
    std::vector<std::string> command = command_for(engine);
    std::string command_line = describe(command);

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (auto& arg : command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    Pipe in_pipe, out_pipe, err_pipe;

    std::cerr << "[llm] Running " << command_line << " (" << prompt.size() << " byte prompt)\n";

    pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork() failed: ") + strerror(errno));
    }

    if (pid == 0) {
        // Child process - exec the engine CLI
        dup2(in_pipe.read_end(), STDIN_FILENO);
        dup2(out_pipe.write_end(), STDOUT_FILENO);
        dup2(err_pipe.write_end(), STDERR_FILENO);
        in_pipe.close_read(); in_pipe.close_write();
        out_pipe.close_read(); out_pipe.close_write();
        err_pipe.close_read(); err_pipe.close_write();

        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        const char* msg = strerror(errno);
        ssize_t ignored = write(STDERR_FILENO, "exec failed: ", 13);
        ignored = write(STDERR_FILENO, msg, strlen(msg));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    in_pipe.close_read();
    out_pipe.close_write();
    err_pipe.close_write();
    set_nonblocking(in_pipe.write_end());
    set_nonblocking(out_pipe.read_end());
    set_nonblocking(err_pipe.read_end());

    std::string output;
    std::string errors;
    std::string io_error;
    size_t written = 0;
    if (prompt.empty()) in_pipe.close_write();

    char buffer[8192];
    while (out_pipe.read_end() >= 0 || err_pipe.read_end() >= 0) {
        pollfd fds[3];
        nfds_t count = 0;
        if (in_pipe.write_end() >= 0) fds[count++] = {in_pipe.write_end(), POLLOUT, 0};
        if (out_pipe.read_end() >= 0) fds[count++] = {out_pipe.read_end(), POLLIN, 0};
        if (err_pipe.read_end() >= 0) fds[count++] = {err_pipe.read_end(), POLLIN, 0};

        if (poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            io_error = std::string("poll() failed: ") + strerror(errno);
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;

            if (fds[i].fd == in_pipe.write_end()) {
                if (fds[i].revents & (POLLERR | POLLHUP)) {
                    // Child closed stdin early; the rest of the prompt is dropped
                    in_pipe.close_write();
                    continue;
                }
                ssize_t n = write(in_pipe.write_end(), prompt.data() + written,
                                  prompt.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == prompt.size()) in_pipe.close_write();
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    in_pipe.close_write();
                }
                continue;
            }

            std::string& sink = fds[i].fd == out_pipe.read_end() ? output : errors;
            Pipe& source = fds[i].fd == out_pipe.read_end() ? out_pipe : err_pipe;
            ssize_t n = read(source.read_end(), buffer, sizeof(buffer));
            if (n > 0) {
                sink.append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                source.close_read();
            }
        }
    }
    in_pipe.close_write();
    out_pipe.close_read();
    err_pipe.close_read();

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(command_line + ": waitpid() failed: " + strerror(errno));
        }
    }

    if (!io_error.empty()) {
        throw std::runtime_error(command_line + ": " + io_error);
    }

    std::string excerpt = trim(errors);
    if (excerpt.size() > MAX_STDERR_EXCERPT) {
        excerpt = excerpt.substr(excerpt.size() - MAX_STDERR_EXCERPT);
    }

    if (WIFSIGNALED(status)) {
        throw std::runtime_error(command_line + " killed by signal " +
                                 std::to_string(WTERMSIG(status)) +
                                 (excerpt.empty() ? "" : ": " + excerpt));
    }
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (code != 0) {
        throw std::runtime_error(command_line + " exited with status " +
                                 std::to_string(code) +
                                 (excerpt.empty() ? "" : ": " + excerpt));
    }

    std::cerr << "[llm] " << command[0] << " finished (" << output.size() << " bytes)\n";
    return trim_end(output);
}

} // namespace council
