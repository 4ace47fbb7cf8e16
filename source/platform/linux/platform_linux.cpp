#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace platform {

namespace {

constexpr int kPollIntervalMilliseconds = 100;

// Both pipes are created close-on-exec; the child dup2()s the write ends onto 1 and 2.
struct Pipe {
    int read_end = -1;
    int write_end = -1;
};

bool open_pipe(Pipe &pipe_fds) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    pipe_fds.read_end = fds[0];
    pipe_fds.write_end = fds[1];
    return true;
}

void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void close_pipe(Pipe &pipe_fds) {
    close_fd(pipe_fds.read_end);
    close_fd(pipe_fds.write_end);
}

// Echo complete lines from pending, keeping any trailing partial line buffered.
void echo_lines(std::string &pending, std::ostream &stream, const std::string &prefix, bool flush_all) {
    size_t newline = pending.find('\n');
    while (newline != std::string::npos) {
        stream << prefix << pending.substr(0, newline) << '\n';
        pending.erase(0, newline + 1);
        newline = pending.find('\n');
    }
    if (flush_all && !pending.empty()) {
        stream << prefix << pending << '\n';
        pending.clear();
    }
    stream.flush();
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Tracks the SIGTERM -> SIGKILL escalation for a cancelled child.
// Signals go to the child's process group so tools that spawn helpers
// (npm, dotnet build servers) are taken down with it.
struct CancelState {
    bool term_sent = false;
    bool kill_sent = false;
    std::chrono::steady_clock::time_point term_time;
};

void apply_cancellation(pid_t child_pid, const ProcessOptions &options, CancelState &state) {
    if (options.cancel_flag == nullptr || !options.cancel_flag->load()) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    if (!state.term_sent) {
        kill(-child_pid, SIGTERM);
        state.term_sent = true;
        state.term_time = now;
        return;
    }
    if (!state.kill_sent &&
        now - state.term_time >= std::chrono::milliseconds(options.kill_grace_milliseconds)) {
        kill(-child_pid, SIGKILL);
        state.kill_sent = true;
    }
}

} // namespace

ProcessResult run_process(const std::string &executable,
                          const std::vector<std::string> &arguments,
                          const ProcessOptions &options) {
    ProcessResult result;
    bool redirect = options.capture_output || options.echo_output;

    // Build argv array: [executable, arg1, arg2, ..., nullptr] before forking.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    Pipe stdout_pipe;
    Pipe stderr_pipe;
    Pipe exec_error_pipe; // child writes errno here if chdir/exec fails

    if (!open_pipe(exec_error_pipe) ||
        (redirect && (!open_pipe(stdout_pipe) || !open_pipe(stderr_pipe)))) {
        result.error_message = "Failed to create pipe: " + std::string(strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_error_pipe);
        return result;
    }

    const char *working_directory = options.working_directory.empty() ? nullptr : options.working_directory.c_str();

    pid_t child_pid = fork();
    if (child_pid < 0) {
        result.error_message = "Failed to fork process: " + std::string(strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_error_pipe);
        return result;
    }

    if (child_pid == 0) {
        // Child: only async-signal-safe calls from here on.
        setpgid(0, 0);
        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }
        if (redirect) {
            dup2(stdout_pipe.write_end, STDOUT_FILENO);
            dup2(stderr_pipe.write_end, STDERR_FILENO);
        }
        if (working_directory != nullptr && chdir(working_directory) != 0) {
            int error_number = errno;
            ssize_t ignored = write(exec_error_pipe.write_end, &error_number, sizeof(error_number));
            (void)ignored;
            _exit(127);
        }
        execvp(argv_pointers[0], argv_pointers.data());
        int error_number = errno;
        ssize_t ignored = write(exec_error_pipe.write_end, &error_number, sizeof(error_number));
        (void)ignored;
        _exit(127);
    }

    // Parent. setpgid here as well so the group exists before any signal is sent.
    setpgid(child_pid, child_pid);
    close_fd(stdout_pipe.write_end);
    close_fd(stderr_pipe.write_end);
    close_fd(exec_error_pipe.write_end);

    // The error pipe closes on a successful exec; otherwise it carries the child's errno.
    int child_errno = 0;
    ssize_t error_bytes = 0;
    do {
        error_bytes = read(exec_error_pipe.read_end, &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);
    close_fd(exec_error_pipe.read_end);

    if (error_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(child_pid, &status, 0);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        result.exit_code = 127;
        result.error_message = (working_directory != nullptr && child_errno == ENOENT
                                    ? "Cannot run '" + executable + "' in '" + options.working_directory + "': "
                                    : "Cannot run '" + executable + "': ") +
                               std::string(strerror(child_errno));
        return result;
    }

    result.started = true;
    CancelState cancel_state;

    std::string stdout_pending;
    std::string stderr_pending;
    char buffer[4096];

    while (stdout_pipe.read_end >= 0 || stderr_pipe.read_end >= 0) {
        struct pollfd poll_fds[2];
        int count = 0;
        if (stdout_pipe.read_end >= 0) {
            poll_fds[count++] = {stdout_pipe.read_end, POLLIN, 0};
        }
        if (stderr_pipe.read_end >= 0) {
            poll_fds[count++] = {stderr_pipe.read_end, POLLIN, 0};
        }

        int ready = poll(poll_fds, count, kPollIntervalMilliseconds);
        if (ready < 0 && errno != EINTR) {
            break;
        }

        for (int index = 0; index < count && ready > 0; ++index) {
            if ((poll_fds[index].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            bool is_stdout = poll_fds[index].fd == stdout_pipe.read_end;
            ssize_t bytes_read = read(poll_fds[index].fd, buffer, sizeof(buffer));
            if (bytes_read <= 0) {
                if (bytes_read < 0 && errno == EINTR) {
                    continue;
                }
                close_fd(is_stdout ? stdout_pipe.read_end : stderr_pipe.read_end);
                continue;
            }

            std::string chunk(buffer, static_cast<size_t>(bytes_read));
            (is_stdout ? result.standard_output : result.standard_error) += chunk;
            if (options.echo_output) {
                std::string &pending = is_stdout ? stdout_pending : stderr_pending;
                pending += chunk;
                echo_lines(pending, is_stdout ? std::cout : std::cerr, options.echo_prefix, false);
            }
        }

        apply_cancellation(child_pid, options, cancel_state);
    }

    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);

    if (options.echo_output) {
        echo_lines(stdout_pending, std::cout, options.echo_prefix, true);
        echo_lines(stderr_pending, std::cerr, options.echo_prefix, true);
    }

    int status = 0;
    while (true) {
        pid_t waited = waitpid(child_pid, &status, WNOHANG);
        if (waited == child_pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            status = 0;
            break;
        }
        apply_cancellation(child_pid, options, cancel_state);
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMilliseconds / 2));
    }

    result.exit_code = decode_wait_status(status);
    result.cancelled = cancel_state.term_sent;
    return result;
}

std::string find_executable(const std::string &name) {
    if (name.empty()) {
        return "";
    }
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            directory = ".";
        }
        std::string full_path = directory + "/" + name;
        struct stat file_status;
        if (stat(full_path.c_str(), &file_status) == 0 && S_ISREG(file_status.st_mode) &&
            access(full_path.c_str(), X_OK) == 0) {
            return full_path;
        }
    }
    return "";
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool write_file_contents(const std::string &file_path, const std::string &contents) {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream.is_open()) {
        return false;
    }
    file_stream << contents;
    file_stream.close();
    return !file_stream.fail();
}

} // namespace platform
