#include "mqttident/process.hpp"

#include <cerrno>
#include <cstring>

#if defined(ESP_PLATFORM) || defined(ARDUINO)
#define MQTTIDENT_PROCESS_UNSUPPORTED 1
#elif defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#define MQTTIDENT_PROCESS_WINDOWS 1
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#define MQTTIDENT_PROCESS_POSIX 1
#endif

namespace mqttident {
namespace process {

namespace {

#if defined(MQTTIDENT_PROCESS_POSIX)

// Exit code used by the child when execvp fails
constexpr int kExecFailedExitCode = 127;

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

CommandResult run_posix(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    CommandResult result;

    int fds[2];
    if (::pipe(fds) != 0) {
        return result;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        return result;
    }

    if (pid == 0) {
        // child: stdout to the pipe, stdin and stderr to /dev/null
        ::dup2(fds[1], STDOUT_FILENO);
        ::close(fds[1]);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::execvp(cargv[0], cargv.data());
        ::_exit(kExecFailedExitCode);
    }

    ::close(fds[1]);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;
    char buffer[4096];

    while (true) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            timed_out = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = fds[0];
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (rc == 0) {
            timed_out = true;
            break;
        }

        ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;  // EOF or read error
    }
    ::close(fds[0]);

    int status = 0;
    if (timed_out) {
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        result.status = CommandStatus::TimedOut;
        result.output.clear();
        return result;
    }

    // Output is closed; give the child the rest of the budget to exit
    while (true) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            break;
        }
        if (w == -1 && errno != EINTR) {
            result.status = CommandStatus::Failed;
            return result;
        }
        if (remaining_ms(deadline) == 0) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
            }
            result.status = CommandStatus::TimedOut;
            result.output.clear();
            return result;
        }
        struct timespec pause = {0, 5 * 1000 * 1000};
        ::nanosleep(&pause, nullptr);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == 0) {
            result.status = CommandStatus::Completed;
        } else if (result.exit_code == kExecFailedExitCode) {
            result.status = CommandStatus::NotLaunched;
        } else {
            result.status = CommandStatus::Failed;
        }
    } else {
        result.status = CommandStatus::Failed;
    }
    return result;
}

#elif defined(MQTTIDENT_PROCESS_WINDOWS)

std::string quote_argument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted.push_back(c);
    }
    quoted.append(backslashes * 2, '\\');
    quoted.push_back('"');
    return quoted;
}

CommandResult run_windows(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    CommandResult result;

    SECURITY_ATTRIBUTES sa;
    ZeroMemory(&sa, sizeof(sa));
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE read_end = nullptr;
    HANDLE write_end = nullptr;
    if (!CreatePipe(&read_end, &write_end, &sa, 0)) {
        return result;
    }
    SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);

    std::string command_line;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            command_line.push_back(' ');
        }
        command_line += quote_argument(argv[i]);
    }
    std::vector<char> cmd_buffer(command_line.begin(), command_line.end());
    cmd_buffer.push_back('\0');

    STARTUPINFOA si;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdOutput = write_end;
    si.hStdError = nullptr;
    si.hStdInput = nullptr;

    PROCESS_INFORMATION pi;
    ZeroMemory(&pi, sizeof(pi));

    BOOL created = CreateProcessA(nullptr, cmd_buffer.data(), nullptr, nullptr, TRUE,
                                  CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);
    CloseHandle(write_end);
    if (!created) {
        CloseHandle(read_end);
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;
    char buffer[4096];

    while (true) {
        DWORD available = 0;
        if (PeekNamedPipe(read_end, nullptr, 0, nullptr, &available, nullptr) && available > 0) {
            DWORD read = 0;
            DWORD to_read = available < sizeof(buffer) ? available : static_cast<DWORD>(sizeof(buffer));
            if (ReadFile(read_end, buffer, to_read, &read, nullptr) && read > 0) {
                result.output.append(buffer, read);
                continue;
            }
        }
        if (WaitForSingleObject(pi.hProcess, 10) == WAIT_OBJECT_0) {
            // drain what is left
            DWORD read = 0;
            while (ReadFile(read_end, buffer, sizeof(buffer), &read, nullptr) && read > 0) {
                result.output.append(buffer, read);
            }
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }
    }
    CloseHandle(read_end);

    if (timed_out) {
        TerminateProcess(pi.hProcess, 1u);
        WaitForSingleObject(pi.hProcess, INFINITE);
        CloseHandle(pi.hThread);
        CloseHandle(pi.hProcess);
        result.status = CommandStatus::TimedOut;
        result.output.clear();
        return result;
    }

    DWORD exit_code = 0;
    if (!GetExitCodeProcess(pi.hProcess, &exit_code)) {
        CloseHandle(pi.hThread);
        CloseHandle(pi.hProcess);
        result.status = CommandStatus::Failed;
        return result;
    }
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);

    result.exit_code = static_cast<int>(exit_code);
    result.status = exit_code == 0 ? CommandStatus::Completed : CommandStatus::Failed;
    return result;
}

#endif

}  // namespace

CommandResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty() || argv.front().empty()) {
        return CommandResult{};
    }
#if defined(MQTTIDENT_PROCESS_POSIX)
    return run_posix(argv, timeout);
#elif defined(MQTTIDENT_PROCESS_WINDOWS)
    return run_windows(argv, timeout);
#else
    (void)timeout;
    return CommandResult{};
#endif
}

std::optional<std::string> capture_output(const std::vector<std::string>& argv,
                                          std::chrono::milliseconds timeout) {
    CommandResult result = run(argv, timeout);
    if (result.status != CommandStatus::Completed) {
        return std::nullopt;
    }
    return result.output;
}

}  // namespace process
}  // namespace mqttident
