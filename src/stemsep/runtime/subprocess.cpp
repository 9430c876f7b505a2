//
//  subprocess.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-08.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "runtime/subprocess.h"

#include "stemsep/logging.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace stemsep::detail {
namespace {

bool is_executable_file(const std::string& path) {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return false;
    }
    return S_ISREG(info.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

bool resolve_executable(const std::string& command, std::string* resolved) {
    if (command.empty()) {
        return false;
    }
    if (command.find('/') != std::string::npos) {
        if (!is_executable_file(command)) {
            return false;
        }
        if (resolved) {
            *resolved = command;
        }
        return true;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return false;
    }
    std::stringstream paths(path_env);
    std::string directory;
    while (std::getline(paths, directory, ':')) {
        if (directory.empty()) {
            directory = ".";
        }
        const std::string candidate = directory + "/" + command;
        if (is_executable_file(candidate)) {
            if (resolved) {
                *resolved = candidate;
            }
            return true;
        }
    }
    return false;
}

bool run_subprocess(const std::vector<std::string>& argv,
                    double timeout_seconds,
                    const std::string& log_path,
                    SubprocessResult* result,
                    std::string* error) {
    if (argv.empty()) {
        if (error) {
            *error = "Empty command line.";
        }
        return false;
    }

    std::vector<char*> raw_argv;
    raw_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        raw_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    raw_argv.push_back(nullptr);

    const std::string sink = log_path.empty() ? std::string("/dev/null") : log_path;
    const auto start = std::chrono::steady_clock::now();

    const pid_t pid = ::fork();
    if (pid < 0) {
        if (error) {
            *error = std::string("fork failed: ") + std::strerror(errno);
        }
        return false;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        const int fd = ::open(sink.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (fd >= 0) {
            ::dup2(fd, STDOUT_FILENO);
            ::dup2(fd, STDERR_FILENO);
            ::close(fd);
        }
        ::execvp(raw_argv[0], raw_argv.data());
        _exit(127);
    }

    // Also set from the parent so the kill below cannot race the child.
    ::setpgid(pid, pid);

    SubprocessResult local;
    int status = 0;
    for (;;) {
        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            local.exit_code = decode_status(status);
            break;
        }
        if (waited < 0 && errno != EINTR) {
            if (error) {
                *error = std::string("waitpid failed: ") + std::strerror(errno);
            }
            return false;
        }

        const double elapsed =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        if (timeout_seconds > 0.0 && elapsed >= timeout_seconds) {
            STEMSEP_LOG_WARN("Subprocess '" << argv.front() << "' exceeded " << timeout_seconds
                                            << " s, killing process group " << pid);
            ::kill(-pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            local.timed_out = true;
            local.exit_code = decode_status(status);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    local.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (result) {
        *result = local;
    }
    return true;
}

} // namespace stemsep::detail
