//
// Created by garrett on 2/27/25.
//

#ifndef CHILD_PROCESS_HPP
#define CHILD_PROCESS_HPP

#include "sys/file_descriptor.hpp"

#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <sys/wait.h>

namespace sys {

struct CommandResult {
    int exitCode;
    std::string output;
    std::string errorOutput;
};

// A command run without a shell. One end of the child's stdin or stdout can be
// attached to a pipe held by the parent; stderr is always captured to an
// unlinked temporary file so it can be read after the child exits.
class ChildProcess {
public:
    enum class Pipe {
        NONE,
        STDIN,   // parent writes into the child's stdin
        STDOUT   // parent reads from the child's stdout
    };

    ChildProcess(const std::vector<std::string>& argv, Pipe pipe)
        : m_commandLine(joinArgs(argv)),
          m_stderr(std::tmpfile(), &std::fclose) {
        if (argv.empty()) {
            throw std::invalid_argument("Empty command line");
        }
        if (!m_stderr) {
            throw std::system_error(errno, std::system_category(), "Unable to create stderr capture file");
        }

        int fds[2] = {-1, -1};
        if (pipe != Pipe::NONE && ::pipe2(fds, O_CLOEXEC) < 0) {
            throw std::system_error(errno, std::system_category(), "Unable to create pipe for " + m_commandLine);
        }

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        m_pid = ::fork();
        if (m_pid < 0) {
            int err = errno;
            if (pipe != Pipe::NONE) {
                ::close(fds[0]);
                ::close(fds[1]);
            }
            throw std::system_error(err, std::system_category(), "Unable to fork for " + m_commandLine);
        }

        if (m_pid == 0) {
            // Child process. Rearrange file descriptors, then exec.
            int devNull = ::open("/dev/null", O_RDWR);
            int childIn = pipe == Pipe::STDIN ? fds[0] : devNull;
            int childOut = pipe == Pipe::STDOUT ? fds[1] : devNull;
            if (::dup2(childIn, 0) < 0 || ::dup2(childOut, 1) < 0 || ::dup2(::fileno(m_stderr.get()), 2) < 0) {
                ::_exit(126);
            }
            ::execvp(args[0], args.data());
            std::fprintf(stderr, "Could not exec %s: %s\n", args[0], std::strerror(errno));
            ::_exit(127);
        }

        // Parent process
        if (pipe == Pipe::STDIN) {
            ::close(fds[0]);
            m_pipe = FileDescriptor(fds[1]);
        } else if (pipe == Pipe::STDOUT) {
            ::close(fds[1]);
            m_pipe = FileDescriptor(fds[0]);
        }
    }

    ~ChildProcess() {
        if (m_pid > 0 && !m_reaped) {
            m_pipe = FileDescriptor();
            ::kill(m_pid, SIGTERM);
            int status;
            ::waitpid(m_pid, &status, 0);
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    FileDescriptor& pipe() { return m_pipe; }

    void closePipe() { m_pipe.close(); }

    // Wait for the child; returns its exit code, 128+signal if it was killed
    int wait() {
        if (m_reaped) {
            return m_exitCode;
        }
        m_pipe = FileDescriptor();
        int status = 0;
        pid_t result;
        do {
            result = ::waitpid(m_pid, &status, 0);
        } while (result == -1 && errno == EINTR);
        if (result == -1) {
            throw std::system_error(errno, std::system_category(), "waitpid failed for " + m_commandLine);
        }
        m_reaped = true;
        if (WIFEXITED(status)) {
            m_exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            m_exitCode = 128 + WTERMSIG(status);
        } else {
            m_exitCode = -1;
        }
        return m_exitCode;
    }

    void terminate() {
        if (m_pid > 0 && !m_reaped) {
            ::kill(m_pid, SIGTERM);
        }
    }

    // Everything the child wrote to stderr so far
    std::string errorOutput() {
        std::string result;
        std::FILE* file = m_stderr.get();
        std::fflush(file);
        std::rewind(file);
        char buffer[4096];
        size_t n;
        while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
            result.append(buffer, n);
        }
        while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
            result.pop_back();
        }
        return result;
    }

    const std::string& commandLine() const { return m_commandLine; }

    // Run to completion, capturing stdout and stderr
    static CommandResult run(const std::vector<std::string>& argv) {
        ChildProcess child(argv, Pipe::STDOUT);
        std::string output;
        char buffer[8192];
        size_t n;
        while ((n = child.pipe().read(buffer, sizeof(buffer))) > 0) {
            output.append(buffer, n);
        }
        int exitCode = child.wait();
        return CommandResult{exitCode, std::move(output), child.errorOutput()};
    }

private:
    std::string m_commandLine;
    std::unique_ptr<std::FILE, decltype(&std::fclose)> m_stderr;
    FileDescriptor m_pipe;
    pid_t m_pid = -1;
    bool m_reaped = false;
    int m_exitCode = -1;

    static std::string joinArgs(const std::vector<std::string>& argv) {
        std::string line;
        for (const auto& arg : argv) {
            if (!line.empty()) {
                line += ' ';
            }
            line += arg;
        }
        return line;
    }
};

}
#endif // CHILD_PROCESS_HPP
