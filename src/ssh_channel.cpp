//
// Created by garrett on 2/28/25.
//

#include "ssh_channel.hpp"
#include "backup_errors.hpp"
#include "sys/child_process.hpp"

#include <spdlog/spdlog.h>

namespace {

// ssh exits with 255 when the connection or authentication failed
constexpr int SSH_FAILURE = 255;

class SshWriter : public RemoteWriter {
public:
    SshWriter(const SshChannel& channel, const RemoteHost& host, const std::string& path)
        : m_channel(channel), m_host(host), m_partial(path + ".partial") {
        std::string command = "cat > " + SshChannel::shellQuote(m_partial) + " && sync && mv " +
                              SshChannel::shellQuote(m_partial) + " " + SshChannel::shellQuote(path) + " && sync";
        try {
            m_child = std::make_unique<sys::ChildProcess>(channel.commandLine(host, command),
                                                          sys::ChildProcess::Pipe::STDIN);
        } catch (const std::system_error& e) {
            throw TransportError(std::string("Cannot start ssh: ") + e.what());
        }
    }

    ~SshWriter() override {
        if (m_child) {
            abort();
        }
    }

    void write(const char* data, size_t size) override {
        try {
            m_child->pipe().writeAll(data, size);
        } catch (const std::system_error& e) {
            throw TransportError(m_host.label() + ": " + e.what() + describeExit());
        }
    }

    void close() override {
        try {
            m_child->closePipe();
        } catch (const std::system_error& e) {
            throw TransportError(m_host.label() + ": " + e.what());
        }
        int status = m_child->wait();
        std::string error = m_child->errorOutput();
        m_child.reset();
        if (status != 0) {
            throw TransportError(m_host.label() + ": remote write of " + m_partial + " failed (" +
                                 std::to_string(status) + "): " + error);
        }
    }

    void abort() noexcept override {
        if (!m_child) {
            return;
        }
        m_child->terminate();
        try {
            m_child->wait();
        } catch (const std::system_error& e) {
            spdlog::warn("Waiting for ssh to {} failed: {}", m_host.label(), e.what());
        }
        m_child.reset();

        try {
            auto result = sys::ChildProcess::run(
                m_channel.commandLine(m_host, "rm -f " + SshChannel::shellQuote(m_partial)));
            if (result.exitCode != 0) {
                spdlog::warn("Could not remove {}:{}: {}", m_host.label(), m_partial, result.errorOutput);
            }
        } catch (const std::system_error& e) {
            spdlog::warn("Could not remove {}:{}: {}", m_host.label(), m_partial, e.what());
        }
    }

private:
    const SshChannel& m_channel;
    RemoteHost m_host;
    std::string m_partial;
    std::unique_ptr<sys::ChildProcess> m_child;

    // Exit status of an ssh that stopped reading
    std::string describeExit() {
        try {
            int status = m_child->wait();
            std::string error = m_child->errorOutput();
            return " (ssh exited with " + std::to_string(status) + (error.empty() ? ")" : ": " + error + ")");
        } catch (const std::system_error& e) {
            return std::string(" (") + e.what() + ")";
        }
    }
};

class SshReadSource : public ByteSource {
public:
    SshReadSource(const std::vector<std::string>& argv, std::string label)
        : m_child(argv, sys::ChildProcess::Pipe::STDOUT), m_label(std::move(label)) {}

    size_t read(char* buffer, size_t size) override {
        try {
            return m_child.pipe().read(buffer, size);
        } catch (const std::system_error& e) {
            throw TransportError(m_label + ": " + e.what());
        }
    }

    void close() override {
        int status = m_child.wait();
        if (status != 0) {
            throw TransportError(m_label + ": remote read failed (" + std::to_string(status) + "): " +
                                 m_child.errorOutput());
        }
    }

private:
    sys::ChildProcess m_child;
    std::string m_label;
};

class SshSession : public RemoteSession {
public:
    SshSession(const SshChannel& channel, RemoteHost host) : m_channel(channel), m_host(std::move(host)) {}

    std::unique_ptr<RemoteWriter> writeFile(const std::string& path) override {
        return std::make_unique<SshWriter>(m_channel, m_host, path);
    }

    std::unique_ptr<ByteSource> readFile(const std::string& path) override {
        try {
            return std::make_unique<SshReadSource>(
                m_channel.commandLine(m_host, "cat " + SshChannel::shellQuote(path)), m_host.label());
        } catch (const std::system_error& e) {
            throw TransportError(std::string("Cannot start ssh: ") + e.what());
        }
    }

    bool exists(const std::string& path) override {
        auto result = run("test -e " + SshChannel::shellQuote(path));
        if (result.exitCode == 0) {
            return true;
        }
        if (result.exitCode == 1) {
            return false;
        }
        throw TransportError(m_host.label() + ": " + result.errorOutput);
    }

    void remove(const std::string& path) override {
        checked("rm -f " + SshChannel::shellQuote(path));
    }

    void makeDirectories(const std::string& path) override {
        checked("mkdir -p " + SshChannel::shellQuote(path));
    }

private:
    const SshChannel& m_channel;
    RemoteHost m_host;

    sys::CommandResult run(const std::string& command) {
        try {
            return sys::ChildProcess::run(m_channel.commandLine(m_host, command));
        } catch (const std::system_error& e) {
            throw TransportError(m_host.label() + ": " + e.what());
        }
    }

    void checked(const std::string& command) {
        auto result = run(command);
        if (result.exitCode != 0) {
            std::string reason = result.exitCode == SSH_FAILURE ? "connection failed" : "command failed";
            throw TransportError(m_host.label() + ": " + reason + " (" + command + "): " + result.errorOutput);
        }
    }
};

}

SshChannel::SshChannel(std::string sshCommand) : m_ssh(std::move(sshCommand)) {}

std::unique_ptr<RemoteSession> SshChannel::connect(const RemoteHost& host) {
    return std::make_unique<SshSession>(*this, host);
}

std::string SshChannel::shellQuote(const std::string& word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::vector<std::string> SshChannel::commandLine(const RemoteHost& host, const std::string& command) const {
    std::vector<std::string> argv{m_ssh, "-o", "BatchMode=yes"};
    if (host.keyPath) {
        argv.push_back("-i");
        argv.push_back(*host.keyPath);
    }
    if (host.port) {
        argv.push_back("-p");
        argv.push_back(std::to_string(*host.port));
    }
    argv.push_back(host.user ? *host.user + "@" + host.host : host.host);
    argv.push_back(command);
    return argv;
}
