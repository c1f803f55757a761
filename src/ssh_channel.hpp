//
// Created by garrett on 2/28/25.
//

#ifndef SSH_CHANNEL_HPP
#define SSH_CHANNEL_HPP

#include "remote_channel.hpp"

#include <string>
#include <vector>

// RemoteChannel on top of the ssh client. Every operation is one non-interactive ssh command.
class SshChannel : public RemoteChannel {
public:
    explicit SshChannel(std::string sshCommand = "ssh");

    std::unique_ptr<RemoteSession> connect(const RemoteHost& host) override;

    // Quote a word for the remote POSIX shell
    static std::string shellQuote(const std::string& word);

    // ssh argv that runs command on host
    std::vector<std::string> commandLine(const RemoteHost& host, const std::string& command) const;

private:
    std::string m_ssh;
};

#endif // SSH_CHANNEL_HPP
