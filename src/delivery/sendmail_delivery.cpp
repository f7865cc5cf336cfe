#include "delivery/sendmail_delivery.hpp"

#include "common/logger.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <signal.h>
#include <time.h>
#include <pthread.h>
#include <sys/wait.h>

namespace labgate {
namespace delivery {

namespace {

bool HasLineBreak(const std::string& value) {
    return value.find_first_of("\r\n") != std::string::npos;
}

// 在当前线程屏蔽 SIGPIPE; 管道对端提前退出时写入得到 EPIPE 而不是终止进程.
// 析构时丢弃本次写入产生的挂起信号并恢复原屏蔽字
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0) {
            was_pending_ = sigismember(&pending, SIGPIPE) == 1;
        }
        blocked_ = ::pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_set_) == 0;
    }

    ~SigpipeGuard() {
        if (!blocked_) {
            return;
        }
        if (!was_pending_) {
            const struct timespec no_wait = {0, 0};
            while (::sigtimedwait(&pipe_set_, nullptr, &no_wait) == SIGPIPE) {
            }
        }
        ::pthread_sigmask(SIG_SETMASK, &old_set_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    sigset_t pipe_set_;
    sigset_t old_set_;
    bool was_pending_ = false;
    bool blocked_ = false;
};

} // namespace

SendmailCodeDelivery::SendmailCodeDelivery(labgate::common::DeliveryConfig config)
    : config_(std::move(config)) {}

labgate::common::StatusOr<std::string> SendmailCodeDelivery::BuildMessage(const labgate::core::IdentityRecord& recipient
                                                                          , const std::string& code) const {
    if (recipient.email.empty() || HasLineBreak(recipient.email) || HasLineBreak(recipient.name)
        || HasLineBreak(config_.from_address) || HasLineBreak(config_.subject)) {
        return labgate::common::Status::InvalidArgument("Invalid mail header value");
    }
    std::string greeting = recipient.name.empty() ? "Hello," : fmt::format("Hello {},", recipient.name);
    return labgate::common::StatusOr<std::string>(fmt::format(
        "From: {}\r\n"
        "To: {}\r\n"
        "Subject: {}\r\n"
        "MIME-Version: 1.0\r\n"
        "Content-Type: text/plain; charset=UTF-8\r\n"
        "\r\n"
        "{}\r\n"
        "\r\n"
        "Your verification code is: {}\r\n"
        "\r\n"
        "This code will expire in 10 minutes.\r\n"
        "If you didn't request this code, please ignore this email.\r\n",
        config_.from_address, recipient.email, config_.subject, greeting, code));
}

labgate::common::Status SendmailCodeDelivery::Deliver(const labgate::core::IdentityRecord& recipient
                                                      , const std::string& code) {
    if (config_.sendmail_path.empty()) {
        return labgate::common::Status::Unavailable("Email service not configured");
    }
    auto message = BuildMessage(recipient, code);
    if (!message.IsOk()) {
        return message.GetStatus();
    }

    // 收件人由 -t 从邮件头读取, 不出现在命令行上
    const std::string command = config_.sendmail_path + " -t -i";
    SigpipeGuard sigpipe_guard;
    FILE* pipe = ::popen(command.c_str(), "w");
    if (pipe == nullptr) {
        return labgate::common::Status::Unavailable(
            fmt::format("Failed to start sendmail: {}", std::strerror(errno)));
    }
    const auto& body = message.Value();
    const auto written = std::fwrite(body.data(), 1, body.size(), pipe);
    // 先显式 flush, pclose 内部的 flush 错误无法取回
    const bool flushed = std::fflush(pipe) == 0;
    const int write_errno = (written != body.size() || !flushed) ? errno : 0;
    const int rc = ::pclose(pipe);
    if (written != body.size() || !flushed) {
        return labgate::common::Status::Unavailable(
            fmt::format("Failed to write mail to sendmail: {}", std::strerror(write_errno)));
    }
    if (rc == -1 || !WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
        return labgate::common::Status::Unavailable(fmt::format("sendmail exited with status {}", rc));
    }
    LABGATE_LOG_INFO("Auth code mail handed to sendmail for student {}", recipient.id);
    return labgate::common::Status::OK();
}

} // namespace delivery
} // namespace labgate
