// NotificationSource.cpp — Очередь уведомлений и разбор вывода dbus-monitor

#include "peersync/Notifications/NotificationSource.h"
#include <spdlog/spdlog.h>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <vector>
#include <cstring>
#include <thread>

#ifndef _WIN32
#include <unistd.h>
#include <signal.h>
#include <poll.h>
#include <sys/wait.h>
#include <errno.h>
#endif

namespace PeerSync {

static int64_t nowUnix() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ═══════════════════════════════════════════════════════════
// QueueNotificationSource
// ═══════════════════════════════════════════════════════════

class QueueNotificationSource::Impl {
public:
    void push(NotificationEvent event) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_queue.push_back(std::move(event));
        }
        m_cv.notify_one();
    }

    std::optional<NotificationEvent> next(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_cv.wait_for(lock, timeout, [this]() { return !m_queue.empty(); })) {
            return std::nullopt;
        }
        NotificationEvent event = std::move(m_queue.front());
        m_queue.pop_front();
        return event;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<NotificationEvent> m_queue;
};

QueueNotificationSource::QueueNotificationSource() : m_impl(std::make_unique<Impl>()) {}
QueueNotificationSource::~QueueNotificationSource() = default;

void QueueNotificationSource::push(NotificationEvent event) {
    m_impl->push(std::move(event));
}

std::optional<NotificationEvent> QueueNotificationSource::next(std::chrono::milliseconds timeout) {
    return m_impl->next(timeout);
}

// ═══════════════════════════════════════════════════════════
// DbusMonitorSource
// ═══════════════════════════════════════════════════════════

/// Аргументы Notify: app_name, replaces_id, app_icon, summary, body, ...
/// Строковые аргументы по порядку: app_name, app_icon, summary, body
class DbusMonitorSource::Impl {
public:
    explicit Impl(std::string command) : m_command(std::move(command)) {}

    ~Impl() {
        closeProcess();
    }

    std::optional<NotificationEvent> feedLine(const std::string& rawLine) {
        std::string line = trim(rawLine);

        if (line.find("member=Notify") != std::string::npos) {
            m_inNotify = true;
            m_strings.clear();
            m_partial.reset();
            return std::nullopt;
        }
        if (!m_inNotify) {
            return std::nullopt;
        }

        // Продолжение многострочной строки
        if (m_partial) {
            if (endsWithQuote(line)) {
                m_partial->append("\n").append(line.substr(0, line.size() - 1));
                m_strings.push_back(*m_partial);
                m_partial.reset();
            } else {
                m_partial->append("\n").append(line);
                return std::nullopt;
            }
        } else if (line.rfind("string \"", 0) == 0) {
            std::string value = line.substr(8);
            if (endsWithQuote(value)) {
                m_strings.push_back(value.substr(0, value.size() - 1));
            } else {
                m_partial = value;
                return std::nullopt;
            }
        } else {
            return std::nullopt;
        }

        if (m_strings.size() < 4) {
            return std::nullopt;
        }

        NotificationEvent event;
        event.appName = m_strings[0];
        event.summary = m_strings[2];
        event.body = m_strings[3];
        event.message = event.body.empty() ? event.summary : event.summary + ": " + event.body;
        event.timestamp = nowUnix();

        m_inNotify = false;
        m_strings.clear();

        spdlog::info("DbusMonitorSource: Notification captured: {} - {}", event.appName, event.summary);
        return event;
    }

    std::optional<NotificationEvent> next(std::chrono::milliseconds timeout) {
#ifdef _WIN32
        std::this_thread::sleep_for(timeout);
        return std::nullopt;
#else
        if (m_failed) {
            return waitIdle(timeout);
        }
        if (m_fd < 0 && !spawn()) {
            m_failed = true;
            return waitIdle(timeout);
        }

        // Сначала уже прочитанные полные строки
        if (auto event = drainLines()) {
            return event;
        }

        pollfd pfd{};
        pfd.fd = m_fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc <= 0) {
            return std::nullopt;
        }

        char buf[4096];
        ssize_t n = ::read(m_fd, buf, sizeof(buf));
        if (n <= 0) {
            spdlog::warn("DbusMonitorSource: '{}' exited, notification capture disabled", m_command);
            closeProcess();
            m_failed = true;
            return std::nullopt;
        }
        m_buffer.append(buf, static_cast<size_t>(n));
        return drainLines();
#endif
    }

private:
    static std::string trim(const std::string& s) {
        size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    static bool endsWithQuote(const std::string& s) {
        return !s.empty() && s.back() == '"';
    }

    std::optional<NotificationEvent> drainLines() {
        size_t pos;
        while ((pos = m_buffer.find('\n')) != std::string::npos) {
            std::string line = m_buffer.substr(0, pos);
            m_buffer.erase(0, pos + 1);
            if (auto event = feedLine(line)) {
                return event;
            }
        }
        return std::nullopt;
    }

    std::optional<NotificationEvent> waitIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_idleMutex);
        m_idleCv.wait_for(lock, timeout);
        return std::nullopt;
    }

#ifndef _WIN32
    bool spawn() {
        int fds[2];
        if (::pipe(fds) != 0) {
            spdlog::error("DbusMonitorSource: pipe() failed: {}", std::strerror(errno));
            return false;
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            spdlog::error("DbusMonitorSource: fork() failed: {}", std::strerror(errno));
            ::close(fds[0]);
            ::close(fds[1]);
            return false;
        }

        if (pid == 0) {
            ::dup2(fds[1], STDOUT_FILENO);
            ::close(fds[0]);
            ::close(fds[1]);
            ::execl("/bin/sh", "sh", "-c", m_command.c_str(), static_cast<char*>(nullptr));
            ::_exit(127);
        }

        ::close(fds[1]);
        m_fd = fds[0];
        m_pid = pid;
        spdlog::info("DbusMonitorSource: Started '{}' (pid {})", m_command, m_pid);
        return true;
    }
#endif

    void closeProcess() {
#ifndef _WIN32
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
        if (m_pid > 0) {
            ::kill(m_pid, SIGTERM);
            int status = 0;
            ::waitpid(m_pid, &status, 0);
            m_pid = -1;
        }
#endif
    }

    std::string m_command;
    std::string m_buffer;
    bool m_inNotify = false;
    std::vector<std::string> m_strings;
    std::optional<std::string> m_partial;

    int m_fd = -1;
#ifndef _WIN32
    pid_t m_pid = -1;
#endif
    bool m_failed = false;
    std::mutex m_idleMutex;
    std::condition_variable m_idleCv;
};

DbusMonitorSource::DbusMonitorSource(std::string command)
    : m_impl(std::make_unique<Impl>(std::move(command))) {}

DbusMonitorSource::~DbusMonitorSource() = default;

std::optional<NotificationEvent> DbusMonitorSource::next(std::chrono::milliseconds timeout) {
    return m_impl->next(timeout);
}

std::optional<NotificationEvent> DbusMonitorSource::feedLine(const std::string& line) {
    return m_impl->feedLine(line);
}

} // namespace PeerSync
