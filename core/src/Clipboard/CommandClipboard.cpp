// CommandClipboard.cpp — Буфер обмена через popen

#include "peersync/Clipboard/ClipboardBackend.h"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <array>

#ifdef _WIN32
#define popen _popen
#define pclose _pclose
#endif

namespace PeerSync {

CommandClipboard::CommandClipboard(std::string getCommand, std::string setCommand)
    : m_getCommand(std::move(getCommand))
    , m_setCommand(std::move(setCommand)) {}

std::optional<std::string> CommandClipboard::getText() {
    std::string command = m_getCommand + " 2>/dev/null";
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        spdlog::error("CommandClipboard: Failed to run '{}'", m_getCommand);
        return std::nullopt;
    }

    std::string out;
    std::array<char, 4096> buf{};
    size_t n = 0;
    while ((n = fread(buf.data(), 1, buf.size(), pipe)) > 0) {
        out.append(buf.data(), n);
    }

    int rc = pclose(pipe);
    if (rc != 0) {
        // Пустой буфер у xclip тоже даёт ненулевой код
        spdlog::debug("CommandClipboard: '{}' exited with {}", m_getCommand, rc);
        return std::nullopt;
    }
    return out;
}

bool CommandClipboard::setText(const std::string& text) {
    FILE* pipe = popen(m_setCommand.c_str(), "w");
    if (!pipe) {
        spdlog::error("CommandClipboard: Failed to run '{}'", m_setCommand);
        return false;
    }

    size_t written = text.empty() ? 0 : fwrite(text.data(), 1, text.size(), pipe);
    int rc = pclose(pipe);
    if (written != text.size() || rc != 0) {
        spdlog::error("CommandClipboard: Failed to set clipboard (rc={})", rc);
        return false;
    }
    return true;
}

} // namespace PeerSync
