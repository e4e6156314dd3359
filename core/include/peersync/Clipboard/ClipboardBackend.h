// ClipboardBackend.h — Доступ к системному буферу обмена

#pragma once

#include "../export.h"
#include <string>
#include <optional>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// ClipboardBackend — чтение/запись текста буфера
// ═══════════════════════════════════════════════════════════

class PS_API ClipboardBackend {
public:
    virtual ~ClipboardBackend() = default;

    /// Текущий текст
    /// @return nullopt если буфер недоступен
    virtual std::optional<std::string> getText() = 0;

    /// Записать текст
    /// @return true если успешно
    virtual bool setText(const std::string& text) = 0;
};

// ═══════════════════════════════════════════════════════════
// CommandClipboard — буфер через внешние команды (xclip, wl-copy)
// ═══════════════════════════════════════════════════════════

constexpr const char* DEFAULT_CLIPBOARD_GET_COMMAND = "xclip -selection clipboard -o";
constexpr const char* DEFAULT_CLIPBOARD_SET_COMMAND = "xclip -selection clipboard -i";

class PS_API CommandClipboard : public ClipboardBackend {
public:
    /// @param getCommand Команда, печатающая буфер в stdout
    /// @param setCommand Команда, читающая новый текст из stdin
    CommandClipboard(std::string getCommand = DEFAULT_CLIPBOARD_GET_COMMAND,
                     std::string setCommand = DEFAULT_CLIPBOARD_SET_COMMAND);

    std::optional<std::string> getText() override;
    bool setText(const std::string& text) override;

private:
    std::string m_getCommand;
    std::string m_setCommand;
};

} // namespace PeerSync
