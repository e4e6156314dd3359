// Errors.h — Исключения и категории ошибок PeerSync

#pragma once

#include <stdexcept>
#include <string>

namespace PeerSync {

/// Категория ошибки (определяет реакцию диспетчера)
enum class ErrorKind {
    Validation,     // Некорректные/отсутствующие поля, неизвестный file_id, не то направление
    NotFound,       // Файл или передача не найдены
    IO,             // Ошибка открытия/чтения/записи
    Auth,           // Неверный код или запрос от несопряжённого устройства
    Protocol        // Кадр не разбирается
};

const char* errorKindCode(ErrorKind kind);

/// Исключение PeerSync
class PeerSyncError : public std::runtime_error {
public:
    PeerSyncError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace PeerSync
