// EchoSuppressor.cpp — Метка синхронизации и сравнение наблюдений

#include "peersync/Clipboard/EchoSuppressor.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace PeerSync {

static bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

void EchoSuppressor::markSynced(const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_marker = text;
}

void EchoSuppressor::clearMarker(const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_marker && *m_marker == text) {
        m_marker.reset();
    }
}

bool EchoSuppressor::observe(const std::string& current) {
    std::lock_guard<std::mutex> lock(m_mutex);

    bool fromSync = m_marker && *m_marker == current;
    bool notify = current != m_last && !fromSync && !isBlank(current);

    if (fromSync) {
        spdlog::debug("EchoSuppressor: Suppressed synced clipboard value");
        m_marker.reset();
    }
    m_last = current;
    return notify;
}

void EchoSuppressor::reset(const std::string& lastObserved) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last = lastObserved;
}

std::optional<std::string> EchoSuppressor::marker() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_marker;
}

std::string EchoSuppressor::lastObserved() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last;
}

} // namespace PeerSync
