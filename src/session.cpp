#include "macrorec/session.hpp"
#include "macrorec/errors.hpp"

#include <mutex>

namespace macrorec {

namespace {
std::mutex sessionMutex;
SessionKind currentSession = SessionKind::NONE;
}

SessionGuard::~SessionGuard() {
    release();
}

SessionGuard::SessionGuard(SessionGuard&& other) noexcept : heldKind(other.heldKind) {
    other.heldKind = SessionKind::NONE;
}

SessionGuard& SessionGuard::operator=(SessionGuard&& other) noexcept {
    if (this != &other) {
        release();
        heldKind = other.heldKind;
        other.heldKind = SessionKind::NONE;
    }
    return *this;
}

SessionGuard SessionGuard::acquire(SessionKind kind) {
    std::lock_guard<std::mutex> lk(sessionMutex);
    if (currentSession == SessionKind::RECORDING) throw AlreadyRecordingError();
    if (currentSession == SessionKind::PLAYBACK) throw AlreadyPlayingError();
    currentSession = kind;
    return SessionGuard(kind);
}

void SessionGuard::release() {
    if (heldKind == SessionKind::NONE) return;
    std::lock_guard<std::mutex> lk(sessionMutex);
    if (currentSession == heldKind) currentSession = SessionKind::NONE;
    heldKind = SessionKind::NONE;
}

SessionKind activeSession() {
    std::lock_guard<std::mutex> lk(sessionMutex);
    return currentSession;
}

} // namespace macrorec
