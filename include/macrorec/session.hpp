#pragma once

namespace macrorec {

enum class SessionKind {
    NONE,
    RECORDING,
    PLAYBACK
};

// Process-wide claim on the global input capabilities. Recording and
// playback exclude each other, and each excludes a second session of its
// own kind, so the Recorder never captures the Player's synthetic input.
class SessionGuard {
public:
    SessionGuard() = default;
    ~SessionGuard();

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;
    SessionGuard(SessionGuard&& other) noexcept;
    SessionGuard& operator=(SessionGuard&& other) noexcept;

    // Throws AlreadyRecordingError or AlreadyPlayingError, naming whichever
    // session currently holds the claim.
    static SessionGuard acquire(SessionKind kind);

    void release();
    bool held() const { return heldKind != SessionKind::NONE; }

private:
    explicit SessionGuard(SessionKind kind) : heldKind(kind) {}

    SessionKind heldKind = SessionKind::NONE;
};

SessionKind activeSession();

} // namespace macrorec
