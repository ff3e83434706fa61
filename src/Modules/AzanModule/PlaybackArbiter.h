#pragma once
/**
 * @file PlaybackArbiter.h
 * @brief Single-session playback state machine with latest-wins preemption.
 *
 * The arbiter never performs I/O. Each input (request, stop, asset and
 * backend completions, tick) may queue actions that the owner drains with
 * popAction() and executes asynchronously. Completions are matched by the
 * sequence number carried by the action, stale ones are ignored.
 *
 * Phases:
 * - Idle: no session.
 * - Resolving: waiting for the audio asset of the current request.
 * - Starting: backend start in flight.
 * - Playing: backend reported a running session.
 * - Stopping: backend stop in flight, an optional pending request follows.
 *
 * Every non-idle phase is bounded by a timeout handled in tick().
 */

#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/PrayerTimesModule/TimeTable.h"

enum class AzanStatus : uint8_t {
    Idle = 0,
    Downloading,
    Playing
};

const char* azanStatusStr(AzanStatus st);

enum class ArbiterPhase : uint8_t {
    Idle = 0,
    Resolving,
    Starting,
    Playing,
    Stopping
};

const char* arbiterPhaseStr(ArbiterPhase ph);

enum class ArbiterActionType : uint8_t {
    ResolveAsset = 0,
    StartPlayback,
    StopPlayback,
    ReportError
};

struct ArbiterAction {
    ArbiterActionType type = ArbiterActionType::ReportError;
    uint32_t seq = 0;
    PrayerKind kind = PrayerKind::Test;
    uint32_t handle = 0;
    ErrorCode error = ErrorCode::None;
};

struct ArbiterTimeouts {
    uint32_t preemptMs = 5000;
    uint32_t fetchWaitMs = 180000;
    uint32_t startMs = Limits::Azan::StartTimeoutMs;
    uint32_t playMaxMs = 300000;   // 0 disables the auto-reset
};

class PlaybackArbiter {
public:
    void setTimeouts(const ArbiterTimeouts& t) { timeouts_ = t; }
    const ArbiterTimeouts& timeouts() const { return timeouts_; }

    /** @brief Issues a playback request. The most recent request wins. Returns its sequence. */
    uint32_t request(PrayerKind kind, uint32_t nowMs);
    /** @brief Stops the active session, if any. Idempotent. */
    void stop(uint32_t nowMs);

    void onAssetPending(uint32_t seq);
    void onAssetReady(uint32_t seq, uint32_t nowMs);
    /** @brief Ends a resolving session; `err` is MissingUrl when no source is configured. */
    void onAssetFailed(uint32_t seq, ErrorCode err = ErrorCode::FetchFailed);
    void onStartCompleted(uint32_t seq, bool ok, uint32_t handle, uint32_t nowMs);
    void onStopCompleted(uint32_t seq, bool ok, uint32_t nowMs);

    /** @brief Enforces phase timeouts. */
    void tick(uint32_t nowMs);

    bool popAction(ArbiterAction& out);
    uint8_t pendingActions() const { return actionCount_; }
    uint32_t droppedActions() const { return droppedActions_; }

    AzanStatus status() const { return status_; }
    ArbiterPhase phase() const { return phase_; }
    bool active() const { return phase_ != ArbiterPhase::Idle; }
    PrayerKind activeKind() const { return current_.kind; }
    uint32_t activeSeq() const { return (phase_ == ArbiterPhase::Idle) ? 0 : current_.seq; }
    uint32_t handle() const { return handle_; }
    bool hasPending() const { return hasPending_; }
    PrayerKind pendingKind() const { return pending_.kind; }
    ErrorCode lastError() const { return lastError_; }

private:
    struct Request {
        uint32_t seq = 0;
        PrayerKind kind = PrayerKind::Test;
    };

    void beginResolve_(const Request& req, uint32_t nowMs);
    void beginStop_(uint32_t nowMs);
    void finishSession_(uint32_t nowMs);
    void enterPhase_(ArbiterPhase ph, uint32_t nowMs);
    void report_(ErrorCode err, PrayerKind kind, uint32_t seq);
    void push_(const ArbiterAction& a);

    ArbiterTimeouts timeouts_{};
    ArbiterPhase phase_ = ArbiterPhase::Idle;
    AzanStatus status_ = AzanStatus::Idle;
    uint32_t phaseSinceMs_ = 0;

    uint32_t nextSeq_ = 0;
    Request current_{};
    Request pending_{};
    bool hasPending_ = false;
    bool stopAfterStart_ = false;
    uint32_t handle_ = 0;
    uint32_t stopSeq_ = 0;
    ErrorCode lastError_ = ErrorCode::None;

    ArbiterAction actions_[Limits::Azan::MaxPendingActions]{};
    uint8_t actionHead_ = 0;
    uint8_t actionCount_ = 0;
    uint32_t droppedActions_ = 0;
};
