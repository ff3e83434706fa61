/**
 * @file PlaybackArbiter.cpp
 * @brief Implementation file.
 */

#include "Modules/AzanModule/PlaybackArbiter.h"

const char* azanStatusStr(AzanStatus st)
{
    switch (st) {
    case AzanStatus::Idle: return "idle";
    case AzanStatus::Downloading: return "downloading";
    case AzanStatus::Playing: return "playing";
    default: return "unknown";
    }
}

const char* arbiterPhaseStr(ArbiterPhase ph)
{
    switch (ph) {
    case ArbiterPhase::Idle: return "idle";
    case ArbiterPhase::Resolving: return "resolving";
    case ArbiterPhase::Starting: return "starting";
    case ArbiterPhase::Playing: return "playing";
    case ArbiterPhase::Stopping: return "stopping";
    default: return "unknown";
    }
}

static bool elapsed(uint32_t nowMs, uint32_t sinceMs, uint32_t limitMs)
{
    return (uint32_t)(nowMs - sinceMs) >= limitMs;
}

uint32_t PlaybackArbiter::request(PrayerKind kind, uint32_t nowMs)
{
    Request req;
    req.seq = ++nextSeq_;
    if (req.seq == 0) req.seq = ++nextSeq_;
    req.kind = kind;

    switch (phase_) {
    case ArbiterPhase::Idle:
    case ArbiterPhase::Resolving:
        // A superseded resolve is simply forgotten, its completion no longer matches.
        beginResolve_(req, nowMs);
        break;
    case ArbiterPhase::Starting:
        pending_ = req;
        hasPending_ = true;
        stopAfterStart_ = true;
        break;
    case ArbiterPhase::Playing:
        pending_ = req;
        hasPending_ = true;
        beginStop_(nowMs);
        break;
    case ArbiterPhase::Stopping:
        pending_ = req;
        hasPending_ = true;
        break;
    }
    return req.seq;
}

void PlaybackArbiter::stop(uint32_t nowMs)
{
    hasPending_ = false;
    switch (phase_) {
    case ArbiterPhase::Idle:
        status_ = AzanStatus::Idle;
        break;
    case ArbiterPhase::Resolving:
        // The shared fetch keeps running for later requests.
        finishSession_(nowMs);
        break;
    case ArbiterPhase::Starting:
        stopAfterStart_ = true;
        break;
    case ArbiterPhase::Playing:
        beginStop_(nowMs);
        break;
    case ArbiterPhase::Stopping:
        break;
    }
}

void PlaybackArbiter::onAssetPending(uint32_t seq)
{
    if (phase_ != ArbiterPhase::Resolving || seq != current_.seq) return;
    status_ = AzanStatus::Downloading;
}

void PlaybackArbiter::onAssetReady(uint32_t seq, uint32_t nowMs)
{
    if (phase_ != ArbiterPhase::Resolving || seq != current_.seq) return;
    ArbiterAction a;
    a.type = ArbiterActionType::StartPlayback;
    a.seq = current_.seq;
    a.kind = current_.kind;
    push_(a);
    stopAfterStart_ = false;
    enterPhase_(ArbiterPhase::Starting, nowMs);
}

void PlaybackArbiter::onAssetFailed(uint32_t seq, ErrorCode err)
{
    if (phase_ != ArbiterPhase::Resolving || seq != current_.seq) return;
    report_(err, current_.kind, seq);
    phase_ = ArbiterPhase::Idle;
    status_ = AzanStatus::Idle;
}

void PlaybackArbiter::onStartCompleted(uint32_t seq, bool ok, uint32_t handle, uint32_t nowMs)
{
    if (phase_ != ArbiterPhase::Starting || seq != current_.seq) {
        // Late start of an abandoned session: make sure it does not keep playing.
        // Backend stops are entity wide, so skip it once a newer session owns the speaker.
        const bool speakerOwned = phase_ == ArbiterPhase::Starting ||
                                  phase_ == ArbiterPhase::Playing ||
                                  phase_ == ArbiterPhase::Stopping;
        if (ok && !speakerOwned) {
            ArbiterAction a;
            a.type = ArbiterActionType::StopPlayback;
            a.seq = 0;
            a.handle = handle;
            push_(a);
        }
        return;
    }

    if (!ok) {
        report_(ErrorCode::PlaybackFailed, current_.kind, seq);
        finishSession_(nowMs);
        return;
    }

    handle_ = handle;
    if (stopAfterStart_) {
        beginStop_(nowMs);
        return;
    }
    status_ = AzanStatus::Playing;
    enterPhase_(ArbiterPhase::Playing, nowMs);
}

void PlaybackArbiter::onStopCompleted(uint32_t seq, bool ok, uint32_t nowMs)
{
    if (phase_ != ArbiterPhase::Stopping || seq != stopSeq_) return;
    if (!ok) report_(ErrorCode::PlaybackFailed, current_.kind, seq);
    finishSession_(nowMs);
}

void PlaybackArbiter::tick(uint32_t nowMs)
{
    switch (phase_) {
    case ArbiterPhase::Resolving:
        if (elapsed(nowMs, phaseSinceMs_, timeouts_.fetchWaitMs)) {
            report_(ErrorCode::FetchFailed, current_.kind, current_.seq);
            phase_ = ArbiterPhase::Idle;
            status_ = AzanStatus::Idle;
        }
        break;
    case ArbiterPhase::Starting:
        if (elapsed(nowMs, phaseSinceMs_, timeouts_.startMs)) {
            report_(ErrorCode::PlaybackFailed, current_.kind, current_.seq);
            finishSession_(nowMs);
        }
        break;
    case ArbiterPhase::Stopping:
        if (elapsed(nowMs, phaseSinceMs_, timeouts_.preemptMs)) {
            report_(hasPending_ ? ErrorCode::PreemptionTimeout : ErrorCode::PlaybackFailed,
                    current_.kind, stopSeq_);
            finishSession_(nowMs);
        }
        break;
    case ArbiterPhase::Playing:
        if (timeouts_.playMaxMs > 0 && elapsed(nowMs, phaseSinceMs_, timeouts_.playMaxMs)) {
            handle_ = 0;
            phase_ = ArbiterPhase::Idle;
            status_ = AzanStatus::Idle;
        }
        break;
    case ArbiterPhase::Idle:
        break;
    }
}

bool PlaybackArbiter::popAction(ArbiterAction& out)
{
    if (actionCount_ == 0) return false;
    out = actions_[actionHead_];
    actionHead_ = (uint8_t)((actionHead_ + 1) % Limits::Azan::MaxPendingActions);
    --actionCount_;
    return true;
}

void PlaybackArbiter::beginResolve_(const Request& req, uint32_t nowMs)
{
    current_ = req;
    stopAfterStart_ = false;
    handle_ = 0;
    status_ = AzanStatus::Idle;

    ArbiterAction a;
    a.type = ArbiterActionType::ResolveAsset;
    a.seq = req.seq;
    a.kind = req.kind;
    push_(a);
    enterPhase_(ArbiterPhase::Resolving, nowMs);
}

void PlaybackArbiter::beginStop_(uint32_t nowMs)
{
    stopSeq_ = current_.seq;
    ArbiterAction a;
    a.type = ArbiterActionType::StopPlayback;
    a.seq = stopSeq_;
    a.kind = current_.kind;
    a.handle = handle_;
    push_(a);
    enterPhase_(ArbiterPhase::Stopping, nowMs);
}

void PlaybackArbiter::finishSession_(uint32_t nowMs)
{
    handle_ = 0;
    stopAfterStart_ = false;
    status_ = AzanStatus::Idle;
    if (hasPending_) {
        hasPending_ = false;
        beginResolve_(pending_, nowMs);
        return;
    }
    phase_ = ArbiterPhase::Idle;
}

void PlaybackArbiter::enterPhase_(ArbiterPhase ph, uint32_t nowMs)
{
    phase_ = ph;
    phaseSinceMs_ = nowMs;
}

void PlaybackArbiter::report_(ErrorCode err, PrayerKind kind, uint32_t seq)
{
    lastError_ = err;
    ArbiterAction a;
    a.type = ArbiterActionType::ReportError;
    a.seq = seq;
    a.kind = kind;
    a.error = err;
    push_(a);
}

void PlaybackArbiter::push_(const ArbiterAction& a)
{
    if (actionCount_ >= Limits::Azan::MaxPendingActions) {
        // Oldest action is overwritten; owners drain after every input.
        actionHead_ = (uint8_t)((actionHead_ + 1) % Limits::Azan::MaxPendingActions);
        --actionCount_;
        ++droppedActions_;
    }
    const uint8_t tail = (uint8_t)((actionHead_ + actionCount_) % Limits::Azan::MaxPendingActions);
    actions_[tail] = a;
    ++actionCount_;
}
