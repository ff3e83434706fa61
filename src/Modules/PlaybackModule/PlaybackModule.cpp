/**
 * @file PlaybackModule.cpp
 * @brief Implementation file.
 */

#include "PlaybackModule.h"
#include "Core/Runtime.h"
#include "Modules/AudioCacheModule/AssetTable.h"
#include <LittleFS.h>
#include <string.h>
#include <strings.h>

#define LOG_TAG "Playback"
#include "Core/ModuleLog.h"

bool PlaybackModule::buildMediaUrl(const char* mediaBase, const char* ip, const char* localPath,
                                   char* out, size_t len)
{
    if (!localPath || !out || len == 0) return false;
    const char* file = strrchr(localPath, '/');
    file = file ? file + 1 : localPath;
    if (file[0] == '\0') return false;

    int n = 0;
    if (mediaBase && mediaBase[0] != '\0') {
        size_t baseLen = strlen(mediaBase);
        while (baseLen > 0 && mediaBase[baseLen - 1] == '/') --baseLen;
        n = snprintf(out, len, "%.*s/local/azan/%s", (int)baseLen, mediaBase, file);
    } else {
        if (!ip || ip[0] == '\0') return false;
        if (Limits::Playback::MediaServerPort == 80) {
            n = snprintf(out, len, "http://%s/local/azan/%s", ip, file);
        } else {
            n = snprintf(out, len, "http://%s:%u/local/azan/%s", ip,
                         (unsigned)Limits::Playback::MediaServerPort, file);
        }
    }
    return n > 0 && (size_t)n < len;
}

void PlaybackModule::selectBackend_()
{
    PlaybackTarget* next = &cast_;
    if (strcasecmp(cfgData.backend, "wake_launch") == 0) {
        next = &wakeLaunch_;
    } else if (strcasecmp(cfgData.backend, "cast") != 0) {
        LOGW("unknown backend '%s', using cast", cfgData.backend);
    }
    target_ = next;
    LOGI("playback backend: %s", next->name());
}

void PlaybackModule::startServer_()
{
    if (serverStarted_) return;
    server_.serveStatic("/local/azan/", LittleFS, "/azan/")
        .setCacheControl("no-cache")
        .setFilter([](AsyncWebServerRequest* request) {
            const String& url = request->url();
            const int slash = url.lastIndexOf('/');
            return isPayloadFileName(url.c_str() + slash + 1);
        });
    server_.onNotFound([](AsyncWebServerRequest* request) {
        request->send(404, "text/plain", "not found");
    });
    server_.begin();
    serverStarted_ = true;
    LOGI("media server listening on port %u", (unsigned)Limits::Playback::MediaServerPort);
}

void PlaybackModule::complete_(const Request& req, bool ok, ErrorCode err, uint32_t handle)
{
    PlaybackCompletedPayload p{};
    p.seq = req.seq;
    p.op = req.op;
    p.ok = ok ? 1U : 0U;
    p.errorCode = (uint16_t)(ok ? ErrorCode::None : err);
    p.handle = handle;
    if (!eventBus_ || !eventBus_->post(EventId::PlaybackCompleted, &p, sizeof(p))) {
        LOGW("PlaybackCompleted seq=%lu not posted", (unsigned long)req.seq);
    }
}

void PlaybackModule::run_(const Request& req)
{
    if (backendDirty_) {
        backendDirty_ = false;
        selectBackend_();
    }
    PlaybackTarget* target = target_;

    if ((PlaybackOp)req.op == PlaybackOp::Stop) {
        ErrorCode err = ErrorCode::None;
        const bool ok = target->stop(req.handle, err);
        LOGI("stop seq=%lu handle=%lu -> %s", (unsigned long)req.seq, (unsigned long)req.handle,
             ok ? "ok" : errorCodeStr(err));
        complete_(req, ok, err, req.handle);
        return;
    }

    char ip[16] = {0};
    if (wifiSvc_ && wifiSvc_->getIP) (void)wifiSvc_->getIP(wifiSvc_->ctx, ip, sizeof(ip));
    char mediaUrl[192] = {0};
    if (!buildMediaUrl(cfgData.mediaBase, ip, req.path, mediaUrl, sizeof(mediaUrl))) {
        LOGW("start seq=%lu: no media url for %s", (unsigned long)req.seq, req.path);
        complete_(req, false, ErrorCode::PlaybackFailed, 0);
        return;
    }

    if (++nextHandle_ == 0) nextHandle_ = 1;
    const uint32_t handle = nextHandle_;
    ErrorCode err = ErrorCode::None;
    const uint32_t t0 = millis();
    const bool ok = target->start(mediaUrl, handle, err);
    LOGI("start seq=%lu via %s -> %s (%lu ms)", (unsigned long)req.seq, target->name(),
         ok ? "ok" : errorCodeStr(err), (unsigned long)(millis() - t0));
    complete_(req, ok, err, ok ? handle : 0);
}

void PlaybackModule::loop()
{
    if (!serverStarted_) {
        if (dataStore_ && wifiReady(*dataStore_)) startServer_();
    }

    Request req;
    if (reqQ_ && xQueueReceive(reqQ_, &req, pdMS_TO_TICKS(500)) == pdTRUE) {
        run_(req);
    }
}

bool PlaybackModule::enqueue_(const Request& req)
{
    if (!reqQ_) return false;
    if (xQueueSendToBack(reqQ_, &req, 0) != pdTRUE) {
        LOGW("request queue full, seq=%lu dropped", (unsigned long)req.seq);
        return false;
    }
    return true;
}

bool PlaybackModule::svcRequestStart_(void* ctx, uint32_t seq, const char* localPath)
{
    PlaybackModule* self = static_cast<PlaybackModule*>(ctx);
    if (!self || !localPath || localPath[0] == '\0') return false;
    Request req;
    req.op = (uint8_t)PlaybackOp::Start;
    req.seq = seq;
    snprintf(req.path, sizeof(req.path), "%s", localPath);
    return self->enqueue_(req);
}

bool PlaybackModule::svcRequestStop_(void* ctx, uint32_t seq, uint32_t handle)
{
    PlaybackModule* self = static_cast<PlaybackModule*>(ctx);
    if (!self) return false;
    Request req;
    req.op = (uint8_t)PlaybackOp::Stop;
    req.seq = seq;
    req.handle = handle;
    return self->enqueue_(req);
}

const char* PlaybackModule::svcBackendName_(void* ctx)
{
    PlaybackModule* self = static_cast<PlaybackModule*>(ctx);
    if (!self) return "";
    return self->target_->name();
}

void PlaybackModule::onEventStatic_(const Event& e, void* user)
{
    PlaybackModule* self = static_cast<PlaybackModule*>(user);
    if (self) self->onEvent_(e);
}

void PlaybackModule::onEvent_(const Event& e)
{
    if (e.id != EventId::ConfigChanged) return;
    if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
    const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
    if (strcmp(p->nvsKey, NvsKeys::Playback::Backend) == 0) {
        backendDirty_ = true;
    }
}

void PlaybackModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(backendVar);
    cfg.registerVar(haUrlVar);
    cfg.registerVar(haTokenVar);
    cfg.registerVar(entityVar);
    cfg.registerVar(notifyVar);
    cfg.registerVar(wakeAckVar);
    cfg.registerVar(wakeGraceVar);
    cfg.registerVar(mediaBaseVar);

    reqQ_ = xQueueCreate(Limits::Playback::RequestQueueLen, sizeof(Request));
    if (!reqQ_) LOGE("playback queue allocation failed");

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    auto* dsSvc = services.get<DataStoreService>("datastore");
    dataStore_ = dsSvc ? dsSvc->store : nullptr;
    wifiSvc_ = services.get<WifiService>("wifi");

    svc_.requestStart = &PlaybackModule::svcRequestStart_;
    svc_.requestStop = &PlaybackModule::svcRequestStop_;
    svc_.backendName = &PlaybackModule::svcBackendName_;
    svc_.ctx = this;
    services.add("playback", &svc_);

    if (eventBus_) {
        eventBus_->subscribe(EventId::ConfigChanged, &PlaybackModule::onEventStatic_, this);
    }
}

void PlaybackModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    selectBackend_();
}
