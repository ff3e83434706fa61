/**
 * @file AudioCacheModule.cpp
 * @brief Implementation file.
 */

#include "AudioCacheModule.h"
#include "Core/CommandRegistry.h"
#include "Core/HttpSession.h"
#include "Core/Runtime.h"
#include <Arduino.h>
#include <ArduinoJson.h>
#include <FS.h>
#include <LittleFS.h>
#include <string.h>
#include <strings.h>

#define LOG_TAG "AudioCch"
#include "Core/ModuleLog.h"

static constexpr char CacheDir[] = "/azan";

static bool parseCmdArgsObject(const CommandRequest& req, StaticJsonDocument<Limits::JsonCmdAzanBuf>& doc)
{
    const char* json = req.args ? req.args : req.json;
    if (!json || json[0] == '\0') return false;
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObject>()) return false;
    if (doc["args"].is<JsonObject>()) {
        StaticJsonDocument<Limits::JsonCmdAzanBuf> inner;
        inner.set(doc["args"]);
        doc.set(inner.as<JsonVariantConst>());
    }
    return true;
}

const char* AudioCacheModule::assetName(AudioAssetId id)
{
    return (id == AudioAssetId::Fajr) ? "fajr" : "primary";
}

bool AudioCacheModule::parseAssetName(const char* text, AudioAssetId& out)
{
    if (!text) return false;
    if (strcasecmp(text, "primary") == 0) { out = AudioAssetId::Primary; return true; }
    if (strcasecmp(text, "fajr") == 0) { out = AudioAssetId::Fajr; return true; }
    return false;
}

bool AudioCacheModule::sourceSupported(const char* url)
{
    if (!url || url[0] == '\0') return false;
    if (url[0] == '/') return true;
    if (strncmp(url, "http://", 7) != 0 && strncmp(url, "https://", 8) != 0) return false;
    return strstr(url, "youtube.com/") == nullptr && strstr(url, "youtu.be/") == nullptr;
}

const char* AudioCacheModule::configuredUrl_(uint8_t idx) const
{
    return (idx == (uint8_t)AudioAssetId::Fajr) ? cfgData.fajrUrl : cfgData.primaryUrl;
}

void AudioCacheModule::buildPath_(uint8_t idx, const char* suffix, bool hidden, char* out, size_t len)
{
    snprintf(out, len, "%s/%s%s%s", CacheDir, hidden ? "." : "", assetName((AudioAssetId)idx), suffix);
}

uint32_t AudioCacheModule::fileSize_(const char* path)
{
    if (!fsReady_ || !LittleFS.exists(path)) return 0;
    File f = LittleFS.open(path, FILE_READ);
    if (!f) return 0;
    const uint32_t sz = (uint32_t)f.size();
    f.close();
    return sz;
}

bool AudioCacheModule::readMarker_(uint8_t idx, char* out, size_t len)
{
    if (!out || len == 0) return false;
    out[0] = '\0';
    char path[Limits::Audio::PathBuf] = {0};
    buildPath_(idx, ".url", true, path, sizeof(path));
    if (!LittleFS.exists(path)) return false;

    File f = LittleFS.open(path, FILE_READ);
    if (!f) return false;
    size_t n = f.readBytes(out, len - 1);
    f.close();
    out[n] = '\0';
    while (n > 0 && (out[n - 1] == '\n' || out[n - 1] == '\r')) out[--n] = '\0';
    return n > 0;
}

void AudioCacheModule::publishState_(uint8_t idx)
{
    if (!dataStore_) return;
    AssetState st = AssetState::Absent;
    if (tableMutex_ && xSemaphoreTake(tableMutex_, portMAX_DELAY) == pdTRUE) {
        st = table_.state(idx);
        xSemaphoreGive(tableMutex_);
    }
    char path[Limits::Audio::PathBuf] = {0};
    buildPath_(idx, ".mp3", false, path, sizeof(path));
    const uint32_t bytes = (st == AssetState::Ready) ? fileSize_(path) : 0;
    setAudioAsset(*dataStore_, idx, (uint8_t)st, bytes);
}

bool AudioCacheModule::enqueue_(JobOp op, uint8_t idx, uint32_t generation, const char* url)
{
    if (!jobQ_) return false;
    FetchJob job;
    job.op = op;
    job.idx = idx;
    job.generation = generation;
    if (url) snprintf(job.url, sizeof(job.url), "%s", url);
    return xQueueSendToBack(jobQ_, &job, 0) == pdTRUE;
}

AudioResolve AudioCacheModule::resolve_(uint8_t idx, uint32_t* generation, char* path, size_t pathLen)
{
    if (idx >= AUDIO_ASSET_COUNT || !fsReady_ || !tableMutex_) return AudioResolve::Failed;

    char url[Limits::Audio::UrlBuf] = {0};
    snprintf(url, sizeof(url), "%s", configuredUrl_(idx));
    if (url[0] == '\0') return AudioResolve::Failed;
    if (!sourceSupported(url)) {
        LOGW("asset %s: unsupported source %s", assetName((AudioAssetId)idx), url);
        return AudioResolve::Failed;
    }

    char finalPath[Limits::Audio::PathBuf] = {0};
    buildPath_(idx, ".mp3", false, finalPath, sizeof(finalPath));

    uint32_t gen = 0;
    bool queued = true;
    if (xSemaphoreTake(tableMutex_, portMAX_DELAY) != pdTRUE) return AudioResolve::Failed;
    AssetRequest r = table_.request(idx, url, gen);
    if (r == AssetRequest::Ready && !LittleFS.exists(finalPath)) {
        LOGW("asset %s: cached file vanished, refetching", assetName((AudioAssetId)idx));
        table_.invalidate(idx);
        r = table_.request(idx, url, gen);
    }
    if (r == AssetRequest::StartFetch) {
        queued = enqueue_(JobOp::Fetch, idx, gen, url);
        if (!queued) (void)table_.complete(idx, gen, false);
    }
    xSemaphoreGive(tableMutex_);

    if (generation) *generation = gen;

    switch (r) {
    case AssetRequest::Ready:
        if (path && pathLen > 0) snprintf(path, pathLen, "%s", finalPath);
        return AudioResolve::Ready;
    case AssetRequest::Joined:
        return AudioResolve::Fetching;
    case AssetRequest::StartFetch:
        publishState_(idx);
        if (!queued) {
            LOGW("asset %s: fetch queue full", assetName((AudioAssetId)idx));
            return AudioResolve::Failed;
        }
        LOGI("asset %s: fetch queued gen=%lu", assetName((AudioAssetId)idx), (unsigned long)gen);
        return AudioResolve::Fetching;
    case AssetRequest::Failed:
    default:
        return AudioResolve::Failed;
    }
}

void AudioCacheModule::discard_(uint8_t idx)
{
    if (!tableMutex_) return;
    if (xSemaphoreTake(tableMutex_, portMAX_DELAY) != pdTRUE) return;
    table_.invalidate(idx);
    xSemaphoreGive(tableMutex_);
    if (!enqueue_(JobOp::Discard, idx, 0, nullptr)) {
        LOGW("asset %s: discard not queued", assetName((AudioAssetId)idx));
    }
    publishState_(idx);
}

void AudioCacheModule::seedFromFlash_()
{
    for (uint8_t idx = 0; idx < AUDIO_ASSET_COUNT; ++idx) {
        char tmpPath[Limits::Audio::PathBuf] = {0};
        char finalPath[Limits::Audio::PathBuf] = {0};
        char markerPath[Limits::Audio::PathBuf] = {0};
        buildPath_(idx, ".tmp", false, tmpPath, sizeof(tmpPath));
        buildPath_(idx, ".mp3", false, finalPath, sizeof(finalPath));
        buildPath_(idx, ".url", true, markerPath, sizeof(markerPath));

        if (LittleFS.exists(tmpPath)) (void)LittleFS.remove(tmpPath);

        char marker[Limits::Audio::UrlBuf] = {0};
        const bool haveFile = LittleFS.exists(finalPath) && fileSize_(finalPath) > 0;
        const bool haveMarker = readMarker_(idx, marker, sizeof(marker));
        const char* url = configuredUrl_(idx);

        if (haveFile && haveMarker && strcmp(marker, url) == 0) {
            (void)table_.seed(idx, marker);
            LOGI("asset %s: cached (%lu bytes)", assetName((AudioAssetId)idx), (unsigned long)fileSize_(finalPath));
        } else if (haveFile || haveMarker) {
            LOGI("asset %s: cached copy does not match source, dropped", assetName((AudioAssetId)idx));
            if (LittleFS.exists(finalPath)) (void)LittleFS.remove(finalPath);
            if (LittleFS.exists(markerPath)) (void)LittleFS.remove(markerPath);
        }
        publishState_(idx);
    }
}

void AudioCacheModule::prefetch_()
{
    prefetchDone_ = true;
    for (uint8_t idx = 0; idx < AUDIO_ASSET_COUNT; ++idx) {
        if (configuredUrl_(idx)[0] == '\0') continue;
        uint32_t gen = 0;
        const AudioResolve r = resolve_(idx, &gen, nullptr, 0);
        LOGD("prefetch %s -> %u", assetName((AudioAssetId)idx), (unsigned)r);
    }
}

bool AudioCacheModule::download_(const char* url, const char* tmpPath, uint32_t& bytes, ErrorCode& err)
{
    bytes = 0;
    err = ErrorCode::FetchFailed;

    HttpSession session;
    if (!session.begin(url, Limits::Audio::HttpTimeoutMs)) {
        LOGW("http begin failed url=%s", url);
        return false;
    }
    HTTPClient& http = session.client();
    const char* headerKeys[] = {"Content-Type"};
    http.collectHeaders(headerKeys, 1);

    const int code = http.GET();
    if (code != HTTP_CODE_OK) {
        LOGW("http %d url=%s", code, url);
        return false;
    }
    const String ctype = http.header("Content-Type");
    if (ctype.startsWith("text/html")) {
        LOGW("source is a web page, not audio url=%s", url);
        return false;
    }

    const int total = http.getSize();
    File f = LittleFS.open(tmpPath, FILE_WRITE);
    if (!f) {
        LOGE("open %s failed", tmpPath);
        return false;
    }

    WiFiClient* stream = http.getStreamPtr();
    uint32_t lastRx = millis();
    DownloadEnd end = DownloadEnd::Closed;
    while (stream) {
        const int avail = stream->available();
        if (avail > 0) {
            const size_t want = ((size_t)avail < sizeof(ioBuf_)) ? (size_t)avail : sizeof(ioBuf_);
            const int n = stream->readBytes(ioBuf_, want);
            if (n > 0) {
                if (f.write(ioBuf_, (size_t)n) != (size_t)n) {
                    end = DownloadEnd::WriteFailed;
                    break;
                }
                bytes += (uint32_t)n;
                lastRx = millis();
            }
            continue;
        }
        if (total >= 0 && bytes >= (uint32_t)total) {
            end = DownloadEnd::Complete;
            break;
        }
        if (!http.connected()) {
            end = DownloadEnd::Closed;
            break;
        }
        if ((uint32_t)(millis() - lastRx) > Limits::Audio::StallTimeoutMs) {
            LOGW("download stalled at %lu bytes", (unsigned long)bytes);
            end = DownloadEnd::Stalled;
            break;
        }
        vTaskDelay(pdMS_TO_TICKS(10));
    }
    f.close();

    if (end == DownloadEnd::WriteFailed) {
        LOGE("flash write failed at %lu bytes (filesystem full?)", (unsigned long)bytes);
        return false;
    }
    if (bytes == 0) {
        LOGW("empty body url=%s", url);
        return false;
    }
    if (!downloadAcceptable(end, bytes, (int32_t)total)) {
        LOGW("incomplete download %lu/%d", (unsigned long)bytes, total);
        return false;
    }
    err = ErrorCode::None;
    return true;
}

bool AudioCacheModule::copyLocal_(const char* srcPath, const char* tmpPath, uint32_t& bytes, ErrorCode& err)
{
    bytes = 0;
    err = ErrorCode::FetchFailed;
    if (!LittleFS.exists(srcPath)) {
        LOGW("local source %s missing", srcPath);
        return false;
    }
    File in = LittleFS.open(srcPath, FILE_READ);
    if (!in) return false;
    File out = LittleFS.open(tmpPath, FILE_WRITE);
    if (!out) {
        in.close();
        return false;
    }

    const uint32_t expected = (uint32_t)in.size();
    bool ok = true;
    while (in.available()) {
        const size_t n = in.read(ioBuf_, sizeof(ioBuf_));
        if (n == 0) break;
        if (out.write(ioBuf_, n) != n) {
            ok = false;
            break;
        }
        bytes += (uint32_t)n;
    }
    in.close();
    out.close();

    if (!ok || bytes == 0 || bytes != expected) {
        LOGW("copy %s failed %lu/%lu", srcPath, (unsigned long)bytes, (unsigned long)expected);
        return false;
    }
    err = ErrorCode::None;
    return true;
}

bool AudioCacheModule::install_(uint8_t idx, const char* url, const char* tmpPath)
{
    char finalPath[Limits::Audio::PathBuf] = {0};
    char markerPath[Limits::Audio::PathBuf] = {0};
    buildPath_(idx, ".mp3", false, finalPath, sizeof(finalPath));
    buildPath_(idx, ".url", true, markerPath, sizeof(markerPath));

    if (LittleFS.exists(markerPath)) (void)LittleFS.remove(markerPath);
    if (LittleFS.exists(finalPath)) (void)LittleFS.remove(finalPath);
    if (!LittleFS.rename(tmpPath, finalPath)) {
        LOGE("rename %s -> %s failed", tmpPath, finalPath);
        return false;
    }

    File m = LittleFS.open(markerPath, FILE_WRITE);
    if (!m) {
        LOGE("marker %s not written", markerPath);
        (void)LittleFS.remove(finalPath);
        return false;
    }
    const size_t n = m.print(url);
    m.close();
    if (n != strlen(url)) {
        (void)LittleFS.remove(markerPath);
        (void)LittleFS.remove(finalPath);
        return false;
    }
    return true;
}

void AudioCacheModule::runJob_(const FetchJob& job)
{
    const char* name = assetName((AudioAssetId)job.idx);
    char tmpPath[Limits::Audio::PathBuf] = {0};
    buildPath_(job.idx, ".tmp", false, tmpPath, sizeof(tmpPath));

    if (job.op == JobOp::Discard) {
        char finalPath[Limits::Audio::PathBuf] = {0};
        char markerPath[Limits::Audio::PathBuf] = {0};
        buildPath_(job.idx, ".mp3", false, finalPath, sizeof(finalPath));
        buildPath_(job.idx, ".url", true, markerPath, sizeof(markerPath));
        if (LittleFS.exists(markerPath)) (void)LittleFS.remove(markerPath);
        if (LittleFS.exists(finalPath)) (void)LittleFS.remove(finalPath);
        LOGI("asset %s: cache discarded", name);
        return;
    }

    LOGI("asset %s: fetching %s", name, job.url);
    const uint32_t startMs = millis();
    if (LittleFS.exists(tmpPath)) (void)LittleFS.remove(tmpPath);

    uint32_t bytes = 0;
    ErrorCode err = ErrorCode::FetchFailed;
    bool ok = (job.url[0] == '/')
        ? copyLocal_(job.url, tmpPath, bytes, err)
        : download_(job.url, tmpPath, bytes, err);

    bool stale = false;
    if (xSemaphoreTake(tableMutex_, portMAX_DELAY) == pdTRUE) {
        stale = (table_.generation(job.idx) != job.generation);
        if (ok && !stale) {
            ok = install_(job.idx, job.url, tmpPath);
            if (!ok) err = ErrorCode::FetchFailed;
        }
        if (!stale) (void)table_.complete(job.idx, job.generation, ok);
        xSemaphoreGive(tableMutex_);
    }
    if (LittleFS.exists(tmpPath)) (void)LittleFS.remove(tmpPath);

    if (stale) {
        LOGI("asset %s: source changed during fetch, result dropped", name);
        ok = false;
        err = ErrorCode::FetchFailed;
    } else if (ok) {
        LOGI("asset %s: ready (%lu bytes in %lu ms)", name, (unsigned long)bytes,
             (unsigned long)(millis() - startMs));
    } else {
        LOGW("asset %s: fetch failed (%s)", name, errorCodeStr(err));
    }

    if (dataStore_) noteAudioFetch(*dataStore_, ok);
    publishState_(job.idx);

    AssetResolvedPayload p{};
    p.assetIdx = job.idx;
    p.ok = ok ? 1U : 0U;
    p.errorCode = (uint16_t)(ok ? ErrorCode::None : err);
    p.generation = job.generation;
    if (!eventBus_ || !eventBus_->post(EventId::AssetResolved, &p, sizeof(p))) {
        LOGW("asset %s: AssetResolved not posted", name);
    }
}

void AudioCacheModule::loop()
{
    FetchJob job;
    if (jobQ_ && xQueueReceive(jobQ_, &job, pdMS_TO_TICKS(1000)) == pdTRUE) {
        runJob_(job);
    }
    if (!prefetchDone_ && startupReady_ && fsReady_ && dataStore_ && wifiReady(*dataStore_)) {
        prefetch_();
    }
}

void AudioCacheModule::onEventStatic_(const Event& e, void* user)
{
    AudioCacheModule* self = static_cast<AudioCacheModule*>(user);
    if (self) self->onEvent_(e);
}

void AudioCacheModule::onEvent_(const Event& e)
{
    if (e.id != EventId::ConfigChanged) return;
    if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
    const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
    if (strcmp(p->nvsKey, NvsKeys::Audio::PrimaryUrl) == 0) {
        discard_((uint8_t)AudioAssetId::Primary);
    } else if (strcmp(p->nvsKey, NvsKeys::Audio::FajrUrl) == 0) {
        discard_((uint8_t)AudioAssetId::Fajr);
    }
}

bool AudioCacheModule::cmdStatus_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    AudioCacheModule* self = static_cast<AudioCacheModule*>(userCtx);
    if (!self || !self->tableMutex_) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "audio.status");
        return false;
    }

    AssetState st[AUDIO_ASSET_COUNT];
    uint32_t fetches[AUDIO_ASSET_COUNT];
    if (xSemaphoreTake(self->tableMutex_, portMAX_DELAY) != pdTRUE) return false;
    for (uint8_t i = 0; i < AUDIO_ASSET_COUNT; ++i) {
        st[i] = self->table_.state(i);
        fetches[i] = self->table_.fetchCount(i);
    }
    xSemaphoreGive(self->tableMutex_);

    char path[Limits::Audio::PathBuf] = {0};
    self->buildPath_(0, ".mp3", false, path, sizeof(path));
    const uint32_t b0 = self->fileSize_(path);
    self->buildPath_(1, ".mp3", false, path, sizeof(path));
    const uint32_t b1 = self->fileSize_(path);

    snprintf(reply, replyLen,
             "{\"ok\":true,\"fs\":%s,\"assets\":["
             "{\"id\":\"primary\",\"state\":\"%s\",\"bytes\":%lu,\"fetches\":%lu,\"source\":\"%s\"},"
             "{\"id\":\"fajr\",\"state\":\"%s\",\"bytes\":%lu,\"fetches\":%lu,\"source\":\"%s\"}]}",
             self->fsReady_ ? "true" : "false",
             assetStateStr(st[0]), (unsigned long)b0, (unsigned long)fetches[0], self->cfgData.primaryUrl,
             assetStateStr(st[1]), (unsigned long)b1, (unsigned long)fetches[1], self->cfgData.fajrUrl);
    return true;
}

bool AudioCacheModule::cmdInvalidate_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    AudioCacheModule* self = static_cast<AudioCacheModule*>(userCtx);
    if (!self) return false;

    StaticJsonDocument<Limits::JsonCmdAzanBuf> doc;
    if (!parseCmdArgsObject(req, doc)) {
        writeErrorJson(reply, replyLen, ErrorCode::MissingArgs, "audio.invalidate");
        return false;
    }
    AudioAssetId id;
    if (!parseAssetName(doc["asset"].as<const char*>(), id)) {
        writeErrorJson(reply, replyLen, ErrorCode::MissingValue, "audio.invalidate");
        return false;
    }
    self->discard_((uint8_t)id);
    writeOkJson(reply, replyLen, "audio.invalidate");
    return true;
}

AudioResolve AudioCacheModule::svcResolve_(void* ctx, AudioAssetId id, uint32_t* generation, char* path, size_t pathLen)
{
    AudioCacheModule* self = static_cast<AudioCacheModule*>(ctx);
    if (!self) return AudioResolve::Failed;
    return self->resolve_((uint8_t)id, generation, path, pathLen);
}

bool AudioCacheModule::svcHasSource_(void* ctx, AudioAssetId id)
{
    AudioCacheModule* self = static_cast<AudioCacheModule*>(ctx);
    if (!self) return false;
    return self->configuredUrl_((uint8_t)id)[0] != '\0';
}

bool AudioCacheModule::svcInvalidate_(void* ctx, AudioAssetId id)
{
    AudioCacheModule* self = static_cast<AudioCacheModule*>(ctx);
    if (!self) return false;
    self->discard_((uint8_t)id);
    return true;
}

void AudioCacheModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(primaryUrlVar);
    cfg.registerVar(fajrUrlVar);

    tableMutex_ = xSemaphoreCreateMutex();
    jobQ_ = xQueueCreate(Limits::Audio::FetchQueueLen, sizeof(FetchJob));
    if (!tableMutex_ || !jobQ_) {
        LOGE("audio cache primitives allocation failed");
    }

    fsReady_ = LittleFS.begin(true);
    if (!fsReady_) {
        LOGE("LittleFS mount failed, audio cache disabled");
    } else if (!LittleFS.exists(CacheDir) && !LittleFS.mkdir(CacheDir)) {
        LOGE("mkdir %s failed", CacheDir);
        fsReady_ = false;
    }

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    auto* dsSvc = services.get<DataStoreService>("datastore");
    dataStore_ = dsSvc ? dsSvc->store : nullptr;
    cmdSvc_ = services.get<CommandService>("cmd");

    svc_.resolve = &AudioCacheModule::svcResolve_;
    svc_.hasSource = &AudioCacheModule::svcHasSource_;
    svc_.invalidate = &AudioCacheModule::svcInvalidate_;
    svc_.ctx = this;
    services.add("audiocache", &svc_);

    if (cmdSvc_ && cmdSvc_->registerHandler) {
        cmdSvc_->registerHandler(cmdSvc_->ctx, "audio.status", &AudioCacheModule::cmdStatus_, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "audio.invalidate", &AudioCacheModule::cmdInvalidate_, this);
    }
    if (eventBus_) {
        eventBus_->subscribe(EventId::ConfigChanged, &AudioCacheModule::onEventStatic_, this);
    }
}

void AudioCacheModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (!fsReady_) return;
    seedFromFlash_();
}
