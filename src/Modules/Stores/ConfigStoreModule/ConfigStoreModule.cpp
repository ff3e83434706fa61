/**
 * @file ConfigStoreModule.cpp
 * @brief Implementation file.
 */
#include "ConfigStoreModule.h"
#define LOG_TAG "CfgModul"
#include "Core/ModuleLog.h"

bool ConfigStoreModule::svcApplyJson_(void* ctx, const char* json)
{
    return static_cast<ConfigStore*>(ctx)->applyJson(json);
}

bool ConfigStoreModule::svcToJsonModule_(void* ctx, const char* module, char* out, size_t outLen, bool* truncated)
{
    return static_cast<ConfigStore*>(ctx)->toJsonModule(module, out, outLen, truncated);
}

uint8_t ConfigStoreModule::svcListModules_(void* ctx, const char** out, uint8_t max)
{
    return static_cast<ConfigStore*>(ctx)->listModules(out, max);
}

const char* ConfigStoreModule::svcModuleForKey_(void* ctx, const char* nvsKey)
{
    return static_cast<ConfigStore*>(ctx)->moduleForKey(nvsKey);
}

void ConfigStoreModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    svc_.applyJson = &ConfigStoreModule::svcApplyJson_;
    svc_.toJsonModule = &ConfigStoreModule::svcToJsonModule_;
    svc_.listModules = &ConfigStoreModule::svcListModules_;
    svc_.moduleForKey = &ConfigStoreModule::svcModuleForKey_;
    svc_.ctx = &cfg;

    services.add("config", &svc_);
    LOGI("Config service registered");
}
