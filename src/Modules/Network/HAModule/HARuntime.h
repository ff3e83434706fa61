#pragma once
/**
 * @file HARuntime.h
 * @brief Home Assistant runtime helpers and keys.
 */

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventPayloads.h"

constexpr DataKey DATAKEY_HA_PUBLISHED = DataKeys::HaPublished;
constexpr DataKey DATAKEY_HA_ENTITIES = DataKeys::HaEntities;

static inline bool haDiscoveryPublished(const DataStore& ds)
{
    return ds.data().ha.discoveryPublished;
}

static inline uint8_t haEntityCount(const DataStore& ds)
{
    return ds.data().ha.entityCount;
}

/** @brief `entities` is ignored when `published` is false. */
static inline void setHaDiscovery(DataStore& ds, bool published, uint8_t entities)
{
    RuntimeData& rt = ds.dataMutable();
    if (rt.ha.discoveryPublished != published) {
        rt.ha.discoveryPublished = published;
        ds.notifyChanged(DATAKEY_HA_PUBLISHED, DIRTY_NETWORK);
    }
    if (published && rt.ha.entityCount != entities) {
        rt.ha.entityCount = entities;
        ds.notifyChanged(DATAKEY_HA_ENTITIES, DIRTY_NETWORK);
    }
}
