#pragma once
/**
 * @file IDataStore.h
 * @brief "datastore" service.
 */
#include "Core/DataStore/DataStore.h"

/** @brief Runtime state shared by modules; read and written through the `<Module>Runtime.h` helpers. */
struct DataStoreService {
    DataStore* store;
};
