// include/lakestore.h
#pragma once

// Public entry points of the table store.

#include "types.h"
#include "config/core_options.h"
#include "schema/table_schema.h"
#include "fs/file_io.h"
#include "operation/compaction_coordinator.h"
#include "operation/file_store_commit.h"
#include "operation/file_store_scan.h"
#include "snapshot/consumer_manager.h"
#include "snapshot/snapshot_expirer.h"
#include "table/file_store_table.h"
#include "table/table_commit.h"
#include "table/table_read.h"
#include "table/table_write.h"
