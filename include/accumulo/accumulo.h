#pragma once

#include "accumulo/client_async.h"
#include "accumulo/client_sync.h"
#include "accumulo/connection.h"
#include "accumulo/error.h"
#include "accumulo/pool/connection_pool.h"
#include "accumulo/pool/pool_executor.h"
#include "accumulo/structs.h"
#include "accumulo/whole_row.h"
