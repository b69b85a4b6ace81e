#pragma once

#include "model/connection_status.h"
#include "model/device_record.h"
#include "model/peer_entry.h"
#include "model/self_node.h"
#include "model/status_snapshot.h"
