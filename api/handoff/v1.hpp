#pragma once

#include "handoff/v1/transfer.pb.h"
#include "handoff/v1/transfer_service.pb.h"
