#pragma once

#include "handoff/v1.hpp"
#include "handoff/v1/transfer_service.grpc.pb.h"
