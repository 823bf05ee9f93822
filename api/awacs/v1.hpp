#pragma once

#include "awacs/v1/admin_service.pb.h"
#include "awacs/v1/speech_gateway.pb.h"
#include "awacs/v1/types.pb.h"

#if AWACS_WITH_GRPC
#include "awacs/v1/admin_service.grpc.pb.h"
#include "awacs/v1/speech_gateway.grpc.pb.h"
#endif
