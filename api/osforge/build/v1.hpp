#pragma once

#include "osforge/build/v1/types.pb.h"

#include "osforge/build/v1/build_service.pb.h"

#include "osforge/build/v1/build_service.grpc.pb.h"
