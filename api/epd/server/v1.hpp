#pragma once

#include "epd/server/v1/types.pb.h"
#include "epd/server/v1/image_service.pb.h"
#include "epd/server/v1/image_service.grpc.pb.h"
