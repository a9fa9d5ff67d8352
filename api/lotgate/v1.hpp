#pragma once

#include "lotgate/v1/types.pb.h"
#include "lotgate/v1/events.pb.h"

#include "lotgate/v1/access_service.pb.h"
#include "lotgate/v1/admin_service.pb.h"
#include "lotgate/v1/terminal_service.pb.h"
#include "lotgate/v1/event_service.pb.h"

#include "lotgate/v1/access_service.grpc.pb.h"
#include "lotgate/v1/admin_service.grpc.pb.h"
#include "lotgate/v1/terminal_service.grpc.pb.h"
#include "lotgate/v1/event_service.grpc.pb.h"
