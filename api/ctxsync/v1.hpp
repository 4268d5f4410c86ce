#pragma once

#include "ctxsync/v1/context.pb.h"
#include "ctxsync/v1/producer.pb.h"
#include "ctxsync/v1/cache.pb.h"
#include "ctxsync/v1/vector.pb.h"

#include "ctxsync/v1/producer.grpc.pb.h"
#include "ctxsync/v1/cache.grpc.pb.h"
#include "ctxsync/v1/vector.grpc.pb.h"
