#pragma once

#include "entitlement/manager/v1/activation_code.pb.h"
#include "entitlement/manager/v1/enterprise.pb.h"

#include "entitlement/manager/v1/enterprise.grpc.pb.h"
