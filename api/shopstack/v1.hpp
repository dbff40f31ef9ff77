#pragma once

#include "shopstack/v1/pipeline.pb.h"
#include "shopstack/v1/topology.pb.h"

namespace shopstack::api::v1 {
using namespace ::shopstack::v1;
}
