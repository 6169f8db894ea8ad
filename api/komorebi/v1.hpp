#pragma once

#include "komorebi/core/v1/document.pb.h"
#include "komorebi/core/v1/key_set.pb.h"

namespace komorebi::v1 {
using namespace ::komorebi::core::v1;
}
