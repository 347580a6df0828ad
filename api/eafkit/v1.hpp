#pragma once

#include "eafkit/document/v1/document.pb.h"

namespace eafkit::v1 {
using namespace ::eafkit::document::v1;
}
