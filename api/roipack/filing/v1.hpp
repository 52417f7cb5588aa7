#pragma once

#include "roipack/filing/v1/export.pb.h"
