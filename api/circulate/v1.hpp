#pragma once

#include "circulate/v1/task.pb.h"
#include "circulate/v1/upload.pb.h"
