#pragma once

#include "modelreg/registry/v1/version.pb.h"
#include "modelreg/registry/v1/registry.pb.h"
#include "modelreg/registry/v1/reports.pb.h"
