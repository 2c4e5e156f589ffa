#pragma once

// diffdb Core Library - Convenience header

#include "diffdb/core/types.hpp"
#include "diffdb/core/result.hpp"
#include "diffdb/core/address.hpp"
#include "diffdb/core/timestamp.hpp"
