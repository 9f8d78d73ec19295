
#pragma once

// The precompiled header: every translation unit includes this first.

#include "granville/utils/base-include.hpp"
