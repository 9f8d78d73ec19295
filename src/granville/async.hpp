
#pragma once

#include "async/future.hpp"
