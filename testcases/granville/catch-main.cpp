
#define CATCH_CONFIG_MAIN

#include "stdinc.hpp"

#include <catch2/catch.hpp>
