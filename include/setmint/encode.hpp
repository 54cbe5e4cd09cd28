#pragma once

#include <setmint/encode/error.hpp>
#include <setmint/encode/hex.hpp>
