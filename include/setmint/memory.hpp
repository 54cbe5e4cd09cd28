#pragma once

#include <setmint/memory/memory.hpp>
