#pragma once

#include <setmint/config/deployment.hpp>
#include <setmint/config/options.hpp>
#include <setmint/config/scenario.hpp>
