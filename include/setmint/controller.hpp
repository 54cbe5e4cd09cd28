#pragma once

#include <setmint/controller/controller.hpp>
#include <setmint/controller/error.hpp>
#include <setmint/controller/execution_context.hpp>
#include <setmint/controller/state.hpp>
