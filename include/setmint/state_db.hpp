#pragma once

#include <setmint/state_db/database.hpp>
#include <setmint/state_db/error.hpp>
#include <setmint/state_db/state_delta.hpp>
#include <setmint/state_db/state_node.hpp>
#include <setmint/state_db/types.hpp>
