#pragma once

#include <setmint/program/display_pool.hpp>
#include <setmint/program/error.hpp>
#include <setmint/program/io.hpp>
#include <setmint/program/minter.hpp>
#include <setmint/program/program.hpp>
#include <setmint/program/random_source.hpp>
#include <setmint/program/storage.hpp>
#include <setmint/program/system_interface.hpp>
#include <setmint/program/token.hpp>
