#pragma once

#include <setmint/protocol/account.hpp>
#include <setmint/protocol/block.hpp>
#include <setmint/protocol/event.hpp>
#include <setmint/protocol/operation.hpp>
#include <setmint/protocol/program.hpp>
#include <setmint/protocol/serialization.hpp>
#include <setmint/protocol/transaction.hpp>
