#pragma once

#include <setmint/log/log.hpp>
