#pragma once

#include <setmint/crypto/hash.hpp>
