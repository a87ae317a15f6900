#pragma once

#define TREEWALK_COMMON_HXX_INCLUDED 1

#define TREEWALK_EXPORT

#include <cassert>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <exception>

#include "debug.hxx"
