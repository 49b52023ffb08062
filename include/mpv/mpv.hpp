#pragma once

#include "types.hpp"
#include "stream.hpp"
#include "result.hpp"
#include "error.hpp"
#include "value.hpp"
#include "log.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "format.hpp"
