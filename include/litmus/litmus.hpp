#pragma once

#include "backend.hpp"
#include "builtins.hpp"
#include "config.hpp"
#include "error.hpp"
#include "format.hpp"
#include "guards.hpp"
#include "harness.hpp"
#include "interpreter.hpp"
#include "matcher.hpp"
#include "runner.hpp"
#include "runs.hpp"
#include "transcript.hpp"
#include "user_config.hpp"
#include "utils.hpp"
#include "value.hpp"
