#pragma once

#include "tk_types.hpp"

THUMBKIT_API void print_cli_help();
