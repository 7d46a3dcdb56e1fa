// Public header for the pylit library: parse and format Python literals
#pragma once

#include <pylit/format.h>
#include <pylit/parse.h>
#include <pylit/parse_error.h>
#include <pylit/value.h>
