#pragma once

// Private definitions for the core support library (logging, error messages, string helpers).

#include <folio/main.hpp>
#include <folio/log.h>
#include <folio/strings.hpp>
