#pragma once

// Convenience header: includes the full public API.
#include "ast.h"
#include "ast_printer.h"
#include "dialect.h"
#include "engine.h"
#include "error.h"
#include "function_registry.h"
#include "host_object.h"
#include "native_function.h"
#include "optimizer.h"
#include "parser.h"
#include "scope.h"
#include "source_location.h"
#include "value.h"
