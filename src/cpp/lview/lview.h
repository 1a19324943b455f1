#pragma once

// everything needed to build and query views
#include "lview/exception.h"
#include "lview/predicates.h"
#include "lview/functions.h"
#include "lview/views.h"
#include "lview/sequence.h"
