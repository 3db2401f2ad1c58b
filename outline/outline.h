#pragma once

#include "ancestry.h"
#include "classify.h"
#include "cursor.h"
#include "error.h"
#include "flatten.h"
#include "io.h"
#include "locate.h"
#include "ordered_forest.h"
#include "relocate.h"
