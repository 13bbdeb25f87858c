#pragma once

// Python.h must be included before any standard header.
#define PY_SSIZE_T_CLEAN
#include <Python.h>
