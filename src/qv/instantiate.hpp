#pragma once
// Explicit instantiation lists for the compiled kernels. Integer types get
// the exact ops; division, roots, angles and statistics are floating only.

#define QV_FOR_NUMERIC_TYPES(X) X(int) X(long) X(long long) X(float) X(double)
#define QV_FOR_FLOATING_TYPES(X) X(float) X(double)
