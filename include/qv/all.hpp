#pragma once
// Umbrella header for bindings and applications.

#include "qv/version.hpp"

// Core
#include "qv/core/errors.hpp"
#include "qv/core/info.hpp"
#include "qv/core/log.hpp"
#include "qv/core/matrix.hpp"
#include "qv/core/shape.hpp"
#include "qv/core/vector.hpp"

// Ops
#include "qv/ops/broadcast.hpp"
#include "qv/ops/compare.hpp"
#include "qv/ops/elementwise.hpp"
#include "qv/ops/generate.hpp"
#include "qv/ops/linalg.hpp"
#include "qv/ops/ranking.hpp"
#include "qv/ops/series.hpp"
#include "qv/ops/similarity.hpp"
#include "qv/ops/stats.hpp"
#include "qv/ops/unary.hpp"
#include "qv/ops/vector_ops.hpp"

// Parallel runtime knobs
#include "qv/parallel/config.hpp"

// Text
#include "qv/text/embedding.hpp"
#include "qv/text/tokenize.hpp"
