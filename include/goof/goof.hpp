#pragma once

/** \file goof.hpp
 *  \brief Umbrella header: descriptors, checks and the four strategies.
 *
 * - Fail-fast: call the checks in assert.hpp and propagate their result.
 * - Fail-complete: drive the checks through Accumulator (accumulator.hpp).
 * - Fail-recoverable: wrap a check with recover (recover.hpp).
 * - Resumable: wrap a check with try_or_resume (resumable.hpp).
 */

#include "goof/accumulator.hpp"
#include "goof/assert.hpp"
#include "goof/config.hpp"
#include "goof/context.hpp"
#include "goof/descriptors.hpp"
#include "goof/error.hpp"
#include "goof/error_mapping.hpp"
#include "goof/recover.hpp"
#include "goof/resumable.hpp"
#include "goof/simple.hpp"
#include "goof/version.hpp"
