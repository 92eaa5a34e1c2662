#pragma once

/** \file executor.hpp
 *  \brief Task executor seam used by the assembler to run part uploads.
 */

#include <expected>
#include <functional>

#include "tessera/error.hpp"

namespace tessera::upload {

/** \brief Runs fire-and-forget tasks, possibly concurrently.
 *
 * Implementations must either run the task eventually or return an error;
 * a task that was accepted must not be silently dropped.
 */
class Executor {
public:
  virtual ~Executor() = default;

  virtual auto execute(std::function<void()> task) -> std::expected<void, core::error> = 0;
};

} // namespace tessera::upload
