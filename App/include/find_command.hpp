#pragma once

#include "arguments.hpp"
#include "cancellation.hpp"

namespace doppel_app {

/**
 * Handles the 'find' command: match every reference image against the inputs
 * @param args Validated arguments (references, inputs, distance, output, threads)
 * @param cancel Token set by the interrupt handler
 * @return 0 on success, 1 on error or cancellation
 */
int handleFindCommand(const Arguments& args, const doppel::CancellationToken& cancel);

} // namespace doppel_app
