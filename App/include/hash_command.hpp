#pragma once

#include "arguments.hpp"
#include "cancellation.hpp"

namespace doppel_app {

/**
 * Handles the 'hash' command: build one merged index from the inputs and write it as JSON
 * @param args Validated arguments (inputs, output, threads, hashing options)
 * @param cancel Token set by the interrupt handler
 * @return 0 on success, 1 on error or cancellation
 */
int handleHashCommand(const Arguments& args, const doppel::CancellationToken& cancel);

} // namespace doppel_app
