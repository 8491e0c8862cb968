// shimbridge/elab/shim_diagnostics.hpp - One diagnostics round after a batch
#pragma once

#include "shimbridge/basic/source_manager.hpp"
#include "shimbridge/elab/translator.hpp"

namespace shimbridge
{

/**
 * Analyse the current shim buffer with the shim tool and report what it
 * finds for the batch starting at `batch.get_begin()`.
 *
 * Does nothing when diagnostics are disabled or no provider is installed.
 * A timeout is an error only if diagnostics were explicitly enabled; tool
 * failures are warnings. Neither stops elaboration.
 */
void run_diagnostics_round(Translator & translator, SourceRange batch);

}  // namespace shimbridge
