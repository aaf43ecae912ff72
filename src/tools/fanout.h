#pragma once

/**
 * Fanout: copy one input descriptor to several lossy readers.
 *
 * Input is read in fanout.chunk_size pieces and written to a Broadcaster.
 * fanout.num_readers readers drain it with WriteTo(), each into
 * <fanout.output_prefix>.N, or into stdout when the prefix is empty. With
 * fanout.timeout_ms > 0 each reader stops at its deadline; that is not a
 * failure.
 */

#include "../common/configuration.h"

namespace Teepipe {

/**
 * Run the fanout until in_fd reaches end of file.
 * @return Process exit code: 0 on success, 1 if the configuration is invalid,
 *         an output cannot be opened, reading in_fd fails or a reader's
 *         output fails.
 */
int RunFanout(const TeepipeConfig& config, int in_fd);

} // namespace Teepipe
