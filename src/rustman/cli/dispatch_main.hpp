#pragma once

namespace rustman {

class cancellation_flag;

namespace cli {

struct options;

/**
 * @brief Run the action selected by the given options, returning the process exit code.
 *
 * Errors are reported through the logger and never escape.
 */
int dispatch_main(const options& opts, const cancellation_flag& cancel) noexcept;

}  // namespace cli

}  // namespace rustman
