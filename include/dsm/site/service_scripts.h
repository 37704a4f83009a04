#pragma once

#include <dsm/core/types.h>
#include <dsm/site/site.h>

namespace dsm::site {

/**
 * Run one of the generated control scripts (www.start, db.stop, ...).
 *
 * Exit status 2 from a start or stop script is reported as
 * ProcessStartTimeout or ProcessStopTimeout; any other non-zero status is an
 * InternalError naming the script. For IsRunning, a non-zero status means
 * "not running" and is returned as NotFound.
 */
Result<void> runServiceScript(const Site& site, ServiceKind kind, ServiceAction action);

// Stop both services, logging failures instead of returning them.
void stopServicesBestEffort(const Site& site);

} // namespace dsm::site
