#pragma once

#include <string>
#include <vector>

#include "tools/multipath_daemon.h"

namespace MpathPr {

// PR commands and multipathd queries need CAP_SYS_ADMIN; throws ConfigError
void RequireRoot();

// Throws ConfigError naming every program that cannot be found
void RequirePrograms(const std::vector<std::string>& programs);

/**
 * Both access paths must lead to the same logical unit, otherwise every
 * verification after the first peer command is meaningless.
 * Returns the shared WWID; throws IdentifierMismatch.
 */
std::string VerifySameStorage(IMultipathDaemon& daemon, const std::string& map,
                              const std::string& peer_name, const std::string& peer_wwid);

} // namespace MpathPr
