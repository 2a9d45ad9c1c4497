#include "preflight.h"

#include <unistd.h>

#include <glog/logging.h>
#include "absl/strings/str_join.h"
#include "common/errors.h"
#include "tools/command_runner.h"

namespace MpathPr {

void RequireRoot() {
    if (geteuid() != 0) {
        throw ConfigError("mpath_pr_test must be run as root");
    }
}

void RequirePrograms(const std::vector<std::string>& programs) {
    std::vector<std::string> missing;
    for (const auto& program : programs) {
        if (!ProgramExists(program)) {
            missing.push_back(program);
        }
    }
    if (!missing.empty()) {
        throw ConfigError("Required programs not found: " + absl::StrJoin(missing, ", "));
    }
}

std::string VerifySameStorage(IMultipathDaemon& daemon, const std::string& map,
                              const std::string& peer_name, const std::string& peer_wwid) {
    LOG(INFO) << "Verifying that " << map << " and " << peer_name << " point to the same storage...";
    const std::string map_wwid = daemon.MapWwid(map);
    if (map_wwid != peer_wwid) {
        throw IdentifierMismatch("Device WWIDs do not match: " + map_wwid + " vs " + peer_wwid);
    }
    LOG(INFO) << "Device WWIDs match: " << map_wwid;

    const std::vector<std::string> paths = daemon.MapPaths(map);
    if (paths.empty()) {
        LOG(WARNING) << map << " currently has no paths";
    } else {
        LOG(INFO) << map << " paths: " << absl::StrJoin(paths, " ");
    }
    return map_wwid;
}

} // namespace MpathPr
