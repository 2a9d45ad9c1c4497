#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/key.h"
#include "command_runner.h"

namespace MpathPr {

/**
 * multipathd's own view of the PR state of a map. Independent of the
 * READ KEYS / READ RESERVATION data the PR tool reports.
 */
class IMultipathDaemon {
public:
	virtual ~IMultipathDaemon() = default;

	// `getprkey`: the key multipathd registers on new paths, nullopt for "none"
	virtual std::optional<Key> GetPrKey(const std::string& map) = 0;
	// `getprstatus`: whether multipathd considers the map registered
	virtual bool GetPrStatus(const std::string& map) = 0;
	// `getprhold`: whether multipathd considers the map the reservation holder
	virtual bool GetPrHold(const std::string& map) = 0;

	// WWID from `show maps raw format "%n %w"`
	virtual std::string MapWwid(const std::string& map) = 0;
	// Path devices (sdX) from `show paths raw format "%m %d"`
	virtual std::vector<std::string> MapPaths(const std::string& map) = 0;

	// `multipath -l <map>` for the exit-state dump
	virtual std::string DumpTopology(const std::string& map) = 0;
};

class MultipathDaemon : public IMultipathDaemon {
public:
	MultipathDaemon(std::shared_ptr<ICommandRunner> runner, std::string multipathd,
			std::string multipath);

	std::optional<Key> GetPrKey(const std::string& map) override;
	bool GetPrStatus(const std::string& map) override;
	bool GetPrHold(const std::string& map) override;
	std::string MapWwid(const std::string& map) override;
	std::vector<std::string> MapPaths(const std::string& map) override;
	std::string DumpTopology(const std::string& map) override;

private:
	std::string Query(const std::vector<std::string>& args);
	bool QuerySetUnset(const std::string& command, const std::string& map);
	// Second column of the raw table row whose first column is `map`
	std::vector<std::string> SecondColumnFor(const std::string& table, const std::string& map);

	std::shared_ptr<ICommandRunner> runner_;
	std::string multipathd_;
	std::string multipath_;
};

/**
 * ID_SERIAL of a raw SCSI device through udev; matches the WWID
 * multipathd reports for the map built on top of it.
 */
std::string RawDeviceWwid(ICommandRunner& runner, const std::string& udevadm,
		const std::string& device);

} // namespace MpathPr
