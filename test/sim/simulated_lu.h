#pragma once

#include <map>
#include <optional>
#include <string>

#include "../../src/tools/multipath_daemon.h"
#include "../../src/tools/pr_tool.h"

namespace MpathPr {

/**
 * In-memory logical unit with SPC-3 persistent reservation rules, enough
 * for the commands the harness issues. Initiators are identified by small
 * integers; a command that would get RESERVATION CONFLICT throws.
 */
class SimulatedLu {
public:
    void Register(int initiator, std::optional<Key> reservation_key, Key service_action_key);
    void RegisterIgnore(int initiator, Key service_action_key);
    void Reserve(int initiator, Key reservation_key);
    void Release(int initiator, Key reservation_key);
    void Clear(int initiator, Key reservation_key);
    void Preempt(int initiator, Key reservation_key, Key service_action_key);

    // sg_persist -ik style output; each registration listed once per nexus
    std::string KeysOutput() const;
    // sg_persist -ir style output
    std::string ReservationOutput() const;

    std::optional<Key> KeyOf(int initiator) const;
    std::optional<int> holder() const { return holder_; }
    std::optional<Key> ReservationKey() const;

    void SetNexusCount(int initiator, int count) { nexus_count_[initiator] = count; }

    int commands() const { return commands_; }

private:
    void RequireRegistered(int initiator, Key reservation_key, const char* command);
    void Unregister(int initiator);
    void SetRegistration(int initiator, Key service_action_key);

    std::map<int, Key> registrations_;
    std::map<int, int> nexus_count_;
    std::optional<int> holder_;
    int generation_ = 0;
    int commands_ = 0;
};

// IPrTool issuing its commands on the simulated LU as `initiator`
class FakePrTool : public IPrTool {
public:
    FakePrTool(SimulatedLu& lu, int initiator, std::string device)
        : lu_(lu), initiator_(initiator), device_(std::move(device)) {}

    void Register(std::optional<Key> reservation_key, Key service_action_key) override;
    void RegisterIgnore(Key service_action_key) override;
    void Reserve(Key reservation_key, int type) override;
    void Release(Key reservation_key, int type) override;
    void Clear(Key reservation_key) override;
    void Preempt(Key reservation_key, Key service_action_key, int type) override;

    KeyReport ReadKeys() override;
    ReservationReport ReadReservation() override;
    std::string DumpKeys() override { return lu_.KeysOutput(); }
    std::string DumpReservation() override { return lu_.ReservationOutput(); }

    const std::string& device() const override { return device_; }

    // Next OUT command fails as if the tool had exited non-zero
    void FailNextCommand() { fail_next_ = true; }

private:
    void MaybeFail(const char* command);

    SimulatedLu& lu_;
    int initiator_;
    std::string device_;
    bool fail_next_ = false;
};

/**
 * multipathd answering from the simulated LU for `initiator`.
 * Individual answers can be overridden to provoke mismatches.
 */
class FakeMultipathDaemon : public IMultipathDaemon {
public:
    FakeMultipathDaemon(SimulatedLu& lu, int initiator, std::string wwid)
        : lu_(lu), initiator_(initiator), wwid_(std::move(wwid)) {}

    std::optional<Key> GetPrKey(const std::string& map) override;
    bool GetPrStatus(const std::string& map) override;
    bool GetPrHold(const std::string& map) override;
    std::string MapWwid(const std::string& map) override { return wwid_; }
    std::vector<std::string> MapPaths(const std::string& map) override { return {"sdb", "sdc"}; }
    std::string DumpTopology(const std::string& map) override { return map + " (" + wwid_ + ")"; }

    std::optional<bool> forced_prhold;
    std::optional<std::optional<Key>> forced_prkey;

private:
    SimulatedLu& lu_;
    int initiator_;
    std::string wwid_;
};

} // namespace MpathPr
