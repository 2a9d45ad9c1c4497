#include "verifier.h"

#include <glog/logging.h>
#include "common/errors.h"

namespace MpathPr {

namespace {

std::string KeyOrNone(const std::optional<Key>& key) {
    return key.has_value() ? FormatKey(*key) : "none";
}

const char* SetOrUnset(bool value) {
    return value ? "set" : "unset";
}

} // namespace

Verifier::Verifier(IPrTool& local, IMultipathDaemon* daemon, std::string map,
                   IPrTool* peer, VerifyOptions options)
    : local_(local),
      daemon_(daemon),
      map_(std::move(map)),
      peer_(peer),
      options_(options) {}

void Verifier::CheckRegistration(const PrState& state, const KeyReport& keys) {
    if (state.LocalRegistered() && !keys.Contains(state.local_key)) {
        throw StateMismatch("local should be registered with key " + FormatKey(state.local_key) +
                            " but registered keys are " + DescribeKeys(keys));
    }
}

void Verifier::CheckReservation(const PrState& state, const ReservationReport& reservation) {
    const std::optional<Key> expected = state.HolderKey();
    if (!expected.has_value()) {
        if (reservation.Held()) {
            throw StateMismatch("no reservation should exist but one is held with key " +
                                FormatKey(*reservation.key));
        }
        return;
    }
    if (!reservation.Held()) {
        throw StateMismatch(std::string("reservation should exist for ") + HolderName(state.holder) +
                            " but none found");
    }
    if (*reservation.key != *expected) {
        throw StateMismatch("reservation key " + FormatKey(*reservation.key) +
                            " does not match expected " + FormatKey(*expected) + " for " +
                            HolderName(state.holder));
    }
}

void Verifier::CheckDaemon(const PrState& state) {
    const std::optional<Key> prkey = daemon_->GetPrKey(map_);
    const bool prstatus = daemon_->GetPrStatus(map_);
    const bool prhold = daemon_->GetPrHold(map_);

    std::optional<Key> expected_key;
    if (state.LocalRegistered()) {
        expected_key = state.local_key;
    }
    if (prkey != expected_key) {
        throw StateMismatch("multipathd getprkey should return " + KeyOrNone(expected_key) +
                            " but returned " + KeyOrNone(prkey));
    }
    if (prstatus != state.LocalRegistered()) {
        throw StateMismatch(std::string("multipathd getprstatus should return ") +
                            SetOrUnset(state.LocalRegistered()) + " but returned " +
                            SetOrUnset(prstatus));
    }
    const bool holds = state.holder == Holder::kLocal;
    if (prhold != holds) {
        throw StateMismatch(std::string("multipathd getprhold should return ") + SetOrUnset(holds) +
                            " but returned " + SetOrUnset(prhold));
    }
    LOG(INFO) << "multipathd state verified: prkey=" << KeyOrNone(prkey)
              << ", prstatus=" << SetOrUnset(prstatus) << ", prhold=" << SetOrUnset(prhold);
}

void Verifier::CheckPeerPath(const KeyReport& keys, const ReservationReport& reservation) {
    const KeyReport peer_keys = peer_->ReadKeys();
    if (peer_keys.keys != keys.keys) {
        throw StateMismatch("peer path reports keys " + DescribeKeys(peer_keys) +
                            " but local path reports " + DescribeKeys(keys));
    }
    const ReservationReport peer_reservation = peer_->ReadReservation();
    if (peer_reservation.key != reservation.key) {
        throw StateMismatch("peer path reports reservation " + KeyOrNone(peer_reservation.key) +
                            " but local path reports " + KeyOrNone(reservation.key));
    }
    VLOG(1) << "peer path agrees: keys=" << DescribeKeys(keys)
            << " reservation=" << KeyOrNone(reservation.key);
}

PrState Verifier::Verify(const PrState& state) {
    const KeyReport keys = local_.ReadKeys();
    CheckRegistration(state, keys);

    const ReservationReport reservation = local_.ReadReservation();
    CheckReservation(state, reservation);

    PrState verified = state;
    // multipathd only learns about a preemption of its own key lazily
    bool local_just_preempted = false;
    if (state.pending_preemption.has_value()) {
        const Key preempted = *state.pending_preemption;
        if (keys.Contains(preempted)) {
            throw StateMismatch("preempted key " + FormatKey(preempted) +
                                " should not be registered but was found in " + DescribeKeys(keys));
        }
        LOG(INFO) << "Verified preempted key " << FormatKey(preempted) << " was removed";
        local_just_preempted = preempted != state.peer_key;
        verified = state.WithPendingPreemption(std::nullopt);
    }

    if (daemon_ != nullptr && options_.check_multipathd && !local_just_preempted) {
        CheckDaemon(verified);
    }
    if (peer_ != nullptr && options_.cross_check_peer_path) {
        CheckPeerPath(keys, reservation);
    }

    LOG(INFO) << "State verified: local_key=" << FormatKey(verified.local_key)
              << ", reservation_holder=" << HolderName(verified.holder);
    return verified;
}

void Verifier::VerifyCleared() {
    const KeyReport keys = local_.ReadKeys();
    if (!keys.Empty()) {
        throw StateMismatch("Failed to clear all registrations - keys still registered: " +
                            DescribeKeys(keys));
    }
    LOG(INFO) << "Verified all registrations cleared";
}

} // namespace MpathPr
