#pragma once

#include <cstdint>
#include <vector>

#include "data.h"
#include "transfer.h"

// -----------------------------------------------------------------------
// LamzuMouse
//
// Profile-slot level access on top of TransferPlanner. The device only
// exposes its active profile, so reading or writing another slot switches
// the active profile for the duration of the transfer and switches back
// afterwards, also when the transfer fails.
//
// Profile indices are 0-based (0..3).
// -----------------------------------------------------------------------

class LamzuMouse {
public:
    explicit LamzuMouse(TransferPlanner& planner) : _planner(planner) {}

    // Non-copyable
    LamzuMouse(const LamzuMouse&) = delete;
    LamzuMouse& operator=(const LamzuMouse&) = delete;

    ProfileBlob profile_blob(int index);
    Profile     profile(int index);

    // All four profiles, in slot order.
    std::vector<Profile> profiles();

    // Apply `patch` to slot `index`. Returns the profile as written.
    Profile set_profile(int index, const PartialProfile& patch);

    int  active_profile_index();
    void set_active_profile_index(int index);

private:
    TransferPlanner& _planner;

    template <typename Fn>
    auto _with_profile(int index, Fn&& fn) -> decltype(fn());

    void _restore_active(int index) noexcept;
};
