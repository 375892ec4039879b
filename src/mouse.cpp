#include "mouse.h"

#include <iostream>

#include "errors.h"
#include "layout.h"

static void check_index(int index) {
    if (index < 0 || index >= NUM_PROFILES)
        throw OutOfRange("profile index", index);
}

// Run `fn` with slot `index` active, then put the previous slot back.
template <typename Fn>
auto LamzuMouse::_with_profile(int index, Fn&& fn) -> decltype(fn()) {
    check_index(index);

    int previous = active_profile_index();
    if (previous == index)
        return fn();

    set_active_profile_index(index);
    try {
        auto result = fn();
        set_active_profile_index(previous);
        return result;
    } catch (const LamzuError&) {
        _restore_active(previous);
        throw;
    }
}

void LamzuMouse::_restore_active(int index) noexcept {
    try {
        set_active_profile_index(index);
    } catch (const LamzuError& e) {
        std::cerr << "Warning: could not switch back to profile " << (index + 1)
                  << ": " << e.what() << "\n";
    }
}

ProfileBlob LamzuMouse::profile_blob(int index) {
    return _with_profile(index, [this]() { return _planner.read_profile(); });
}

Profile LamzuMouse::profile(int index) {
    return profile_from_bytes(profile_blob(index));
}

std::vector<Profile> LamzuMouse::profiles() {
    int previous = active_profile_index();
    std::vector<Profile> result;
    result.reserve(NUM_PROFILES);

    try {
        for (int i = 0; i < NUM_PROFILES; ++i) {
            set_active_profile_index(i);
            result.push_back(profile_from_bytes(_planner.read_profile()));
        }
    } catch (const LamzuError&) {
        _restore_active(previous);
        throw;
    }

    set_active_profile_index(previous);
    return result;
}

Profile LamzuMouse::set_profile(int index, const PartialProfile& patch) {
    return _with_profile(index, [&]() { return _planner.write_partial(patch); });
}

int LamzuMouse::active_profile_index() {
    return _planner.active_profile();
}

void LamzuMouse::set_active_profile_index(int index) {
    check_index(index);
    _planner.set_active_profile(static_cast<uint8_t>(index));
}
