#include "hotkey/KeyRepeatFilter.h"

namespace Glowpoint {

bool KeyRepeatFilter::acceptPress(int bindingId, qint64 timestampMs)
{
    KeyState& state = m_states[bindingId];

    bool repeat = false;
    if (state.held) {
        repeat = state.lastPress >= 0 && (timestampMs - state.lastPress) < kHeldTimeoutMs;
    } else if (state.lastRelease >= 0) {
        repeat = (timestampMs - state.lastRelease) <= kSyntheticReleaseGapMs;
    }

    state.held = true;
    state.lastPress = timestampMs;
    return !repeat;
}

void KeyRepeatFilter::release(int bindingId, qint64 timestampMs)
{
    KeyState& state = m_states[bindingId];
    state.held = false;
    state.lastRelease = timestampMs;
}

bool KeyRepeatFilter::isHeld(int bindingId) const
{
    return m_states.value(bindingId).held;
}

void KeyRepeatFilter::reset()
{
    m_states.clear();
}

} // namespace Glowpoint
