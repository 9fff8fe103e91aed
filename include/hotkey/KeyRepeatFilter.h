#pragma once

#include <QHash>
#include <QtGlobal>

namespace Glowpoint {

/**
 * @brief Collapses OS key-repeat activations into one press per binding.
 *
 * While a chord is held the OS keeps re-sending activations. A press is
 * treated as a repeat when the chord is still held and the previous
 * activation was recent, or when it arrives right after a release (X11
 * auto-repeat emits synthetic release/press pairs).
 *
 * Platforms that never report releases fall back to the held timeout: a
 * new press is accepted once no activation arrived for kHeldTimeoutMs.
 *
 * Not thread-safe; owned by the listener thread.
 */
class KeyRepeatFilter
{
public:
    static constexpr qint64 kHeldTimeoutMs = 1000;
    static constexpr qint64 kSyntheticReleaseGapMs = 15;

    /**
     * @return true when this activation is a new physical press.
     */
    bool acceptPress(int bindingId, qint64 timestampMs);
    void release(int bindingId, qint64 timestampMs);

    bool isHeld(int bindingId) const;
    void reset();

private:
    struct KeyState {
        bool held = false;
        qint64 lastPress = -1;
        qint64 lastRelease = -1;
    };

    QHash<int, KeyState> m_states;
};

} // namespace Glowpoint
