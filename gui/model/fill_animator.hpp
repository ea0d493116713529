// gui/model/fill_animator.hpp: time-based tweens for the water level and wave phase
#pragma once

#include <QEasingCurve>
#include <QtGlobal>

namespace cfl {

using Millis = qint64;

// One water level animation request.
struct FillTween {
    float  from       = 1.0f;
    float  to         = 1.0f;
    int    durationMs = 0;
    Millis startedAt  = 0;
};

// One wave phase loop.
struct WaveLoop {
    int    periodMs  = 1000;
    Millis startedAt = 0;
};

// Water level tween: Idle -> Animating on start(), Animating -> Idle when the
// target is reached. A new start() replaces the running tween.
class FillLevelAnimator {
public:
    enum class State { Idle, Animating };

    explicit FillLevelAnimator(float initial = 1.0f);

    // Zero or negative durations land on the target immediately.
    void start(const FillTween& tween);

    // Advances to `now`. Returns true if the value moved.
    bool tick(Millis now);

    // Jump to the target and go Idle.
    void finish();

    State state() const { return m_state; }
    bool  isAnimating() const { return m_state == State::Animating; }
    float value() const { return m_value; }
    float target() const { return m_tween.to; }

private:
    QEasingCurve m_curve{QEasingCurve::OutQuad};   // decelerate, factor 1
    FillTween    m_tween;
    State        m_state = State::Idle;
    float        m_value = 1.0f;
};

// Continuous 0 -> 1 linear phase loop, repeating while running.
class WaveShiftAnimator {
public:
    // (Re)starts from ratio 0.
    void start(const WaveLoop& loop);

    // Stops; the ratio keeps its last value.
    void cancel() { m_running = false; }

    // Advances to `now`. Returns true if the ratio moved.
    bool tick(Millis now);

    bool  isRunning() const { return m_running; }
    float ratio() const { return m_ratio; }
    int   periodMs() const { return m_loop.periodMs; }

private:
    WaveLoop m_loop;
    bool     m_running = false;
    float    m_ratio   = 0.0f;
};

} // namespace cfl
