// gui/model/fill_animator.cpp
#include "fill_animator.hpp"

#include <algorithm>

namespace cfl {

FillLevelAnimator::FillLevelAnimator(float initial)
    : m_value(initial)
{
    m_tween.from = initial;
    m_tween.to   = initial;
}

void FillLevelAnimator::start(const FillTween& tween)
{
    m_tween = tween;
    m_value = tween.from;

    if (tween.durationMs <= 0) {
        m_value = tween.to;
        m_state = State::Idle;
        return;
    }
    m_state = State::Animating;
}

bool FillLevelAnimator::tick(Millis now)
{
    if (m_state != State::Animating) return false;

    const Millis elapsed = std::max<Millis>(0, now - m_tween.startedAt);
    const qreal t = std::min<qreal>(1.0, static_cast<qreal>(elapsed) / m_tween.durationMs);

    const float before = m_value;
    if (t >= 1.0) {
        m_value = m_tween.to;
        m_state = State::Idle;
    } else {
        const qreal eased = m_curve.valueForProgress(t);
        m_value = static_cast<float>(m_tween.from + (m_tween.to - m_tween.from) * eased);
    }
    return m_value != before;
}

void FillLevelAnimator::finish()
{
    m_value = m_tween.to;
    m_state = State::Idle;
}

void WaveShiftAnimator::start(const WaveLoop& loop)
{
    m_loop = loop;
    m_loop.periodMs = std::max(1, loop.periodMs);
    m_ratio = 0.0f;
    m_running = true;
}

bool WaveShiftAnimator::tick(Millis now)
{
    if (!m_running) return false;

    const Millis elapsed = std::max<Millis>(0, now - m_loop.startedAt);
    const Millis phase = elapsed % m_loop.periodMs;
    const float next = static_cast<float>(phase) / static_cast<float>(m_loop.periodMs);
    if (next == m_ratio) return false;
    m_ratio = next;
    return true;
}

} // namespace cfl
