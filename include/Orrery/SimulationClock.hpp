#pragma once
#include <Orrery/Constants.hpp>
#include <string>

namespace Orrery {

/**
 * @brief Accelerated simulation time owned by the animation loop
 *
 * Keeps simulated days since a start epoch. The caller pushes real elapsed
 * time in through advance(); the clock never reads a wall clock, so the
 * same sequence of calls always produces the same times.
 */
class SimulationClock {
public:
    static constexpr double kDefaultTimeSpeed = 100000.0;
    static constexpr double kMinTimeSpeed = 1.0;
    static constexpr double kMaxTimeSpeed = 500000.0;

    explicit SimulationClock(double startEpochJulianDate = kJ2000);

    // Advance by `realDeltaSeconds` of real time; returns the simulated days added.
    double advance(double realDeltaSeconds);

    double simulationDays() const { return m_simulationDays; }
    double julianDate() const { return m_startEpoch + m_simulationDays; }
    double startEpoch() const { return m_startEpoch; }
    double lastDeltaDays() const { return m_lastDeltaDays; }

    void setSimulationDays(double days) { m_simulationDays = days; }
    void setJulianDate(double julianDate) { m_simulationDays = julianDate - m_startEpoch; }

    double timeSpeed() const { return m_timeSpeed; }
    void setTimeSpeed(double speed);   // clamped to [kMinTimeSpeed, kMaxTimeSpeed]

    bool isPaused() const { return m_paused; }
    void pause() { m_paused = true; }
    void play() { m_paused = false; }
    void togglePause() { m_paused = !m_paused; }

    // Back to the start epoch; speed and pause state are kept.
    void reset();

    std::string formatSimulationTime() const;  // "42.0 minutes", "3.5 hours", "12.0 days", "2.50 years"
    std::string formatTimeSpeed() const;       // "500x", "100.0kx"

private:
    double m_startEpoch;
    double m_simulationDays = 0.0;
    double m_lastDeltaDays = 0.0;
    double m_timeSpeed = kDefaultTimeSpeed;
    bool m_paused = false;
};

} // namespace Orrery
