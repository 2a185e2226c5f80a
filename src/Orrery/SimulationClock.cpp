#include <Orrery/SimulationClock.hpp>
#include <plog/Log.h>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace Orrery {

namespace {

std::string fixed(double value, int precision, const char* suffix) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value << suffix;
    return ss.str();
}

} // anonymous namespace

SimulationClock::SimulationClock(double startEpochJulianDate)
    : m_startEpoch(startEpochJulianDate) {}

double SimulationClock::advance(double realDeltaSeconds) {
    if (m_paused || realDeltaSeconds <= 0.0) {
        m_lastDeltaDays = 0.0;
        return 0.0;
    }
    m_lastDeltaDays = realDeltaSeconds * m_timeSpeed / kSecondsPerDay;
    m_simulationDays += m_lastDeltaDays;
    return m_lastDeltaDays;
}

void SimulationClock::setTimeSpeed(double speed) {
    if (std::isnan(speed)) {
        PLOGW << "SimulationClock: ignoring NaN time speed";
        return;
    }
    m_timeSpeed = std::clamp(speed, kMinTimeSpeed, kMaxTimeSpeed);
}

void SimulationClock::reset() {
    m_simulationDays = 0.0;
    m_lastDeltaDays = 0.0;
}

std::string SimulationClock::formatSimulationTime() const {
    const double days = m_simulationDays;
    if (days < 1.0) {
        const double hours = days * 24.0;
        if (hours < 1.0) return fixed(hours * 60.0, 1, " minutes");
        return fixed(hours, 1, " hours");
    }
    if (days < 365.0) return fixed(days, 1, " days");
    return fixed(days / kDaysPerJulianYear, 2, " years");
}

std::string SimulationClock::formatTimeSpeed() const {
    if (m_timeSpeed >= 1000.0) return fixed(m_timeSpeed / 1000.0, 1, "kx");
    std::ostringstream ss;
    ss << m_timeSpeed << "x";
    return ss.str();
}

} // namespace Orrery
