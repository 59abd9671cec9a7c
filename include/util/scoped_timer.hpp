#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include <chrono>
#include <string>

// Prints the start message on construction and "<end message> in <seconds>s." on destruction.
// Empty messages are not printed.
class ScopedTimer {
public:
    ScopedTimer(const std::string& startMessage, const std::string& endMessage);
    ~ScopedTimer();

    double getSecondsElapsed() const;

private:
    std::chrono::steady_clock::time_point m_startTime;
    std::string m_endMessage;
};

#endif // SCOPED_TIMER_HPP
