/**
 * @file ProcessingTimer.h
 * @brief Wall-clock timing of analysis stages
 */

#ifndef NEURODECODE_PROCESSING_TIMER_H
#define NEURODECODE_PROCESSING_TIMER_H

#include <chrono>
#include <iomanip>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace neurodecode {

/**
 * @brief High-resolution timer for performance measurements
 */
class Timer {
private:
  std::chrono::high_resolution_clock::time_point m_start;
  std::chrono::high_resolution_clock::time_point m_end;
  bool m_is_running;

public:
  Timer() : m_is_running(false) {}

  void Start() {
    m_start = std::chrono::high_resolution_clock::now();
    m_is_running = true;
  }

  void Stop() {
    m_end = std::chrono::high_resolution_clock::now();
    m_is_running = false;
  }

  double ElapsedMilliseconds() const {
    auto end_time =
        m_is_running ? std::chrono::high_resolution_clock::now() : m_end;
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        end_time - m_start);
    return duration.count() / 1000.0;
  }
};

/**
 * @brief Records one duration per named stage, in the order stages ran
 */
class ProcessingTimer {
private:
  std::vector<std::pair<std::string, double>> m_stages;
  std::string m_current_stage;
  Timer m_timer;

public:
  void BeginStage(const std::string &name) {
    if (!m_current_stage.empty()) {
      EndStage();
    }
    m_current_stage = name;
    m_timer.Start();
  }

  void EndStage() {
    if (m_current_stage.empty()) {
      return;
    }
    m_timer.Stop();
    m_stages.emplace_back(m_current_stage, m_timer.ElapsedMilliseconds());
    m_current_stage.clear();
  }

  const std::vector<std::pair<std::string, double>> &GetStages() const {
    return m_stages;
  }

  double TotalMilliseconds() const {
    double total = 0.0;
    for (const auto &stage : m_stages) {
      total += stage.second;
    }
    return total;
  }

  void PrintSummary(std::ostream &os) const {
    os << "Stage timings:" << std::endl;
    for (const auto &stage : m_stages) {
      os << "  " << std::left << std::setw(24) << stage.first << std::right
         << std::fixed << std::setprecision(1) << std::setw(10) << stage.second
         << " ms" << std::endl;
    }
    os << "  " << std::left << std::setw(24) << "total" << std::right
       << std::fixed << std::setprecision(1) << std::setw(10)
       << TotalMilliseconds() << " ms" << std::endl;
  }
};

} // namespace neurodecode

#endif // NEURODECODE_PROCESSING_TIMER_H
