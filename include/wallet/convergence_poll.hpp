#ifndef CONVERGENCE_POLL_HPP_
#define CONVERGENCE_POLL_HPP_

#include "wallet_connector.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace settlement {
namespace wallet {

enum class ConvergenceOutcome {
  CONVERGED,
  NOT_YET_CONVERGED,
  EXHAUSTED
};

std::string convergenceOutcomeToString(ConvergenceOutcome outcome);

/**
 * Topic present in both registries, carrying `required_namespace` and
 * acknowledged in each. A session visible in only one is not safe to sign
 * with.
 */
std::optional<std::string> findConvergedTopic(const std::vector<RegistryEntry>& sessions,
                                              const std::vector<RegistryEntry>& sign_client,
                                              const std::string& required_namespace = "hedera");

/**
 * Bounded retry of a registry read until it yields a value.
 *
 * attempt() reads once and reports CONVERGED, NOT_YET_CONVERGED (attempts
 * left) or EXHAUSTED (no attempts left). run() loops attempt() and waits
 * nextDelay() between attempts: `delay` times the attempts made so far,
 * capped at `max_delay`.
 */
template<typename T>
class ConvergencePoll {
 public:
  using Read = std::function<std::optional<T>()>;
  using AttemptObserver = std::function<void(int attempt, ConvergenceOutcome outcome)>;

  ConvergencePoll(Read read, int max_attempts, std::chrono::milliseconds delay,
                  std::chrono::milliseconds max_delay = std::chrono::milliseconds(5000))
      : read_(std::move(read)),
        max_attempts_(max_attempts < 1 ? 1 : max_attempts),
        delay_(delay),
        max_delay_(max_delay < delay ? delay : max_delay),
        attempts_(0) {}

  void setAttemptObserver(AttemptObserver observer) { observer_ = std::move(observer); }

  ConvergenceOutcome attempt() {
    if (value_) return ConvergenceOutcome::CONVERGED;
    if (attempts_ >= max_attempts_) return ConvergenceOutcome::EXHAUSTED;

    ++attempts_;
    value_ = read_();

    ConvergenceOutcome outcome = value_ ? ConvergenceOutcome::CONVERGED
                               : attempts_ >= max_attempts_ ? ConvergenceOutcome::EXHAUSTED
                                                            : ConvergenceOutcome::NOT_YET_CONVERGED;
    if (observer_) observer_(attempts_, outcome);
    return outcome;
  }

  ConvergenceOutcome run() {
    ConvergenceOutcome outcome = attempt();
    while (outcome == ConvergenceOutcome::NOT_YET_CONVERGED) {
      std::this_thread::sleep_for(nextDelay());
      outcome = attempt();
    }
    return outcome;
  }

  // Linear backoff
  std::chrono::milliseconds nextDelay() const {
    auto delay = delay_ * (attempts_ < 1 ? 1 : attempts_);
    return delay < max_delay_ ? delay : max_delay_;
  }

  const std::optional<T>& value() const { return value_; }
  int attempts() const { return attempts_; }

 private:
  Read read_;
  int max_attempts_;
  std::chrono::milliseconds delay_;
  std::chrono::milliseconds max_delay_;
  int attempts_;
  std::optional<T> value_;
  AttemptObserver observer_;
};

}  // namespace wallet
}  // namespace settlement

#endif  // CONVERGENCE_POLL_HPP_
