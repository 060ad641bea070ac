#include "convergence_poll.hpp"

#include <algorithm>

namespace settlement {
namespace wallet {

namespace {

bool hasNamespace(const RegistryEntry& entry, const std::string& required_namespace) {
  return std::find(entry.namespaces.begin(), entry.namespaces.end(), required_namespace) !=
         entry.namespaces.end();
}

bool isSigningReady(const RegistryEntry& entry, const std::string& required_namespace) {
  return !entry.topic.empty() && entry.acknowledged && hasNamespace(entry, required_namespace);
}

}  // namespace

std::string convergenceOutcomeToString(ConvergenceOutcome outcome) {
  switch (outcome) {
    case ConvergenceOutcome::CONVERGED: return "CONVERGED";
    case ConvergenceOutcome::NOT_YET_CONVERGED: return "NOT_YET_CONVERGED";
    case ConvergenceOutcome::EXHAUSTED: return "EXHAUSTED";
  }
  return "UNKNOWN";
}

std::optional<std::string> findConvergedTopic(const std::vector<RegistryEntry>& sessions,
                                              const std::vector<RegistryEntry>& sign_client,
                                              const std::string& required_namespace) {
  for (const auto& session : sessions) {
    if (!isSigningReady(session, required_namespace)) continue;

    for (const auto& signer : sign_client) {
      if (signer.topic == session.topic && isSigningReady(signer, required_namespace)) {
        return session.topic;
      }
    }
  }
  return std::nullopt;
}

}  // namespace wallet
}  // namespace settlement
