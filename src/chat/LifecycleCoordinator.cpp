#include "LifecycleCoordinator.hpp"

namespace parley {
LifecycleCoordinator::LifecycleCoordinator(
    ConnectionManager& _manager, shared_ptr<ConversationStateStore> _store)
    : manager(_manager), store(_store), generation(0) {}

LifecycleCoordinator::~LifecycleCoordinator() {
  if (!current.isEmpty()) {
    manager.disconnect();
  }
}

LifecycleCoordinator::Generation LifecycleCoordinator::bind(
    const Identity& identity) {
  if (identity == current && generation > 0) {
    VLOG(1) << "Identity already bound at generation " << generation;
    return generation;
  }
  if (!current.isEmpty()) {
    // Keep the log when only the credential rotated
    teardown(identity.conversationId != current.conversationId);
  }
  generation++;
  current = identity;
  if (identity.isComplete()) {
    LOG(INFO) << "Binding " << identity << " at generation " << generation;
    manager.connect(identity);
  } else if (!identity.isEmpty()) {
    LOG(INFO) << "Identity incomplete, staying idle: " << identity;
  }
  return generation;
}

bool LifecycleCoordinator::unbind(Generation _generation) {
  if (_generation != generation) {
    VLOG(1) << "Skipping stale teardown for generation " << _generation
            << " (current " << generation << ")";
    return false;
  }
  LOG(INFO) << "Releasing generation " << generation;
  teardown(true);
  generation++;
  return true;
}

void LifecycleCoordinator::teardown(bool clearLog) {
  manager.reset();
  manager.getDeduplicator().reset();
  manager.getTypingThrottle().reset();
  if (clearLog) {
    store->reset();
  }
  current = Identity();
}
}  // namespace parley
