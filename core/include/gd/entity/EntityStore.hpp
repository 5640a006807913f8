#pragma once
#include "gd/geo/Types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gd {

struct DataQualityIssue {
  std::string entityId;
  std::string code;     // "INVALID_COORDINATE", "DUPLICATE_ID"
  std::string message;
};

using DataQualityCallback = std::function<void(const DataQualityIssue&)>;

// Owns the entity list handed to the engine. Entities with unusable
// coordinates are kept for non-spatial callers but left out of locatable().
class EntityStore {
public:
  void setDataQualityCallback(DataQualityCallback cb) { onIssue_ = std::move(cb); }

  // Returns false (and reports DUPLICATE_ID) if the id is already present.
  bool add(const Entity& entity);
  std::size_t addAll(const std::vector<Entity>& list);
  bool remove(const std::string& id);
  void clear();

  const Entity* get(const std::string& id) const;
  bool isLocatable(const std::string& id) const;

  const std::vector<Entity>& entities() const { return entities_; }
  const std::vector<Entity>& locatable() const { return locatable_; }
  std::size_t count() const { return entities_.size(); }
  std::size_t unlocatableCount() const { return entities_.size() - locatable_.size(); }

  // Bumped on every mutation.
  std::uint64_t revision() const { return revision_; }

  // {"entities":[{"id","name","lat","lng","tags":[...]}]}
  std::string toJSON() const;
  bool loadJSON(const std::string& json);

private:
  void report(const std::string& id, const char* code, const std::string& message) const;
  void rebuildIndex();

  std::vector<Entity> entities_;
  std::vector<Entity> locatable_;
  std::unordered_map<std::string, std::size_t> index_;
  DataQualityCallback onIssue_;
  std::uint64_t revision_{0};
};

} // namespace gd
