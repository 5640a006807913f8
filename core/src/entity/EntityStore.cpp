#include "gd/entity/EntityStore.hpp"
#include "gd/geo/GeoMath.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cmath>
#include <cstdio>
#include <limits>

namespace gd {

namespace {

// Non-finite coordinates are written as null; JSON has no NaN.
void writeCoordinate(rapidjson::Writer<rapidjson::StringBuffer>& w, double v) {
  if (std::isfinite(v)) w.Double(v);
  else w.Null();
}

bool readCoordinate(const rapidjson::Value& obj, const char* key, double& out) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (v.IsNull()) {
    out = std::numeric_limits<double>::quiet_NaN();
    return true;
  }
  if (!v.IsNumber()) return false;
  out = v.GetDouble();
  return true;
}

} // namespace

void EntityStore::report(const std::string& id, const char* code,
                         const std::string& message) const {
  DataQualityIssue issue{id, code, message};
  if (onIssue_) {
    onIssue_(issue);
  } else {
    std::fprintf(stderr, "EntityStore: %s [%s] %s\n",
                 code, id.c_str(), message.c_str());
  }
}

bool EntityStore::add(const Entity& entity) {
  if (index_.count(entity.id) != 0) {
    report(entity.id, "DUPLICATE_ID", "entity id already present, ignored");
    return false;
  }

  index_[entity.id] = entities_.size();
  entities_.push_back(entity);

  if (isValidCoordinate(entity.location)) {
    locatable_.push_back(entity);
  } else {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "unlocatable coordinate (%.6f, %.6f)",
                  entity.location.lat, entity.location.lng);
    report(entity.id, "INVALID_COORDINATE", buf);
  }

  revision_++;
  return true;
}

std::size_t EntityStore::addAll(const std::vector<Entity>& list) {
  std::size_t accepted = 0;
  entities_.reserve(entities_.size() + list.size());
  for (const auto& e : list) {
    if (add(e)) accepted++;
  }
  return accepted;
}

bool EntityStore::remove(const std::string& id) {
  auto it = index_.find(id);
  if (it == index_.end()) return false;

  entities_.erase(entities_.begin() + static_cast<std::ptrdiff_t>(it->second));
  rebuildIndex();
  revision_++;
  return true;
}

void EntityStore::clear() {
  entities_.clear();
  locatable_.clear();
  index_.clear();
  revision_++;
}

const Entity* EntityStore::get(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) return nullptr;
  return &entities_[it->second];
}

bool EntityStore::isLocatable(const std::string& id) const {
  const Entity* e = get(id);
  return e && isValidCoordinate(e->location);
}

void EntityStore::rebuildIndex() {
  index_.clear();
  locatable_.clear();
  for (std::size_t i = 0; i < entities_.size(); i++) {
    index_[entities_[i].id] = i;
    if (isValidCoordinate(entities_[i].location)) locatable_.push_back(entities_[i]);
  }
}

std::string EntityStore::toJSON() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("entities");
  w.StartArray();
  for (const auto& e : entities_) {
    w.StartObject();
    w.Key("id");   w.String(e.id.c_str());
    w.Key("name"); w.String(e.name.c_str());
    w.Key("lat");  writeCoordinate(w, e.location.lat);
    w.Key("lng");  writeCoordinate(w, e.location.lng);
    w.Key("tags");
    w.StartArray();
    for (const auto& t : e.tags) w.String(t.c_str());
    w.EndArray();
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

bool EntityStore::loadJSON(const std::string& json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) return false;
  if (!doc.IsObject()) return false;
  if (!doc.HasMember("entities") || !doc["entities"].IsArray()) return false;

  const auto& arr = doc["entities"].GetArray();

  std::vector<Entity> loaded;
  loaded.reserve(arr.Size());

  for (const auto& v : arr) {
    if (!v.IsObject()) return false;
    Entity e;

    if (v.HasMember("id") && v["id"].IsString())
      e.id = v["id"].GetString();
    else
      return false;

    if (v.HasMember("name") && v["name"].IsString()) e.name = v["name"].GetString();

    // Missing coordinates stay at (0,0), null ones load as NaN; both are
    // flagged unlocatable on add.
    if (!readCoordinate(v, "lat", e.location.lat)) return false;
    if (!readCoordinate(v, "lng", e.location.lng)) return false;

    if (v.HasMember("tags") && v["tags"].IsArray()) {
      for (const auto& t : v["tags"].GetArray()) {
        if (t.IsString()) e.tags.emplace_back(t.GetString());
      }
    }

    loaded.push_back(std::move(e));
  }

  clear();
  addAll(loaded);
  return true;
}

} // namespace gd
