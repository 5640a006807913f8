#include "gd/config/EngineConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <utility>

namespace gd {

namespace {

bool readDouble(const rapidjson::Value& obj, const char* key, double& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsNumber()) return false;
  double v = it->value.GetDouble();
  if (!std::isfinite(v)) return false;
  out = v;
  return true;
}

bool readInt(const rapidjson::Value& obj, const char* key, int& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsInt()) return false;
  out = it->value.GetInt();
  return true;
}

bool readSize(const rapidjson::Value& obj, const char* key, std::size_t& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsUint64()) return false;
  out = static_cast<std::size_t>(it->value.GetUint64());
  return true;
}

bool readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsBool()) return false;
  out = it->value.GetBool();
  return true;
}

bool reject(const char* what) {
  std::fprintf(stderr, "EngineConfig: rejected document: %s\n", what);
  return false;
}

bool readCluster(const rapidjson::Value& v, ClusterConfig& c) {
  if (!v.IsObject()) return reject("cluster is not an object");

  if (v.HasMember("radiusTable")) {
    const auto& t = v["radiusTable"];
    if (!t.IsArray() || t.Empty()) return reject("cluster.radiusTable must be a non-empty array");
    std::vector<RadiusStep> table;
    for (const auto& s : t.GetArray()) {
      if (!s.IsObject()) return reject("cluster.radiusTable entry is not an object");
      RadiusStep step{0, 0.0};
      if (!readInt(s, "minZoom", step.minZoom) || !readDouble(s, "radiusPx", step.radiusPx)) {
        return reject("cluster.radiusTable entry has bad field types");
      }
      if (!(step.radiusPx > 0.0)) return reject("cluster.radiusTable radiusPx must be positive");
      table.push_back(step);
    }
    c.radiusTable = std::move(table);
  }

  if (!readInt(v, "minZoom", c.minZoom) ||
      !readInt(v, "maxClusterZoom", c.maxClusterZoom) ||
      !readInt(v, "maxExpansionZoom", c.maxExpansionZoom) ||
      !readSize(v, "minPoints", c.minPoints)) {
    return reject("cluster has bad field types");
  }
  return true;
}

bool readRank(const rapidjson::Value& v, RankConfig& r) {
  if (!v.IsObject()) return reject("rank is not an object");
  if (!readBool(v, "includeUnlocatable", r.includeUnlocatable) ||
      !readDouble(v, "defaultDistanceKm", r.defaultDistanceKm) ||
      !readSize(v, "maxResults", r.maxResults) ||
      !readDouble(v, "walkingSpeedKmh", r.walkingSpeedKmh)) {
    return reject("rank has bad field types");
  }
  if (!(r.walkingSpeedKmh > 0.0)) return reject("rank.walkingSpeedKmh must be positive");
  return true;
}

bool readTracker(const rapidjson::Value& v, TrackerConfig& t) {
  if (!v.IsObject()) return reject("tracker is not an object");
  if (!readDouble(v, "discoveryRadiusKm", t.discoveryRadiusKm) ||
      !readDouble(v, "lookAheadMinutes", t.lookAheadMinutes) ||
      !readSize(v, "historySize", t.historySize) ||
      !readSize(v, "maxNearby", t.maxNearby) ||
      !readDouble(v, "walkingSpeedKmh", t.walkingSpeedKmh)) {
    return reject("tracker has bad field types");
  }
  if (t.discoveryRadiusKm < 0.0) return reject("tracker.discoveryRadiusKm must be >= 0");
  if (t.lookAheadMinutes < 0.0) return reject("tracker.lookAheadMinutes must be >= 0");
  if (t.historySize < 1) return reject("tracker.historySize must be >= 1");
  if (!(t.walkingSpeedKmh > 0.0)) return reject("tracker.walkingSpeedKmh must be positive");
  return true;
}

bool readTransition(const rapidjson::Value& v, TransitionConfig& t) {
  if (!v.IsObject()) return reject("transition is not an object");
  if (!readDouble(v, "durationMs", t.durationMs)) return reject("transition.durationMs is not a number");
  if (t.durationMs < 0.0) return reject("transition.durationMs must be >= 0");
  if (v.HasMember("easing")) {
    if (!v["easing"].IsString() || !parseEasing(v["easing"].GetString(), t.easing)) {
      return reject("transition.easing is unknown");
    }
  }
  return true;
}

} // namespace

std::string serializeEngineConfig(const EngineConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version", rapidjson::Value(cfg.version.c_str(), alloc), alloc);

  rapidjson::Value cluster(rapidjson::kObjectType);
  rapidjson::Value table(rapidjson::kArrayType);
  for (const auto& step : cfg.cluster.radiusTable) {
    rapidjson::Value s(rapidjson::kObjectType);
    s.AddMember("minZoom", step.minZoom, alloc);
    s.AddMember("radiusPx", step.radiusPx, alloc);
    table.PushBack(s, alloc);
  }
  cluster.AddMember("radiusTable", table, alloc);
  cluster.AddMember("minZoom", cfg.cluster.minZoom, alloc);
  cluster.AddMember("maxClusterZoom", cfg.cluster.maxClusterZoom, alloc);
  cluster.AddMember("maxExpansionZoom", cfg.cluster.maxExpansionZoom, alloc);
  cluster.AddMember("minPoints", static_cast<std::uint64_t>(cfg.cluster.minPoints), alloc);
  doc.AddMember("cluster", cluster, alloc);

  rapidjson::Value rank(rapidjson::kObjectType);
  rank.AddMember("includeUnlocatable", cfg.rank.includeUnlocatable, alloc);
  rank.AddMember("defaultDistanceKm", cfg.rank.defaultDistanceKm, alloc);
  rank.AddMember("maxResults", static_cast<std::uint64_t>(cfg.rank.maxResults), alloc);
  rank.AddMember("walkingSpeedKmh", cfg.rank.walkingSpeedKmh, alloc);
  doc.AddMember("rank", rank, alloc);

  rapidjson::Value tracker(rapidjson::kObjectType);
  tracker.AddMember("discoveryRadiusKm", cfg.tracker.discoveryRadiusKm, alloc);
  tracker.AddMember("lookAheadMinutes", cfg.tracker.lookAheadMinutes, alloc);
  tracker.AddMember("historySize", static_cast<std::uint64_t>(cfg.tracker.historySize), alloc);
  tracker.AddMember("maxNearby", static_cast<std::uint64_t>(cfg.tracker.maxNearby), alloc);
  tracker.AddMember("walkingSpeedKmh", cfg.tracker.walkingSpeedKmh, alloc);
  doc.AddMember("tracker", tracker, alloc);

  rapidjson::Value transition(rapidjson::kObjectType);
  transition.AddMember("durationMs", cfg.transition.durationMs, alloc);
  transition.AddMember("easing",
      rapidjson::Value(easingName(cfg.transition.easing), alloc), alloc);
  doc.AddMember("transition", transition, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeEngineConfig(const std::string& json, EngineConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return reject("not a JSON object");

  EngineConfig cfg = out;

  if (doc.HasMember("version")) {
    if (!doc["version"].IsString()) return reject("version is not a string");
    cfg.version = doc["version"].GetString();
  }
  if (doc.HasMember("cluster") && !readCluster(doc["cluster"], cfg.cluster)) return false;
  if (doc.HasMember("rank") && !readRank(doc["rank"], cfg.rank)) return false;
  if (doc.HasMember("tracker") && !readTracker(doc["tracker"], cfg.tracker)) return false;
  if (doc.HasMember("transition") && !readTransition(doc["transition"], cfg.transition)) return false;

  out = std::move(cfg);
  return true;
}

} // namespace gd
