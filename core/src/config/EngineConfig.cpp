#include "sc/config/EngineConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace sc {

std::string serializeEngineConfig(const EngineConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("tileSize", cfg.tileSize, alloc);
  doc.AddMember("tilesPerPile", cfg.tilesPerPile, alloc);
  doc.AddMember("maxPiles", cfg.maxPiles, alloc);
  doc.AddMember("workgroupSize", cfg.workgroupSize, alloc);

  rapidjson::Value clear(rapidjson::kArrayType);
  for (float c : cfg.clearColor) {
    clear.PushBack(c, alloc);
  }
  doc.AddMember("clearColor", clear, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

static void readUint(const rapidjson::Value& obj, const char* key, std::uint32_t& out) {
  auto it = obj.FindMember(key);
  if (it != obj.MemberEnd() && it->value.IsUint()) out = it->value.GetUint();
}

bool deserializeEngineConfig(const std::string& json, EngineConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  EngineConfig cfg = out;
  readUint(doc, "tileSize", cfg.tileSize);
  readUint(doc, "tilesPerPile", cfg.tilesPerPile);
  readUint(doc, "maxPiles", cfg.maxPiles);
  readUint(doc, "workgroupSize", cfg.workgroupSize);

  if (doc.HasMember("clearColor") && doc["clearColor"].IsArray()) {
    const auto& arr = doc["clearColor"];
    if (arr.Size() == 4) {
      for (rapidjson::SizeType i = 0; i < 4; i++) {
        if (arr[i].IsNumber()) cfg.clearColor[i] = arr[i].GetFloat();
      }
    }
  }

  if (cfg.tileSize == 0 || cfg.tilesPerPile == 0 || cfg.workgroupSize == 0) return false;

  out = cfg;
  return true;
}

} // namespace sc
