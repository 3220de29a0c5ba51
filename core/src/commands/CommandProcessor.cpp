#include "px/commands/CommandProcessor.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <utility>
#include <vector>

namespace px {

CommandProcessor::CommandProcessor(EditorSession& session)
  : session_(session) {}

CmdResult CommandProcessor::ok() {
  return CmdResult{};
}

CmdResult CommandProcessor::fail(const std::string& code,
                                 const std::string& message,
                                 const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

CmdResult CommandProcessor::fromStatus(Status s, const std::string& message,
                                       const std::string& detailsJson) {
  if (s == Status::Ok) return ok();
  return fail(statusCode(s), message, detailsJson);
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

bool CommandProcessor::getInt(const rapidjson::Value& obj, const char* key, int& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsInt()) return false;
  out = v->GetInt();
  return true;
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  // pointer
  if (cmd == "press") return cmdPress(obj, true);
  if (cmd == "hover") return cmdPress(obj, false);
  if (cmd == "release") { session_.release(); return ok(); }
  if (cmd == "pointerLeave") { session_.pointerLeave(); return ok(); }

  // color
  if (cmd == "selectHue") return cmdSelectHue(obj);
  if (cmd == "selectBrightness") return cmdSelectBrightness(obj);
  if (cmd == "setHex") return cmdSetHex(obj);
  if (cmd == "pickPreset") return cmdPickPreset(obj);

  // history
  if (cmd == "undo") return fromStatus(session_.requestUndo(), "undo: nothing to undo");
  if (cmd == "redo") return fromStatus(session_.requestRedo(), "redo: nothing to redo");
  if (cmd == "clear") { session_.requestClear(); return ok(); }

  if (cmd == "export") return cmdExport(obj);
  if (cmd == "getState") return ok();

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("cmd");
  w.String(cmdV->GetString(), cmdV->GetStringLength());
  w.EndObject();
  return fail("UNKNOWN_COMMAND", "Unknown cmd", sb.GetString());
}

// -------------------- pointer --------------------

CmdResult CommandProcessor::cmdPress(const rapidjson::Value& obj, bool isPress) {
  const char* name = isPress ? "press" : "hover";
  int row = 0, col = 0;
  if (!getInt(obj, "row", row) || !getInt(obj, "col", col)) {
    return fail("MISSING_FIELD", std::string(name) + ": row and col must be integers");
  }

  Status s = isPress ? session_.press(row, col) : session_.hover(row, col);
  return fromStatus(s, std::string(name) + ": cell outside grid",
                    R"({"row":)" + std::to_string(row) +
                    R"(,"col":)" + std::to_string(col) + "}");
}

// -------------------- color --------------------

CmdResult CommandProcessor::cmdSelectHue(const rapidjson::Value& obj) {
  int hue = 0;
  if (!getInt(obj, "hue", hue)) {
    return fail("MISSING_FIELD", "selectHue: hue must be an integer");
  }
  session_.selectHue(hue);
  return ok();
}

CmdResult CommandProcessor::cmdSelectBrightness(const rapidjson::Value& obj) {
  int level = 0;
  if (!getInt(obj, "level", level)) {
    return fail("MISSING_FIELD", "selectBrightness: level must be an integer");
  }
  session_.selectBrightness(level);
  return ok();
}

CmdResult CommandProcessor::cmdSetHex(const rapidjson::Value& obj) {
  const auto* v = getMember(obj, "hex");
  if (!v || !v->IsString()) {
    return fail("MISSING_FIELD", "setHex: hex must be a string");
  }
  return fromStatus(session_.setHex(v->GetString()), "setHex: expected #RRGGBB");
}

CmdResult CommandProcessor::cmdPickPreset(const rapidjson::Value& obj) {
  if (const auto* v = getMember(obj, "color")) {
    Color c;
    if (!v->IsString() || !parseHex(v->GetString(), c)) {
      return fail(statusCode(Status::InvalidHexFormat), "pickPreset: expected #RRGGBB");
    }
    session_.pickPreset(c);
    return ok();
  }

  // "index" selects from the full palette, "quick" from the quick-access row.
  const auto& cfg = session_.config();
  const std::vector<Color>* row = &cfg.palette;
  const char* key = "index";
  if (getMember(obj, "quick")) {
    row = &cfg.quickColors;
    key = "quick";
  }

  int index = 0;
  if (!getInt(obj, key, index)) {
    return fail("MISSING_FIELD", "pickPreset: color, index or quick required");
  }
  if (index < 0 || static_cast<std::size_t>(index) >= row->size()) {
    return fail(statusCode(Status::OutOfBounds), "pickPreset: preset index out of range",
                R"({")" + std::string(key) + R"(":)" + std::to_string(index) +
                R"(,"size":)" + std::to_string(row->size()) + "}");
  }
  session_.pickPreset((*row)[static_cast<std::size_t>(index)]);
  return ok();
}

// -------------------- export --------------------

CmdResult CommandProcessor::cmdExport(const rapidjson::Value& obj) {
  const auto& cfg = session_.config();

  ImageFormat format = cfg.defaultExportFormat;
  if (const auto* v = getMember(obj, "format")) {
    if (!v->IsString() || !parseImageFormat(v->GetString(), format)) {
      return fail(statusCode(Status::InvalidFormat), "export: format must be png or jpeg");
    }
  }

  int scale = cfg.defaultExportScale;
  if (getMember(obj, "scale") && !getInt(obj, "scale", scale)) {
    return fail(statusCode(Status::InvalidScale), "export: scale must be an integer");
  }

  ExportResult result;
  Status s = session_.requestExport(format, scale, result);
  if (s != Status::Ok) {
    return fromStatus(s, "export rejected",
                      R"({"scale":)" + std::to_string(scale) +
                      R"(,"min":)" + std::to_string(cfg.minExportScale) +
                      R"(,"max":)" + std::to_string(cfg.maxExportScale) + "}");
  }

  lastExport_ = std::move(result);
  hasExport_ = true;
  return ok();
}

// -------------------- Query --------------------

std::string CommandProcessor::resultJson(const CmdResult& r, const char* key,
                                         const std::string& payloadJson) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("ok");
  w.Bool(r.ok);
  if (r.ok) {
    if (key && !payloadJson.empty()) {
      w.Key(key);
      w.RawValue(payloadJson.c_str(), payloadJson.size(), rapidjson::kObjectType);
    }
  } else {
    const std::string& details = r.err.details.empty() ? std::string("{}") : r.err.details;
    w.Key("code");
    w.String(r.err.code.c_str(), static_cast<rapidjson::SizeType>(r.err.code.size()));
    w.Key("message");
    w.String(r.err.message.c_str(), static_cast<rapidjson::SizeType>(r.err.message.size()));
    w.Key("details");
    w.RawValue(details.c_str(), details.size(), rapidjson::kObjectType);
  }
  w.EndObject();

  return sb.GetString();
}

std::string CommandProcessor::stateJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  const auto& hist = session_.history();
  const std::string color = toHex(session_.selectedColor());

  w.StartObject();

  w.Key("selectedColor");
  w.String(color.c_str());

  w.Key("hue");
  w.Int(session_.hue());

  w.Key("canUndo");
  w.Bool(session_.canUndo());

  w.Key("canRedo");
  w.Bool(session_.canRedo());

  w.Key("cursor");
  w.Uint64(hist.cursor());

  w.Key("historySize");
  w.Uint64(hist.size());

  w.Key("undoCount");
  w.Uint64(hist.undoCount());

  w.Key("redoCount");
  w.Uint64(hist.redoCount());

  w.Key("side");
  w.Int(session_.currentGrid().side());

  w.Key("drawing");
  w.Bool(session_.paintSession().isDrawing());

  w.EndObject();

  return sb.GetString();
}

std::string CommandProcessor::gridJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  const Grid& grid = session_.currentGrid();

  w.StartObject();
  w.Key("side");
  w.Int(grid.side());

  w.Key("rows");
  w.StartArray();
  for (int r = 0; r < grid.side(); r++) {
    w.StartArray();
    for (int c = 0; c < grid.side(); c++) {
      const std::string hex = toHex(grid.getCell(r, c));
      w.String(hex.c_str());
    }
    w.EndArray();
  }
  w.EndArray();

  w.EndObject();

  return sb.GetString();
}

} // namespace px
