#pragma once
#include "px/core/Status.hpp"
#include "px/session/EditorSession.hpp"

#include <string>

#include <rapidjson/document.h>

namespace px {

struct CmdError {
  std::string code;     // e.g. "INVALID_HEX_FORMAT"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
};

// JSON front end for an EditorSession. One command object per host input
// event, e.g. {"cmd":"press","row":3,"col":4} or {"cmd":"setHex","hex":"#FF0000"}.
class CommandProcessor {
public:
  explicit CommandProcessor(EditorSession& session);

  // Apply a single JSON command object.
  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  // Encoded image from the most recent successful "export".
  const ExportResult& lastExport() const { return lastExport_; }
  bool hasExport() const { return hasExport_; }

  // Selected color, hue, undo/redo availability and counts, cursor,
  // history size, grid side and paint mode.
  std::string stateJson() const;

  // {"side":N,"rows":[["#FFFFFF",...],...]}
  std::string gridJson() const;

  // One result line: {"ok":true[,"<key>":<payloadJson>]} or
  // {"ok":false,"code":...,"message":...,"details":{...}}.
  // payloadJson and err.details must already be JSON objects.
  static std::string resultJson(const CmdResult& r, const char* key = nullptr,
                                const std::string& payloadJson = std::string());

private:
  EditorSession& session_;
  ExportResult lastExport_;
  bool hasExport_{false};

  // ---- handlers ----
  CmdResult cmdPress(const rapidjson::Value& obj, bool isPress);
  CmdResult cmdSelectHue(const rapidjson::Value& obj);
  CmdResult cmdSelectBrightness(const rapidjson::Value& obj);
  CmdResult cmdSetHex(const rapidjson::Value& obj);
  CmdResult cmdPickPreset(const rapidjson::Value& obj);
  CmdResult cmdExport(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static bool getInt(const rapidjson::Value& obj, const char* key, int& out);
  static CmdResult ok();
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
  static CmdResult fromStatus(Status s, const std::string& message,
                              const std::string& detailsJson = "{}");
};

} // namespace px
