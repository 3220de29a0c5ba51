// P8.1 CommandProcessor: JSON input events and error codes

#include "px/commands/CommandProcessor.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireOk(const px::CmdResult& r, const char* ctx) {
  if (!r.ok) {
    std::fprintf(stderr, "FAIL [%s]: code=%s msg=%s\n",
                 ctx, r.err.code.c_str(), r.err.message.c_str());
    std::exit(1);
  }
}

static void requireCode(const px::CmdResult& r, const char* code, const char* ctx) {
  if (r.ok || r.err.code != code) {
    std::fprintf(stderr, "FAIL [%s]: expected %s, got ok=%d code=%s\n",
                 ctx, code, r.ok ? 1 : 0, r.err.code.c_str());
    std::exit(1);
  }
}

int main() {
  // ---- Test 1: drag-paint via JSON ----
  {
    px::EditorSession s;
    px::CommandProcessor cp(s);
    requireOk(cp.applyJsonText(R"({"cmd":"setHex","hex":"#FF0000"})"), "setHex");
    requireOk(cp.applyJsonText(R"({"cmd":"press","row":0,"col":0})"), "press");
    requireOk(cp.applyJsonText(R"({"cmd":"hover","row":0,"col":1})"), "hover");
    requireOk(cp.applyJsonText(R"({"cmd":"release"})"), "release");
    requireOk(cp.applyJsonText(R"({"cmd":"hover","row":0,"col":2})"), "idle hover");

    requireTrue(s.history().size() == 3, "two cells committed");
    requireTrue(px::toHex(s.currentGrid().getCell(0, 1)) == "#FF0000", "(0,1) red");
    requireTrue(s.currentGrid().getCell(0, 2) == px::kWhite, "(0,2) untouched");
    std::printf("  Test 1 (drag via JSON): PASS\n");
  }

  // ---- Test 2: undo/redo codes ----
  {
    px::EditorSession s;
    px::CommandProcessor cp(s);
    requireCode(cp.applyJsonText(R"({"cmd":"undo"})"), "AT_HISTORY_START", "undo at start");
    requireCode(cp.applyJsonText(R"({"cmd":"redo"})"), "AT_HISTORY_END", "redo at end");
    requireOk(cp.applyJsonText(R"({"cmd":"press","row":1,"col":1})"), "press");
    requireOk(cp.applyJsonText(R"({"cmd":"pointerLeave"})"), "leave");
    requireOk(cp.applyJsonText(R"({"cmd":"undo"})"), "undo");
    requireOk(cp.applyJsonText(R"({"cmd":"redo"})"), "redo");
    requireOk(cp.applyJsonText(R"({"cmd":"clear"})"), "clear");
    requireTrue(s.history().size() == 3, "press + clear");
    std::printf("  Test 2 (history commands): PASS\n");
  }

  // ---- Test 3: validation errors ----
  {
    px::EditorSession s;
    px::CommandProcessor cp(s);
    requireCode(cp.applyJsonText("nope"), "BAD_COMMAND", "not JSON");
    requireCode(cp.applyJsonText(R"({"row":1})"), "BAD_COMMAND", "missing cmd");
    requireCode(cp.applyJsonText(R"({"cmd":"fill"})"), "UNKNOWN_COMMAND", "unknown");
    requireCode(cp.applyJsonText(R"({"cmd":"press","row":1})"), "MISSING_FIELD", "no col");
    requireCode(cp.applyJsonText(R"({"cmd":"press","row":"1","col":2})"), "MISSING_FIELD", "string row");
    requireCode(cp.applyJsonText(R"({"cmd":"press","row":40,"col":0})"), "OUT_OF_BOUNDS", "oob");
    requireCode(cp.applyJsonText(R"({"cmd":"setHex","hex":"#12"})"), "INVALID_HEX_FORMAT", "bad hex");
    requireCode(cp.applyJsonText(R"({"cmd":"selectHue"})"), "MISSING_FIELD", "no hue");
    requireTrue(s.history().size() == 1, "nothing committed");
    requireTrue(s.selectedColor() == px::kBlack, "selection untouched");
    std::printf("  Test 3 (validation): PASS\n");
  }

  // ---- Test 4: color commands ----
  {
    px::EditorSession s;
    px::CommandProcessor cp(s);
    requireOk(cp.applyJsonText(R"({"cmd":"selectHue","hue":120})"), "hue");
    requireTrue(px::toHex(s.selectedColor()) == "#00FF00", "green");
    requireOk(cp.applyJsonText(R"({"cmd":"selectBrightness","level":100})"), "brightness");
    requireTrue(s.selectedColor() == px::kWhite, "white at 100");
    requireOk(cp.applyJsonText(R"({"cmd":"pickPreset","index":8})"), "preset index");
    requireTrue(px::toHex(s.selectedColor()) == "#FFA500", "orange");
    requireOk(cp.applyJsonText(R"({"cmd":"pickPreset","color":"#800080"})"), "preset color");
    requireTrue(px::toHex(s.selectedColor()) == "#800080", "purple");
    requireCode(cp.applyJsonText(R"({"cmd":"pickPreset","index":16})"), "OUT_OF_BOUNDS", "index 16");
    requireCode(cp.applyJsonText(R"({"cmd":"pickPreset","color":"purple"})"),
                "INVALID_HEX_FORMAT", "named color");
    requireCode(cp.applyJsonText(R"({"cmd":"pickPreset"})"), "MISSING_FIELD", "empty preset");

    requireOk(cp.applyJsonText(R"({"cmd":"pickPreset","quick":1})"), "quick preset");
    requireTrue(px::toHex(s.selectedColor()) == "#FFFFFF", "quick 1 is white");
    requireCode(cp.applyJsonText(R"({"cmd":"pickPreset","quick":8})"), "OUT_OF_BOUNDS", "quick 8");
    requireCode(cp.applyJsonText(R"({"cmd":"pickPreset","quick":"1"})"), "MISSING_FIELD",
                "string quick");
    std::printf("  Test 4 (color commands): PASS\n");
  }

  // ---- Test 5: export ----
  {
    px::EditorSession s;
    px::CommandProcessor cp(s);
    requireTrue(!cp.hasExport(), "no export yet");
    requireCode(cp.applyJsonText(R"({"cmd":"export","scale":2})"), "INVALID_SCALE", "scale 2");
    requireCode(cp.applyJsonText(R"({"cmd":"export","scale":"big"})"), "INVALID_SCALE", "string scale");
    requireCode(cp.applyJsonText(R"({"cmd":"export","format":"bmp"})"), "INVALID_FORMAT", "bmp");
    requireTrue(!cp.hasExport(), "rejections leave no export");

    requireOk(cp.applyJsonText(R"({"cmd":"export"})"), "default export");
    requireTrue(cp.hasExport(), "export stored");
    requireTrue(cp.lastExport().width == 320, "default scale 10");
    requireTrue(cp.lastExport().format == px::ImageFormat::Png, "default png");

    requireOk(cp.applyJsonText(R"({"cmd":"export","format":"lossy","scale":20})"), "jpeg export");
    requireTrue(cp.lastExport().width == 640, "scale 20");
    requireTrue(cp.lastExport().fileName == "pixel-art.jpeg", "jpeg name");
    std::printf("  Test 5 (export): PASS\n");
  }

  // ---- Test 6: state and grid queries ----
  {
    px::EditorSession s;
    px::CommandProcessor cp(s);
    cp.applyJsonText(R"({"cmd":"setHex","hex":"#0000ff"})");
    cp.applyJsonText(R"({"cmd":"press","row":2,"col":3})");
    requireOk(cp.applyJsonText(R"({"cmd":"getState"})"), "getState");

    rapidjson::Document st;
    st.Parse(cp.stateJson().c_str());
    requireTrue(!st.HasParseError() && st.IsObject(), "state is JSON");
    requireTrue(std::string(st["selectedColor"].GetString()) == "#0000FF", "selected");
    requireTrue(st["hue"].GetInt() == 240, "hue");
    requireTrue(st["canUndo"].GetBool(), "canUndo");
    requireTrue(!st["canRedo"].GetBool(), "canRedo");
    requireTrue(st["cursor"].GetUint64() == 1, "cursor");
    requireTrue(st["historySize"].GetUint64() == 2, "historySize");
    requireTrue(st["undoCount"].GetUint64() == 1, "undoCount");
    requireTrue(st["redoCount"].GetUint64() == 0, "redoCount");
    requireTrue(st["side"].GetInt() == 32, "side");
    requireTrue(st["drawing"].GetBool(), "still drawing");

    rapidjson::Document g;
    g.Parse(cp.gridJson().c_str());
    requireTrue(!g.HasParseError() && g.IsObject(), "grid is JSON");
    requireTrue(g["rows"].Size() == 32, "32 rows");
    requireTrue(g["rows"][2u].Size() == 32, "32 cols");
    requireTrue(std::string(g["rows"][2u][3u].GetString()) == "#0000FF", "painted cell");
    requireTrue(std::string(g["rows"][3u][2u].GetString()) == "#FFFFFF", "other cell");
    std::printf("  Test 6 (queries): PASS\n");
  }

  // ---- Test 7: unknown cmd text is escaped in details ----
  {
    px::EditorSession s;
    px::CommandProcessor cp(s);
    px::CmdResult r = cp.applyJsonText(R"({"cmd":"a\"b"})");
    requireCode(r, "UNKNOWN_COMMAND", "quoted cmd");

    rapidjson::Document d;
    d.Parse(r.err.details.c_str());
    requireTrue(!d.HasParseError() && d.IsObject(), "details is JSON");
    requireTrue(std::string(d["cmd"].GetString()) == "a\"b", "cmd echoed verbatim");

    r = cp.applyJsonText(R"({"cmd":"x\ny"})");
    requireCode(r, "UNKNOWN_COMMAND", "newline cmd");
    requireTrue(r.err.details.find('\n') == std::string::npos, "no raw newline in details");
    d.Parse(r.err.details.c_str());
    requireTrue(!d.HasParseError() && std::string(d["cmd"].GetString()) == "x\ny",
                "newline round-trips");
    std::printf("  Test 7 (escaped details): PASS\n");
  }

  // ---- Test 8: result lines stay single-line JSON ----
  {
    px::EditorSession s;
    px::CommandProcessor cp(s);

    px::CmdResult bad = cp.applyJsonText(R"({"cmd":"q\"\n\t"})");
    bad.err.message = "could not write out\n\"1\".png";
    std::string line = px::CommandProcessor::resultJson(bad);
    requireTrue(line.find('\n') == std::string::npos, "failure line has no newline");
    rapidjson::Document d;
    d.Parse(line.c_str());
    requireTrue(!d.HasParseError() && d.IsObject(), "failure line is JSON");
    requireTrue(!d["ok"].GetBool(), "ok false");
    requireTrue(std::string(d["code"].GetString()) == "UNKNOWN_COMMAND", "code");
    requireTrue(std::string(d["message"].GetString()) == bad.err.message, "message kept");
    requireTrue(std::string(d["details"]["cmd"].GetString()) == "q\"\n\t", "details nested");

    line = px::CommandProcessor::resultJson(cp.applyJsonText(R"({"cmd":"getState"})"),
                                            "state", cp.stateJson());
    d.Parse(line.c_str());
    requireTrue(!d.HasParseError() && d["ok"].GetBool(), "ok line is JSON");
    requireTrue(d["state"]["side"].GetInt() == 32, "payload nested");

    line = px::CommandProcessor::resultJson(px::CmdResult{});
    requireTrue(line == R"({"ok":true})", "bare ok");
    std::printf("  Test 8 (result lines): PASS\n");
  }

  std::printf("P8.1 command_processor: ALL PASS\n");
  return 0;
}
