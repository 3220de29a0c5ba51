// Pixel canvas command server
// Reads JSON commands from stdin, writes one JSON result line per command.
// Protocol:
//   stdin:  newline-delimited JSON, e.g. {"cmd":"press","row":0,"col":0}
//   stdout: {"ok":true,"state":{...}} or {"ok":false,"code":...,"message":...}
//   export: {"cmd":"export","format":"png","scale":10,"path":"out.png"}
//           writes the image to "path" (or the suggested name) and replies
//           {"ok":true,"export":{"path":...,"bytes":...,"width":...,"height":...}}.
//   grid:   {"cmd":"getGrid"} replies {"ok":true,"grid":{...}}.

#include "px/commands/CommandProcessor.hpp"
#include "px/config/EditorConfig.hpp"
#include "px/export/ImageExport.hpp"
#include "px/session/EditorSession.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool readLine(std::string& line) {
  line.clear();
  int c;
  while ((c = std::fgetc(stdin)) != EOF && c != '\n') {
    line += static_cast<char>(c);
  }
  return !(c == EOF && line.empty());
}

static void writeLine(const std::string& json) {
  std::fwrite(json.data(), 1, json.size(), stdout);
  std::fputc('\n', stdout);
  std::fflush(stdout);
}

static std::string exportJson(const std::string& path, const px::ExportResult& exp) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("path");
  w.String(path.c_str(), static_cast<rapidjson::SizeType>(path.size()));
  w.Key("bytes");
  w.Uint64(exp.bytes.size());
  w.Key("width");
  w.Int(exp.width);
  w.Key("height");
  w.Int(exp.height);
  w.EndObject();
  return sb.GetString();
}

static void usage(const char* argv0) {
  std::fprintf(stderr, "usage: %s [--config <file.json>]\n", argv0);
}

// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
  px::EditorConfig config;

  for (int i = 1; i < argc; i++) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      if (!px::loadEditorConfigFile(argv[++i], config)) return 1;
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  std::unique_ptr<px::EditorSession> session;
  try {
    session = std::make_unique<px::EditorSession>(config);
  } catch (const std::invalid_argument& e) {
    std::fprintf(stderr, "pixel_server: %s\n", e.what());
    return 1;
  }

  px::CommandProcessor cp(*session);

  std::string line;
  while (readLine(line)) {
    if (line.empty()) continue;

    rapidjson::Document doc;
    doc.Parse(line.c_str());
    if (doc.HasParseError() || !doc.IsObject()) {
      px::CmdResult bad;
      bad.ok = false;
      bad.err = {"BAD_COMMAND", "invalid JSON object", "{}"};
      writeLine(px::CommandProcessor::resultJson(bad));
      continue;
    }

    const bool isGridQuery = doc.HasMember("cmd") && doc["cmd"].IsString() &&
                             std::strcmp(doc["cmd"].GetString(), "getGrid") == 0;
    if (isGridQuery) {
      writeLine(px::CommandProcessor::resultJson(px::CmdResult{}, "grid", cp.gridJson()));
      continue;
    }

    px::CmdResult r = cp.applyJson(doc);

    const bool isExport = doc.HasMember("cmd") && doc["cmd"].IsString() &&
                          std::strcmp(doc["cmd"].GetString(), "export") == 0;
    if (r.ok && isExport) {
      const auto& exp = cp.lastExport();
      std::string path = exp.fileName;
      if (doc.HasMember("path") && doc["path"].IsString()) {
        path = doc["path"].GetString();
      }
      if (!px::writeBytes(path, exp.bytes)) {
        r.ok = false;
        r.err = {"EXPORT_FAILED", "could not write " + path, "{}"};
        writeLine(px::CommandProcessor::resultJson(r));
        continue;
      }
      writeLine(px::CommandProcessor::resultJson(r, "export", exportJson(path, exp)));
      continue;
    }

    writeLine(px::CommandProcessor::resultJson(r, "state", cp.stateJson()));
  }

  return 0;
}
