// PDDL LSP server (stdio JSON-RPC)
//
// This is a thin wrapper around pddl::lsp::Workspace (serverless APIs).
// It implements the subset of LSP needed for completion and structural
// diagnostics.
//
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <pddl/basic/source_manager.hpp>
#include <pddl/lsp.hpp>
#include <pddl/project/project_config.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

using nlohmann::json;

namespace
{

struct DocState
{
  std::string uri;
  std::string text;
  std::vector<uint32_t> line_offsets;  // byte offsets of each line start
};

std::vector<uint32_t> build_line_offsets(std::string_view text)
{
  std::vector<uint32_t> offsets;
  offsets.push_back(0);
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      offsets.push_back(static_cast<uint32_t>(i + 1));
    }
  }
  return offsets;
}

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

int hex_to_int(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string url_decode(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      const int hi = hex_to_int(s[i + 1]);
      const int lo = hex_to_int(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

std::optional<std::string> file_uri_to_path(std::string_view uri)
{
  // Minimal file URI decoding for Linux/macOS paths, e.g. file:///home/user/domain.pddl
  if (!starts_with(uri, "file:")) {
    return std::nullopt;
  }

  std::string_view rest = uri.substr(std::string_view("file:").size());
  if (starts_with(rest, "///")) {
    rest = rest.substr(2);  // keep one leading slash
  } else if (starts_with(rest, "//")) {
    // file://hostname/path is not supported here.
    return std::nullopt;
  }

  return url_decode(rest);
}

int lsp_severity(std::string_view s)
{
  // LSP DiagnosticSeverity:
  // 1 Error, 2 Warning, 3 Information, 4 Hint
  if (s == "Error") return 1;
  if (s == "Warning") return 2;
  if (s == "Info") return 3;
  if (s == "Hint") return 4;
  return 3;
}

int completion_kind(std::string_view s)
{
  // LSP CompletionItemKind (subset)
  if (s == "Text") return 1;
  if (s == "Method") return 2;
  if (s == "Function") return 3;
  if (s == "Class") return 7;
  if (s == "Interface") return 8;
  if (s == "Module") return 9;
  if (s == "Property") return 10;
  if (s == "Unit") return 11;
  if (s == "Value") return 12;
  if (s == "Keyword") return 14;
  if (s == "Snippet") return 15;
  if (s == "Struct") return 22;
  if (s == "Event") return 23;
  if (s == "Operator") return 24;
  if (s == "TypeParameter") return 25;
  return 1;
}

int insert_text_format(std::string_view s)
{
  // LSP InsertTextFormat: 1 PlainText, 2 Snippet
  return s == "Snippet" ? 2 : 1;
}

json to_lsp_range_from_full_range(const json & fr)
{
  // FullSourceRange uses 1-indexed line/column; LSP uses 0-indexed.
  const int sl = std::max(0, fr.value("startLine", 1) - 1);
  const int sc = std::max(0, fr.value("startColumn", 1) - 1);
  const int el = std::max(0, fr.value("endLine", 1) - 1);
  const int ec = std::max(0, fr.value("endColumn", 1) - 1);

  return json{
    {"start", json{{"line", sl}, {"character", sc}}},
    {"end", json{{"line", el}, {"character", ec}}},
  };
}

/// Decode one UTF-8 code point at `i`: {code point, byte length}
std::pair<uint32_t, uint32_t> decode_utf8(std::string_view s, size_t i)
{
  const auto c0 = static_cast<unsigned char>(s[i]);
  if (c0 >= 0x80 && (c0 & 0xE0) == 0xC0 && i + 1 < s.size()) {
    return {((c0 & 0x1F) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3F), 2};
  }
  if (c0 >= 0x80 && (c0 & 0xF0) == 0xE0 && i + 2 < s.size()) {
    return {
      ((c0 & 0x0F) << 12) | ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 6) |
        (static_cast<unsigned char>(s[i + 2]) & 0x3F),
      3};
  }
  if (c0 >= 0x80 && (c0 & 0xF8) == 0xF0 && i + 3 < s.size()) {
    return {
      ((c0 & 0x07) << 18) | ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 12) |
        ((static_cast<unsigned char>(s[i + 2]) & 0x3F) << 6) |
        (static_cast<unsigned char>(s[i + 3]) & 0x3F),
      4};
  }
  return {c0, 1};
}

std::string_view line_slice(const DocState & doc, uint32_t line)
{
  const uint32_t line_start = doc.line_offsets[line];
  const uint32_t next_line_start = (line + 1 < doc.line_offsets.size())
                                     ? doc.line_offsets[line + 1]
                                     : static_cast<uint32_t>(doc.text.size());
  return std::string_view(doc.text).substr(line_start, next_line_start - line_start);
}

std::optional<uint32_t> utf8_position_to_byte_offset(
  const DocState & doc, uint32_t line, uint32_t character)
{
  if (doc.line_offsets.empty()) {
    return std::nullopt;
  }
  if (line >= doc.line_offsets.size()) {
    return static_cast<uint32_t>(doc.text.size());
  }

  const auto slice = line_slice(doc, line);
  return doc.line_offsets[line] + std::min<uint32_t>(character, static_cast<uint32_t>(slice.size()));
}

std::optional<uint32_t> utf16_position_to_byte_offset(
  const DocState & doc, uint32_t line, uint32_t character)
{
  if (doc.line_offsets.empty()) {
    return std::nullopt;
  }
  if (line >= doc.line_offsets.size()) {
    return static_cast<uint32_t>(doc.text.size());
  }

  const auto slice = line_slice(doc, line);

  uint32_t utf16_units = 0;
  uint32_t byte_index = 0;
  while (byte_index < slice.size() && utf16_units < character) {
    const auto [cp, nbytes] = decode_utf8(slice, byte_index);
    const uint32_t units = (cp <= 0xFFFF) ? 1U : 2U;
    if (utf16_units + units > character) {
      // Target is inside this code point; clamp to current byte index.
      break;
    }
    utf16_units += units;
    byte_index += nbytes;
  }

  return doc.line_offsets[line] + std::min<uint32_t>(byte_index, static_cast<uint32_t>(slice.size()));
}

/// UTF-16 code units between the start of the line and `byte_offset`
uint32_t utf16_column(std::string_view line_prefix)
{
  uint32_t units = 0;
  size_t i = 0;
  while (i < line_prefix.size()) {
    const auto [cp, nbytes] = decode_utf8(line_prefix, i);
    units += (cp <= 0xFFFF) ? 1U : 2U;
    i += nbytes;
  }
  return units;
}

void write_message(const json & msg)
{
  const std::string body = msg.dump();
  std::cout << "Content-Length: " << body.size() << "\r\n\r\n";
  std::cout << body;
  std::cout.flush();
}

std::optional<json> read_message()
{
  std::string line;
  size_t content_length = 0;
  bool saw_length = false;

  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      break;
    }

    const std::string_view sv(line);
    if (starts_with(sv, "Content-Length:")) {
      const std::string_view rest = sv.substr(std::string_view("Content-Length:").size());
      content_length = static_cast<size_t>(std::strtoul(std::string(rest).c_str(), nullptr, 10));
      saw_length = true;
    }
  }

  if (!saw_length || content_length == 0) {
    // Ignore malformed message.
    return std::nullopt;
  }

  std::string body(content_length, '\0');
  std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
  if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }

  json parsed = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

std::string id_key(const json & id) { return id.dump(); }

bool is_queued_request(const std::deque<json> & queue, const std::string & key)
{
  return std::any_of(queue.begin(), queue.end(), [&key](const json & msg) {
    return msg.contains("id") && msg.contains("method") && id_key(msg["id"]) == key;
  });
}

/**
 * Messages already sitting in the stdin buffer, read without blocking.
 *
 * A `$/cancelRequest` is recorded only while its request is still queued, so
 * that request is answered with RequestCancelled. Cancellations of requests
 * that were already answered are dropped.
 */
void drain_buffered_messages(std::deque<json> & queue, std::unordered_set<std::string> & cancelled)
{
  while (std::cin.rdbuf()->in_avail() > 0) {
    auto msg = read_message();
    if (!msg) {
      return;
    }
    if (msg->value("method", "") == "$/cancelRequest") {
      const auto params = msg->value("params", json::object());
      if (params.contains("id")) {
        auto key = id_key(params["id"]);
        if (is_queued_request(queue, key)) {
          cancelled.insert(std::move(key));
        }
      }
      continue;
    }
    queue.push_back(std::move(*msg));
  }
}

/// `completion.job_scheduling` from the pddl.yaml above the workspace root, if any
std::optional<bool> job_scheduling_from_project(const json & params)
{
  std::optional<std::string> root;
  if (params.contains("rootUri") && params["rootUri"].is_string()) {
    root = file_uri_to_path(params["rootUri"].get<std::string>());
  }
  if (!root) {
    return std::nullopt;
  }

  const auto config_path = pddl::find_project_config(*root);
  if (!config_path) {
    return std::nullopt;
  }
  const auto result = pddl::load_project_config(*config_path);
  if (!result.success) {
    std::cerr << "pddl_lsp_server: " << result.error << "\n";
    return std::nullopt;
  }
  return result.config.completion.job_scheduling;
}

}  // namespace

int main()
{
  try {
    std::ios::sync_with_stdio(false);

    pddl::lsp::Workspace ws;

    std::unordered_map<std::string, DocState> docs;
    std::string negotiated_position_encoding = "utf-16";

    std::deque<json> pending;
    std::unordered_set<std::string> cancelled_ids;

    auto upsert_doc = [&](const std::string & uri, const std::string & text) -> DocState & {
      auto & d = docs[uri];
      d.uri = uri;
      d.text = text;
      d.line_offsets = build_line_offsets(d.text);
      ws.set_document(uri, text);
      return d;
    };

    auto publish_diagnostics = [&](const DocState & doc) {
      const json dj = json::parse(ws.diagnostics_json(doc.uri));

      json lsp_diags = json::array();
      for (const auto & it : dj.value("items", json::array())) {
        if (!it.is_object()) continue;
        json d0;
        d0["message"] = it.value("message", "");
        d0["severity"] = lsp_severity(it.value("severity", "Info"));
        d0["source"] = it.value("source", "pddl");
        if (it.contains("code") && it["code"].is_string()) {
          d0["code"] = it["code"];
        }
        if (it.contains("range") && it["range"].is_object()) {
          d0["range"] = to_lsp_range_from_full_range(it["range"]);
        } else {
          d0["range"] = json{
            {"start", json{{"line", 0}, {"character", 0}}},
            {"end", json{{"line", 0}, {"character", 0}}}};
        }
        lsp_diags.push_back(std::move(d0));
      }

      json notif;
      notif["jsonrpc"] = "2.0";
      notif["method"] = "textDocument/publishDiagnostics";
      notif["params"] = json{{"uri", doc.uri}, {"diagnostics", lsp_diags}};
      write_message(notif);
    };

    auto pos_to_byte_offset = [&](const DocState & doc, const json & pos) -> uint32_t {
      const auto line = pos.value<uint32_t>("line", 0U);
      const auto character = pos.value<uint32_t>("character", 0U);

      if (negotiated_position_encoding == "utf-16") {
        if (auto off = utf16_position_to_byte_offset(doc, line, character)) {
          return *off;
        }
        return 0;
      }

      if (auto off = utf8_position_to_byte_offset(doc, line, character)) {
        return *off;
      }
      return 0;
    };

    auto byte_offset_to_lsp_position = [&](const DocState & doc, uint32_t byte_offset) -> json {
      const pddl::SourceManager sm(doc.text);
      const auto lc = sm.get_line_column(byte_offset);
      const int line = std::max(0, static_cast<int>(lc.line) - 1);
      int col = std::max(0, static_cast<int>(lc.column) - 1);
      if (negotiated_position_encoding == "utf-16" && lc.line > 0) {
        const uint32_t line_start = doc.line_offsets[lc.line - 1];
        col = static_cast<int>(utf16_column(
          std::string_view(doc.text).substr(line_start, byte_offset - line_start)));
      }
      return json{{"line", line}, {"character", col}};
    };

    auto byte_range_to_lsp_range = [&](const DocState & doc, uint32_t sb, uint32_t eb) -> json {
      return json{
        {"start", byte_offset_to_lsp_position(doc, sb)},
        {"end", byte_offset_to_lsp_position(doc, eb)},
      };
    };

    bool running = true;
    while (running) {
      if (pending.empty()) {
        auto msg_opt = read_message();
        if (!msg_opt) {
          if (!std::cin.good()) {
            break;
          }
          continue;
        }
        pending.push_back(std::move(*msg_opt));
        // Pick up any $/cancelRequest that arrived together with this request.
        drain_buffered_messages(pending, cancelled_ids);
      }

      const json msg = std::move(pending.front());
      pending.pop_front();

      const std::string method = msg.value("method", "");
      const bool is_request = msg.contains("id");

      auto respond = [&](const json & id, const json & result) {
        json resp;
        resp["jsonrpc"] = "2.0";
        resp["id"] = id;
        resp["result"] = result;
        write_message(resp);
      };

      auto respond_error = [&](const json & id, int code, std::string message) {
        json resp;
        resp["jsonrpc"] = "2.0";
        resp["id"] = id;
        resp["error"] = json{{"code", code}, {"message", std::move(message)}};
        write_message(resp);
      };

      const json params = msg.value("params", json::object());

      // Read while nothing was queued: its request has been answered already.
      if (method == "$/cancelRequest") {
        continue;
      }

      if (is_request && cancelled_ids.erase(id_key(msg["id"])) > 0) {
        respond_error(msg["id"], -32800, "Request cancelled");
        continue;
      }

      if (method == "initialize" && is_request) {
        // Determine position encoding (UTF-16 unless the client offers UTF-8)
        negotiated_position_encoding = "utf-16";
        const auto caps_in = params.value("capabilities", json::object());
        const auto general = caps_in.value("general", json::object());
        for (const auto & e : general.value("positionEncodings", json::array())) {
          if (e.is_string() && e.get<std::string>() == "utf-8") {
            negotiated_position_encoding = "utf-8";
          }
        }

        pddl::lsp::CompletionOptions options;
        if (const auto from_project = job_scheduling_from_project(params)) {
          options.job_scheduling = *from_project;
        }
        const auto init_opts = params.value("initializationOptions", json::object());
        if (init_opts.is_object() && init_opts.contains("jobScheduling")) {
          options.job_scheduling = init_opts.value("jobScheduling", false);
        }
        ws.set_options(options);

        json caps;
        caps["positionEncoding"] = negotiated_position_encoding;
        caps["textDocumentSync"] = json{{"openClose", true}, {"change", 1}};  // Full sync
        caps["completionProvider"] = json{
          {"resolveProvider", false},
          {"triggerCharacters", json::array({"(", ":", "?", "-"})},
        };

        const json result = json{
          {"capabilities", caps},
          {"serverInfo", json{{"name", "pddl_lsp_server"}}},
        };
        respond(msg["id"], result);
        continue;
      }

      if (method == "initialized") {
        // no-op
        continue;
      }

      if (method == "shutdown" && is_request) {
        respond(msg["id"], json());
        continue;
      }

      if (method == "exit") {
        running = false;
        continue;
      }

      if (method == "textDocument/didOpen") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        const std::string text = td.value("text", "");
        if (!uri.empty()) {
          publish_diagnostics(upsert_doc(uri, text));
        }
        continue;
      }

      if (method == "textDocument/didChange") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (uri.empty()) {
          continue;
        }

        // Full sync: take first change text
        const auto changes = params.value("contentChanges", json::array());
        if (!changes.is_array() || changes.empty()) {
          continue;
        }
        const auto & c0 = changes.at(0);
        if (!c0.is_object() || !c0.contains("text") || !c0["text"].is_string()) {
          continue;
        }

        publish_diagnostics(upsert_doc(uri, c0["text"].get<std::string>()));
        continue;
      }

      if (method == "textDocument/didClose") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (!uri.empty()) {
          ws.remove_document(uri);
          docs.erase(uri);

          // Clear diagnostics on close
          json notif;
          notif["jsonrpc"] = "2.0";
          notif["method"] = "textDocument/publishDiagnostics";
          notif["params"] = json{{"uri", uri}, {"diagnostics", json::array()}};
          write_message(notif);
        }
        continue;
      }

      if (method == "textDocument/completion" && is_request) {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        const auto pos = params.value("position", json::object());
        auto it = docs.find(uri);
        if (it == docs.end()) {
          respond(msg["id"], json{{"isIncomplete", false}, {"items", json::array()}});
          continue;
        }
        const DocState & doc = it->second;

        // LSP CompletionTriggerKind: 1 Invoked, 2 TriggerCharacter, 3 re-trigger
        pddl::lsp::CompletionRequest request;
        request.offset = pos_to_byte_offset(doc, pos);
        const auto context = params.value("context", json::object());
        if (context.value("triggerKind", 1) == 2) {
          request.trigger_kind = pddl::lsp::TriggerKind::TriggerCharacter;
        }
        const std::string trigger = context.value("triggerCharacter", "");
        if (!trigger.empty()) {
          request.trigger_character = trigger.front();
        }

        const json cj = json::parse(ws.completion_json(uri, request));

        json items = json::array();
        for (const auto & it0 : cj.value("items", json::array())) {
          if (!it0.is_object()) continue;
          const std::string label = it0.value("label", "");
          const std::string insert = it0.value("insertText", label);

          json item;
          item["label"] = label;
          item["kind"] = completion_kind(it0.value("kind", "Text"));
          if (it0.contains("detail")) {
            item["detail"] = it0["detail"];
          }
          if (it0.contains("documentation")) {
            item["documentation"] = json{{"kind", "markdown"}, {"value", it0["documentation"]}};
          }
          item["insertTextFormat"] = insert_text_format(it0.value("insertTextFormat", "PlainText"));
          if (it0.contains("filterText")) {
            item["filterText"] = it0["filterText"];
          }
          if (it0.contains("sortText")) {
            item["sortText"] = it0["sortText"];
          }

          // textEdit: replaceRange is in bytes (absolute)
          if (it0.contains("replaceRange") && it0["replaceRange"].is_object()) {
            const auto sb = it0["replaceRange"].value<uint32_t>("startByte", 0U);
            const auto eb = it0["replaceRange"].value<uint32_t>("endByte", 0U);
            item["textEdit"] = json{
              {"range", byte_range_to_lsp_range(doc, sb, eb)},
              {"newText", insert},
            };
          } else {
            item["insertText"] = insert;
          }

          items.push_back(std::move(item));
        }

        const json result =
          json{{"isIncomplete", cj.value("isIncomplete", false)}, {"items", items}};
        respond(msg["id"], result);
        continue;
      }

      // Unknown method
      if (is_request) {
        respond_error(msg["id"], -32601, "Method not found");
      }
    }

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "pddl_lsp_server: fatal error: " << e.what() << "\n";
    return 1;
  }
}
