#include "warden/waivers.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <regex>
#include <sstream>

#include "warden/fsutil.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/outline.hpp"
#include "warden/version.hpp"

namespace fs = std::filesystem;

namespace warden {

namespace {

const char* kGenesisDigest = "0000000000000000000000000000000000000000000000000000000000000000";

std::int64_t now_unix() {
  using SC = std::chrono::system_clock;
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(SC::now().time_since_epoch()).count());
}

std::uint64_t as_u64(std::int64_t v) { return v > 0 ? static_cast<std::uint64_t>(v) : 0; }

std::string record_line(const Waiver& w, std::uint64_t seq, const std::string& prev) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["seq"] = Value{seq};
  o["prev"] = Value{prev};
  o["v"] = Value{static_cast<std::uint64_t>(version::LEDGER_FORMAT_VERSION)};
  o["tf_id"] = Value{w.tf_id};
  o["scope"] = Value{w.scope};
  o["context"] = Value{w.context};
  o["rationale"] = Value{w.rationale};
  o["source"] = Value{w.source};
  o["expires_unix"] = Value{as_u64(w.expires_unix)};
  o["recorded_unix"] = Value{as_u64(w.recorded_unix)};
  return jsonlite::to_json(Value{o});
}

struct ParsedRecord {
  Waiver waiver;
  std::uint64_t seq{0};
  std::string prev;
};

std::optional<ParsedRecord> parse_record(const std::string& line, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const auto o = jsonlite::parse(line, &err);
  if (err) {
    *error = err->code + ": " + err->message;
    return std::nullopt;
  }
  if (jsonlite::get_u64(o, "v", 0) > version::LEDGER_FORMAT_VERSION) {
    *error = "unsupported ledger version";
    return std::nullopt;
  }
  ParsedRecord r;
  r.seq = jsonlite::get_u64(o, "seq", 0);
  r.prev = jsonlite::get_string(o, "prev", "");
  r.waiver.tf_id = jsonlite::get_string(o, "tf_id", "");
  r.waiver.scope = jsonlite::get_string(o, "scope", "*");
  r.waiver.context = jsonlite::get_string(o, "context", "*");
  r.waiver.rationale = jsonlite::get_string(o, "rationale", "");
  r.waiver.source = jsonlite::get_string(o, "source", "");
  r.waiver.expires_unix = static_cast<std::int64_t>(jsonlite::get_u64(o, "expires_unix", 0));
  r.waiver.recorded_unix = static_cast<std::int64_t>(jsonlite::get_u64(o, "recorded_unix", 0));
  if (r.waiver.tf_id.empty() || r.seq == 0) {
    *error = "record without tf_id or seq";
    return std::nullopt;
  }
  return r;
}

}  // namespace

// ---------------------------------------------------------------------------
// Activity
// ---------------------------------------------------------------------------

bool scope_matches(const std::string& scope, const std::string& file) {
  if (scope.empty() || scope == "*" || scope == "**") return true;
  return glob_match(scope, file);
}

bool waiver_is_active(const Waiver& w, const ChangeContext& ctx, std::int64_t now) {
  if (w.expires_unix != 0 && w.expires_unix <= now) return false;
  if (w.context != "*" && w.context != ctx.id) return false;
  if (scope_matches(w.scope, "")) return true;
  for (const auto& f : ctx.changed_files) {
    if (scope_matches(w.scope, f)) return true;
  }
  return false;
}

std::vector<Waiver> active_waivers(const std::vector<Waiver>& all, const ChangeContext& ctx,
                                   std::int64_t now) {
  std::vector<Waiver> out;
  for (const auto& w : all) {
    if (waiver_is_active(w, ctx, now)) out.push_back(w);
  }
  return out;
}

// ---------------------------------------------------------------------------
// WaiverLedger
// ---------------------------------------------------------------------------

struct WaiverLedger::Impl {
  mutable std::mutex mu;
  std::vector<Waiver> entries;
  std::uint64_t seq{0};
  std::string last_digest{kGenesisDigest};
  std::string load_error;
};

WaiverLedger::WaiverLedger(std::string path) : path_(std::move(path)), impl_(std::make_unique<Impl>()) {
  if (path_.empty()) return;
  std::string text;
  std::error_code ec;
  if (!fs::exists(path_, ec)) return;
  if (!read_file(path_, &text)) {
    impl_->load_error = "ledger unreadable";
    return;
  }
  std::istringstream in(text);
  std::string line;
  std::size_t n = 0;
  while (std::getline(in, line)) {
    ++n;
    if (line.empty()) continue;
    std::string error;
    auto rec = parse_record(line, &error);
    if (!rec) {
      if (impl_->load_error.empty()) impl_->load_error = "line " + std::to_string(n) + ": " + error;
      continue;
    }
    impl_->entries.push_back(std::move(rec->waiver));
    impl_->seq = std::max(impl_->seq, rec->seq);
    impl_->last_digest = blake3_hex(line);
  }
  if (!impl_->load_error.empty()) {
    report_issue(ErrorCode::waiver_unparseable, "", path_, impl_->load_error);
  }
}

WaiverLedger::~WaiverLedger() = default;

bool WaiverLedger::record(Waiver waiver) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (waiver.recorded_unix == 0) waiver.recorded_unix = now_unix();

  const std::uint64_t seq = impl_->seq + 1;
  const std::string line = record_line(waiver, seq, impl_->last_digest);

  if (!path_.empty()) {
    std::error_code ec;
    const fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    FILE* f = std::fopen(path_.c_str(), "a");
    if (!f) {
      report_issue(ErrorCode::io_error, waiver.tf_id, path_, "cannot open waiver ledger");
      return false;
    }
    std::fseek(f, 0, SEEK_END);
    const std::string final_line = line + "\n";
    const bool written = std::fwrite(final_line.data(), 1, final_line.size(), f) == final_line.size();
    const bool flushed = std::fflush(f) == 0;
    std::fclose(f);
    if (!written || !flushed) {
      report_issue(ErrorCode::io_error, waiver.tf_id, path_, "waiver ledger write failed");
      return false;
    }
  }

  impl_->seq = seq;
  impl_->last_digest = blake3_hex(line);
  impl_->entries.push_back(std::move(waiver));
  global_engine_stats().waivers_recorded.fetch_add(1, std::memory_order_relaxed);
  return true;
}

std::vector<Waiver> WaiverLedger::all() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entries;
}

std::vector<Waiver> WaiverLedger::active(const ChangeContext& ctx, std::int64_t now) const {
  return active_waivers(all(), ctx, now);
}

std::uint64_t WaiverLedger::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entries.size();
}

std::string WaiverLedger::load_error() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->load_error;
}

bool WaiverLedger::verify_chain(std::string* error) const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  auto fail = [&](const std::string& reason) {
    if (error) *error = reason;
    return false;
  };
  if (path_.empty()) return true;
  std::error_code ec;
  if (!fs::exists(path_, ec)) return true;
  std::string text;
  if (!read_file(path_, &text)) return fail("ledger unreadable");

  std::istringstream in(text);
  std::string line;
  std::string prev = kGenesisDigest;
  std::uint64_t expected_seq = 1;
  std::size_t n = 0;
  while (std::getline(in, line)) {
    ++n;
    if (line.empty()) return fail("line " + std::to_string(n) + ": empty record");
    std::string perr;
    auto rec = parse_record(line, &perr);
    if (!rec) return fail("line " + std::to_string(n) + ": " + perr);
    if (rec->seq != expected_seq) {
      return fail("line " + std::to_string(n) + ": sequence " + std::to_string(rec->seq) + ", expected " +
                  std::to_string(expected_seq));
    }
    if (rec->prev != prev) return fail("line " + std::to_string(n) + ": chain digest mismatch");
    prev = blake3_hex(line);
    ++expected_seq;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Waiver documents
// ---------------------------------------------------------------------------

std::optional<std::int64_t> parse_iso_date(const std::string& text) {
  static const std::regex re(R"(^(\d{4})-(\d{2})-(\d{2})$)");
  std::smatch m;
  if (!std::regex_match(text, m, re)) return std::nullopt;
  const int y = std::stoi(m[1].str());
  const unsigned mo = static_cast<unsigned>(std::stoi(m[2].str()));
  const unsigned d = static_cast<unsigned>(std::stoi(m[3].str()));
  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{mo}, std::chrono::day{d}};
  if (!ymd.ok()) return std::nullopt;
  const std::chrono::sys_days days{ymd};
  return static_cast<std::int64_t>(days.time_since_epoch().count()) * 86400;
}

std::string waiver_document_path(const std::string& pattern, const std::string& context) {
  std::string out = pattern;
  const std::string token = "{context}";
  for (std::size_t pos = out.find(token); pos != std::string::npos; pos = out.find(token, pos + context.size())) {
    out.replace(pos, token.size(), context);
  }
  return out;
}

WaiverDocument parse_waiver_document(const std::string& text, const std::string& context,
                                     const std::string& source) {
  static const std::regex key_re(R"(^([A-Za-z_]+)\s*:\s*(.*)$)");
  static const std::regex id_re(R"(^[A-Z]+-[0-9]{3}$)");

  WaiverDocument doc;
  std::optional<Waiver> current;
  bool discarding = false;
  auto flush = [&]() {
    if (current) doc.waivers.push_back(std::move(*current));
    current.reset();
  };
  auto warn = [&](std::size_t n, const std::string& reason) {
    doc.warnings.push_back("line " + std::to_string(n) + ": " + reason);
  };

  const auto lines = split_lines(text, nullptr);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const std::size_t n = i + 1;
    std::string line = trim(lines[i]);
    if (line.empty() || line[0] == '#') continue;
    if (line.size() >= 2 && (line[0] == '-' || line[0] == '*') && line[1] == ' ') line = trim(line.substr(2));
    // Markdown emphasis around the key ("**tf_id**: X").
    if (line.rfind("**", 0) == 0) {
      const auto close = line.find("**", 2);
      if (close != std::string::npos) line = line.substr(2, close - 2) + line.substr(close + 2);
    }

    std::smatch m;
    if (std::regex_match(line, m, key_re)) {
      std::string key = m[1].str();
      for (auto& c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      const std::string value = trim(m[2].str());

      if (key == "tf_id") {
        flush();
        if (!std::regex_match(value, id_re)) {
          warn(n, "malformed tf_id '" + value + "'");
          discarding = true;
          continue;
        }
        discarding = false;
        Waiver w;
        w.tf_id = value;
        w.context = context.empty() ? "*" : context;
        w.source = source;
        current = std::move(w);
        continue;
      }
      if (key == "scope" || key == "expires" || key == "rationale") {
        if (discarding) continue;
        if (!current) {
          warn(n, "'" + key + ":' outside a waiver");
          continue;
        }
        if (key == "scope") {
          current->scope = value.empty() ? "*" : normalize_rel_path(value);
        } else if (key == "expires") {
          auto day = parse_iso_date(value);
          if (!day) {
            warn(n, "malformed date '" + value + "', waiver " + current->tf_id + " dropped");
            current.reset();
            discarding = true;
            continue;
          }
          current->expires_unix = *day + 86400;
        } else {
          current->rationale = value;
        }
        continue;
      }
      warn(n, "unknown key '" + key + ":'");
      continue;
    }

    if (discarding) continue;
    if (!current) {
      warn(n, "text outside a waiver");
      continue;
    }
    if (!current->rationale.empty()) current->rationale += " ";
    current->rationale += line;
  }
  flush();
  return doc;
}

}  // namespace warden
