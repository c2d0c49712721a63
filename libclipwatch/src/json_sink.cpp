/**
 * @file json_sink.cpp
 * @brief JSON history file sink implementation
 */

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "clipwatch/json_sink.h"
#include "clipwatch/log.h"

namespace fs = ::std::filesystem;

namespace clipwatch {

namespace {

constexpr const char *kComponent = "json-sink";

nlohmann::json optional_to_json(const std::optional<std::string> &value) {
  if (value) {
    return *value;
  }
  return nullptr;
}

nlohmann::json record_to_json(const ClipboardRecord &record) {
  nlohmann::json data;
  data["content"] = record_content(record);
  data["owner"] = optional_to_json(record_owner(record));
  if (const auto *html = std::get_if<HtmlRecord>(&record)) {
    data["url"] = optional_to_json(html->url);
  }
  data["created_at"] = format_rfc3339(record_created_at(record));

  nlohmann::json entry;
  entry["type"] = record_type_name(record);
  entry["data"] = std::move(data);
  return entry;
}

Result<nlohmann::json> load_history(const fs::path &path) {
  std::error_code ec;
  const auto status = fs::status(path, ec);
  if (status.type() == fs::file_type::not_found) {
    return nlohmann::json::array();
  }
  if (ec || !fs::is_regular_file(status)) {
    return Error(ErrorCode::FileReadError,
                 "History path is not a regular file", path.string());
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return nlohmann::json::array();
  }

  auto history = nlohmann::json::parse(file, nullptr, false);
  if (history.is_discarded() || !history.is_array()) {
    CLIPWATCH_LOG_WARN(kComponent, "ignoring malformed history in "
                                       << path.string());
    return nlohmann::json::array();
  }
  return history;
}

} // namespace

std::string format_rfc3339(Timestamp timestamp) {
  using namespace std::chrono;

  const auto since_epoch = timestamp.time_since_epoch();
  auto secs = duration_cast<seconds>(since_epoch);
  auto micros = duration_cast<microseconds>(since_epoch - secs).count();
  if (micros < 0) {
    secs -= seconds(1);
    micros += 1000000;
  }

  const std::time_t t = static_cast<std::time_t>(secs.count());
  std::tm utc{};
  gmtime_r(&t, &utc);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

  char out[48];
  std::snprintf(out, sizeof(out), "%s.%06lldZ", date,
                static_cast<long long>(micros));
  return out;
}

JsonFileSink::JsonFileSink(fs::path path) : path_(std::move(path)) {}

Result<void> JsonFileSink::append(const ClipboardRecord &record) {
  std::error_code ec;
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
      return Error(ErrorCode::FileWriteError,
                   "Cannot create history directory", ec.message());
    }
  }

  auto loaded = load_history(path_);
  if (loaded.is_error()) {
    return loaded.error();
  }
  nlohmann::json history = std::move(loaded.value());
  history.push_back(record_to_json(record));

  // Window titles are not guaranteed to be UTF-8
  const std::string text =
      history.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);

  fs::path tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream file(tmp, std::ios::trunc);
    if (!file.is_open()) {
      return Error(ErrorCode::FileWriteError, "Cannot open history file",
                   tmp.string());
    }
    file << text << '\n';
    file.flush();
    if (!file) {
      return Error(ErrorCode::FileWriteError, "Short write to history file",
                   tmp.string());
    }
  }

  fs::rename(tmp, path_, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return Error(ErrorCode::FileWriteError, "Cannot replace history file",
                 path_.string());
  }

  CLIPWATCH_LOG_DEBUG(kComponent, "history now holds " << history.size()
                                                       << " records");
  return Result<void>::ok();
}

ClipboardSink JsonFileSink::as_sink() {
  return [this](const ClipboardRecord &record) { return append(record); };
}

} // namespace clipwatch
