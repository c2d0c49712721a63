/**
 * @file record.cpp
 * @brief Clipboard record helpers
 */

#include "clipwatch/record.h"
#include "clipwatch/atoms.h"
#include <chrono>

namespace clipwatch {

const char *record_type_name(const ClipboardRecord &record) {
  return std::holds_alternative<HtmlRecord>(record) ? "html" : "text";
}

const std::string &record_content(const ClipboardRecord &record) {
  return std::visit(
      [](const auto &r) -> const std::string & { return r.content; }, record);
}

const std::optional<std::string> &record_owner(const ClipboardRecord &record) {
  return std::visit(
      [](const auto &r) -> const std::optional<std::string> & {
        return r.owner;
      },
      record);
}

Timestamp record_created_at(const ClipboardRecord &record) {
  return std::visit([](const auto &r) { return r.created_at; }, record);
}

ClipboardRecord make_record(const std::string &target, std::string content,
                            std::optional<std::string> owner) {
  const Timestamp now = std::chrono::system_clock::now();

  if (target == atom_names::kHtml) {
    HtmlRecord html;
    html.content = std::move(content);
    html.owner = std::move(owner);
    html.created_at = now;
    return html;
  }

  UnicodeTextRecord text;
  text.content = std::move(content);
  text.owner = std::move(owner);
  text.created_at = now;
  return text;
}

} // namespace clipwatch
