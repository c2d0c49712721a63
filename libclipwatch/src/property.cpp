/**
 * @file property.cpp
 * @brief Property payload decoding
 */

#include "clipwatch/property.h"

#include <utf8.h>

#include <cstdint>
#include <cstring>
#include <iterator>

namespace clipwatch {

// ============================================================================
// Decoding
// ============================================================================

Result<std::vector<AtomId>> decode_atom_list(const PropertyData &property) {
  if (property.format != 32) {
    return Error(ErrorCode::DecodeError, "Atom list must have format 32",
                 "format " + std::to_string(property.format));
  }

  const size_t needed = property.item_count * sizeof(unsigned long);
  if (property.data.size() < needed) {
    return Error(ErrorCode::DecodeError, "Atom list is truncated",
                 std::to_string(property.data.size()) + " of " +
                     std::to_string(needed) + " bytes");
  }

  std::vector<AtomId> atoms(property.item_count);
  if (!atoms.empty()) {
    std::memcpy(atoms.data(), property.data.data(), needed);
  }
  return atoms;
}

Result<std::string> decode_text(const PropertyData &property, bool latin1) {
  if (property.format != 8) {
    return Error(ErrorCode::DecodeError, "Text must have format 8",
                 "format " + std::to_string(property.format));
  }

  const auto *begin = reinterpret_cast<const char *>(property.data.data());
  size_t length = property.data.size();
  if (length > 0) {
    const void *nul = std::memchr(begin, '\0', length);
    if (nul) {
      length = static_cast<const char *>(nul) - begin;
    }
  }

  std::string text(begin, length);
  if (latin1) {
    return latin1_to_utf8(text);
  }

  if (!is_valid_utf8(text)) {
    return Error(ErrorCode::DecodeError, "Selection text is not valid UTF-8");
  }
  return text;
}

bool is_valid_utf8(const std::string &text) {
  return utf8::is_valid(text.begin(), text.end());
}

std::string latin1_to_utf8(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    // ISO 8859-1 bytes are the first 256 code points
    utf8::append(static_cast<uint32_t>(c), std::back_inserter(out));
  }
  return out;
}

// ============================================================================
// Construction
// ============================================================================

PropertyData make_atom_property(AtomId type, const std::vector<AtomId> &atoms) {
  PropertyData property;
  property.type = type;
  property.format = 32;
  property.item_count = atoms.size();
  property.data.resize(atoms.size() * sizeof(unsigned long));
  if (!atoms.empty()) {
    std::memcpy(property.data.data(), atoms.data(), property.data.size());
  }
  return property;
}

PropertyData make_text_property(AtomId type, const std::string &text) {
  PropertyData property;
  property.type = type;
  property.format = 8;
  property.item_count = text.size();
  property.data.assign(text.begin(), text.end());
  return property;
}

} // namespace clipwatch
