/**
 * @file property.h
 * @brief Decoding of selection property payloads
 */

#ifndef CLIPWATCH_PROPERTY_H
#define CLIPWATCH_PROPERTY_H

#include "error.h"
#include "platform.h"
#include "transport.h"
#include "types.h"
#include <string>
#include <vector>

namespace clipwatch {

// ============================================================================
// Decoding
// ============================================================================

/**
 * @brief Decode a format-32 property as a list of atoms
 * @return Atoms, or DecodeError if the format is not 32
 */
CLIPWATCH_API Result<std::vector<AtomId>>
decode_atom_list(const PropertyData &property);

/**
 * @brief Decode a format-8 property as UTF-8 text
 *
 * The buffer is cut at the first NUL byte. When `latin1` is set the bytes
 * are ISO 8859-1 (the STRING type) and are converted; otherwise they must
 * already be valid UTF-8.
 *
 * @return Text, or DecodeError
 */
CLIPWATCH_API Result<std::string> decode_text(const PropertyData &property,
                                              bool latin1 = false);

/// Check that a byte string is well-formed UTF-8
CLIPWATCH_API bool is_valid_utf8(const std::string &text);

/// Convert ISO 8859-1 bytes to UTF-8
CLIPWATCH_API std::string latin1_to_utf8(const std::string &text);

// ============================================================================
// Construction
// ============================================================================

/// Build a format-32 property holding `atoms`
CLIPWATCH_API PropertyData make_atom_property(AtomId type,
                                              const std::vector<AtomId> &atoms);

/// Build a format-8 property holding `text`
CLIPWATCH_API PropertyData make_text_property(AtomId type,
                                              const std::string &text);

} // namespace clipwatch

#endif // CLIPWATCH_PROPERTY_H
