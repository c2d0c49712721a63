/**
 * @file atoms.h
 * @brief Atom interning and caching
 */

#ifndef CLIPWATCH_ATOMS_H
#define CLIPWATCH_ATOMS_H

#include "connection.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <string>
#include <unordered_map>

namespace clipwatch {

// ============================================================================
// Well-known Atom Names
// ============================================================================

namespace atom_names {
constexpr const char *kClipboard = "CLIPBOARD";
constexpr const char *kTargets = "TARGETS";
constexpr const char *kIncr = "INCR";
constexpr const char *kHtml = "text/html";
constexpr const char *kUtf8String = "UTF8_STRING";
constexpr const char *kText = "TEXT";
constexpr const char *kString = "STRING";
} // namespace atom_names

// ============================================================================
// Atom Registry
// ============================================================================

/**
 * @brief Interns protocol atoms once per connection
 *
 * The vocabulary is small and fixed, so the cache only grows and is never
 * evicted. Atom values are meaningless outside the connection they were
 * interned on.
 */
class CLIPWATCH_API AtomRegistry {
public:
  explicit AtomRegistry(ConnectionHandle &connection);

  /**
   * @brief Get the atom for a name, interning it on first use
   * @return Atom, or AtomInternFailed
   */
  Result<AtomId> intern(const std::string &name);

  /**
   * @brief Resolve an atom back to its name
   *
   * Not cached: target lists carry arbitrary atoms chosen by the owner.
   */
  Result<std::string> name_of(AtomId atom);

  /// Number of cached names
  size_t size() const { return cache_.size(); }

private:
  ConnectionHandle &connection_;
  std::unordered_map<std::string, AtomId> cache_;
};

} // namespace clipwatch

#endif // CLIPWATCH_ATOMS_H
