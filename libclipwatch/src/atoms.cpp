/**
 * @file atoms.cpp
 * @brief Atom registry implementation
 */

#include "clipwatch/atoms.h"

namespace clipwatch {

AtomRegistry::AtomRegistry(ConnectionHandle &connection)
    : connection_(connection) {}

Result<AtomId> AtomRegistry::intern(const std::string &name) {
  auto it = cache_.find(name);
  if (it != cache_.end()) {
    return it->second;
  }

  auto atom = connection_.transport().intern_atom(name);
  if (atom.is_error()) {
    return Error(ErrorCode::AtomInternFailed, "Could not intern " + name,
                 atom.error().to_string());
  }
  if (atom.value() == kNone) {
    return Error(ErrorCode::AtomInternFailed, "Server returned None for " +
                                                  name);
  }

  cache_.emplace(name, atom.value());
  return atom.value();
}

Result<std::string> AtomRegistry::name_of(AtomId atom) {
  if (atom == kNone) {
    return Error(ErrorCode::InvalidArgument, "Cannot resolve None");
  }
  return connection_.transport().atom_name(atom);
}

} // namespace clipwatch
