/**
 * @file targets.cpp
 * @brief Target negotiation implementation
 */

#include "clipwatch/targets.h"
#include "clipwatch/log.h"
#include "clipwatch/property.h"
#include "selection_request.h"

namespace clipwatch {

namespace {
constexpr const char *kComponent = "targets";
}

TargetNegotiator::TargetNegotiator(ConnectionHandle &connection,
                                   AtomRegistry &atoms)
    : connection_(connection), atoms_(atoms) {}

Result<TargetSet> TargetNegotiator::negotiate(AtomId selection) {
  auto targets_atom = atoms_.intern(atom_names::kTargets);
  if (targets_atom.is_error()) {
    return targets_atom.error();
  }

  auto &transport = connection_.transport();
  if (!subscribed_) {
    transport.select_selection_notify(connection_.window());
    subscribed_ = true;
  }

  auto notify =
      detail::request_conversion(connection_, selection, targets_atom.value());
  if (notify.is_error()) {
    return notify.error();
  }
  if (notify.value().property == kNone) {
    return Error(ErrorCode::NoTargetsAvailable,
                 "Owner could not convert the selection to TARGETS");
  }

  auto info = transport.probe_property(connection_.window(),
                                       connection_.transfer_property());
  if (info.is_error()) {
    return info.error();
  }
  if (!info.value().exists()) {
    return Error(ErrorCode::NoTargetsAvailable,
                 "Owner did not write a TARGETS reply");
  }

  auto data = detail::read_reply(connection_, info.value());
  if (data.is_error()) {
    return data.error();
  }

  auto atoms = decode_atom_list(data.value());
  if (atoms.is_error()) {
    return atoms.error();
  }

  TargetSet targets;
  for (AtomId atom : atoms.value()) {
    if (atom == kNone) {
      continue;
    }
    auto name = atoms_.name_of(atom);
    if (name.is_error()) {
      CLIPWATCH_LOG_WARN(kComponent, "skipping unnamed target atom "
                                         << atom << ": "
                                         << name.error().to_string());
      continue;
    }
    targets.emplace(std::move(name).value(), atom);
  }

  if (targets.empty()) {
    return Error(ErrorCode::NoTargetsAvailable,
                 "Owner offered an empty target list");
  }

  CLIPWATCH_LOG_DEBUG(kComponent, "owner offers " << targets.size()
                                                  << " targets");
  return targets;
}

std::optional<std::string>
select_target(const TargetSet &targets,
              const std::vector<std::string> &priority) {
  for (const auto &name : priority) {
    if (targets.find(name) != targets.end()) {
      return name;
    }
  }
  return std::nullopt;
}

const std::vector<std::string> &default_target_priority() {
  static const std::vector<std::string> priority = {
      atom_names::kHtml, atom_names::kUtf8String, atom_names::kText};
  return priority;
}

} // namespace clipwatch
