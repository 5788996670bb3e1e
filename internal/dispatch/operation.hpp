#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace fleet::dispatch {

enum class OperationKind {
  kProvision,
  kDestroy,
  kRotate,
};

constexpr std::string_view ToString(OperationKind kind) {
  switch (kind) {
    case OperationKind::kProvision:
      return "provision";
    case OperationKind::kDestroy:
      return "destroy";
    case OperationKind::kRotate:
      return "rotate";
  }
  return "unknown";
}

/*
  Unit of lifecycle work submitted by a fleet controller.
  Exactly one of run / cancel is invoked: run on an executor thread once a slot
  is free, cancel when the operation is dropped before it started.
*/
struct Operation {
  std::string           fleet;
  OperationKind         kind = OperationKind::kProvision;
  std::function<void()> run;
  std::function<void()> cancel;
};

} // namespace fleet::dispatch
