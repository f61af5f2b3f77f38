#include "runtime_gateway.h"

namespace stackctl {

std::string_view image_removal_name(image_removal policy) {
  switch (policy) {
    case image_removal::none: return "";
    case image_removal::all: return "all";
    case image_removal::local: return "local";
  }
  return "";
}

}  // namespace stackctl
