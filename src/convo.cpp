#include "convo/convo.hpp"

#include "core/version.hpp"

namespace convo {

std::string version() {
  return CONVO_VERSION_STRING;
}

}  // namespace convo
