#include "conduit/application-config.hpp"

#include <algorithm>

#include "conduit/compose.hpp"
#include "conduit/errors.hpp"

namespace conduit {

void ApplicationConfig::validate() const {
  router.validate();
  lifespan.validate();
  if (std::ranges::any_of(stages, [](const StageFactory& factory) { return !factory; })) {
    throw ConfigurationError("Cannot register empty stage factory");
  }
}

}  // namespace conduit
