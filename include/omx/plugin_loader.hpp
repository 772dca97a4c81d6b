#pragma once
#include "omx/provider.hpp"
#include <memory>
#include <string>

#ifdef __cplusplus
extern "C" {
#endif

// Entry point every provider plugin exports. Ownership of the returned
// provider passes to the caller.
omx::Provider* codecstore_create_provider();

#ifdef __cplusplus
}
#endif

namespace omx {

inline constexpr const char kCreateProviderSymbol[] = "codecstore_create_provider";

// dlopen()s a provider plugin and instantiates its provider. The library stays
// loaded for as long as the returned handle lives. Null on failure.
std::shared_ptr<Provider> load_provider_plugin(const std::string& path);

} // namespace omx
