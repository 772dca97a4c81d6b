#include "omx/plugin_loader.hpp"
#include "codecstore/reporting.hpp"
#include <dlfcn.h>

namespace omx {

using codecstore::reporting::debug;
using codecstore::reporting::error;

std::shared_ptr<Provider> load_provider_plugin(const std::string& path) {
    void* raw = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!raw) {
        error("plugin", std::string("dlopen failed: ") + dlerror());
        return nullptr;
    }
    std::shared_ptr<void> handle(raw, [](void* h) { dlclose(h); });

    using create_fn = Provider* (*)();
    auto create = reinterpret_cast<create_fn>(dlsym(raw, kCreateProviderSymbol));
    if (!create) {
        error("plugin", path + ": failed to resolve " + kCreateProviderSymbol);
        return nullptr;
    }

    Provider* provider = create();
    if (!provider) {
        error("plugin", path + ": " + kCreateProviderSymbol + " returned null");
        return nullptr;
    }
    debug("plugin", "loaded provider '" + provider->name() + "' from " + path);

    // The deleter keeps the library mapped until the provider is gone.
    return std::shared_ptr<Provider>(provider, [handle](Provider* p) { delete p; });
}

} // namespace omx
