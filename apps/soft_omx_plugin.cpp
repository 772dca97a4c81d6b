// Software codec provider built as a loadable plugin.
#include "omx/plugin_loader.hpp"
#include "omx/provider.hpp"

#include <string>
#include <vector>

namespace {

class SoftOmxProvider : public omx::Provider {
public:
    std::string name() const override { return "soft-omx"; }
    std::vector<std::string> list_nodes() const override {
        return {
            "OMX.soft.aac.decoder",
            "OMX.soft.aac.encoder",
            "OMX.soft.avc.decoder",
            "OMX.soft.vp9.decoder",
        };
    }
};

} // namespace

extern "C" omx::Provider* codecstore_create_provider() {
    return new SoftOmxProvider;
}
