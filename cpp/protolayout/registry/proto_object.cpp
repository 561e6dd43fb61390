#include "protolayout/registry/proto_object.h"

#include "protolayout/core/errors.h"
#include "protolayout/registry/pid.h"
#include "protolayout/registry/proto_registry.h"

#include <utility>

namespace protolayout {

ProtoObject::ProtoObject(ProtoClass cls, std::string pid) : cls_(cls) {
    if (pid.empty()) {
        pid_ = issuePid(cls);
        return;
    }
    const ParsedPid parsed = parsePid(pid);
    if (parsed.cls != cls) {
        throw RegistryError("PID '" + pid + "' does not carry the '" + std::string(protoClassPrefix(cls))
            + "' prefix required for " + std::string(protoClassName(cls)));
    }
    pid_ = std::move(pid);
}

ProtoObject::~ProtoObject() {
    if (registry_) registry_->forget(pid_);
}

void ProtoObject::forEachChild(const std::function<void(ProtoObject&)>&) {}

std::shared_ptr<ProtoObject> ProtoObject::detachReferences() {
    return nullptr;
}

} // namespace protolayout
