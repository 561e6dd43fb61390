#ifndef PROTOLAYOUT_REGISTRY_PROTO_OBJECT_H
#define PROTOLAYOUT_REGISTRY_PROTO_OBJECT_H

#include "protolayout/registry/proto_class.h"

#include <functional>
#include <memory>
#include <string>

namespace protolayout {

class ProtoRegistry;

// Base of every object addressable by PID.
//
// Objects are identity-bearing and therefore non-copyable; duplication goes
// through cloneFresh(), which assigns new PIDs to every node of the copy.
// A registered object removes itself from its registry when destroyed.
class ProtoObject {
public:
    virtual ~ProtoObject();

    ProtoObject(const ProtoObject&) = delete;
    ProtoObject& operator=(const ProtoObject&) = delete;

    const std::string& pid() const noexcept { return pid_; }
    ProtoClass protoClass() const noexcept { return cls_; }
    ProtoRegistry* registry() const noexcept { return registry_; }
    bool isRegistered() const noexcept { return registry_ != nullptr; }

    // Owned sub-objects that are registered and deregistered with this one.
    virtual void forEachChild(const std::function<void(ProtoObject&)>& fn);

    // Deep copy with fresh PIDs for every node. The copy is never registered.
    virtual std::unique_ptr<ProtoObject> cloneFresh() const = 0;

protected:
    // An empty pid issues a fresh one. A supplied pid must parse and carry
    // the prefix of `cls`.
    ProtoObject(ProtoClass cls, std::string pid);

    // Called by the registry as the object leaves it. Implementations drop
    // every reference other objects hold to this one and hand back any
    // ownership they took, so the registry can release it last.
    virtual std::shared_ptr<ProtoObject> detachReferences();

private:
    friend class ProtoRegistry;

    std::string pid_;
    ProtoClass cls_;
    ProtoRegistry* registry_ = nullptr;
};

} // namespace protolayout

#endif // PROTOLAYOUT_REGISTRY_PROTO_OBJECT_H
