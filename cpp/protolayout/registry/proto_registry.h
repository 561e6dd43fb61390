#ifndef PROTOLAYOUT_REGISTRY_PROTO_REGISTRY_H
#define PROTOLAYOUT_REGISTRY_PROTO_REGISTRY_H

#include "protolayout/registry/proto_class.h"
#include "protolayout/registry/proto_object.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace protolayout {

// Non-owning PID -> object index.
//
// Objects are owned by their parents (layout -> slots, template -> elements)
// or by the caller; the registry only indexes them. Registration covers the
// object and all of its children and is all-or-nothing.
class ProtoRegistry {
public:
    ProtoRegistry() = default;
    ~ProtoRegistry();

    ProtoRegistry(const ProtoRegistry&) = delete;
    ProtoRegistry& operator=(const ProtoRegistry&) = delete;

    // Throws RegistryError on a duplicate PID or an object owned by another
    // registry. Children already indexed here are left as they are.
    void registerObject(ProtoObject& obj);
    // Detaches references to the object, then removes it and its children.
    // Throws RegistryError if the PID is unknown.
    void deregister(std::string_view pid);

    bool has(std::string_view pid) const;
    ProtoObject* find(std::string_view pid) const;

    template <typename T>
    T* get(std::string_view pid) const {
        return dynamic_cast<T*>(find(pid));
    }

    // Objects of one class, ordered by PID.
    std::vector<ProtoObject*> all(ProtoClass cls) const;
    // Throws RegistryError if the prefix is unknown.
    std::vector<ProtoObject*> all(std::string_view prefix) const;

    std::size_t size() const noexcept { return objects_.size(); }
    bool empty() const noexcept { return objects_.empty(); }

    // Fresh PID that is not indexed here.
    std::string issuePid(ProtoClass cls) const;

    // Deep copy with fresh PIDs; registered here when registerClone is set.
    template <typename T>
    std::unique_ptr<T> clone(const T& obj, bool registerClone) {
        std::unique_ptr<ProtoObject> copy = obj.cloneFresh();
        std::unique_ptr<T> typed(static_cast<T*>(copy.release()));
        if (registerClone) registerObject(*typed);
        return typed;
    }

private:
    friend class ProtoObject;

    void forget(const std::string& pid) noexcept;

    std::map<std::string, ProtoObject*, std::less<>> objects_;
};

} // namespace protolayout

#endif // PROTOLAYOUT_REGISTRY_PROTO_REGISTRY_H
