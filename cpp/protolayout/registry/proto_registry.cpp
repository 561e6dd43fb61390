#include "protolayout/registry/proto_registry.h"

#include "protolayout/core/errors.h"
#include "protolayout/core/logging.h"
#include "protolayout/registry/pid.h"

#include <set>

namespace protolayout {

namespace {

void collectTree(ProtoObject& root, std::vector<ProtoObject*>& out) {
    out.push_back(&root);
    root.forEachChild([&out](ProtoObject& child) { collectTree(child, out); });
}

} // namespace

ProtoRegistry::~ProtoRegistry() {
    for (auto& kv : objects_) kv.second->registry_ = nullptr;
}

void ProtoRegistry::registerObject(ProtoObject& obj) {
    if (obj.registry_ == this || objects_.count(obj.pid()) > 0) {
        throw RegistryError("duplicate PID '" + obj.pid() + "'");
    }
    if (obj.registry_ != nullptr) {
        throw RegistryError("object '" + obj.pid() + "' is already registered elsewhere");
    }

    std::vector<ProtoObject*> tree;
    collectTree(obj, tree);

    // Validate everything before touching the index.
    std::vector<ProtoObject*> pending;
    std::set<std::string_view> seen;
    for (ProtoObject* node : tree) {
        if (node->registry_ == this) continue;
        if (node->registry_ != nullptr) {
            throw RegistryError("object '" + node->pid() + "' is already registered elsewhere");
        }
        const auto cls = pidClass(node->pid());
        if (!cls || *cls != node->protoClass()) {
            throw RegistryError("PID '" + node->pid() + "' does not match its object type");
        }
        if (objects_.count(node->pid()) > 0 || !seen.insert(node->pid()).second) {
            throw RegistryError("duplicate PID '" + node->pid() + "'");
        }
        pending.push_back(node);
    }

    for (ProtoObject* node : pending) {
        objects_.emplace(node->pid(), node);
        node->registry_ = this;
    }
    PROTOLAYOUT_LOG_DEBUG("registered %s (+%zu children)", obj.pid().c_str(), pending.size() - 1);
}

void ProtoRegistry::deregister(std::string_view pid) {
    auto it = objects_.find(pid);
    if (it == objects_.end()) {
        throw RegistryError("cannot deregister unknown PID '" + std::string(pid) + "'");
    }
    ProtoObject* obj = it->second;

    std::vector<ProtoObject*> tree;
    collectTree(*obj, tree);
    for (ProtoObject* node : tree) {
        if (node->registry_ != this) continue;
        objects_.erase(node->pid());
        node->registry_ = nullptr;
    }

    // May hand back the last owning reference; released at scope exit.
    std::shared_ptr<ProtoObject> keepAlive = obj->detachReferences();
    PROTOLAYOUT_LOG_DEBUG("deregistered %s", std::string(pid).c_str());
}

bool ProtoRegistry::has(std::string_view pid) const {
    return objects_.find(pid) != objects_.end();
}

ProtoObject* ProtoRegistry::find(std::string_view pid) const {
    auto it = objects_.find(pid);
    return it == objects_.end() ? nullptr : it->second;
}

std::vector<ProtoObject*> ProtoRegistry::all(ProtoClass cls) const {
    std::vector<ProtoObject*> out;
    for (const auto& kv : objects_) {
        if (kv.second->protoClass() == cls) out.push_back(kv.second);
    }
    return out;
}

std::vector<ProtoObject*> ProtoRegistry::all(std::string_view prefix) const {
    const auto cls = protoClassFromPrefix(prefix);
    if (!cls) throw RegistryError("unknown PID prefix '" + std::string(prefix) + "'");
    return all(*cls);
}

std::string ProtoRegistry::issuePid(ProtoClass cls) const {
    std::string pid = protolayout::issuePid(cls);
    while (has(pid)) pid = protolayout::issuePid(cls);
    return pid;
}

void ProtoRegistry::forget(const std::string& pid) noexcept {
    objects_.erase(pid);
}

} // namespace protolayout
