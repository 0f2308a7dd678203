#include <tcoll/types/identity_registry.h>
#include <tcoll/util/errors.h>

namespace tcoll {

namespace {

bool same_owner(const std::weak_ptr<const void>& lhs, const std::shared_ptr<const void>& rhs) {
    return !lhs.owner_before(rhs) && !rhs.owner_before(lhs);
}

} // namespace

const identity_registry_s_ptr& IdentityRegistry::shared() {
    static const identity_registry_s_ptr registry = std::make_shared<IdentityRegistry>();
    return registry;
}

identity_token_t IdentityRegistry::token_for(const std::shared_ptr<const void>& instance) {
    if (!instance) throw_error<std::invalid_argument>("Cannot register a null instance.");

    std::lock_guard lock(_mutex);
    auto [it, inserted] = _entries.try_emplace(instance.get(), Entry{instance, _next_token});
    if (inserted) return _next_token++;

    // The address was reused by a new instance once the previous owner expired
    if (!same_owner(it->second.instance, instance)) {
        it->second = Entry{instance, _next_token++};
    }
    return it->second.token;
}

identity_token_t IdentityRegistry::find(const std::shared_ptr<const void>& instance) const {
    if (!instance) return 0;

    std::lock_guard lock(_mutex);
    auto it = _entries.find(instance.get());
    if (it == _entries.end() || !same_owner(it->second.instance, instance)) return 0;
    return it->second.token;
}

size_t IdentityRegistry::size() const {
    std::lock_guard lock(_mutex);
    return _entries.size();
}

} // namespace tcoll
