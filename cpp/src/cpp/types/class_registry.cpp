#include <tcoll/types/class_registry.h>
#include <tcoll/types/type_errors.h>
#include <tcoll/types/type_tag.h>
#include <tcoll/util/errors.h>

namespace tcoll {

// ============================================================================
// Object
// ============================================================================

Object::Object(class_meta_ptr meta) : _meta(meta) {
    if (!_meta) throw_error<std::invalid_argument>("An Object needs class metadata.");
}

// ============================================================================
// ClassRegistry
// ============================================================================

ClassRegistry& ClassRegistry::instance() {
    static ClassRegistry registry;
    return registry;
}

ClassRegistry::ClassRegistry() {
    _generic = define(generic_class_name).default_constructible().build();
}

ClassBuilder ClassRegistry::define(std::string_view name) {
    auto normalized = TypeTag::normalize_identifier(name);
    if (!TypeTag::is_valid_identifier(name) || TypeTag::is_keyword(normalized)) {
        throw_error<InvalidTypeName>("Invalid class name: '{}'.", name);
    }
    if (has(normalized)) {
        throw_error<std::invalid_argument>("Class '{}' is already defined.", normalized);
    }
    return ClassBuilder{*this, std::string(normalized)};
}

class_meta_ptr ClassRegistry::find(std::string_view name) const {
    auto it = _by_name.find(TypeTag::normalize_identifier(name));
    return it != _by_name.end() ? it->second : nullptr;
}

object_s_ptr ClassRegistry::instantiate(std::string_view name) const {
    auto meta = find(name);
    if (!meta) throw_error<std::out_of_range>("Unknown class: '{}'.", name);
    return instantiate(meta);
}

object_s_ptr ClassRegistry::instantiate(class_meta_ptr meta) {
    if (!meta) throw_error<std::invalid_argument>("Cannot instantiate a null class.");
    if (!meta->is_default_constructible()) {
        throw_error<NoDefaultAvailable>("Class '{}' cannot be constructed without arguments.", meta->name);
    }
    return meta->factory(meta);
}

class_meta_ptr ClassRegistry::register_class(std::unique_ptr<ClassMeta> meta) {
    if (has(meta->name)) {
        throw_error<std::invalid_argument>("Class '{}' is already defined.", meta->name);
    }
    class_meta_ptr ptr = meta.get();
    _by_name.emplace(meta->name, ptr);
    _classes.push_back(std::move(meta));
    return ptr;
}

// ============================================================================
// ClassBuilder
// ============================================================================

ClassBuilder::ClassBuilder(ClassRegistry& registry, std::string name)
    : _registry(registry), _meta(std::make_unique<ClassMeta>()) {
    _meta->capabilities.insert(name);
    _meta->name = std::move(name);
}

ClassBuilder& ClassBuilder::extends(std::string_view parent) {
    auto parent_meta = _registry.find(parent);
    if (!parent_meta) {
        throw_error<std::invalid_argument>("Cannot extend unknown class '{}'.", parent);
    }
    for (const auto& capability : parent_meta->capabilities) {
        _meta->capabilities.insert(capability);
    }
    return *this;
}

ClassBuilder& ClassBuilder::implements(std::string_view interface_name) {
    add_capability(interface_name);
    return *this;
}

ClassBuilder& ClassBuilder::uses(std::string_view trait) {
    add_capability(trait);
    return *this;
}

ClassBuilder& ClassBuilder::default_constructible() {
    _meta->factory = [](class_meta_ptr meta) { return std::make_shared<Object>(meta); };
    return *this;
}

ClassBuilder& ClassBuilder::factory(ClassMeta::factory_type fn) {
    _meta->factory = std::move(fn);
    return *this;
}

class_meta_ptr ClassBuilder::build() {
    if (!_meta) throw_error<std::logic_error>("ClassBuilder::build called twice.");
    return _registry.register_class(std::move(_meta));
}

void ClassBuilder::add_capability(std::string_view name) {
    if (!TypeTag::is_valid_identifier(name)) {
        throw_error<InvalidTypeName>("Invalid capability name: '{}'.", name);
    }
    auto normalized = TypeTag::normalize_identifier(name);
    _meta->capabilities.emplace(normalized);
    if (auto meta = _registry.find(normalized)) {
        for (const auto& capability : meta->capabilities) {
            _meta->capabilities.insert(capability);
        }
    }
}

} // namespace tcoll
