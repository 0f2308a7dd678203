//
// Forward declarations and pointer aliases for the tcoll value layer.
//

#ifndef TCOLL_FORWARD_DECLARATIONS_H
#define TCOLL_FORWARD_DECLARATIONS_H

#include <cstdint>
#include <memory>

namespace tcoll {
    class Value;

    // Array - immutable composite, shared between copies of a Value
    class Array;
    using array_s_ptr = std::shared_ptr<const Array>;

    // Object - identity-bearing class instance
    class Object;
    using object_ptr = Object *;
    using object_s_ptr = std::shared_ptr<Object>;

    // Handle - identity-bearing opaque resource
    class Handle;
    using handle_s_ptr = std::shared_ptr<Handle>;

    // Callable - identity-bearing function value
    class Callable;
    using callable_s_ptr = std::shared_ptr<Callable>;

    struct ClassMeta;
    using class_meta_ptr = const ClassMeta *;
    class ClassRegistry;

    class TypeTag;
    class TypeSet;

    class IdentityRegistry;
    using identity_registry_s_ptr = std::shared_ptr<IdentityRegistry>;
    using identity_token_t = uint64_t;

    class KeyCodec;

    class Pair;
    class Dictionary;
} // namespace tcoll

#endif // TCOLL_FORWARD_DECLARATIONS_H
