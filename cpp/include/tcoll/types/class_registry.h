#pragma once

/**
 * @file class_registry.h
 * @brief Named types described by capability sets.
 *
 * Named type constraints ("DateTime", "Countable", a trait name, ...) are
 * matched against the capability set of an object's class. The capability set
 * of a class holds its own name, every capability of its parent, and every
 * interface or trait it declares (expanded with their own capabilities when
 * those are registered too). Matching is then a set lookup rather than a
 * reflective walk of the class hierarchy.
 *
 * Usage:
 * @code
 * auto& classes = ClassRegistry::instance();
 *
 * classes.define("Shape").default_constructible().build();
 * classes.define("Circle")
 *     .extends("Shape")
 *     .implements("Countable")
 *     .default_constructible()
 *     .build();
 *
 * object_s_ptr circle = classes.instantiate("Circle");
 * circle->is_a("Shape");      // true
 * circle->is_a("Countable");  // true
 * @endcode
 */

#include <tcoll/tcoll_export.h>
#include <tcoll/tcoll_forward_declarations.h>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tcoll {

    /**
     * @brief Transparent string hash so lookups can use std::string_view.
     */
    struct StringHash {
        using is_transparent = void;
        using is_avalanching = void;

        [[nodiscard]] uint64_t operator()(std::string_view text) const noexcept {
            return ankerl::unordered_dense::hash<std::string_view>{}(text);
        }
    };

    using capability_set = ankerl::unordered_dense::set<std::string, StringHash, std::equal_to<>>;

    /**
     * ClassMeta - Metadata for a named class
     */
    struct TCOLL_EXPORT ClassMeta {
        using factory_type = std::function<object_s_ptr(class_meta_ptr)>;

        std::string name;
        capability_set capabilities;  // Own name, ancestors, interfaces, traits
        factory_type factory;         // Empty when the class has no zero-argument constructor

        [[nodiscard]] bool is_a(std::string_view capability) const {
            return capabilities.contains(capability);
        }

        [[nodiscard]] bool is_default_constructible() const { return static_cast<bool>(factory); }
    };

    /**
     * Object - Base class for identity-bearing class instances
     *
     * Host code derives from Object to attach state and behaviour; the type
     * engine only needs the class metadata.
     */
    class TCOLL_EXPORT Object {
    public:
        explicit Object(class_meta_ptr meta);

        virtual ~Object() = default;

        Object(const Object &) = delete;
        Object &operator=(const Object &) = delete;

        [[nodiscard]] const ClassMeta &meta() const { return *_meta; }
        [[nodiscard]] const std::string &class_name() const { return _meta->name; }
        [[nodiscard]] bool is_a(std::string_view capability) const { return _meta->is_a(capability); }

    private:
        class_meta_ptr _meta;
    };

    class ClassBuilder;

    /**
     * @brief Registry owning the metadata of every named class.
     *
     * Class metadata pointers remain stable for the lifetime of the registry.
     * A built-in class named GenericObject is always present and backs the
     * default value of the object keyword.
     */
    class TCOLL_EXPORT ClassRegistry {
    public:
        static constexpr std::string_view generic_class_name = "GenericObject";
        static constexpr std::string_view traversable_capability = "Traversable";

        /// Get the process-wide instance
        static ClassRegistry &instance();

        ClassRegistry();

        ClassRegistry(const ClassRegistry &) = delete;
        ClassRegistry &operator=(const ClassRegistry &) = delete;
        ClassRegistry(ClassRegistry &&) = delete;
        ClassRegistry &operator=(ClassRegistry &&) = delete;

        /**
         * @brief Start defining a class.
         * @throws InvalidTypeName if the name is not a legal identifier or is a keyword
         * @throws std::invalid_argument if the name is already registered
         */
        ClassBuilder define(std::string_view name);

        /**
         * @brief Look up a class by name (a leading '\' is ignored).
         * @return The metadata, or nullptr if not registered
         */
        [[nodiscard]] class_meta_ptr find(std::string_view name) const;

        [[nodiscard]] bool has(std::string_view name) const { return find(name) != nullptr; }

        [[nodiscard]] class_meta_ptr generic() const { return _generic; }

        [[nodiscard]] size_t size() const { return _classes.size(); }

        /**
         * @brief Create an instance through the class factory.
         * @throws std::out_of_range if the class is not registered
         * @throws NoDefaultAvailable if the class has no zero-argument constructor
         */
        [[nodiscard]] object_s_ptr instantiate(std::string_view name) const;

        [[nodiscard]] static object_s_ptr instantiate(class_meta_ptr meta);

        /**
         * @brief Register a finished class (called by ClassBuilder).
         *
         * Takes ownership of the metadata.
         */
        class_meta_ptr register_class(std::unique_ptr<ClassMeta> meta);

    private:
        std::vector<std::unique_ptr<ClassMeta>> _classes;
        ankerl::unordered_dense::map<std::string, class_meta_ptr, StringHash, std::equal_to<>> _by_name;
        class_meta_ptr _generic{nullptr};
    };

    /**
     * @brief Fluent builder for ClassMeta.
     */
    class TCOLL_EXPORT ClassBuilder {
    public:
        ClassBuilder(ClassRegistry &registry, std::string name);

        /**
         * @brief Inherit every capability of a registered parent.
         * @throws std::invalid_argument if the parent is not registered
         */
        ClassBuilder &extends(std::string_view parent);

        /**
         * @brief Declare an interface.
         *
         * Registered interfaces contribute their own capabilities as well.
         * @throws InvalidTypeName if the name is not a legal identifier
         */
        ClassBuilder &implements(std::string_view interface_name);

        /// Declare a trait, with the same rules as implements().
        ClassBuilder &uses(std::string_view trait);

        /// Instances are plain Objects created without arguments.
        ClassBuilder &default_constructible();

        /// Instances are created by the given factory.
        ClassBuilder &factory(ClassMeta::factory_type fn);

        class_meta_ptr build();

    private:
        void add_capability(std::string_view name);

        ClassRegistry &_registry;
        std::unique_ptr<ClassMeta> _meta;
    };

} // namespace tcoll
