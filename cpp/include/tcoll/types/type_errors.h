//
// Errors raised by the type engine, key codec and keyed containers.
//

#ifndef TCOLL_TYPES_TYPE_ERRORS_H
#define TCOLL_TYPES_TYPE_ERRORS_H

#include <tcoll/tcoll_export.h>
#include <tcoll/types/type_tag.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace tcoll {

    /**
     * A type specification or class name is lexically malformed.
     */
    struct TCOLL_EXPORT InvalidTypeName : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    /**
     * A value does not satisfy a TypeSet.
     *
     * Carries the role label ("key", "value", ...), the tags the set allows and
     * the tag of the offending value.
     */
    struct TCOLL_EXPORT TypeMismatch : std::invalid_argument {
        TypeMismatch(std::string label, std::vector<TypeTag> expected, TypeTag actual);

        [[nodiscard]] const std::string &label() const { return _label; }
        [[nodiscard]] const std::vector<TypeTag> &expected() const { return _expected; }
        [[nodiscard]] const TypeTag &actual() const { return _actual; }

    private:
        std::string _label;
        std::vector<TypeTag> _expected;
        TypeTag _actual;
    };

    /**
     * TypeSet::default_value could not derive a zero value.
     */
    struct TCOLL_EXPORT NoDefaultAvailable : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * A lookup or removal targets a key that is not present.
     */
    struct TCOLL_EXPORT UnknownKey : std::out_of_range {
        using std::out_of_range::out_of_range;
    };

    /**
     * A value cannot be turned into a canonical index (NaN).
     */
    struct TCOLL_EXPORT InvalidKey : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    /**
     * A transformation produced the same key twice.
     */
    struct TCOLL_EXPORT DuplicateKey : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

} // namespace tcoll

#endif // TCOLL_TYPES_TYPE_ERRORS_H
