#pragma once

/**
 * @file identity_registry.h
 * @brief IdentityRegistry - stable tokens for identity-bearing values.
 *
 * The registry assigns a token to each object, handle or callable instance the
 * first time it is seen. The same instance always gets the same token; a
 * different instance never gets a token already handed out, even if it is
 * allocated at an address a released instance used to occupy.
 *
 * Tokens are never reused. The entry of a released instance is kept until a
 * new instance takes over its address, so a process that churns through many
 * identity keys can grow the table without bound. Entries hold a weak_ptr: for
 * instances created with std::make_shared the object and its control block
 * share one allocation, so the memory of a released instance stays allocated
 * for as long as its entry exists.
 *
 * Containers hold the registry through a shared pointer. Containers that must
 * agree on identity keys share one registry; tests can inject a fresh one.
 */

#include <tcoll/tcoll_export.h>
#include <tcoll/tcoll_forward_declarations.h>

#include <ankerl/unordered_dense.h>

#include <memory>
#include <mutex>

namespace tcoll {

    class TCOLL_EXPORT IdentityRegistry {
    public:
        /// The process default registry
        static const identity_registry_s_ptr &shared();

        static identity_registry_s_ptr create() { return std::make_shared<IdentityRegistry>(); }

        IdentityRegistry() = default;

        IdentityRegistry(const IdentityRegistry &) = delete;
        IdentityRegistry &operator=(const IdentityRegistry &) = delete;

        /**
         * @brief Lookup-or-insert.
         *
         * Thread-safe: two callers racing on a fresh instance receive the same token.
         * @throws std::invalid_argument if instance is null
         */
        identity_token_t token_for(const std::shared_ptr<const void> &instance);

        /// Token of a known instance, or 0 when it has not been registered.
        [[nodiscard]] identity_token_t find(const std::shared_ptr<const void> &instance) const;

        /// Number of entries, released instances included.
        [[nodiscard]] size_t size() const;

    private:
        struct Entry {
            std::weak_ptr<const void> instance;
            identity_token_t token;
        };

        mutable std::mutex _mutex;
        ankerl::unordered_dense::map<const void *, Entry> _entries;
        identity_token_t _next_token{1};
    };

} // namespace tcoll
