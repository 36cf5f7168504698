#pragma once

#include "orbitcore/body.hpp"
#include "orbitcore/kepler.hpp"
#include "orbitcore/orbit.hpp"
#include "orbitcore/types.hpp"

#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace orbitcore
{

    /**
     * @brief Everything needed to add one body to a CelestialSystem.
     *
     * Leave `orbit` empty (and `primary_id` invalid) for the root.
     */
    struct BodyDefinition
    {
        std::string name{};
        GravitySource gravity{GravitationalParameter{}};
        double radius_m{0.0};
        double rotational_period_s{0.0};
        BodyId primary_id{kInvalidBodyId};
        std::optional<OrbitSpec> orbit{};
    };

    /**
     * @brief Arena owning a tree of celestial bodies.
     *
     * Bodies are stored flat and refer to their primary and satellites by id.
     * A body can only orbit a primary that is already in the arena, so insertion
     * order is tree build order; adding a body appends its id to the primary's
     * satellites. Exactly one body (the root) has no orbit.
     */
    class CelestialSystem
    {
    public:
        /** @brief Opaque handle returned when adding a body. */
        struct BodyHandle
        {
            BodyId id{kInvalidBodyId};

            inline bool valid() const { return id != kInvalidBodyId; }
            inline operator BodyId() const { return id; }
        };

        CelestialSystem() = default;

        const std::vector<CelestialBody> &bodies() const { return bodies_; }
        std::size_t size() const { return bodies_.size(); }
        bool empty() const { return bodies_.empty(); }

        /** @brief Validate a definition, normalize its orbit against the primary and link it into the tree. */
        Outcome<BodyHandle> add_body(BodyDefinition def)
        {
            if (def.name.empty())
            {
                return make_error<BodyHandle>(ErrorKind::Validation, "body name must not be empty");
            }
            if (name_to_id_.contains(def.name))
            {
                return make_error<BodyHandle>(ErrorKind::Validation, "body name already in use");
            }

            const double mu = gravitational_parameter_of(def.gravity);
            if (!(mu > 0.0) || !std::isfinite(mu))
            {
                return make_error<BodyHandle>(ErrorKind::Validation, "gravitational parameter must be positive");
            }
            if (!(def.radius_m >= 0.0) || !std::isfinite(def.radius_m) || !std::isfinite(def.rotational_period_s))
            {
                return make_error<BodyHandle>(ErrorKind::Validation, "radius and rotational period must be finite");
            }

            CelestialBody body{};
            body.name = std::move(def.name);
            body.gravitational_parameter_m3_s2 = mu;
            body.radius_m = def.radius_m;
            body.rotational_period_s = def.rotational_period_s;

            if (!def.orbit)
            {
                if (def.primary_id != kInvalidBodyId)
                {
                    return make_error<BodyHandle>(ErrorKind::Validation, "a body with a primary needs an orbit");
                }
                if (root_id_ != kInvalidBodyId)
                {
                    return make_error<BodyHandle>(ErrorKind::Validation, "system already has a root body");
                }
                body.id = allocate_body_id_();
                root_id_ = body.id;
                return make_ok(insert_(std::move(body)));
            }

            const CelestialBody *primary = body_by_id(def.primary_id);
            if (primary == nullptr)
            {
                return make_error<BodyHandle>(ErrorKind::Validation, "primary body is not in the system");
            }

            Outcome<Orbit> orbit = make_orbit(primary->as_primary(), *def.orbit);
            if (!orbit.valid())
            {
                return forward_error<BodyHandle>(orbit);
            }

            body.id = allocate_body_id_();
            body.primary_id = def.primary_id;
            body.orbit = std::move(orbit.value);

            const BodyHandle handle = insert_(std::move(body));
            // Link only after insertion: push_back may have moved the primary.
            body_by_id_(def.primary_id)->satellites.push_back(handle.id);
            return make_ok(handle);
        }

        /**
         * @brief Body with the given id, or nullptr.
         *
         * @note Pointers returned by body_by_id(), body_by_name(), root(),
         * primary_of() and satellites_of() point into the arena and are
         * invalidated by the next add_body(). Keep ids across insertions.
         */
        const CelestialBody *body_by_id(const BodyId id) const
        {
            auto it = id_to_index_.find(id);
            if (it == id_to_index_.end())
            {
                return nullptr;
            }
            return &bodies_[it->second];
        }

        const CelestialBody *body_by_name(const std::string_view name) const
        {
            auto it = name_to_id_.find(std::string(name));
            if (it == name_to_id_.end())
            {
                return nullptr;
            }
            return body_by_id(it->second);
        }

        bool has_body(const BodyId id) const { return id_to_index_.contains(id); }

        const CelestialBody *root() const { return body_by_id(root_id_); }

        const CelestialBody *primary_of(const BodyId id) const
        {
            const CelestialBody *b = body_by_id(id);
            if (b == nullptr)
            {
                return nullptr;
            }
            return body_by_id(b->primary_id);
        }

        std::vector<const CelestialBody *> satellites_of(const BodyId id) const
        {
            std::vector<const CelestialBody *> out;
            const CelestialBody *b = body_by_id(id);
            if (b == nullptr)
            {
                return out;
            }
            out.reserve(b->satellites.size());
            for (const BodyId sid : b->satellites)
            {
                out.push_back(body_by_id(sid));
            }
            return out;
        }

        /**
         * @brief Position of a body at time t relative to the root.
         *
         * Sums the orbit positions along the primary chain; the root sits at the origin.
         */
        Outcome<Vec3> position_t(const BodyId id, const double t_s, const KeplerOptions &opt = {}) const
        {
            return accumulate_chain_(id, [&](const Orbit &o) { return o.position_t(t_s, opt); });
        }

        /** @brief Velocity of a body at time t relative to the root. */
        Outcome<Vec3> velocity_t(const BodyId id, const double t_s, const KeplerOptions &opt = {}) const
        {
            return accumulate_chain_(id, [&](const Orbit &o) { return o.velocity_t(t_s, opt); });
        }

    private:
        BodyId allocate_body_id_()
        {
            BodyId id = next_body_id_++;
            while (id == kInvalidBodyId || id_to_index_.contains(id))
            {
                id = next_body_id_++;
            }
            return id;
        }

        BodyHandle insert_(CelestialBody body)
        {
            const BodyId id = body.id;
            id_to_index_[id] = bodies_.size();
            name_to_id_[body.name] = id;
            bodies_.push_back(std::move(body));
            return BodyHandle{.id = id};
        }

        CelestialBody *body_by_id_(const BodyId id)
        {
            auto it = id_to_index_.find(id);
            if (it == id_to_index_.end())
            {
                return nullptr;
            }
            return &bodies_[it->second];
        }

        template<class OrbitVector>
        Outcome<Vec3> accumulate_chain_(const BodyId id, OrbitVector orbit_vector) const
        {
            const CelestialBody *b = body_by_id(id);
            if (b == nullptr)
            {
                return make_error<Vec3>(ErrorKind::Validation, "unknown body id");
            }

            Vec3 sum{0.0, 0.0, 0.0};
            while (b != nullptr && b->orbit)
            {
                const Outcome<Vec3> part = orbit_vector(*b->orbit);
                if (!part.valid())
                {
                    return part;
                }
                sum += part.value;
                b = body_by_id(b->primary_id);
            }
            return make_ok(sum);
        }

        std::vector<CelestialBody> bodies_{};
        std::unordered_map<BodyId, std::size_t> id_to_index_{};
        std::unordered_map<std::string, BodyId> name_to_id_{};
        BodyId root_id_{kInvalidBodyId};
        BodyId next_body_id_{1};
    };

} // namespace orbitcore
