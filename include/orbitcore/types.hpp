#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <utility>

namespace orbitcore
{

    using Vec3 = glm::dvec3;
    using Mat3 = glm::dmat3;
    using BodyId = std::uint32_t;
    inline constexpr BodyId kInvalidBodyId = 0;

    /// @brief Failure category carried by Outcome.
    enum class ErrorKind
    {
        None,
        Validation,  ///< Malformed or inconsistent input parameters
        Domain,      ///< Operation undefined for this orbit shape or vector
        Convergence, ///< Iterative solver hit its iteration cap
    };

    inline const char *to_string(const ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::None:
                return "none";
            case ErrorKind::Validation:
                return "validation";
            case ErrorKind::Domain:
                return "domain";
            case ErrorKind::Convergence:
                return "convergence";
        }
        return "unknown";
    }

    /**
     * @brief Value plus error status of a fallible operation.
     *
     * `value` holds a default-constructed T whenever `error != ErrorKind::None`.
     */
    template<class T>
    struct Outcome
    {
        T value{};
        ErrorKind error{ErrorKind::None};
        const char *detail{""};

        inline bool valid() const { return error == ErrorKind::None; }
        inline const T &operator*() const { return value; }
        inline const T *operator->() const { return &value; }
    };

    template<class T>
    inline Outcome<T> make_ok(T value)
    {
        return Outcome<T>{.value = std::move(value), .error = ErrorKind::None, .detail = ""};
    }

    template<class T>
    inline Outcome<T> make_error(const ErrorKind kind, const char *detail)
    {
        return Outcome<T>{.value = T{}, .error = kind, .detail = detail};
    }

    /// @brief Re-tag a failed outcome with another value type.
    template<class T, class U>
    inline Outcome<T> forward_error(const Outcome<U> &failed)
    {
        return Outcome<T>{.value = T{}, .error = failed.error, .detail = failed.detail};
    }

} // namespace orbitcore
