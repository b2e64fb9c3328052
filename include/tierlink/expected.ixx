module;
#include <concepts>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <optional>

export module tierlink.expected;

export namespace tierlink {

    // ========== Unexpected Error Object ==========
    template <typename E>
    class [[nodiscard]] unexpected {
    public:
        using error_type = E;

        static_assert(!std::is_same_v<E, void>, "Error type cannot be void");
        static_assert(!std::is_reference_v<E>, "Error type cannot be a reference");

        template <typename Err = E>
        constexpr explicit unexpected(Err&& e)
            noexcept(std::is_nothrow_constructible_v<E, Err>)
            requires std::is_constructible_v<E, Err> &&
                     (!std::is_same_v<std::remove_cvref_t<Err>, unexpected>)
            : error_(std::forward<Err>(e)) {}

        constexpr       E& error() &        noexcept { return error_; }
        constexpr const E& error() const &  noexcept { return error_; }
        constexpr       E&& error() &&      noexcept { return std::move(error_); }

        template <typename E2>
        friend constexpr bool operator==(const unexpected& lhs,
                                         const unexpected<E2>& rhs)
            requires std::equality_comparable_with<E, E2>
        { return lhs.error() == rhs.error(); }

    private:
        E error_;
    };

    // ========== Bad Expected Access Exception ==========
    template <typename E>
    class bad_expected_access : public std::runtime_error {
    public:
        explicit bad_expected_access(E error)
            : std::runtime_error("Bad expected access"), error_(std::move(error)) {}

        const E& error() const & noexcept { return error_; }

    private:
        E error_;
    };

    template <>
    class bad_expected_access<std::string> : public std::runtime_error {
    public:
        explicit bad_expected_access(std::string error)
            : std::runtime_error("Bad expected access: " + error), error_(std::move(error)) {}

        const std::string& error() const & noexcept { return error_; }

    private:
        std::string error_;
    };

    namespace detail {
        template <typename U>
        struct is_unexpected : std::false_type {};

        template <typename E>
        struct is_unexpected< unexpected<E> > : std::true_type {};
    }

    // ========== Core expected ==========
    // Value-or-error for the byte-level primitives. The error side is a
    // plain string with a bracketed reason prefix ("[Invalid] ...").
    template <typename T, typename E = std::string>
    class [[nodiscard]] expected {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference");

        union {
            T value_;
            E error_;
        };
        bool has_value_;

        constexpr void destroy() noexcept {
            if (has_value_) {
                if constexpr (!std::is_trivially_destructible_v<T>) value_.~T();
            } else {
                if constexpr (!std::is_trivially_destructible_v<E>) error_.~E();
            }
        }

    public:
        using value_type = T;
        using error_type = E;

        // Construct from value
        template <typename U = T>
        constexpr expected(U&& v)
            noexcept(std::is_nothrow_constructible_v<T, U>)
            requires std::is_constructible_v<T, U> &&
                     (!std::same_as<std::remove_cvref_t<U>, expected>) &&
                     (!detail::is_unexpected<std::remove_cvref_t<U>>::value)
            : value_(std::forward<U>(v)), has_value_(true) {}

        // Construct from unexpected
        template <typename Err>
        constexpr expected(unexpected<Err> e)
            noexcept(std::is_nothrow_constructible_v<E, Err>)
            requires std::is_constructible_v<E, Err>
            : error_(std::move(e.error())), has_value_(false) {}

        expected(const expected& other)
            requires (std::is_copy_constructible_v<T> &&
                      std::is_copy_constructible_v<E>)
            : has_value_(other.has_value_) {
            if (has_value_) ::new (static_cast<void*>(&value_)) T(other.value_);
            else            ::new (static_cast<void*>(&error_)) E(other.error_);
        }

        expected(expected&& other) noexcept(
            std::is_nothrow_move_constructible_v<T> &&
            std::is_nothrow_move_constructible_v<E>)
            : has_value_(other.has_value_) {
            if (has_value_) ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
            else            ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
        }

        // Copies into a temporary first so a throwing copy leaves *this intact.
        expected& operator=(const expected& other)
            requires (std::is_nothrow_move_constructible_v<T> &&
                      std::is_nothrow_move_constructible_v<E>) {
            if (this != &other) {
                expected tmp(other);
                destroy();
                has_value_ = tmp.has_value_;
                if (has_value_) ::new (static_cast<void*>(&value_)) T(std::move(tmp.value_));
                else            ::new (static_cast<void*>(&error_)) E(std::move(tmp.error_));
            }
            return *this;
        }

        expected& operator=(expected&& other) noexcept(
            std::is_nothrow_move_constructible_v<T> &&
            std::is_nothrow_move_constructible_v<E>) {
            if (this != &other) {
                destroy();
                has_value_ = other.has_value_;
                if (has_value_) ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
                else            ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
            }
            return *this;
        }

        constexpr ~expected() { destroy(); }

        constexpr bool has_value() const noexcept { return has_value_; }
        constexpr explicit operator bool() const noexcept { return has_value_; }

        constexpr T& value() & {
            if (!has_value_) throw bad_expected_access<E>(error_);
            return value_;
        }
        constexpr const T& value() const & {
            if (!has_value_) throw bad_expected_access<E>(error_);
            return value_;
        }
        constexpr T&& value() && {
            if (!has_value_) throw bad_expected_access<E>(std::move(error_));
            return std::move(value_);
        }

        constexpr const E& error() const & noexcept { return error_; }
        constexpr       E& error()       & noexcept { return error_; }
        constexpr       E&& error()      && noexcept { return std::move(error_); }

        constexpr T*       operator->()       noexcept { return &value_; }
        constexpr const T* operator->() const noexcept { return &value_; }

        constexpr T&       operator*() &        noexcept { return value_; }
        constexpr const T& operator*() const &  noexcept { return value_; }
        constexpr T&&      operator*() &&       noexcept { return std::move(value_); }
    };

    // ========== void Specialization ==========
    template <typename E>
    class [[nodiscard]] expected<void, E> {
        std::optional<E> error_;

    public:
        using value_type = void;
        using error_type = E;

        constexpr expected() noexcept : error_(std::nullopt) {}

        template <typename Err>
        constexpr expected(unexpected<Err> e)
            requires std::is_constructible_v<E, Err>
            : error_(std::move(e.error())) {}

        constexpr bool has_value() const noexcept { return !error_.has_value(); }
        constexpr explicit operator bool() const noexcept { return has_value(); }

        constexpr void value() const {
            if (error_) throw bad_expected_access<E>(*error_);
        }

        constexpr const E& error() const & noexcept { return *error_; }
        constexpr       E& error()       & noexcept { return *error_; }
    };

} // namespace tierlink
