#ifndef CAPGATE_ENUM_H
#define CAPGATE_ENUM_H

#include <initializer_list>
#include <iterator>
#include <type_traits>
#include "scalars.hpp"

namespace capgate
{
    template <typename T, typename = void>
    struct has_flag_bitmask : std::false_type
    {
    };

    template <typename T>
    struct has_flag_bitmask<T, std::void_t<typename T::flag_bitmask>> : std::true_type
    {
    };

    template <typename BitType>
    using is_flags = std::enable_if_t<has_flag_bitmask<BitType>::value>;

    template <typename BitType, typename = std::enable_if_t<has_flag_bitmask<BitType>::value>>
    class flags
    {
    public:
        using enum_type = typename BitType::enum_type;
        using mask_t = typename std::underlying_type_t<enum_type>;

        constexpr flags() noexcept : _mask(0) {}
        constexpr flags(enum_type bit) noexcept : _mask(static_cast<mask_t>(bit)) {}
        constexpr explicit flags(mask_t value) noexcept : _mask(value) {}

        constexpr flags operator&(flags const &rhs) const noexcept { return flags(static_cast<mask_t>(_mask & rhs._mask)); }
        constexpr flags operator|(flags const &rhs) const noexcept { return flags(static_cast<mask_t>(_mask | rhs._mask)); }
        constexpr flags operator^(flags const &rhs) const noexcept { return flags(static_cast<mask_t>(_mask ^ rhs._mask)); }

        constexpr flags &operator|=(flags const &rhs) noexcept
        {
            _mask |= rhs._mask;
            return *this;
        }
        constexpr flags &operator&=(flags const &rhs) noexcept
        {
            _mask &= rhs._mask;
            return *this;
        }
        constexpr flags &operator^=(flags const &rhs) noexcept
        {
            _mask ^= rhs._mask;
            return *this;
        }

        constexpr bool operator==(flags const &rhs) const noexcept { return _mask == rhs._mask; }
        constexpr bool operator!=(flags const &rhs) const noexcept { return _mask != rhs._mask; }

        constexpr bool has(enum_type bit) const noexcept { return (_mask & static_cast<mask_t>(bit)) != 0; }

        constexpr operator mask_t() const noexcept { return _mask; }

    private:
        mask_t _mask;
    };

    /**
     * @brief Unique-membership set over a closed enumeration with ordinals in [0, Count).
     *
     * Iteration always follows ordinal order, independent of insertion order.
     */
    template <typename E, size_t Count>
    class enum_set
    {
        static_assert(std::is_enum_v<E>, "enum_set requires an enumeration type");
        static_assert(Count <= 64, "enum_set supports at most 64 enumerators");

    public:
        using value_type = E;
        using mask_t = u64;

        static constexpr size_t capacity = Count;

        class iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = E;
            using difference_type = std::ptrdiff_t;
            using pointer = const E *;
            using reference = E;

            constexpr explicit iterator(mask_t rest) noexcept : _rest(rest) {}

            E operator*() const noexcept { return static_cast<E>(ctz64(_rest)); }

            iterator &operator++() noexcept
            {
                _rest &= (_rest - 1);
                return *this;
            }

            iterator operator++(int) noexcept
            {
                iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            bool operator==(const iterator &rhs) const noexcept { return _rest == rhs._rest; }
            bool operator!=(const iterator &rhs) const noexcept { return _rest != rhs._rest; }

        private:
            mask_t _rest;
        };

        constexpr enum_set() noexcept : _mask(0) {}

        constexpr enum_set(std::initializer_list<E> values) noexcept : _mask(0)
        {
            for (E value : values) _mask |= bit(value);
        }

        static constexpr enum_set all() noexcept
        {
            enum_set result;
            result._mask = Count == 64 ? ~mask_t{0} : ((mask_t{1} << Count) - 1);
            return result;
        }

        static constexpr enum_set from_mask(mask_t mask) noexcept
        {
            enum_set result;
            result._mask = mask & all()._mask;
            return result;
        }

        constexpr bool contains(E value) const noexcept { return (_mask & bit(value)) != 0; }

        constexpr bool contains_all(const enum_set &other) const noexcept { return (other._mask & ~_mask) == 0; }

        /// @return true when the value was not a member before
        constexpr bool add(E value) noexcept
        {
            mask_t b = bit(value);
            bool inserted = (_mask & b) == 0;
            _mask |= b;
            return inserted;
        }

        constexpr void add_all(const enum_set &other) noexcept { _mask |= other._mask; }

        constexpr void remove(E value) noexcept { _mask &= ~bit(value); }

        constexpr void clear() noexcept { _mask = 0; }

        constexpr bool empty() const noexcept { return _mask == 0; }

        size_t size() const noexcept { return popcount64(_mask); }

        constexpr mask_t mask() const noexcept { return _mask; }

        iterator begin() const noexcept { return iterator(_mask); }
        iterator end() const noexcept { return iterator(0); }

        constexpr enum_set operator|(const enum_set &rhs) const noexcept { return from_mask(_mask | rhs._mask); }
        constexpr enum_set operator&(const enum_set &rhs) const noexcept { return from_mask(_mask & rhs._mask); }
        constexpr enum_set operator-(const enum_set &rhs) const noexcept { return from_mask(_mask & ~rhs._mask); }

        constexpr enum_set &operator|=(const enum_set &rhs) noexcept
        {
            _mask |= rhs._mask;
            return *this;
        }

        constexpr bool operator==(const enum_set &rhs) const noexcept { return _mask == rhs._mask; }
        constexpr bool operator!=(const enum_set &rhs) const noexcept { return _mask != rhs._mask; }

    private:
        mask_t _mask;

        static constexpr mask_t bit(E value) noexcept { return mask_t{1} << static_cast<size_t>(value); }
    };
} // namespace capgate

#endif
